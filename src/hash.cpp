#include "treesnap/hash.hpp"
#include "treesnap/consts.hpp"
#include "treesnap/errors.hpp"

#include <array>
#include <cerrno>
#include <fstream>
#include <memory>
#include <openssl/evp.h> // EVP_* digest API
#include <stdexcept>
#include <system_error>

namespace treesnap {

namespace {

const EVP_MD *evp_for(DigestAlgorithm algorithm) {
  switch (algorithm) {
  case DigestAlgorithm::Md5:
    return EVP_md5();
  case DigestAlgorithm::Sha1:
    return EVP_sha1();
  case DigestAlgorithm::Sha256:
    return EVP_sha256();
  }
  throw std::runtime_error("unknown digest algorithm");
}

struct EvpCtxDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
using EvpCtx = std::unique_ptr<EVP_MD_CTX, EvpCtxDeleter>;

// Owns one digest computation; throws on any EVP failure.
class Digester {
public:
  explicit Digester(DigestAlgorithm algorithm) : ctx_(EVP_MD_CTX_new()) {
    if (!ctx_) {
      throw std::runtime_error("EVP_MD_CTX_new failed");
    }
    if (EVP_DigestInit_ex(ctx_.get(), evp_for(algorithm), nullptr) != 1) {
      throw std::runtime_error("EVP_DigestInit_ex failed");
    }
  }

  void update(const void *data, std::size_t len) {
    if (len != 0 && EVP_DigestUpdate(ctx_.get(), data, len) != 1) {
      throw std::runtime_error("EVP_DigestUpdate failed");
    }
  }

  HashCode finish() {
    std::array<unsigned char, EVP_MAX_MD_SIZE> out{};
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx_.get(), out.data(), &len) != 1) {
      throw std::runtime_error("EVP_DigestFinal_ex failed");
    }
    return HashCode(std::vector<std::uint8_t>(out.begin(), out.begin() + len));
  }

private:
  EvpCtx ctx_;
};

} // namespace

HashCode hash_bytes(DigestAlgorithm algorithm, std::span<const std::uint8_t> data) {
  Digester d{algorithm};
  d.update(data.data(), data.size());
  return d.finish();
}

HashCode DefaultFileHasher::hash(const std::filesystem::path &file) const {
  std::ifstream ifs(file, std::ios::binary);
  if (!ifs) {
    const int err = errno != 0 ? errno : EIO;
    throw IoFailure(file, std::error_code(err, std::generic_category()), "open for hashing failed");
  }
  Digester d{algorithm_};
  std::vector<char> buf(consts::kHashChunkSize);
  while (ifs) {
    ifs.read(buf.data(), static_cast<std::streamsize>(buf.size()));
    const auto n = ifs.gcount();
    if (n > 0) {
      d.update(buf.data(), static_cast<std::size_t>(n));
    }
  }
  if (ifs.bad()) {
    throw IoFailure(file, std::make_error_code(std::errc::io_error), "read for hashing failed");
  }
  return d.finish();
}

std::string HashCode::to_hex() const {
  static constexpr std::array<char, 16> kHex = {'0', '1', '2', '3', '4', '5', '6', '7',
                                                '8', '9', 'a', 'b', 'c', 'd', 'e', 'f'};
  std::string s;
  s.resize(bytes_.size() * 2);
  for (std::size_t i = 0; i < bytes_.size(); ++i) {
    unsigned b = bytes_[i];
    s[(2 * i) + 0] = kHex[(b >> 4) & 0xF];
    s[(2 * i) + 1] = kHex[b & 0xF];
  }
  return s;
}

bool HashCode::from_hex(std::string_view hex, HashCode &out) {
  if (hex.size() % 2 != 0 || hex.size() / 2 > consts::kMaxDigestLen) {
    return false;
  }
  auto nibble = [](char c) -> int {
    if (c >= '0' && c <= '9') {
      return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
      return 10 + (c - 'a');
    }
    if (c >= 'A' && c <= 'F') {
      return 10 + (c - 'A');
    }
    return -1;
  };
  std::vector<std::uint8_t> bytes(hex.size() / 2);
  for (std::size_t i = 0; i < bytes.size(); ++i) {
    int hi = nibble(hex[2 * i]);
    int lo = nibble(hex[(2 * i) + 1]);
    if (hi < 0 || lo < 0) {
      return false;
    }
    bytes[i] = static_cast<std::uint8_t>((hi << 4) | lo);
  }
  out = HashCode(std::move(bytes));
  return true;
}

std::string_view algorithm_name(DigestAlgorithm algorithm) {
  switch (algorithm) {
  case DigestAlgorithm::Md5:
    return consts::kDigestMd5;
  case DigestAlgorithm::Sha1:
    return consts::kDigestSha1;
  case DigestAlgorithm::Sha256:
    return consts::kDigestSha256;
  }
  return "unknown";
}

bool parse_algorithm(std::string_view name, DigestAlgorithm &out) {
  if (name == consts::kDigestMd5) {
    out = DigestAlgorithm::Md5;
  } else if (name == consts::kDigestSha1) {
    out = DigestAlgorithm::Sha1;
  } else if (name == consts::kDigestSha256) {
    out = DigestAlgorithm::Sha256;
  } else {
    return false;
  }
  return true;
}

} // namespace treesnap
