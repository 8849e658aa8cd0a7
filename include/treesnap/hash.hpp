#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace treesnap {

enum class DigestAlgorithm : std::uint8_t { Md5, Sha1, Sha256 };

// Raw digest bytes (binary, not hex). Length depends on the algorithm.
class HashCode {
public:
  HashCode() = default;
  explicit HashCode(std::vector<std::uint8_t> bytes) : bytes_(std::move(bytes)) {}

  [[nodiscard]] const std::vector<std::uint8_t> &bytes() const { return bytes_; }
  [[nodiscard]] bool empty() const { return bytes_.empty(); }

  /** Lowercase hex rendering. */
  [[nodiscard]] std::string to_hex() const;

  /**
   * Parse an even-length hex string.
   * Returns false if characters are invalid or the length is odd.
   */
  static bool from_hex(std::string_view hex, HashCode &out);

  friend bool operator==(const HashCode &, const HashCode &) = default;

private:
  std::vector<std::uint8_t> bytes_;
};

/** Digest arbitrary bytes with the given algorithm. */
HashCode hash_bytes(DigestAlgorithm algorithm, std::span<const std::uint8_t> data);

// Convenience overload for string-like input (no copy).
inline HashCode hash_bytes(DigestAlgorithm algorithm, std::string_view s) {
  return hash_bytes(algorithm, std::span<const std::uint8_t>(
                                   reinterpret_cast<const std::uint8_t *>(s.data()), s.size()));
}

std::string_view algorithm_name(DigestAlgorithm algorithm);
bool parse_algorithm(std::string_view name, DigestAlgorithm &out);

/**
 * Capability: content digest of a regular file.
 * Implementations throw IoFailure when the file cannot be read.
 */
class FileHasher {
public:
  virtual ~FileHasher() = default;
  [[nodiscard]] virtual HashCode hash(const std::filesystem::path &file) const = 0;
};

// Streams the file through OpenSSL EVP.
class DefaultFileHasher : public FileHasher {
public:
  explicit DefaultFileHasher(DigestAlgorithm algorithm = DigestAlgorithm::Md5)
      : algorithm_(algorithm) {}

  [[nodiscard]] HashCode hash(const std::filesystem::path &file) const override;
  [[nodiscard]] DigestAlgorithm algorithm() const { return algorithm_; }

private:
  DigestAlgorithm algorithm_;
};

} // namespace treesnap
