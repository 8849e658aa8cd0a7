#pragma once
#include <cstddef>
#include <string_view>

namespace treesnap::consts {

// Configuration
inline constexpr std::string_view kConfigFile     = ".treesnap";
inline constexpr std::string_view kKeyDigest      = "digest:";
inline constexpr std::string_view kKeyLogLevel    = "log-level:";
inline constexpr std::string_view kKeyImmutable   = "immutable:";

// Digest algorithm names (as accepted by config and CLI)
inline constexpr std::string_view kDigestMd5      = "md5";
inline constexpr std::string_view kDigestSha1     = "sha1";
inline constexpr std::string_view kDigestSha256   = "sha256";

// ——— Relative path rendering ———
inline constexpr char kPathSeparator = '/';

// ——— Hashing ———
inline constexpr std::size_t kHashChunkSize = 64 * 1024; // bytes read per EVP_DigestUpdate
inline constexpr std::size_t kMaxDigestLen  = 32;        // SHA-256

} // namespace treesnap::consts
