#ifndef MOSAIC_DIGEST_HPP
#define MOSAIC_DIGEST_HPP

#include <array>
#include <cstddef>
#include <cstdint>

namespace mosaic::utils {

/// Supported hashing algorithms.
enum class HashAlgorithm { SHA256, BLAKE3 };

/// Digest size for supported algorithms (32 bytes).
inline constexpr size_t DIGEST_SIZE = 32;

using DigestArray = std::array<uint8_t, DIGEST_SIZE>;

/// Lowercase name as accepted by the hash_algorithm config key.
inline const char *hashAlgorithmName(HashAlgorithm algo) {
  return algo == HashAlgorithm::SHA256 ? "sha256" : "blake3";
}

} // namespace mosaic::utils

#endif // MOSAIC_DIGEST_HPP
