#include "utilities/blockio.hpp"
#include "utilities/cid_utils.hpp" // Added for digest_to_cid

#include "blake3.h"
#include "utilities/digest.hpp"
#include <stdexcept> // For std::runtime_error
#include <zstd.h>    // For zstd compression

// Constructor
BlockIO::BlockIO(int compression_level, HashAlgorithm hash_algo)
    : compression_level_(compression_level), hash_algo_(hash_algo) {
  if (sodium_init() < 0) {
    // sodium_init() returns -1 on error, 0 on success, 1 if already initialized
    throw std::runtime_error("Failed to initialize libsodium");
  }

  if (hash_algo_ == HashAlgorithm::SHA256) {
    crypto_hash_sha256_init(&sha_state_);
  } else {
    blake3_hasher_init(&blake3_state_);
  }
  finalized_ = false;
}

// Destructor
BlockIO::~BlockIO() {
  // No explicit cleanup needed for the hash states
}

void BlockIO::ingest(const std::byte *data, size_t size) {
  if (finalized_) {
    throw std::logic_error(
        "Cannot ingest data after finalize_hashed() has been called.");
  }
  if (data && size > 0) { // Check for null data pointer and non-zero size
    buffer_.insert(buffer_.end(), data, data + size);
    if (hash_algo_ == HashAlgorithm::SHA256) {
      crypto_hash_sha256_update(
          &sha_state_, reinterpret_cast<const unsigned char *>(data), size);
    } else {
      blake3_hasher_update(&blake3_state_,
                           reinterpret_cast<const uint8_t *>(data), size);
    }
  }
}

std::vector<std::byte> BlockIO::finalize_raw() {
  // finalize_raw() does not touch the hash state, so it stays valid after
  // finalize_hashed().
  return buffer_;
}

DigestResult BlockIO::finalize_hashed() {
  if (finalized_) {
    throw std::logic_error("finalize_hashed() already called.");
  }

  DigestResult result;
  if (hash_algo_ == HashAlgorithm::SHA256) {
    crypto_hash_sha256_final(&sha_state_, result.digest.data());
  } else {
    blake3_hasher_finalize(&blake3_state_, result.digest.data(),
                           mosaic::utils::DIGEST_SIZE);
  }
  result.raw = buffer_; // Copy the raw data

  // Convert digest to CID
  result.cid = mosaic::utils::digest_to_cid(result.digest, hash_algo_);

  finalized_ = true; // Mark as finalized

  return result;
}

mosaic::utils::DigestArray BlockIO::digest(const std::byte *data, size_t size,
                                           HashAlgorithm hash_algo) {
  mosaic::utils::DigestArray out;
  const auto *bytes = reinterpret_cast<const unsigned char *>(data);
  if (hash_algo == HashAlgorithm::SHA256) {
    if (sodium_init() < 0) {
      throw std::runtime_error("Failed to initialize libsodium");
    }
    crypto_hash_sha256_state state;
    crypto_hash_sha256_init(&state);
    if (size > 0) {
      crypto_hash_sha256_update(&state, bytes, size);
    }
    crypto_hash_sha256_final(&state, out.data());
  } else {
    blake3_hasher hasher;
    blake3_hasher_init(&hasher);
    if (size > 0) {
      blake3_hasher_update(&hasher, bytes, size);
    }
    blake3_hasher_finalize(&hasher, out.data(), mosaic::utils::DIGEST_SIZE);
  }
  return out;
}

// Compression methods
std::vector<std::byte>
BlockIO::compress_data(const std::vector<std::byte> &plaintext_data) {
  if (plaintext_data.empty()) {
    return {};
  }

  size_t const cBuffSize = ZSTD_compressBound(plaintext_data.size());
  std::vector<std::byte> compressed_data(cBuffSize);

  size_t const cSize =
      ZSTD_compress(compressed_data.data(), cBuffSize, plaintext_data.data(),
                    plaintext_data.size(), compression_level_);

  if (ZSTD_isError(cSize)) {
    throw std::runtime_error(std::string("ZSTD_compress failed: ") +
                             ZSTD_getErrorName(cSize));
  }

  compressed_data.resize(cSize);
  return compressed_data;
}

std::vector<std::byte>
BlockIO::decompress_data(const std::vector<std::byte> &compressed_data,
                         size_t original_size) {
  if (compressed_data.empty()) {
    return {};
  }
  if (original_size == 0) {
    // Take the size from the frame header; ZSTD_compress always records it.
    unsigned long long const rSize = ZSTD_getFrameContentSize(
        compressed_data.data(), compressed_data.size());
    if (rSize == ZSTD_CONTENTSIZE_ERROR || rSize == ZSTD_CONTENTSIZE_UNKNOWN) {
      throw std::runtime_error(
          "ZSTD_decompress failed: original_size must be provided or "
          "retrievable from frame, and it was not.");
    }
    original_size = static_cast<size_t>(rSize);
    if (original_size == 0) {
      return {};
    }
  }

  std::vector<std::byte> decompressed_data(original_size);

  size_t const dSize =
      ZSTD_decompress(decompressed_data.data(), original_size,
                      compressed_data.data(), compressed_data.size());

  if (ZSTD_isError(dSize)) {
    throw std::runtime_error(std::string("ZSTD_decompress failed: ") +
                             ZSTD_getErrorName(dSize));
  }

  if (dSize != original_size) {
    throw std::runtime_error(
        "ZSTD_decompress failed: output size does not match original size.");
  }

  return decompressed_data;
}
