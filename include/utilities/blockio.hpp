#ifndef BLOCKIO_HPP
#define BLOCKIO_HPP

#include "blake3.h"
#include "utilities/digest.hpp"
#include <cstddef>  // For std::byte
#include <sodium.h> // For libsodium
#include <string>   // For std::string
#include <vector>

// Define DigestResult struct
struct DigestResult {
  mosaic::utils::DigestArray digest; // 32 bytes for SHA-256 and BLAKE3
  std::string cid; // Content Identifier (CID) of the hashed data
  std::vector<std::byte> raw;
};

/**
 * @brief Buffered block processing: hashing of ingested bytes and zstd
 * compression for blobs that are persisted to disk.
 */
class BlockIO {
public:
  using HashAlgorithm = mosaic::utils::HashAlgorithm;

  /**
   * @brief Construct a new BlockIO processor.
   * @param compression_level Zstd compression level to use.
   * @param hash_algo Digest used by finalize_hashed().
   * @throw std::runtime_error If libsodium cannot be initialised.
   */
  explicit BlockIO(int compression_level = 1,
                   HashAlgorithm hash_algo = HashAlgorithm::BLAKE3);

  ~BlockIO(); ///< Destructor

  // Appends data to the internal buffer.
  void ingest(const std::byte *data, size_t size);

  // Returns a copy of the concatenated plaintext data.
  std::vector<std::byte> finalize_raw();

  /**
   * @brief Finalizes the hash and returns the digest and raw data.
   * @throw std::logic_error If called more than once.
   */
  DigestResult finalize_hashed();

  /**
   * @brief Digest of @p size bytes at @p data without buffering them.
   * @throw std::runtime_error If libsodium cannot be initialised.
   */
  static mosaic::utils::DigestArray digest(const std::byte *data, size_t size,
                                           HashAlgorithm hash_algo);

  // Compression methods
  std::vector<std::byte>
  compress_data(const std::vector<std::byte> &plaintext_data);
  std::vector<std::byte>
  decompress_data(const std::vector<std::byte> &compressed_data,
                  size_t original_size);

private:
  std::vector<std::byte> buffer_;
  crypto_hash_sha256_state sha_state_; // Libsodium SHA-256 state
  blake3_hasher blake3_state_;
  bool finalized_ = false;    // Tracks if finalize_hashed() has been called
  int compression_level_ = 1; ///< Zstd compression level
  HashAlgorithm hash_algo_ = HashAlgorithm::BLAKE3;
};

#endif // BLOCKIO_HPP
