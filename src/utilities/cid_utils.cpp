#include "utilities/cid_utils.hpp"
#include "cppcodec/base32_rfc4648.hpp" // For Base32 encoding/decoding
#include "utilities/digest.hpp"
#include <algorithm>
#include <sodium.h>
#include <stdexcept> // For std::runtime_error
#include <vector>

namespace mosaic::utils {

// CIDv1 (0x01)
// multicodec for DAG-PB (0x70)
// multicodec for SHA2-256 (0x12) or BLAKE3 (0x1e)
// length of hash (0x20)
const std::vector<uint8_t> CID_PREFIX_SHA256 = {0x01, 0x70, 0x12, 0x20};
const std::vector<uint8_t> CID_PREFIX_BLAKE3 = {0x01, 0x70, 0x1e, 0x20};

std::string digest_to_cid(const DigestArray &digest, HashAlgorithm algo) {
  const auto &prefix =
      algo == HashAlgorithm::SHA256 ? CID_PREFIX_SHA256 : CID_PREFIX_BLAKE3;
  std::vector<uint8_t> bytes_to_encode;
  bytes_to_encode.insert(bytes_to_encode.end(), prefix.begin(), prefix.end());
  bytes_to_encode.insert(bytes_to_encode.end(), digest.begin(), digest.end());

  return cppcodec::base32_rfc4648::encode(bytes_to_encode);
}

DigestArray cid_to_digest(const std::string &cid, HashAlgorithm *algo_out) {
  if (cid.empty()) {
    throw std::runtime_error("CID string cannot be empty.");
  }

  std::vector<uint8_t> decoded_bytes;
  try {
    decoded_bytes = cppcodec::base32_rfc4648::decode(cid.data(), cid.length());
  } catch (const std::exception &e) {
    throw std::runtime_error("Failed to decode Base32 CID: " +
                             std::string(e.what()));
  }

  if (decoded_bytes.size() < CID_PREFIX_BLAKE3.size()) {
    throw std::runtime_error(
        "Invalid CID: Decoded data too short to contain prefix.");
  }

  const std::vector<uint8_t> *prefix = nullptr;
  HashAlgorithm algo;
  if (std::equal(CID_PREFIX_SHA256.begin(), CID_PREFIX_SHA256.end(),
                 decoded_bytes.begin())) {
    prefix = &CID_PREFIX_SHA256;
    algo = HashAlgorithm::SHA256;
  } else if (std::equal(CID_PREFIX_BLAKE3.begin(), CID_PREFIX_BLAKE3.end(),
                        decoded_bytes.begin())) {
    prefix = &CID_PREFIX_BLAKE3;
    algo = HashAlgorithm::BLAKE3;
  } else {
    throw std::runtime_error("Invalid CID: Prefix mismatch.");
  }

  if (decoded_bytes.size() != prefix->size() + DIGEST_SIZE) {
    throw std::runtime_error("Invalid CID: Decoded data length does not match "
                             "expected digest size.");
  }

  DigestArray digest;
  std::copy(decoded_bytes.begin() + prefix->size(), decoded_bytes.end(),
            digest.begin());

  if (algo_out) {
    *algo_out = algo;
  }

  return digest;
}

std::vector<uint8_t> cid_to_bytes(const std::string &cid) {
  HashAlgorithm algo;
  auto digest = cid_to_digest(cid, &algo);
  const auto &prefix =
      algo == HashAlgorithm::SHA256 ? CID_PREFIX_SHA256 : CID_PREFIX_BLAKE3;
  std::vector<uint8_t> bytes;
  bytes.insert(bytes.end(), prefix.begin(), prefix.end());
  bytes.insert(bytes.end(), digest.begin(), digest.end());
  return bytes;
}

std::string digest_to_hex(const DigestArray &digest) {
  char hex[DIGEST_SIZE * 2 + 1];
  sodium_bin2hex(hex, sizeof(hex), digest.data(), digest.size());
  return std::string(hex, DIGEST_SIZE * 2);
}

DigestArray hex_to_digest(const std::string &hex) {
  if (hex.size() != DIGEST_SIZE * 2) {
    throw std::runtime_error("Invalid hex digest length: " +
                             std::to_string(hex.size()));
  }
  DigestArray digest;
  size_t bin_len = 0;
  const char *hex_end = nullptr;
  // sodium_hex2bin stops at the first non-hex character, so a short decode
  // means the input was not pure hex.
  if (sodium_hex2bin(digest.data(), digest.size(), hex.data(), hex.size(),
                     nullptr, &bin_len, &hex_end) != 0 ||
      bin_len != DIGEST_SIZE || hex_end != hex.data() + hex.size()) {
    throw std::runtime_error("Invalid hex digest: " + hex);
  }
  return digest;
}

} // namespace mosaic::utils
