#ifndef MOSAIC_NODE_HASH_HPP
#define MOSAIC_NODE_HASH_HPP

#include "utilities/digest.hpp"
#include <cstddef>
#include <cstring>
#include <functional>
#include <ostream>
#include <string>

namespace mosaic {

/**
 * @brief Identity of a stored blob: the 32 byte digest of its contents.
 *
 * The hex form is what tree listings carry; the CID form is the key the
 * content stores use.
 */
class NodeHash {
public:
  NodeHash() { digest_.fill(0); }
  explicit NodeHash(const utils::DigestArray &digest) : digest_(digest) {}

  /** @throws std::runtime_error if @p hex is not 64 hex characters. */
  static NodeHash fromHex(const std::string &hex);

  std::string toHex() const;
  std::string toCid(utils::HashAlgorithm algo) const;

  const utils::DigestArray &digest() const { return digest_; }

  bool operator==(const NodeHash &other) const {
    return digest_ == other.digest_;
  }
  bool operator!=(const NodeHash &other) const { return !(*this == other); }
  bool operator<(const NodeHash &other) const {
    return digest_ < other.digest_;
  }

private:
  utils::DigestArray digest_;
};

inline std::ostream &operator<<(std::ostream &os, const NodeHash &hash) {
  return os << hash.toHex();
}

} // namespace mosaic

template <> struct std::hash<mosaic::NodeHash> {
  size_t operator()(const mosaic::NodeHash &h) const noexcept {
    // The digest is already uniformly distributed.
    size_t out;
    std::memcpy(&out, h.digest().data(), sizeof(out));
    return out;
  }
};

#endif // MOSAIC_NODE_HASH_HPP
