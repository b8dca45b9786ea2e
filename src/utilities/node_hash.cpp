#include "utilities/node_hash.hpp"
#include "utilities/cid_utils.hpp"

namespace mosaic {

NodeHash NodeHash::fromHex(const std::string &hex) {
  return NodeHash(utils::hex_to_digest(hex));
}

std::string NodeHash::toHex() const { return utils::digest_to_hex(digest_); }

std::string NodeHash::toCid(utils::HashAlgorithm algo) const {
  return utils::digest_to_cid(digest_, algo);
}

} // namespace mosaic
