#ifndef CONTENT_STORE_HPP
#define CONTENT_STORE_HPP

#include "utilities/digest.hpp"
#include "utilities/node_hash.hpp"
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace mosaic {

struct MosaicConfig;

/**
 * @brief Content-addressed blob storage.
 *
 * Blobs are immutable and keyed by the digest of their bytes, so writing the
 * same bytes twice yields the same hash and leaves the store unchanged.
 * Implementations must be safe for concurrent get/put.
 */
class ContentStore {
public:
  virtual ~ContentStore() = default;

  /**
   * @brief Retrieve a blob.
   * @return The blob bytes, or std::nullopt if no blob has that hash.
   */
  virtual std::optional<std::vector<std::byte>>
  get(const NodeHash &hash) const = 0;

  /**
   * @brief Store a blob.
   * @param data Raw bytes of the blob.
   * @return Hash derived from the blob contents.
   */
  virtual NodeHash put(const std::vector<std::byte> &data) = 0;

  /** Check if a blob exists. */
  virtual bool has(const NodeHash &hash) const = 0;

  /** Digest used to derive blob hashes. */
  virtual utils::HashAlgorithm algorithm() const = 0;
};

class MemoryContentStore : public ContentStore {
public:
  explicit MemoryContentStore(
      utils::HashAlgorithm algo = utils::HashAlgorithm::BLAKE3)
      : algo_(algo) {}

  std::optional<std::vector<std::byte>>
  get(const NodeHash &hash) const override;
  NodeHash put(const std::vector<std::byte> &data) override;
  bool has(const NodeHash &hash) const override;
  utils::HashAlgorithm algorithm() const override { return algo_; }

  /** Number of distinct blobs held. */
  size_t size() const;

private:
  utils::HashAlgorithm algo_;
  mutable std::mutex mutex_;
  std::unordered_map<NodeHash, std::vector<std::byte>> blobs_;
};

/**
 * @brief Blob store on the local filesystem.
 *
 * Each blob lives zstd-compressed in objects/<cid prefix>/<cid> under the
 * root directory. Writes go to a temporary file that is renamed into place.
 */
class FileContentStore : public ContentStore {
public:
  /**
   * @param root Directory holding the objects/ tree; created if missing.
   * @param algo Digest used for blob hashes.
   * @param compressionLevel Zstd level for stored blobs.
   */
  FileContentStore(const std::string &root,
                   utils::HashAlgorithm algo = utils::HashAlgorithm::BLAKE3,
                   int compressionLevel = 1);

  std::optional<std::vector<std::byte>>
  get(const NodeHash &hash) const override;
  NodeHash put(const std::vector<std::byte> &data) override;
  bool has(const NodeHash &hash) const override;
  utils::HashAlgorithm algorithm() const override { return algo_; }

private:
  std::filesystem::path objectPath(const NodeHash &hash) const;

  std::filesystem::path root_;
  utils::HashAlgorithm algo_;
  int compressionLevel_;
};

/**
 * @brief Build the store selected by @p config.
 * @throws std::invalid_argument for an unknown backend name.
 */
std::shared_ptr<ContentStore> makeContentStore(const MosaicConfig &config);

} // namespace mosaic

#endif // CONTENT_STORE_HPP
