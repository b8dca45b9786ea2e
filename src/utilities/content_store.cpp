#include "utilities/content_store.hpp"
#include "utilities/blockio.hpp"
#include "utilities/config.hpp"
#include <atomic>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <system_error>

namespace mosaic {

namespace {

// Empty blobs are still hashed to produce a unique identity.
NodeHash hashBlob(const std::vector<std::byte> &data,
                  utils::HashAlgorithm algo) {
  return NodeHash(BlockIO::digest(data.data(), data.size(), algo));
}

std::atomic<unsigned long> tmpCounter{0};

} // namespace

std::optional<std::vector<std::byte>>
MemoryContentStore::get(const NodeHash &hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = blobs_.find(hash);
  if (it != blobs_.end()) {
    return it->second;
  }
  return std::nullopt;
}

NodeHash MemoryContentStore::put(const std::vector<std::byte> &data) {
  NodeHash hash = hashBlob(data, algo_);

  std::lock_guard<std::mutex> lock(mutex_);
  blobs_.emplace(hash, data);
  return hash;
}

bool MemoryContentStore::has(const NodeHash &hash) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blobs_.count(hash) > 0;
}

size_t MemoryContentStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return blobs_.size();
}

FileContentStore::FileContentStore(const std::string &root,
                                   utils::HashAlgorithm algo,
                                   int compressionLevel)
    : root_(root), algo_(algo), compressionLevel_(compressionLevel) {
  std::filesystem::create_directories(root_ / "objects");
}

std::filesystem::path FileContentStore::objectPath(const NodeHash &hash) const {
  std::string cid = hash.toCid(algo_);
  // The first characters of a CID are the shared prefix, so fan out on the
  // tail instead.
  std::string shard = cid.substr(cid.size() - 2);
  return root_ / "objects" / shard / cid;
}

std::optional<std::vector<std::byte>>
FileContentStore::get(const NodeHash &hash) const {
  std::filesystem::path path = objectPath(hash);
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return std::nullopt;
  }
  std::vector<char> tmp((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>());
  std::vector<std::byte> compressed(tmp.size());
  for (size_t i = 0; i < tmp.size(); ++i)
    compressed[i] = std::byte(tmp[i]);

  BlockIO bio(compressionLevel_, algo_);
  try {
    return bio.decompress_data(compressed, 0);
  } catch (const std::runtime_error &e) {
    throw std::runtime_error("Corrupt blob " + path.string() + ": " +
                             e.what());
  }
}

NodeHash FileContentStore::put(const std::vector<std::byte> &data) {
  NodeHash hash = hashBlob(data, algo_);
  std::filesystem::path path = objectPath(hash);
  if (std::filesystem::exists(path)) {
    return hash;
  }

  BlockIO bio(compressionLevel_, algo_);
  std::vector<std::byte> compressed = bio.compress_data(data);

  std::filesystem::create_directories(path.parent_path());
  std::filesystem::path tmpPath = path;
  tmpPath += ".tmp." + std::to_string(tmpCounter.fetch_add(1));
  {
    std::ofstream out(tmpPath, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
      throw std::runtime_error("Could not open " + tmpPath.string() +
                               " for writing");
    }
    out.write(reinterpret_cast<const char *>(compressed.data()),
              static_cast<std::streamsize>(compressed.size()));
    if (!out) {
      throw std::runtime_error("Short write to " + tmpPath.string());
    }
  }
  // Identical content under the same name, so losing a rename race is fine.
  std::error_code ec;
  std::filesystem::rename(tmpPath, path, ec);
  if (ec) {
    std::filesystem::remove(tmpPath, ec);
    if (!std::filesystem::exists(path)) {
      throw std::runtime_error("Could not store blob " + path.string());
    }
  }
  return hash;
}

bool FileContentStore::has(const NodeHash &hash) const {
  return std::filesystem::exists(objectPath(hash));
}

std::shared_ptr<ContentStore> makeContentStore(const MosaicConfig &config) {
  if (config.storeBackend == "memory") {
    return std::make_shared<MemoryContentStore>(config.hashAlgorithm);
  }
  if (config.storeBackend == "file") {
    return std::make_shared<FileContentStore>(
        config.storeDir, config.hashAlgorithm, config.compressionLevel);
  }
  throw std::invalid_argument("Unknown store backend: " + config.storeBackend);
}

} // namespace mosaic
