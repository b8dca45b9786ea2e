#pragma once

#include "manifest/blob_entry.h"
#include "manifest/path.h"
#include "utilities/content_store.hpp"
#include "utilities/node_hash.hpp"
#include <cstddef>
#include <optional>
#include <vector>

namespace mosaic {

/// One line of a persisted tree listing.
struct ManifestEntry {
    MPathElement name;
    NodeHash hash;
    EntryType type;

    BlobEntry toBlobEntry() const { return BlobEntry(name, hash, type); }
};

/**
 * @brief Decoded, immutable listing of one persisted tree level.
 *
 * Wire format, one line per entry, sorted by name, nothing else:
 *
 *     <name> NUL <64 hex chars> <type suffix> '\n'
 *
 * where the suffix is "" (file), "x" (executable), "l" (symlink) or "t"
 * (tree). Identical listings always serialize to identical bytes.
 */
class TreeManifest {
public:
    TreeManifest() = default;

    /**
     * @brief Fetch and decode the tree stored under @p hash.
     * @return std::nullopt if the store has no blob with that hash.
     * @throws ManifestCorrupt if the blob is not a valid listing.
     */
    static std::optional<TreeManifest> load(const ContentStore& store, const NodeHash& hash);

    /** @throws ManifestCorrupt */
    static TreeManifest parse(const std::vector<std::byte>& raw);

    /** Entries need not be sorted; they are sorted on the way out. */
    static std::vector<std::byte> serialize(std::vector<ManifestEntry> entries);

    const std::vector<ManifestEntry>& list() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    /** Binary search on the sorted listing. */
    std::optional<ManifestEntry> lookup(const MPathElement& name) const;

private:
    explicit TreeManifest(std::vector<ManifestEntry> entries) : entries_(std::move(entries)) {}

    std::vector<ManifestEntry> entries_;
};

} // namespace mosaic
