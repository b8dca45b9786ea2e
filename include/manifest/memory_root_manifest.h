#pragma once

#include "manifest/memory_manifest.h"
#include <future>
#include <optional>
#include <vector>

namespace mosaic {

/**
 * @brief Entry point for building a new manifest from zero, one or two
 * parents, editing it by path, merging, and persisting it.
 *
 * Copies share the same root tree.
 */
class MemoryRootManifest {
public:
    /**
     * @brief Start a new manifest.
     *
     * No parents gives an empty tree, one parent a clean tree over it, and
     * two parents the three-way merge of both (p1 wins the first slot of
     * every conflict).
     */
    static std::future<MemoryRootManifest> create(ManifestContext ctx,
                                                  std::optional<NodeHash> p1,
                                                  std::optional<NodeHash> p2);

    /**
     * @brief Set (@p entry present) or delete (@p entry absent) the leaf at
     * @p path, creating intermediate directories.
     * @throws PathNotFound if a non-directory sits on the way.
     */
    std::future<void> changeEntry(const MPath& path, std::optional<BlobEntry> entry) const;

    /// Merge @p other into a new manifest; this manifest is p1.
    std::future<MemoryRootManifest> merge(const MemoryRootManifest& other) const;

    /// Current entry at @p path, without recording anything.
    std::future<std::optional<MemoryManifestEntry>> locate(const MPath& path) const;

    /// Persist the whole tree and return the root reference.
    std::future<BlobEntry> save() const;

    /// Paths of unresolved conflicts, in path order.
    std::vector<RepoPath> conflicts() const;

    const MemoryManifestEntry& rootEntry() const { return root_; }
    const ManifestContext& context() const { return ctx_; }

private:
    MemoryRootManifest(ManifestContext ctx, MemoryManifestEntry root)
        : ctx_(std::move(ctx)), root_(std::move(root)) {}

    ManifestContext ctx_;
    MemoryManifestEntry root_;
};

} // namespace mosaic
