#pragma once

#include "manifest/blob_entry.h"
#include "manifest/path.h"
#include "utilities/content_store.hpp"
#include "utilities/fanout.hpp"
#include "utilities/logger.h"
#include "utilities/metrics.h"
#include "utilities/node_hash.hpp"
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <type_traits>
#include <variant>
#include <vector>

namespace mosaic {

class MemoryManifestEntry;
class TreeManifest;
struct ManifestEntry;
struct ChangeSet;

/**
 * @brief Collaborators handed to every manifest operation.
 *
 * Copies are cheap and share the same store, logger and metrics. Null
 * logger or metrics pointers disable that side channel.
 */
struct ManifestContext {
    std::shared_ptr<ContentStore> store;
    Logger* logger = nullptr;
    MetricsRegistry* metrics = nullptr;
    /// Child subtrees run on their own threads when set, inline otherwise.
    bool parallel = true;
    /// Shared by every copy; bounds the threads @c parallel may start.
    std::shared_ptr<FanoutBudget> fanout = std::make_shared<FanoutBudget>(DEFAULT_FANOUT_THREADS);

    void log(LogLevel level, const std::string& message) const;
    void count(const std::string& counter) const;

    /// Start @p fn on a budgeted thread, or defer it to the first wait.
    template <typename F>
    std::future<std::invoke_result_t<F&>> spawn(F fn) const {
        if (parallel) {
            return spawnBounded(fanout, std::move(fn));
        }
        return std::async(std::launch::deferred, std::move(fn));
    }
};

/// Unresolved merge outcome. Candidates are ordered by merge parent.
struct ConflictSet {
    std::vector<MemoryManifestEntry> candidates;
};

/**
 * @brief In-memory directory node layered over an optional persisted tree.
 *
 * @c changes only records what differs from @c base: a name mapped to
 * std::nullopt is deleted, a name mapped to an entry is added or replaced.
 * Every copy of a MemTree shares the same ChangeSet.
 */
struct MemTree {
    std::optional<NodeHash> base;
    std::optional<NodeHash> p1;
    std::optional<NodeHash> p2;
    std::shared_ptr<ChangeSet> changes;
};

using ChildMap = std::map<MPathElement, MemoryManifestEntry>;
using ChangeMap = std::map<MPathElement, std::optional<MemoryManifestEntry>>;

/**
 * @brief One node of an in-memory manifest: a persisted leaf, a conflict or
 * a tree.
 *
 * Copying an entry aliases it: a MemTree copy shares its change set with the
 * original, so a handle returned by findMut() can be mutated and the change
 * is visible from the root.
 *
 * Operations that may read or write the content store return futures;
 * errors (ManifestException subclasses) surface from future::get().
 */
class MemoryManifestEntry {
public:
    MemoryManifestEntry(BlobEntry blob) : value_(std::move(blob)) {}
    explicit MemoryManifestEntry(ConflictSet conflict) : value_(std::move(conflict)) {}
    explicit MemoryManifestEntry(MemTree tree) : value_(std::move(tree)) {}

    /// A tree with no baseline, no parents and no changes.
    static MemoryManifestEntry emptyTree();
    /// A clean tree backed by the persisted tree @p hash (p1 = hash).
    static MemoryManifestEntry convertTreenode(const NodeHash& hash);
    /// A tree with explicit identity and pre-populated changes.
    static MemoryManifestEntry memTree(std::optional<NodeHash> base, std::optional<NodeHash> p1,
                                       std::optional<NodeHash> p2, const ChildMap& children = {});

    bool isDir() const { return std::holds_alternative<MemTree>(value_); }
    bool isBlob() const { return std::holds_alternative<BlobEntry>(value_); }
    bool isConflict() const { return std::holds_alternative<ConflictSet>(value_); }

    const BlobEntry* blob() const { return std::get_if<BlobEntry>(&value_); }
    const ConflictSet* conflict() const { return std::get_if<ConflictSet>(&value_); }
    const MemTree* tree() const { return std::get_if<MemTree>(&value_); }

    /// True for a tree without baseline or with recorded changes.
    bool isModified() const;

    /// True only for a tree whose materialized contents hold no leaves.
    std::future<bool> isEmpty(const ManifestContext& ctx) const;

    /// Current children of a tree: baseline listing with changes applied.
    std::future<ChildMap> getNewChildren(const ManifestContext& ctx) const;

    /**
     * @brief Write every modified, non-empty subtree and return this entry's
     * persisted form.
     *
     * Modified subtrees left without leaves are dropped. Unmodified subtrees
     * are kept by reference and never loaded.
     *
     * Children are saved concurrently. A conflict anywhere below fails the
     * whole save with UnresolvedConflicts, though sibling subtrees may have
     * been written already.
     */
    std::future<BlobEntry> save(const ManifestContext& ctx, const RepoPath& path) const;

    /**
     * @brief Three-way merge; this entry is p1, @p other is p2.
     *
     * Differing leaves become a ConflictSet ordered [this, other].
     */
    std::future<MemoryManifestEntry> mergeWithConflicts(const MemoryManifestEntry& other,
                                                        const ManifestContext& ctx,
                                                        const RepoPath& path) const;

    /**
     * @brief Walk @p path, creating trees as needed.
     *
     * Only the listings along the path are read. Conflicts on the way are
     * replaced by a two-parent tree. Returns std::nullopt when the walk has
     * to pass through a non-tree.
     */
    std::future<std::optional<MemoryManifestEntry>> findMut(std::vector<MPathElement> path,
                                                            const ManifestContext& ctx) const;

    /// Read-only counterpart of findMut(): never records anything.
    std::future<std::optional<MemoryManifestEntry>> locate(std::vector<MPathElement> path,
                                                           const ManifestContext& ctx) const;

    /**
     * @brief Set (@p entry present) or delete (@p entry absent) one direct child.
     * @throws NotADirectory if this entry is not a tree.
     */
    void change(const MPathElement& name, const std::optional<BlobEntry>& entry) const;

    /// Paths of every conflict reachable through recorded changes.
    std::vector<RepoPath> conflicts(const RepoPath& path) const;

    /// Copy of the recorded changes (empty for non-trees).
    ChangeMap changesSnapshot() const;

private:
    bool isEmptyNow(const ManifestContext& ctx) const;
    ChildMap childrenNow(const ManifestContext& ctx) const;
    BlobEntry saveNow(const ManifestContext& ctx, const RepoPath& path) const;
    /// std::nullopt for a modified tree with no leaves left unless @p keepEmpty.
    std::optional<BlobEntry> saveLevelNow(const ManifestContext& ctx, const RepoPath& path,
                                          bool keepEmpty) const;
    MemoryManifestEntry mergeNow(const MemoryManifestEntry& other, const ManifestContext& ctx,
                                 const RepoPath& path) const;
    std::optional<MemoryManifestEntry> findMutNow(const std::vector<MPathElement>& path, size_t idx,
                                                  const ManifestContext& ctx) const;
    std::optional<MemoryManifestEntry> locateNow(const std::vector<MPathElement>& path, size_t idx,
                                                 const ManifestContext& ctx) const;

    static MemoryManifestEntry mergeTrees(ChildMap children, ChildMap otherChildren,
                                          const ManifestContext& ctx, const RepoPath& path,
                                          std::optional<NodeHash> p1, std::optional<NodeHash> p2);
    static MemoryManifestEntry fromManifestEntry(const ManifestEntry& entry);
    static TreeManifest loadManifest(const ManifestContext& ctx, const NodeHash& hash);
    /// Number of tree parents found, or std::nullopt if @p slot was no conflict.
    static std::optional<size_t> conflictToMemTree(std::optional<MemoryManifestEntry>& slot);
    static void logCoercion(const ManifestContext& ctx, const std::string& where,
                            size_t treeParents);

    std::variant<BlobEntry, ConflictSet, MemTree> value_;
};

/// Shared, lock-guarded change set of a MemTree.
struct ChangeSet {
    std::mutex mutex;
    ChangeMap entries;
};

} // namespace mosaic
