#include "manifest/memory_manifest.h"
#include "manifest/errors.h"
#include "manifest/tree_manifest.h"

namespace mosaic {

namespace {

/// Wait for every future, then collect results; the first failure is
/// rethrown only after all siblings have finished.
template <typename T>
std::vector<T> joinAll(std::vector<std::future<T>>& futures) {
    for (auto& f : futures) {
        f.wait();
    }
    std::vector<T> results;
    results.reserve(futures.size());
    for (auto& f : futures) {
        results.push_back(f.get());
    }
    return results;
}

std::string describe(const RepoPath& path) {
    return path.isRoot() ? std::string("<root>") : path.toString();
}

std::string joinElements(const std::vector<MPathElement>& path, size_t count) {
    std::string out;
    for (size_t i = 0; i < count && i < path.size(); ++i) {
        if (!out.empty()) out += '/';
        out += path[i].str();
    }
    return out;
}

} // namespace

void ManifestContext::log(LogLevel level, const std::string& message) const {
    if (logger) {
        logger->log(level, message);
    }
}

void ManifestContext::count(const std::string& counter) const {
    if (metrics) {
        metrics->incrementCounter(counter);
    }
}

MemoryManifestEntry MemoryManifestEntry::emptyTree() {
    return MemoryManifestEntry(MemTree{std::nullopt, std::nullopt, std::nullopt,
                                       std::make_shared<ChangeSet>()});
}

MemoryManifestEntry MemoryManifestEntry::convertTreenode(const NodeHash& hash) {
    return MemoryManifestEntry(MemTree{hash, hash, std::nullopt, std::make_shared<ChangeSet>()});
}

MemoryManifestEntry MemoryManifestEntry::memTree(std::optional<NodeHash> base,
                                                 std::optional<NodeHash> p1,
                                                 std::optional<NodeHash> p2,
                                                 const ChildMap& children) {
    auto changes = std::make_shared<ChangeSet>();
    for (const auto& [name, entry] : children) {
        changes->entries.emplace(name, entry);
    }
    return MemoryManifestEntry(MemTree{base, p1, p2, std::move(changes)});
}

MemoryManifestEntry MemoryManifestEntry::fromManifestEntry(const ManifestEntry& entry) {
    if (entry.type == EntryType::Tree) {
        return convertTreenode(entry.hash);
    }
    return MemoryManifestEntry(entry.toBlobEntry());
}

TreeManifest MemoryManifestEntry::loadManifest(const ManifestContext& ctx, const NodeHash& hash) {
    ctx.count(metric_names::MANIFEST_LOADS);
    auto manifest = TreeManifest::load(*ctx.store, hash);
    if (!manifest) {
        ctx.log(LogLevel::ERROR, "Manifest " + hash.toHex() + " not found in store");
        throw ManifestMissing(hash);
    }
    ctx.log(LogLevel::DEBUG, "Loaded manifest " + hash.toHex() + " (" +
                                 std::to_string(manifest->size()) + " entries)");
    return std::move(*manifest);
}

bool MemoryManifestEntry::isModified() const {
    const MemTree* t = tree();
    if (!t) {
        return false;
    }
    if (!t->base) {
        return true;
    }
    std::lock_guard<std::mutex> lock(t->changes->mutex);
    return !t->changes->entries.empty();
}

ChangeMap MemoryManifestEntry::changesSnapshot() const {
    const MemTree* t = tree();
    if (!t) {
        return {};
    }
    std::lock_guard<std::mutex> lock(t->changes->mutex);
    return t->changes->entries;
}

// ---------------------------------------------------------------------------
// Materialization
// ---------------------------------------------------------------------------

ChildMap MemoryManifestEntry::childrenNow(const ManifestContext& ctx) const {
    const MemTree* t = tree();
    if (!t) {
        return {};
    }
    ChildMap children;
    if (t->base) {
        TreeManifest manifest = loadManifest(ctx, *t->base);
        for (const auto& entry : manifest.list()) {
            children.emplace(entry.name, fromManifestEntry(entry));
        }
    }
    std::lock_guard<std::mutex> lock(t->changes->mutex);
    for (const auto& [name, change] : t->changes->entries) {
        if (change) {
            children.insert_or_assign(name, *change);
        } else {
            children.erase(name);
        }
    }
    return children;
}

std::future<ChildMap> MemoryManifestEntry::getNewChildren(const ManifestContext& ctx) const {
    MemoryManifestEntry self = *this;
    return ctx.spawn([self, ctx] { return self.childrenNow(ctx); });
}

bool MemoryManifestEntry::isEmptyNow(const ManifestContext& ctx) const {
    if (!isDir()) {
        return false;
    }
    ChildMap children = childrenNow(ctx);
    for (const auto& [name, child] : children) {
        if (!child.isDir()) {
            return false;
        }
    }
    std::vector<std::future<bool>> pending;
    pending.reserve(children.size());
    for (const auto& [name, child] : children) {
        pending.push_back(child.isEmpty(ctx));
    }
    for (bool empty : joinAll(pending)) {
        if (!empty) {
            return false;
        }
    }
    return true;
}

std::future<bool> MemoryManifestEntry::isEmpty(const ManifestContext& ctx) const {
    MemoryManifestEntry self = *this;
    return ctx.spawn([self, ctx] { return self.isEmptyNow(ctx); });
}

// ---------------------------------------------------------------------------
// Save
// ---------------------------------------------------------------------------

BlobEntry MemoryManifestEntry::saveNow(const ManifestContext& ctx, const RepoPath& path) const {
    return *saveLevelNow(ctx, path, true);
}

// Children are saved first; a modified level that ends up with no entries
// is neither written nor listed by its parent. Clean subtrees are kept by
// reference, so nothing below an untouched directory is ever loaded.
std::optional<BlobEntry> MemoryManifestEntry::saveLevelNow(const ManifestContext& ctx,
                                                           const RepoPath& path,
                                                           bool keepEmpty) const {
    if (const BlobEntry* b = blob()) {
        return *b;
    }
    if (isConflict()) {
        ctx.log(LogLevel::DEBUG, "Unresolved conflict at " + describe(path));
        throw UnresolvedConflicts();
    }

    const MemTree& t = *tree();
    if (!isModified()) {
        // Untouched merge result: nothing new to write.
        if (t.p2) {
            throw UnchangedManifest();
        }
        if (path.isRoot()) {
            return BlobEntry::root(*t.base);
        }
        return BlobEntry(path.mpath()->basename(), *t.base, EntryType::Tree);
    }

    ChildMap children = childrenNow(ctx);

    std::vector<ManifestEntry> entries;
    std::vector<MPathElement> names;
    std::vector<std::future<std::optional<BlobEntry>>> pending;
    entries.reserve(children.size());
    for (const auto& item : children) {
        const MemoryManifestEntry& child = item.second;
        if (const BlobEntry* b = child.blob()) {
            entries.push_back(ManifestEntry{item.first, b->hash(), b->type()});
            continue;
        }
        RepoPath childPath = path.extendWithDir(item.first);
        names.push_back(item.first);
        pending.push_back(ctx.spawn([child, ctx, childPath] {
            return child.saveLevelNow(ctx, childPath, false);
        }));
    }
    std::vector<std::optional<BlobEntry>> saved = joinAll(pending);
    for (size_t i = 0; i < saved.size(); ++i) {
        if (saved[i]) {
            entries.push_back(ManifestEntry{names[i], saved[i]->hash(), saved[i]->type()});
        }
    }

    if (entries.empty() && !keepEmpty) {
        ctx.log(LogLevel::DEBUG, "Dropping empty directory " + describe(path));
        return std::nullopt;
    }

    NodeHash hash = ctx.store->put(TreeManifest::serialize(std::move(entries)));
    ctx.count(metric_names::TREE_WRITES);
    ctx.log(LogLevel::DEBUG, "Wrote tree " + hash.toHex() + " for " + describe(path));

    if (path.isRoot()) {
        return BlobEntry::root(hash);
    }
    return BlobEntry(path.mpath()->basename(), hash, EntryType::Tree);
}

std::future<BlobEntry> MemoryManifestEntry::save(const ManifestContext& ctx,
                                                 const RepoPath& path) const {
    MemoryManifestEntry self = *this;
    return ctx.spawn([self, ctx, path] { return self.saveNow(ctx, path); });
}

// ---------------------------------------------------------------------------
// Merge
// ---------------------------------------------------------------------------

MemoryManifestEntry MemoryManifestEntry::mergeNow(const MemoryManifestEntry& other,
                                                  const ManifestContext& ctx,
                                                  const RepoPath& path) const {
    // Pending edits are persisted first so both sides compare as clean trees.
    if (isModified()) {
        BlobEntry saved = saveNow(ctx, path);
        return convertTreenode(saved.hash()).mergeNow(other, ctx, path);
    }
    if (other.isModified()) {
        BlobEntry saved = other.saveNow(ctx, path);
        return mergeNow(convertTreenode(saved.hash()), ctx, path);
    }

    if (isConflict() || other.isConflict()) {
        throw UnresolvedConflicts();
    }

    const BlobEntry* mine = blob();
    const BlobEntry* theirs = other.blob();
    if (mine && theirs && *mine == *theirs) {
        return *this;
    }
    if (mine || theirs) {
        ctx.count(metric_names::MERGE_CONFLICTS);
        ctx.log(LogLevel::DEBUG, "Conflict at " + describe(path));
        return MemoryManifestEntry(ConflictSet{{*this, other}});
    }

    const MemTree& t1 = *tree();
    const MemTree& t2 = *other.tree();
    if (t1.p1 && t1.p2) {
        throw ManifestAlreadyAMerge(*t1.p1, *t1.p2);
    }
    if (t2.p1 && t2.p2) {
        throw ManifestAlreadyAMerge(*t2.p1, *t2.p2);
    }

    // Both sides are clean here, so equal baselines mean equal trees.
    if (t1.base == t2.base) {
        return *this;
    }

    return mergeTrees(childrenNow(ctx), other.childrenNow(ctx), ctx, path, t1.p1, t2.p1);
}

MemoryManifestEntry MemoryManifestEntry::mergeTrees(ChildMap children, ChildMap otherChildren,
                                                    const ManifestContext& ctx,
                                                    const RepoPath& path,
                                                    std::optional<NodeHash> p1,
                                                    std::optional<NodeHash> p2) {
    std::vector<MPathElement> names;
    std::vector<std::future<MemoryManifestEntry>> pending;

    for (auto& item : otherChildren) {
        const MPathElement& name = item.first;
        MemoryManifestEntry theirs = std::move(item.second);
        auto it = children.find(name);
        if (it == children.end()) {
            children.emplace(name, std::move(theirs));
            continue;
        }
        MemoryManifestEntry mine = std::move(it->second);
        children.erase(it);

        RepoPath childPath = path.extendWithDir(name);
        auto task = [mine, theirs, ctx, childPath] {
            return mine.mergeNow(theirs, ctx, childPath);
        };
        names.push_back(name);
        if (mine.isDir() && theirs.isDir()) {
            pending.push_back(ctx.spawn(std::move(task)));
        } else {
            pending.push_back(std::async(std::launch::deferred, std::move(task)));
        }
    }

    std::vector<MemoryManifestEntry> merged = joinAll(pending);
    for (size_t i = 0; i < merged.size(); ++i) {
        children.insert_or_assign(names[i], std::move(merged[i]));
    }

    return memTree(std::nullopt, std::move(p1), std::move(p2), children);
}

std::future<MemoryManifestEntry> MemoryManifestEntry::mergeWithConflicts(
    const MemoryManifestEntry& other, const ManifestContext& ctx, const RepoPath& path) const {
    MemoryManifestEntry self = *this;
    return ctx.spawn([self, other, ctx, path] { return self.mergeNow(other, ctx, path); });
}

// ---------------------------------------------------------------------------
// Navigation and mutation
// ---------------------------------------------------------------------------

std::optional<size_t> MemoryManifestEntry::conflictToMemTree(
    std::optional<MemoryManifestEntry>& slot) {
    const ConflictSet* conflict = slot->conflict();
    if (!conflict) {
        return std::nullopt;
    }

    std::vector<NodeHash> parents;
    for (const auto& candidate : conflict->candidates) {
        const MemTree* t = candidate.tree();
        if (t && !candidate.isModified()) {
            parents.push_back(*t->base);
        } else if (const BlobEntry* b = candidate.blob(); b && b->type() == EntryType::Tree) {
            parents.push_back(b->hash());
        }
    }

    std::optional<NodeHash> p1;
    std::optional<NodeHash> p2;
    if (parents.size() > 0) p1 = parents[0];
    if (parents.size() > 1) p2 = parents[1];
    slot = MemoryManifestEntry(
        MemTree{std::nullopt, std::move(p1), std::move(p2), std::make_shared<ChangeSet>()});
    return parents.size();
}

void MemoryManifestEntry::logCoercion(const ManifestContext& ctx, const std::string& where,
                                      size_t treeParents) {
    ctx.count(metric_names::CONFLICT_COERCIONS);
    ctx.log(LogLevel::WARN, "Replacing conflict at " + where + " with a directory (" +
                                std::to_string(treeParents) + " tree parents)");
    if (treeParents > 2) {
        ctx.log(LogLevel::WARN, "Dropping " + std::to_string(treeParents - 2) +
                                    " tree candidates at " + where);
    }
}

std::optional<MemoryManifestEntry> MemoryManifestEntry::findMutNow(
    const std::vector<MPathElement>& path, size_t idx, const ManifestContext& ctx) const {
    if (idx == path.size()) {
        return *this;
    }
    const MemTree* t = tree();
    if (!t) {
        return std::nullopt;
    }
    const MPathElement& element = path[idx];

    bool known;
    {
        std::lock_guard<std::mutex> lock(t->changes->mutex);
        known = t->changes->entries.count(element) > 0;
    }
    if (!known && t->base) {
        ctx.count(metric_names::MANIFEST_LOOKUPS);
        TreeManifest manifest = loadManifest(ctx, *t->base);
        if (auto found = manifest.lookup(element)) {
            std::lock_guard<std::mutex> lock(t->changes->mutex);
            // A concurrent change recorded meanwhile wins over the baseline.
            t->changes->entries.emplace(element, fromManifestEntry(*found));
        }
    }

    std::optional<MemoryManifestEntry> child;
    std::optional<size_t> coerced;
    {
        std::lock_guard<std::mutex> lock(t->changes->mutex);
        auto& slot = t->changes->entries.try_emplace(element, emptyTree()).first->second;
        if (!slot) {
            slot = emptyTree();
        }
        coerced = conflictToMemTree(slot);
        child = *slot;
    }
    if (coerced) {
        logCoercion(ctx, joinElements(path, idx + 1), *coerced);
    }
    return child->findMutNow(path, idx + 1, ctx);
}

std::future<std::optional<MemoryManifestEntry>> MemoryManifestEntry::findMut(
    std::vector<MPathElement> path, const ManifestContext& ctx) const {
    MemoryManifestEntry self = *this;
    return ctx.spawn([self, path = std::move(path), ctx] { return self.findMutNow(path, 0, ctx); });
}

std::optional<MemoryManifestEntry> MemoryManifestEntry::locateNow(
    const std::vector<MPathElement>& path, size_t idx, const ManifestContext& ctx) const {
    if (idx == path.size()) {
        return *this;
    }
    const MemTree* t = tree();
    if (!t) {
        return std::nullopt;
    }
    const MPathElement& element = path[idx];

    std::optional<MemoryManifestEntry> child;
    {
        std::lock_guard<std::mutex> lock(t->changes->mutex);
        auto it = t->changes->entries.find(element);
        if (it != t->changes->entries.end()) {
            if (!it->second) {
                return std::nullopt;
            }
            child = *it->second;
        }
    }
    if (!child) {
        if (!t->base) {
            return std::nullopt;
        }
        ctx.count(metric_names::MANIFEST_LOOKUPS);
        auto found = loadManifest(ctx, *t->base).lookup(element);
        if (!found) {
            return std::nullopt;
        }
        child = fromManifestEntry(*found);
    }
    return child->locateNow(path, idx + 1, ctx);
}

std::future<std::optional<MemoryManifestEntry>> MemoryManifestEntry::locate(
    std::vector<MPathElement> path, const ManifestContext& ctx) const {
    MemoryManifestEntry self = *this;
    return ctx.spawn([self, path = std::move(path), ctx] { return self.locateNow(path, 0, ctx); });
}

void MemoryManifestEntry::change(const MPathElement& name,
                                 const std::optional<BlobEntry>& entry) const {
    const MemTree* t = tree();
    if (!t) {
        throw NotADirectory();
    }
    std::lock_guard<std::mutex> lock(t->changes->mutex);
    if (entry) {
        t->changes->entries.insert_or_assign(name, MemoryManifestEntry(*entry));
    } else {
        t->changes->entries.insert_or_assign(name, std::nullopt);
    }
}

std::vector<RepoPath> MemoryManifestEntry::conflicts(const RepoPath& path) const {
    if (isConflict()) {
        return {path};
    }
    std::vector<RepoPath> found;
    for (const auto& [name, change] : changesSnapshot()) {
        if (!change) {
            continue;
        }
        RepoPath childPath = change->isDir()
                                 ? path.extendWithDir(name)
                                 : RepoPath::file(MPath::joinOpt(path.mpath(), name));
        auto below = change->conflicts(childPath);
        found.insert(found.end(), below.begin(), below.end());
    }
    return found;
}

} // namespace mosaic
