#include "manifest/memory_root_manifest.h"
#include "manifest/errors.h"
#include <chrono>

namespace mosaic {

std::future<MemoryRootManifest> MemoryRootManifest::create(ManifestContext ctx,
                                                           std::optional<NodeHash> p1,
                                                           std::optional<NodeHash> p2) {
    return ctx.spawn([ctx, p1, p2]() -> MemoryRootManifest {
        if (p1 && p2) {
            ctx.log(LogLevel::INFO, "Merging manifests " + p1->toHex() + " and " + p2->toHex());
            MemoryRootManifest left(ctx, MemoryManifestEntry::convertTreenode(*p1));
            MemoryRootManifest right(ctx, MemoryManifestEntry::convertTreenode(*p2));
            return left.merge(right).get();
        }
        if (p1 || p2) {
            return MemoryRootManifest(ctx, MemoryManifestEntry::convertTreenode(p1 ? *p1 : *p2));
        }
        return MemoryRootManifest(ctx, MemoryManifestEntry::emptyTree());
    });
}

std::future<void> MemoryRootManifest::changeEntry(const MPath& path,
                                                  std::optional<BlobEntry> entry) const {
    MemoryRootManifest self = *this;
    return ctx_.spawn([self, path, entry] {
        auto [dir, name] = path.splitDirname();
        std::optional<MemoryManifestEntry> target;
        if (dir) {
            target = self.root_.findMut(dir->elements(), self.ctx_).get();
        } else {
            target = self.root_;
        }
        if (!target) {
            self.ctx_.log(LogLevel::DEBUG, "No directory on the way to " + path.toString());
            throw PathNotFound(path.toString());
        }
        target->change(name, entry);
    });
}

std::future<MemoryRootManifest> MemoryRootManifest::merge(const MemoryRootManifest& other) const {
    MemoryRootManifest self = *this;
    return ctx_.spawn([self, other]() -> MemoryRootManifest {
        try {
            MemoryManifestEntry merged = self.root_
                                             .mergeWithConflicts(other.root_, self.ctx_,
                                                                 RepoPath::root())
                                             .get();
            std::vector<RepoPath> unresolved = merged.conflicts(RepoPath::root());
            self.ctx_.log(LogLevel::INFO, "Merge finished with " +
                                              std::to_string(unresolved.size()) + " conflicts");
            return MemoryRootManifest(self.ctx_, std::move(merged));
        } catch (const ManifestException& e) {
            self.ctx_.log(LogLevel::ERROR, std::string("Merge failed: ") + e.what());
            throw;
        }
    });
}

std::future<std::optional<MemoryManifestEntry>> MemoryRootManifest::locate(const MPath& path) const {
    return root_.locate(path.elements(), ctx_);
}

std::future<BlobEntry> MemoryRootManifest::save() const {
    MemoryRootManifest self = *this;
    return ctx_.spawn([self]() -> BlobEntry {
        auto start = std::chrono::steady_clock::now();
        try {
            BlobEntry saved = self.root_.save(self.ctx_, RepoPath::root()).get();
            std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - start;
            if (self.ctx_.metrics) {
                self.ctx_.metrics->observe(metric_names::SAVE_SECONDS, elapsed.count());
            }
            self.ctx_.log(LogLevel::INFO, "Saved manifest " + saved.hash().toHex());
            return saved;
        } catch (const ManifestException& e) {
            self.ctx_.log(LogLevel::ERROR, std::string("Save failed: ") + e.what());
            throw;
        }
    });
}

std::vector<RepoPath> MemoryRootManifest::conflicts() const {
    return root_.conflicts(RepoPath::root());
}

} // namespace mosaic
