#include "manifest/manifest_diff.h"
#include "manifest/errors.h"

namespace mosaic {

const char* entryStatusName(EntryStatus status) {
    switch (status) {
    case EntryStatus::Added:
        return "A";
    case EntryStatus::Deleted:
        return "D";
    case EntryStatus::Modified:
        return "M";
    }
    return "?";
}

namespace {

TreeManifest loadOrThrow(const ContentStore& store, const NodeHash& hash) {
    auto manifest = TreeManifest::load(store, hash);
    if (!manifest) {
        throw ManifestMissing(hash);
    }
    return std::move(*manifest);
}

/// Report @p entry and, for a tree, everything beneath it.
void expand(const ContentStore& store, const MPath& path, const ManifestEntry& entry,
            EntryStatus status, std::vector<ChangedEntry>& out) {
    ChangedEntry change{path, status, std::nullopt, std::nullopt};
    if (status == EntryStatus::Added) {
        change.to = entry;
    } else {
        change.from = entry;
    }
    out.push_back(std::move(change));

    if (entry.type != EntryType::Tree) {
        return;
    }
    for (const auto& child : loadOrThrow(store, entry.hash).list()) {
        expand(store, path.join(child.name), child, status, out);
    }
}

void diffTrees(const ContentStore& store, const std::optional<MPath>& prefix, const NodeHash& to,
               const NodeHash& from, std::vector<ChangedEntry>& out) {
    if (to == from) {
        return;
    }
    TreeManifest toTree = loadOrThrow(store, to);
    TreeManifest fromTree = loadOrThrow(store, from);
    const auto& left = toTree.list();
    const auto& right = fromTree.list();

    size_t i = 0;
    size_t j = 0;
    while (i < left.size() || j < right.size()) {
        if (j == right.size() || (i < left.size() && left[i].name < right[j].name)) {
            expand(store, MPath::joinOpt(prefix, left[i].name), left[i], EntryStatus::Added, out);
            ++i;
            continue;
        }
        if (i == left.size() || right[j].name < left[i].name) {
            expand(store, MPath::joinOpt(prefix, right[j].name), right[j], EntryStatus::Deleted,
                   out);
            ++j;
            continue;
        }

        const ManifestEntry& l = left[i];
        const ManifestEntry& r = right[j];
        MPath path = MPath::joinOpt(prefix, l.name);
        if (l.type != r.type) {
            expand(store, path, l, EntryStatus::Added, out);
            expand(store, path, r, EntryStatus::Deleted, out);
        } else if (l.hash != r.hash) {
            out.push_back(ChangedEntry{path, EntryStatus::Modified, l, r});
            if (l.type == EntryType::Tree) {
                diffTrees(store, path, l.hash, r.hash, out);
            }
        }
        ++i;
        ++j;
    }
}

} // namespace

std::vector<ChangedEntry> diffManifests(const ContentStore& store, const NodeHash& to,
                                        const NodeHash& from) {
    std::vector<ChangedEntry> out;
    diffTrees(store, std::nullopt, to, from, out);
    return out;
}

} // namespace mosaic
