#pragma once

#include "manifest/path.h"
#include "manifest/tree_manifest.h"
#include "utilities/content_store.hpp"
#include <optional>
#include <vector>

namespace mosaic {

enum class EntryStatus { Added, Deleted, Modified };

const char* entryStatusName(EntryStatus status);

/// One difference between two persisted trees.
struct ChangedEntry {
    std::optional<MPath> path;
    EntryStatus status;
    std::optional<ManifestEntry> to;   ///< absent for Deleted
    std::optional<ManifestEntry> from; ///< absent for Added
};

/**
 * @brief List every path that differs between the persisted trees @p to and
 * @p from.
 *
 * Subtrees with equal hashes are skipped without being loaded. Added and
 * deleted directories are reported together with everything below them.
 * A name whose type changed is reported as Added plus Deleted. Parents are
 * reported before their children.
 *
 * @throws ManifestMissing if a tree on the way is not in @p store.
 */
std::vector<ChangedEntry> diffManifests(const ContentStore& store, const NodeHash& to,
                                        const NodeHash& from);

} // namespace mosaic
