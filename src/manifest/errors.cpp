#include "manifest/errors.h"

namespace mosaic {

const char* errorKindName(ManifestErrorKind kind) {
    switch (kind) {
    case ManifestErrorKind::ManifestMissing:
        return "ManifestMissing";
    case ManifestErrorKind::PathNotFound:
        return "PathNotFound";
    case ManifestErrorKind::NotADirectory:
        return "NotADirectory";
    case ManifestErrorKind::UnresolvedConflicts:
        return "UnresolvedConflicts";
    case ManifestErrorKind::UnchangedManifest:
        return "UnchangedManifest";
    case ManifestErrorKind::ManifestAlreadyAMerge:
        return "ManifestAlreadyAMerge";
    case ManifestErrorKind::InvalidPath:
        return "InvalidPath";
    case ManifestErrorKind::ManifestCorrupt:
        return "ManifestCorrupt";
    }
    return "Unknown";
}

} // namespace mosaic
