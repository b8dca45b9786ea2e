#pragma once

#include "utilities/node_hash.hpp"
#include <stdexcept>
#include <string>

namespace mosaic {

enum class ManifestErrorKind {
    ManifestMissing,
    PathNotFound,
    NotADirectory,
    UnresolvedConflicts,
    UnchangedManifest,
    ManifestAlreadyAMerge,
    InvalidPath,
    ManifestCorrupt
};

const char* errorKindName(ManifestErrorKind kind);

/**
 * @brief Base of every error raised by the manifest engine.
 *
 * None of these are retried internally. A failure aborts the subtree
 * operation that raised it; sibling subtrees already in flight still finish.
 */
class ManifestException : public std::runtime_error {
public:
    ManifestException(ManifestErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}

    ManifestErrorKind kind() const { return kind_; }

private:
    ManifestErrorKind kind_;
};

/// A baseline hash does not resolve in the content store.
class ManifestMissing : public ManifestException {
public:
    explicit ManifestMissing(const NodeHash& hash)
        : ManifestException(ManifestErrorKind::ManifestMissing,
                            "Manifest missing: " + hash.toHex()),
          hash_(hash) {}
    const NodeHash& hash() const { return hash_; }

private:
    NodeHash hash_;
};

/// Navigation could not reach the addressed location.
class PathNotFound : public ManifestException {
public:
    explicit PathNotFound(const std::string& path)
        : ManifestException(ManifestErrorKind::PathNotFound,
                            "Path not found: " + path),
          path_(path) {}
    const std::string& path() const { return path_; }

private:
    std::string path_;
};

/// A directory-only mutation was attempted on a non-tree entry.
class NotADirectory : public ManifestException {
public:
    NotADirectory()
        : ManifestException(ManifestErrorKind::NotADirectory,
                            "Cannot change children of a non-directory entry") {}
};

/// Save or merge reached an unresolved conflict.
class UnresolvedConflicts : public ManifestException {
public:
    UnresolvedConflicts()
        : ManifestException(ManifestErrorKind::UnresolvedConflicts,
                            "Manifest contains unresolved conflicts") {}
};

/// A merge-tagged tree with no new content was asked to save itself.
class UnchangedManifest : public ManifestException {
public:
    UnchangedManifest()
        : ManifestException(ManifestErrorKind::UnchangedManifest,
                            "Merge result has no changes to save") {}
};

/// One side of a merge already carries two parents.
class ManifestAlreadyAMerge : public ManifestException {
public:
    ManifestAlreadyAMerge(const NodeHash& p1, const NodeHash& p2)
        : ManifestException(ManifestErrorKind::ManifestAlreadyAMerge,
                            "Manifest is already a merge of " + p1.toHex() +
                                " and " + p2.toHex()),
          p1_(p1), p2_(p2) {}
    const NodeHash& p1() const { return p1_; }
    const NodeHash& p2() const { return p2_; }

private:
    NodeHash p1_;
    NodeHash p2_;
};

/// A path or path component is not representable in a manifest.
class InvalidPath : public ManifestException {
public:
    explicit InvalidPath(const std::string& detail)
        : ManifestException(ManifestErrorKind::InvalidPath,
                            "Invalid path: " + detail) {}
};

/// Stored bytes do not decode as a tree listing.
class ManifestCorrupt : public ManifestException {
public:
    explicit ManifestCorrupt(const std::string& detail)
        : ManifestException(ManifestErrorKind::ManifestCorrupt,
                            "Corrupt manifest: " + detail) {}
};

} // namespace mosaic
