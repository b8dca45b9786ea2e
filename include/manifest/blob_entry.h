#pragma once

#include "manifest/path.h"
#include "utilities/node_hash.hpp"
#include <optional>
#include <string>

namespace mosaic {

enum class EntryType { File, Executable, Symlink, Tree };

/** Suffix written after the hash in a tree listing ("" for plain files). */
const char* entryTypeSuffix(EntryType type);

/**
 * @brief Reference to an entry that is already persisted in the store.
 *
 * Carries what a parent listing needs: the name, the hash and the type.
 * The root tree has no name.
 */
class BlobEntry {
public:
    BlobEntry(MPathElement name, NodeHash hash, EntryType type)
        : name_(std::move(name)), hash_(hash), type_(type) {}

    static BlobEntry root(const NodeHash& hash) { return BlobEntry(std::nullopt, hash); }

    const std::optional<MPathElement>& name() const { return name_; }
    const NodeHash& hash() const { return hash_; }
    EntryType type() const { return type_; }

    /** Same persisted leaf: equal hash and type. The name is not compared. */
    bool operator==(const BlobEntry& other) const {
        return hash_ == other.hash_ && type_ == other.type_;
    }
    bool operator!=(const BlobEntry& other) const { return !(*this == other); }

private:
    BlobEntry(std::optional<MPathElement> name, const NodeHash& hash)
        : name_(std::move(name)), hash_(hash), type_(EntryType::Tree) {}

    std::optional<MPathElement> name_;
    NodeHash hash_;
    EntryType type_;
};

} // namespace mosaic
