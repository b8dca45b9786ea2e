#pragma once

#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace mosaic {

/**
 * @brief One component of a repository path.
 *
 * Never empty; never contains '/', NUL or newline, since those delimit the
 * serialized tree format.
 */
class MPathElement {
public:
    /** @throws InvalidPath */
    explicit MPathElement(std::string name);

    const std::string& str() const { return name_; }

    bool operator==(const MPathElement& other) const { return name_ == other.name_; }
    bool operator!=(const MPathElement& other) const { return name_ != other.name_; }
    bool operator<(const MPathElement& other) const { return name_ < other.name_; }

private:
    std::string name_;
};

/**
 * @brief Non-empty path below the repository root, e.g. "dir/sub/file".
 */
class MPath {
public:
    /** @throws InvalidPath for empty paths or empty components. */
    explicit MPath(const std::string& path);
    /** @throws InvalidPath if @p elements is empty. */
    explicit MPath(std::vector<MPathElement> elements);

    const std::vector<MPathElement>& elements() const { return elements_; }
    size_t numComponents() const { return elements_.size(); }
    const MPathElement& basename() const { return elements_.back(); }

    /** Directory part (absent for a top-level name) and final component. */
    std::pair<std::optional<MPath>, MPathElement> splitDirname() const;

    MPath join(const MPathElement& element) const;
    static MPath joinOpt(const std::optional<MPath>& base, const MPathElement& element);

    std::string toString() const;

    bool operator==(const MPath& other) const { return elements_ == other.elements_; }
    bool operator<(const MPath& other) const { return elements_ < other.elements_; }

private:
    std::vector<MPathElement> elements_;
};

/**
 * @brief Location of an entry: the root, a directory, or a file.
 */
class RepoPath {
public:
    enum class Kind { Root, Dir, File };

    static RepoPath root() { return RepoPath(Kind::Root, std::nullopt); }
    static RepoPath dir(MPath path) { return RepoPath(Kind::Dir, std::move(path)); }
    static RepoPath file(MPath path) { return RepoPath(Kind::File, std::move(path)); }

    Kind kind() const { return kind_; }
    bool isRoot() const { return kind_ == Kind::Root; }
    const std::optional<MPath>& mpath() const { return path_; }

    /** Descend into a child directory. */
    RepoPath extendWithDir(const MPathElement& element) const;

    /** Empty string for the root. */
    std::string toString() const;

    bool operator==(const RepoPath& other) const {
        return kind_ == other.kind_ && path_ == other.path_;
    }

private:
    RepoPath(Kind kind, std::optional<MPath> path) : kind_(kind), path_(std::move(path)) {}

    Kind kind_;
    std::optional<MPath> path_;
};

} // namespace mosaic
