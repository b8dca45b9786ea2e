#include "manifest/path.h"
#include "manifest/errors.h"

namespace mosaic {

MPathElement::MPathElement(std::string name) : name_(std::move(name)) {
    if (name_.empty()) {
        throw InvalidPath("empty path component");
    }
    if (name_.find_first_of(std::string("/\n\0", 3)) != std::string::npos) {
        throw InvalidPath("component contains '/', NUL or newline: " + name_);
    }
}

MPath::MPath(const std::string& path) {
    if (path.empty()) {
        throw InvalidPath("empty path");
    }
    size_t start = 0;
    while (true) {
        size_t slash = path.find('/', start);
        std::string part = path.substr(start, slash == std::string::npos ? std::string::npos : slash - start);
        if (part.empty()) {
            throw InvalidPath("empty component in '" + path + "'");
        }
        elements_.emplace_back(std::move(part));
        if (slash == std::string::npos) break;
        start = slash + 1;
    }
}

MPath::MPath(std::vector<MPathElement> elements) : elements_(std::move(elements)) {
    if (elements_.empty()) {
        throw InvalidPath("empty path");
    }
}

std::pair<std::optional<MPath>, MPathElement> MPath::splitDirname() const {
    if (elements_.size() == 1) {
        return {std::nullopt, elements_.front()};
    }
    std::vector<MPathElement> dir(elements_.begin(), elements_.end() - 1);
    return {MPath(std::move(dir)), elements_.back()};
}

MPath MPath::join(const MPathElement& element) const {
    std::vector<MPathElement> out = elements_;
    out.push_back(element);
    return MPath(std::move(out));
}

MPath MPath::joinOpt(const std::optional<MPath>& base, const MPathElement& element) {
    if (base) return base->join(element);
    return MPath(std::vector<MPathElement>{element});
}

std::string MPath::toString() const {
    std::string out;
    for (const auto& e : elements_) {
        if (!out.empty()) out += '/';
        out += e.str();
    }
    return out;
}

RepoPath RepoPath::extendWithDir(const MPathElement& element) const {
    // Files have no children; merge and save only ever descend through trees.
    return RepoPath::dir(MPath::joinOpt(path_, element));
}

std::string RepoPath::toString() const {
    return path_ ? path_->toString() : std::string();
}

} // namespace mosaic
