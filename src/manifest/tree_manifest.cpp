#include "manifest/tree_manifest.h"
#include "manifest/errors.h"
#include <algorithm>

namespace mosaic {

const char* entryTypeSuffix(EntryType type) {
    switch (type) {
    case EntryType::File:
        return "";
    case EntryType::Executable:
        return "x";
    case EntryType::Symlink:
        return "l";
    case EntryType::Tree:
        return "t";
    }
    return "";
}

static EntryType parseTypeSuffix(const std::string& suffix) {
    if (suffix.empty()) return EntryType::File;
    if (suffix == "x") return EntryType::Executable;
    if (suffix == "l") return EntryType::Symlink;
    if (suffix == "t") return EntryType::Tree;
    throw ManifestCorrupt("unknown entry type '" + suffix + "'");
}

std::optional<TreeManifest> TreeManifest::load(const ContentStore& store, const NodeHash& hash) {
    auto raw = store.get(hash);
    if (!raw) {
        return std::nullopt;
    }
    return parse(*raw);
}

TreeManifest TreeManifest::parse(const std::vector<std::byte>& raw) {
    std::string text(reinterpret_cast<const char*>(raw.data()), raw.size());
    std::vector<ManifestEntry> entries;

    size_t offset = 0;
    while (offset < text.size()) {
        size_t nl = text.find('\n', offset);
        if (nl == std::string::npos) {
            throw ManifestCorrupt("missing trailing newline");
        }
        std::string line = text.substr(offset, nl - offset);
        offset = nl + 1;

        size_t nul = line.find('\0');
        if (nul == std::string::npos) {
            throw ManifestCorrupt("line without NUL separator");
        }
        std::string rest = line.substr(nul + 1);
        if (rest.size() < utils::DIGEST_SIZE * 2) {
            throw ManifestCorrupt("truncated hash");
        }

        std::optional<MPathElement> name;
        try {
            name.emplace(line.substr(0, nul));
        } catch (const InvalidPath& e) {
            throw ManifestCorrupt(e.what());
        }
        NodeHash hash;
        try {
            hash = NodeHash::fromHex(rest.substr(0, utils::DIGEST_SIZE * 2));
        } catch (const std::runtime_error& e) {
            throw ManifestCorrupt(e.what());
        }
        EntryType type = parseTypeSuffix(rest.substr(utils::DIGEST_SIZE * 2));

        if (!entries.empty() && !(entries.back().name < *name)) {
            throw ManifestCorrupt("entries out of order at '" + name->str() + "'");
        }
        entries.push_back(ManifestEntry{*name, hash, type});
    }
    return TreeManifest(std::move(entries));
}

std::vector<std::byte> TreeManifest::serialize(std::vector<ManifestEntry> entries) {
    std::sort(entries.begin(), entries.end(),
              [](const ManifestEntry& a, const ManifestEntry& b) { return a.name < b.name; });

    std::string text;
    for (const auto& e : entries) {
        text += e.name.str();
        text += '\0';
        text += e.hash.toHex();
        text += entryTypeSuffix(e.type);
        text += '\n';
    }
    std::vector<std::byte> out(text.size());
    std::transform(text.begin(), text.end(), out.begin(), [](char c) { return std::byte(c); });
    return out;
}

std::optional<ManifestEntry> TreeManifest::lookup(const MPathElement& name) const {
    auto it = std::lower_bound(entries_.begin(), entries_.end(), name,
                               [](const ManifestEntry& e, const MPathElement& n) { return e.name < n; });
    if (it != entries_.end() && it->name == name) {
        return *it;
    }
    return std::nullopt;
}

} // namespace mosaic
