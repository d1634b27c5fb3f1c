#include "../include/object_codec.h"
#include "../include/constants.h"
#include "../include/errors.h"
#include "../include/sha1_utils.h"

#include <algorithm>
#include <charconv>
#include <iterator>
#include <set>

std::string_view kindToString(ObjectKind kind) {
    switch (kind) {
        case ObjectKind::BLOB: return "blob";
        case ObjectKind::TREE: return "tree";
        case ObjectKind::COMMIT: return "commit";
        case ObjectKind::TAG: return "tag";
    }
    return "unknown";
}

std::optional<ObjectKind> kindFromString(std::string_view name) {
    if (name == "blob") return ObjectKind::BLOB;
    if (name == "tree") return ObjectKind::TREE;
    if (name == "commit") return ObjectKind::COMMIT;
    if (name == "tag") return ObjectKind::TAG;
    return std::nullopt;
}

std::span<const std::byte> asBytes(std::string_view text) {
    return std::as_bytes(std::span{text.data(), text.size()});
}

std::string bytesToString(std::span<const std::byte> bytes) {
    return std::string(reinterpret_cast<const char*>(bytes.data()), bytes.size());
}

std::vector<std::byte> encodeObject(ObjectKind kind, std::span<const std::byte> payload) {
    const std::string header = std::string(kindToString(kind)) + " " + std::to_string(payload.size()) + '\0';
    auto headerBytes = asBytes(header);

    std::vector<std::byte> encoded;
    encoded.reserve(headerBytes.size() + payload.size());
    encoded.insert(encoded.end(), headerBytes.begin(), headerBytes.end());
    encoded.insert(encoded.end(), payload.begin(), payload.end());
    return encoded;
}

std::string addressOf(ObjectKind kind, std::span<const std::byte> payload) {
    return calculateSha1Hex(encodeObject(kind, payload));
}

RawObject decodeObject(std::span<const std::byte> encoded) {
    auto spacePos = std::find(encoded.begin(), encoded.end(), std::byte{' '});
    auto nullPos = std::find(encoded.begin(), encoded.end(), std::byte{0});
    if (nullPos == encoded.end() || spacePos == encoded.end() || spacePos > nullPos) {
        throw MalformedObject("missing '<kind> <size>\\0' header");
    }

    const std::string kindName = bytesToString(std::span<const std::byte>(encoded.begin(), spacePos));
    auto kind = kindFromString(kindName);
    if (!kind) {
        throw MalformedObject("unknown object kind '" + kindName + "'");
    }

    const std::string digits = bytesToString(std::span<const std::byte>(spacePos + 1, nullPos));
    if (digits.empty() || !std::all_of(digits.begin(), digits.end(), [](char c) { return c >= '0' && c <= '9'; }) ||
        (digits.size() > 1 && digits.front() == '0')) {
        throw MalformedObject("invalid size field '" + digits + "'");
    }
    size_t declared = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), declared);
    if (ec != std::errc{}) {
        throw MalformedObject("size field '" + digits + "' out of range");
    }

    auto payload = std::span<const std::byte>(nullPos + 1, encoded.end());
    if (payload.size() != declared) {
        throw MalformedObject("declared size " + digits + " but payload has " +
                              std::to_string(payload.size()) + " bytes");
    }
    return RawObject{*kind, std::vector<std::byte>(payload.begin(), payload.end())};
}

ObjectKind kindForMode(std::string_view mode) {
    if (mode == constants::MODE_TREE) return ObjectKind::TREE;
    if (mode == constants::MODE_GITLINK) return ObjectKind::COMMIT;
    return ObjectKind::BLOB;
}

bool treeEntryLess(const TreeEntry& lhs, const TreeEntry& rhs) {
    std::string left = lhs.filename;
    std::string right = rhs.filename;
    if (lhs.mode == constants::MODE_TREE) left.push_back('/');
    if (rhs.mode == constants::MODE_TREE) right.push_back('/');
    // std::string compares through char_traits<char>, which orders as unsigned bytes.
    return left < right;
}

std::vector<std::byte> encodeTree(std::vector<TreeEntry> entries) {
    std::sort(entries.begin(), entries.end(), treeEntryLess);

    std::vector<std::byte> treeContent;
    std::set<std::string> names;
    for (const auto& entry : entries) {
        if (entry.filename.empty() || entry.filename.find_first_of(std::string("/\0", 2)) != std::string::npos) {
            throw MalformedObject("invalid tree entry name '" + entry.filename + "'");
        }
        if (entry.mode.empty() || entry.sha1Bytes.size() != constants::SHA1_RAW_LENGTH) {
            throw MalformedObject("incomplete tree entry '" + entry.filename + "'");
        }
        // A blob and a tree of the same name need not be neighbours in tree order.
        if (!names.insert(entry.filename).second) {
            throw MalformedObject("duplicate tree entry '" + entry.filename + "'");
        }

        std::string entryStr = entry.mode + " " + entry.filename + '\0';
        std::transform(entryStr.begin(), entryStr.end(), std::back_inserter(treeContent),
                       [](char c) { return std::byte(c); });
        treeContent.insert(treeContent.end(), entry.sha1Bytes.begin(), entry.sha1Bytes.end());
    }
    return treeContent;
}

std::vector<TreeEntry> parseTree(std::span<const std::byte> treeContent) {
    std::vector<TreeEntry> entries;
    auto current = treeContent.begin();

    while (current != treeContent.end()) {
        TreeEntry entry;

        auto spacePos = std::find(current, treeContent.end(), std::byte{' '});
        if (spacePos == treeContent.end() || spacePos == current) {
            throw MalformedObject("tree entry without mode");
        }
        entry.mode = bytesToString(std::span<const std::byte>(current, spacePos));

        auto nullPos = std::find(spacePos + 1, treeContent.end(), std::byte{0});
        if (nullPos == treeContent.end() || nullPos == spacePos + 1) {
            throw MalformedObject("tree entry without name terminator");
        }
        entry.filename = bytesToString(std::span<const std::byte>(spacePos + 1, nullPos));

        auto shaStart = nullPos + 1;
        if (std::distance(shaStart, treeContent.end()) < static_cast<std::ptrdiff_t>(constants::SHA1_RAW_LENGTH)) {
            throw MalformedObject("tree entry '" + entry.filename + "' truncated");
        }
        auto shaEnd = shaStart + constants::SHA1_RAW_LENGTH;
        entry.sha1Bytes.assign(shaStart, shaEnd);

        entries.push_back(std::move(entry));
        current = shaEnd;
    }

    return entries;
}

std::vector<std::byte> encodeCommit(const CommitData& commit) {
    std::string text = "tree " + commit.treeSha + "\n";
    for (const auto& parent : commit.parentShas) {
        text += "parent " + parent + "\n";
    }
    text += "author " + commit.author + "\n";
    text += "committer " + commit.committer + "\n";
    text += "\n";
    text += commit.message;

    auto bytes = asBytes(text);
    return std::vector<std::byte>(bytes.begin(), bytes.end());
}

CommitData parseCommit(std::span<const std::byte> commitContent) {
    const std::string text = bytesToString(commitContent);
    CommitData commit;
    bool haveTree = false;

    size_t pos = 0;
    while (pos < text.size()) {
        size_t end = text.find('\n', pos);
        if (end == std::string::npos) {
            end = text.size();
        }
        const std::string_view line(text.data() + pos, end - pos);
        pos = end + 1;

        if (line.empty()) {
            if (pos <= text.size()) {
                commit.message = text.substr(pos);
            }
            break;
        }
        if (line.front() == ' ') {
            continue; // Continuation of a multi-line header such as gpgsig.
        }

        const size_t space = line.find(' ');
        const std::string_view key = line.substr(0, space);
        const std::string_view value = space == std::string_view::npos ? std::string_view{} : line.substr(space + 1);

        if (key == "tree") {
            if (haveTree) {
                throw MalformedObject("commit has more than one tree line");
            }
            commit.treeSha = normalizeSha1Hex(value);
            haveTree = true;
        } else if (key == "parent") {
            commit.parentShas.push_back(normalizeSha1Hex(value));
        } else if (key == "author") {
            commit.author = std::string(value);
        } else if (key == "committer") {
            commit.committer = std::string(value);
        }
    }

    if (!haveTree) {
        throw MalformedObject("commit has no tree line");
    }
    return commit;
}

std::string formatModeForDisplay(std::string_view mode) {
    if (mode.length() < 6) {
        return std::string(6 - mode.length(), '0') + std::string(mode);
    }
    return std::string(mode);
}
