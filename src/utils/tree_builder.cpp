#include "../include/tree_builder.h"
#include "../include/constants.h"
#include "../include/errors.h"
#include "../include/sha1_utils.h"

#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <stdexcept>

namespace {

// A directory of the tree being assembled. Children are owned by their parent;
// nothing points back up, and objects are written from the leaves upward.
struct DirectoryNode {
    std::map<std::string, std::unique_ptr<DirectoryNode>> subdirectories;
    std::map<std::string, const PathEntry*> files;
};

std::vector<std::string> splitPath(const std::string& path) {
    if (path.empty() || path.front() == '/') {
        throw MalformedObject("invalid path '" + path + "'");
    }
    std::vector<std::string> components;
    size_t start = 0;
    while (start <= path.size()) {
        size_t end = path.find('/', start);
        if (end == std::string::npos) end = path.size();
        std::string component = path.substr(start, end - start);
        // A single trailing slash is tolerated ("dir/").
        if (component.empty() && end == path.size() && !components.empty()) break;
        if (component.empty() || component == "." || component == "..") {
            throw MalformedObject("invalid path '" + path + "'");
        }
        components.push_back(std::move(component));
        start = end + 1;
    }
    return components;
}

DirectoryNode& descend(DirectoryNode& node, const std::string& name, const std::string& path) {
    if (node.files.count(name) != 0) {
        throw MalformedObject("'" + path + "' uses a file as a directory");
    }
    auto& child = node.subdirectories[name];
    if (!child) {
        child = std::make_unique<DirectoryNode>();
    }
    return *child;
}

// Writes the blobs and subtrees of `node` and then the node itself.
std::string writeDirectory(const ObjectStore& store, const DirectoryNode& node) {
    std::vector<TreeEntry> entries;
    entries.reserve(node.subdirectories.size() + node.files.size());

    for (const auto& [name, child] : node.subdirectories) {
        const std::string childSha = writeDirectory(store, *child);
        entries.push_back({std::string(constants::MODE_TREE), name, hexToBytes(childSha)});
    }
    for (const auto& [name, file] : node.files) {
        const std::string blobSha = store.put(ObjectKind::BLOB, file->content);
        const std::string mode = file->mode.empty() ? std::string(constants::MODE_BLOB) : file->mode;
        entries.push_back({mode, name, hexToBytes(blobSha)});
    }

    return store.put(ObjectKind::TREE, encodeTree(std::move(entries)));
}

} // namespace

std::string buildTree(const ObjectStore& store, const std::vector<PathEntry>& entries) {
    if (entries.empty()) {
        throw EmptyTree();
    }

    DirectoryNode root;
    for (const auto& entry : entries) {
        const auto components = splitPath(entry.path);
        DirectoryNode* node = &root;
        for (size_t i = 0; i + 1 < components.size(); ++i) {
            node = &descend(*node, components[i], entry.path);
        }

        const std::string& leaf = components.back();
        if (entry.isDirectory) {
            descend(*node, leaf, entry.path);
            continue;
        }
        if (node->subdirectories.count(leaf) != 0) {
            throw MalformedObject("'" + entry.path + "' is both a file and a directory");
        }
        if (!node->files.emplace(leaf, &entry).second) {
            throw MalformedObject("duplicate path '" + entry.path + "'");
        }
    }

    return writeDirectory(store, root);
}

std::vector<PathEntry> collectWorkingTree(const std::filesystem::path& root) {
    namespace fs = std::filesystem;
    std::vector<PathEntry> entries;

    auto it = fs::recursive_directory_iterator(root);
    for (auto end = fs::end(it); it != end; ++it) {
        const auto& file = *it;
        if (file.path().filename() == constants::GIT_DIR) {
            it.disable_recursion_pending(); // The .git directory is never included in its own tree.
            continue;
        }

        PathEntry entry;
        entry.path = fs::relative(file.path(), root).generic_string();

        if (file.is_symlink()) {
            entry.mode = constants::MODE_SYMLINK;
            const std::string target = fs::read_symlink(file.path()).string();
            auto bytes = asBytes(target);
            entry.content.assign(bytes.begin(), bytes.end());
        } else if (file.is_directory()) {
            entry.isDirectory = true;
        } else if (file.is_regular_file()) {
            const auto perms = file.status().permissions();
            const bool executable = (perms & (fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec)) != fs::perms::none;
            entry.mode = executable ? constants::MODE_EXECUTABLE : constants::MODE_BLOB;

            std::ifstream inFile(file.path(), std::ios::binary);
            if (!inFile) {
                throw std::runtime_error("Cannot read " + file.path().string());
            }
            const std::vector<char> fileContent((std::istreambuf_iterator<char>(inFile)), std::istreambuf_iterator<char>());
            auto bytes = std::as_bytes(std::span{fileContent.data(), fileContent.size()});
            entry.content.assign(bytes.begin(), bytes.end());
        } else {
            continue; // Sockets, fifos and devices have no tree representation.
        }
        entries.push_back(std::move(entry));
    }
    return entries;
}
