#include "../include/checkout.h"
#include "../include/constants.h"
#include "../include/errors.h"
#include "../include/sha1_utils.h"

#include <fstream>
#include <set>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

RawObject readExpected(const ObjectStore& store, const std::string& sha, ObjectKind expected) {
    RawObject object = store.get(sha);
    if (object.kind != expected) {
        throw MalformedObject("object " + sha + " is a " + std::string(kindToString(object.kind)) +
                              ", expected a " + std::string(kindToString(expected)));
    }
    return object;
}

void writeFile(const fs::path& path, const std::vector<std::byte>& content, bool executable) {
    if (fs::is_symlink(path)) {
        fs::remove(path);
    }
    std::ofstream outFile(path, std::ios::binary | std::ios::trunc);
    if (!outFile) {
        throw std::runtime_error("Cannot create " + path.string());
    }
    outFile.write(reinterpret_cast<const char*>(content.data()), static_cast<std::streamsize>(content.size()));
    outFile.close();
    if (!outFile) {
        throw std::runtime_error("Failed to write " + path.string());
    }
    if (executable) {
        fs::permissions(path, fs::perms::owner_exec | fs::perms::group_exec | fs::perms::others_exec,
                        fs::perm_options::add);
    }
}

/**
 * @brief Recursively checks out the contents of a single tree object.
 *
 * For each blob it writes the file; for each sub-tree it creates the directory
 * and calls itself.
 */
void checkoutTree(const ObjectStore& store, const std::string& treeSha, const fs::path& currentPath) {
    const RawObject tree = readExpected(store, treeSha, ObjectKind::TREE);
    fs::create_directories(currentPath);

    std::set<std::string> seen;
    for (const auto& entry : parseTree(tree.payload)) {
        if (!seen.insert(entry.filename).second) {
            throw MalformedObject("tree " + treeSha + " lists '" + entry.filename + "' more than once");
        }
        if (entry.filename == "." || entry.filename == ".." || entry.filename == constants::GIT_DIR_NAME ||
            entry.filename.find('/') != std::string::npos || entry.filename.find('\\') != std::string::npos) {
            throw MalformedObject("tree " + treeSha + " has unsafe entry name '" + entry.filename + "'");
        }
        const fs::path entryPath = currentPath / entry.filename;
        const std::string entrySha = bytesToHex(entry.sha1Bytes);

        // Never descend into or write through a link left on disk.
        if ((entry.mode == constants::MODE_TREE || entry.mode == constants::MODE_GITLINK) &&
            fs::is_symlink(fs::symlink_status(entryPath))) {
            throw MalformedObject("refusing to check out '" + entry.filename + "' through a symbolic link");
        }

        if (entry.mode == constants::MODE_TREE) {
            checkoutTree(store, entrySha, entryPath);
        } else if (entry.mode == constants::MODE_GITLINK) {
            // The submodule's commit lives in another repository.
            fs::create_directories(entryPath);
        } else if (entry.mode == constants::MODE_SYMLINK) {
            const RawObject blob = readExpected(store, entrySha, ObjectKind::BLOB);
            if (fs::exists(fs::symlink_status(entryPath))) {
                fs::remove(entryPath);
            }
            fs::create_symlink(bytesToString(blob.payload), entryPath);
        } else {
            const RawObject blob = readExpected(store, entrySha, ObjectKind::BLOB);
            writeFile(entryPath, blob.payload, entry.mode == constants::MODE_EXECUTABLE);
        }
    }
}

} // namespace

void materializeTree(const ObjectStore& store, const std::string& treeSha, const fs::path& targetDir) {
    checkoutTree(store, normalizeSha1Hex(treeSha), targetDir);
}

void checkoutCommit(const ObjectStore& store, const std::string& commitSha, const fs::path& targetDir) {
    const RawObject commit = readExpected(store, normalizeSha1Hex(commitSha), ObjectKind::COMMIT);
    materializeTree(store, parseCommit(commit.payload).treeSha, targetDir);
}
