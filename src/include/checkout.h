#pragma once

#include "object_store.h"

#include <string>
#include <filesystem>

/**
 * @brief Writes the contents of a tree object below `targetDir`.
 *
 * Blobs become files (mode 100755 also gets execute permission, 120000 becomes
 * a symbolic link), subtrees become directories created as needed, and
 * submodule entries become empty directories. Existing files are overwritten.
 *
 * @param store The object store holding the tree and everything it references.
 * @param treeSha The 40-character hex SHA of the tree to materialize.
 * @param targetDir The directory the tree's entries are written into.
 * @throws ObjectNotFound if any referenced object is missing.
 * @throws MalformedObject if an entry name is unsafe (".", "..", ".git", contains '/')
 *         or an object's kind disagrees with its tree entry.
 */
void materializeTree(const ObjectStore& store, const std::string& treeSha, const std::filesystem::path& targetDir);

/**
 * @brief Restores the files of a commit into a working directory.
 *
 * Reads the commit, finds its root tree and materializes it into `targetDir`.
 *
 * @param commitSha The 40-character hex SHA of the commit to check out.
 * @param targetDir The root directory where files will be written.
 * @throws MalformedObject if the object is not a commit.
 */
void checkoutCommit(const ObjectStore& store, const std::string& commitSha, const std::filesystem::path& targetDir);
