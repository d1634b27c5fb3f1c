#pragma once

#include "object_store.h"

#include <filesystem>
#include <string>
#include <vector>

/** @struct PathEntry
 *  @brief One file or directory of a working tree, relative to its root.
 */
struct PathEntry {
    std::string path;               ///< '/'-separated relative path, e.g. "src/main.cpp".
    std::string mode;               ///< Tree mode for files; empty means "100644". Ignored for directories.
    std::vector<std::byte> content; ///< File bytes (or the link target for mode "120000").
    bool isDirectory = false;       ///< True for an explicit, possibly empty, directory.
};

/**
 * @brief Writes the blobs and trees for a set of path entries and returns the root tree address.
 *
 * Entries may arrive in any order; every tree is written in canonical order, so
 * the resulting address depends only on the set of entries. Parent directories
 * are implied by file paths. A directory with no entries becomes an empty tree.
 *
 * @throws EmptyTree if `entries` contains nothing at all.
 * @throws MalformedObject for an invalid path, a duplicate file, or a path used
 *         both as a file and as a directory.
 */
std::string buildTree(const ObjectStore& store, const std::vector<PathEntry>& entries);

/**
 * @brief Reads a directory into path entries, skipping the `.git` directory.
 *
 * Files with an execute bit get mode "100755", symbolic links get "120000" with
 * their target as content. Other special files are skipped.
 */
std::vector<PathEntry> collectWorkingTree(const std::filesystem::path& root);
