#pragma once

#include <string_view>
#include <filesystem>
#include <cstddef>

/**
 * @file
 * @brief Centralizes compile-time and runtime constants for the application.
 *
 * - `string_view` is used for true compile-time constants that require no memory allocation.
 * - `filesystem::path` objects are initialized at runtime but defined here for convenience.
 */
namespace constants {
    // Core Git directory and file names
    constexpr std::string_view GIT_DIR_NAME = ".git";
    constexpr std::string_view OBJECTS_DIR_NAME = "objects";
    constexpr std::string_view REFS_DIR_NAME = "refs";
    constexpr std::string_view HEADS_DIR_NAME = "heads";
    constexpr std::string_view TAGS_DIR_NAME = "tags";
    constexpr std::string_view HEAD_FILE_NAME = "HEAD";
    constexpr std::string_view DEFAULT_BRANCH_REF = "refs/heads/main";

    // Tree entry modes, as written in tree objects (no leading zero).
    constexpr std::string_view MODE_BLOB = "100644";       // Regular file
    constexpr std::string_view MODE_EXECUTABLE = "100755"; // Executable file
    constexpr std::string_view MODE_SYMLINK = "120000";    // Symbolic link
    constexpr std::string_view MODE_TREE = "40000";        // Directory
    constexpr std::string_view MODE_GITLINK = "160000";    // Submodule commit

    // Default identity for commits, overridden by GIT_AUTHOR_* / GIT_COMMITTER_*.
    constexpr std::string_view AUTHOR_NAME = "packgit";
    constexpr std::string_view AUTHOR_EMAIL = "packgit@localhost";

    // Object addresses
    constexpr std::size_t SHA1_RAW_LENGTH = 20;
    constexpr std::size_t SHA1_HEX_LENGTH = 40;

    // Packfile layout
    constexpr std::string_view PACK_SIGNATURE = "PACK";
    constexpr std::size_t PACK_HEADER_SIZE = 12;
    constexpr std::size_t PACK_TRAILER_SIZE = SHA1_RAW_LENGTH;

    // Smart HTTP protocol
    constexpr std::string_view UPLOAD_PACK_SERVICE = "git-upload-pack";
    constexpr std::string_view AGENT = "packgit/0.1";
    constexpr std::string_view FETCH_CAPABILITIES = "side-band-64k no-progress";

    // Filesystem paths, initialized at runtime
    const std::filesystem::path GIT_DIR = ".git";
}
