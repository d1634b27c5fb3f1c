#pragma once

#include "transport.h"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>

/** @struct CloneResult
 *  @brief Summary of a finished clone.
 */
struct CloneResult {
    std::filesystem::path gitDir;          ///< The new repository's `.git` directory.
    std::string headSha;                   ///< The commit that was checked out.
    std::optional<std::string> headBranch; ///< Branch HEAD points at; empty for a detached HEAD.
    size_t objectCount = 0;                ///< Entries decoded from the pack.
    size_t refCount = 0;                   ///< Refs written under `.git/refs`.
};

/**
 * @brief Clones the repository at `remoteUrl` into `targetDir`.
 *
 * Discovers the remote's refs, fetches a single pack for HEAD and every
 * advertised ref, decodes it into a fresh object store, writes the refs and
 * HEAD, and checks out HEAD's tree.
 *
 * Any failure aborts the clone. Files already written are left in place; since
 * every object write is verified and idempotent, rerunning the clone into an
 * emptied directory is the recovery path.
 *
 * @throws GitError (or a subclass) on any failure of the pipeline, including a
 *         destination that exists and is not an empty directory.
 */
CloneResult cloneRepository(Transport& transport, const std::string& remoteUrl, const std::filesystem::path& targetDir);

/**
 * @brief Directory name `git clone` would pick for a URL: its last path segment without ".git".
 */
std::string defaultCloneDirectory(const std::string& remoteUrl);
