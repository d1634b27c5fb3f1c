#pragma once

#include "object_codec.h"
#include "object_store.h"

#include <string>
#include <vector>

/**
 * @brief Assembles a commit value. Pure construction; nothing is written.
 *
 * @param treeSha Address of the root tree.
 * @param parentShas Parent commits in order; empty for a root commit.
 * @param message The commit message, stored verbatim.
 * @param author Author line, e.g. from authorSignature().
 * @param committer Committer line, e.g. from committerSignature().
 * @throws MalformedObject if any address is not a 40-character hex string.
 */
CommitData buildCommit(const std::string& treeSha,
                       const std::vector<std::string>& parentShas,
                       const std::string& message,
                       const std::string& author,
                       const std::string& committer);

/**
 * @brief Encodes a commit and writes it to the store.
 *
 * Every referenced object is checked before anything is written, so a commit
 * never points at a missing object.
 *
 * @throws DanglingTree if the tree is not in the store.
 * @throws DanglingParent if any parent is not in the store.
 * @return The address of the commit.
 */
std::string commitToStore(const ObjectStore& store, const CommitData& commit);

/**
 * @brief "<name> <<email>> <timestamp> <tz>" for the current author.
 * Reads GIT_AUTHOR_NAME and GIT_AUTHOR_EMAIL, falling back to the built-in identity.
 */
std::string authorSignature();

/**
 * @brief Same as authorSignature() for GIT_COMMITTER_NAME / GIT_COMMITTER_EMAIL.
 */
std::string committerSignature();
