#include "../include/commit_builder.h"
#include "../include/constants.h"
#include "../include/errors.h"
#include "../include/sha1_utils.h"
#include "../include/time_utils.h"

#include <cstdlib>

namespace {

std::string envOr(const char* name, std::string_view fallback) {
    const char* value = std::getenv(name);
    if (value == nullptr || *value == '\0') {
        return std::string(fallback);
    }
    return value;
}

std::string signature(const char* nameVar, const char* emailVar) {
    return envOr(nameVar, constants::AUTHOR_NAME) + " <" + envOr(emailVar, constants::AUTHOR_EMAIL) + "> " +
           getGitTimestamp();
}

} // namespace

CommitData buildCommit(const std::string& treeSha,
                       const std::vector<std::string>& parentShas,
                       const std::string& message,
                       const std::string& author,
                       const std::string& committer) {
    CommitData commit;
    commit.treeSha = normalizeSha1Hex(treeSha);
    for (const auto& parent : parentShas) {
        commit.parentShas.push_back(normalizeSha1Hex(parent));
    }
    commit.author = author;
    commit.committer = committer;
    commit.message = message;
    return commit;
}

std::string commitToStore(const ObjectStore& store, const CommitData& commit) {
    if (!store.contains(commit.treeSha)) {
        throw DanglingTree(commit.treeSha);
    }
    for (const auto& parent : commit.parentShas) {
        if (!store.contains(parent)) {
            throw DanglingParent(parent);
        }
    }
    return store.put(ObjectKind::COMMIT, encodeCommit(commit));
}

std::string authorSignature() {
    return signature("GIT_AUTHOR_NAME", "GIT_AUTHOR_EMAIL");
}

std::string committerSignature() {
    return signature("GIT_COMMITTER_NAME", "GIT_COMMITTER_EMAIL");
}
