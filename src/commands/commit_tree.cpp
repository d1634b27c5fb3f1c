#include "../include/commit_tree.h"
#include "../include/commit_builder.h"
#include "../include/constants.h"
#include "../include/object_store.h"

#include <iostream>
#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

int handleCommitTree(int argc, char* argv[]) {
    // This command takes a tree SHA, any number of parents, and a message.
    if (argc < 3) {
        std::cerr << "Usage: packgit commit-tree <tree_sha> [-p <commit_sha>]... -m <message>\n";
        return EXIT_FAILURE;
    }
    const std::string treeSha = argv[2];
    std::vector<std::string> parentShas;
    std::optional<std::string> commitMessage;

    for (int i = 3; i < argc; i += 2) {
        const std::string flag = argv[i];
        if (i + 1 >= argc || (flag != "-p" && flag != "-m")) {
            std::cerr << "Usage: packgit commit-tree <tree_sha> [-p <commit_sha>]... -m <message>\n";
            return EXIT_FAILURE;
        }
        if (flag == "-p") {
            parentShas.emplace_back(argv[i + 1]);
        } else {
            commitMessage = argv[i + 1];
        }
    }
    if (!commitMessage) {
        std::cerr << "fatal: commit-tree needs a message (-m)\n";
        return EXIT_FAILURE;
    }

    // Like git, a message always ends with a newline.
    std::string message = *commitMessage;
    if (message.empty() || message.back() != '\n') {
        message.push_back('\n');
    }

    const ObjectStore store(constants::GIT_DIR);
    const CommitData commit = buildCommit(treeSha, parentShas, message, authorSignature(), committerSignature());
    std::cout << commitToStore(store, commit) << "\n";
    return EXIT_SUCCESS;
}
