#include "../include/ls_tree.h"
#include "../include/constants.h"
#include "../include/errors.h"
#include "../include/object_store.h"
#include "../include/sha1_utils.h"

#include <iostream>
#include <cstdlib>
#include <string>


int handleLsTree(int argc, char* argv[]) {
    bool nameOnly = false;
    std::string treeSha;

    if (argc == 4 && std::string(argv[2]) == "--name-only") {
        nameOnly = true;
        treeSha = argv[3];
    } else if (argc == 3) {
        treeSha = argv[2];
    } else {
        std::cerr << "Usage: packgit ls-tree [--name-only] <tree-sha>\n";
        return EXIT_FAILURE;
    }

    const ObjectStore store(constants::GIT_DIR);
    RawObject object = store.get(treeSha);
    if (object.kind == ObjectKind::COMMIT) {
        object = store.get(parseCommit(object.payload).treeSha);
    }
    if (object.kind != ObjectKind::TREE) {
        throw MalformedObject(treeSha + " is not a tree object");
    }

    for (const auto& entry : parseTree(object.payload)) {
        if (nameOnly) {
            std::cout << entry.filename << "\n";
        } else {
            std::cout << formatModeForDisplay(entry.mode) << " " << kindToString(kindForMode(entry.mode)) << " "
                      << bytesToHex(entry.sha1Bytes) << "\t" << entry.filename << "\n";
        }
    }

    return EXIT_SUCCESS;
}
