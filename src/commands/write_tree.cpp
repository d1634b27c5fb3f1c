#include "../include/write_tree.h"
#include "../include/constants.h"
#include "../include/object_store.h"
#include "../include/tree_builder.h"

#include <iostream>
#include <cstdlib>
#include <filesystem>

// Command handler for `packgit write-tree`.
int handleWriteTree(int argc, char* argv[]) {
    if (argc != 2) {
        std::cerr << "Usage: packgit write-tree\n";
        return EXIT_FAILURE;
    }
    (void)argv;

    // The command operates on the current working directory.
    const ObjectStore store(constants::GIT_DIR);
    std::cout << buildTree(store, collectWorkingTree(std::filesystem::current_path())) << "\n";
    return EXIT_SUCCESS;
}
