#include "../include/cat_file.h"
#include "../include/constants.h"
#include "../include/object_store.h"
#include "../include/sha1_utils.h"

#include <iostream>
#include <cstdlib>
#include <string>

int handleCatFile(int argc, char* argv[]) {
    if (argc != 4) {
        std::cerr << "Usage: packgit cat-file (-p | -t | -s) <object-sha>\n";
        return EXIT_FAILURE;
    }
    const std::string option = argv[2];
    if (option != "-p" && option != "-t" && option != "-s") {
        std::cerr << "Usage: packgit cat-file (-p | -t | -s) <object-sha>\n";
        return EXIT_FAILURE;
    }

    const ObjectStore store(constants::GIT_DIR);
    const RawObject object = store.get(argv[3]);

    if (option == "-t") {
        std::cout << kindToString(object.kind) << "\n";
    } else if (option == "-s") {
        std::cout << object.payload.size() << "\n";
    } else if (object.kind == ObjectKind::TREE) {
        // Trees are binary; print them the way ls-tree does.
        for (const auto& entry : parseTree(object.payload)) {
            std::cout << formatModeForDisplay(entry.mode) << " " << kindToString(kindForMode(entry.mode)) << " "
                      << bytesToHex(entry.sha1Bytes) << "\t" << entry.filename << "\n";
        }
    } else {
        std::cout.write(reinterpret_cast<const char*>(object.payload.data()),
                        static_cast<std::streamsize>(object.payload.size()));
    }

    return EXIT_SUCCESS;
}
