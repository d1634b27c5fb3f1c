#include "../include/hash_object.h"
#include "../include/constants.h"
#include "../include/object_store.h"

#include <iostream>
#include <cstdlib>
#include <fstream>
#include <filesystem>
#include <vector>
#include <string>
#include <iterator>
#include <span>

// Command handler for `packgit hash-object [-w] [-t <kind>] <file>`.
int handleHashObject(int argc, char* argv[]) {
    bool write = false;
    ObjectKind kind = ObjectKind::BLOB;
    std::filesystem::path filePath;

    for (int i = 2; i < argc; ++i) {
        const std::string arg = argv[i];
        if (arg == "-w") {
            write = true;
        } else if (arg == "-t" && i + 1 < argc) {
            auto parsed = kindFromString(argv[++i]);
            if (!parsed) {
                std::cerr << "fatal: invalid object type '" << argv[i] << "'\n";
                return EXIT_FAILURE;
            }
            kind = *parsed;
        } else if (filePath.empty() && !arg.empty() && arg.front() != '-') {
            filePath = arg;
        } else {
            filePath.clear();
            break;
        }
    }
    if (filePath.empty()) {
        std::cerr << "Usage: packgit hash-object [-w] [-t <kind>] <file-path>\n";
        return EXIT_FAILURE;
    }

    std::ifstream inFile(filePath, std::ios::binary);
    if (!inFile) {
        std::cerr << "fatal: could not open '" << filePath.string() << "' for reading\n";
        return EXIT_FAILURE;
    }
    const std::vector<char> fileContent((std::istreambuf_iterator<char>(inFile)), std::istreambuf_iterator<char>());
    const auto payload = std::as_bytes(std::span{fileContent.data(), fileContent.size()});

    // Without -w only the address is computed; nothing touches the object database.
    if (write) {
        const ObjectStore store(constants::GIT_DIR);
        std::cout << store.put(kind, payload) << "\n";
    } else {
        std::cout << addressOf(kind, payload) << "\n";
    }
    return EXIT_SUCCESS;
}
