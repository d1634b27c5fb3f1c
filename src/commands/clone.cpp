#include "../include/clone.h"
#include "../include/clone_orchestrator.h"
#include "../include/transport.h"

#include <iostream>
#include <cstdlib>
#include <string>
#include <filesystem>

int handleClone(int argc, char* argv[]) {
    std::string baseUrl;
    std::filesystem::path targetDir;

    // --- Argument Parsing ---
    if (argc == 3) { // packgit clone <url>
        baseUrl = argv[2];
        targetDir = defaultCloneDirectory(baseUrl);
    } else if (argc == 4) { // packgit clone <url> <dir>
        baseUrl = argv[2];
        targetDir = argv[3];
    } else {
        std::cerr << "Usage: packgit clone <url> [<directory>]\n";
        return EXIT_FAILURE;
    }
    if (targetDir.empty()) {
        std::cerr << "fatal: cannot infer a directory name from '" << baseUrl << "'\n";
        return EXIT_FAILURE;
    }

    CprTransport transport;
    const CloneResult result = cloneRepository(transport, baseUrl, targetDir);

    std::cout << "HEAD is now at " << result.headSha.substr(0, 7);
    if (result.headBranch) {
        std::cout << " (" << *result.headBranch << ")";
    }
    std::cout << "\n";
    return EXIT_SUCCESS;
}
