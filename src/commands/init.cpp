#include "../include/init.h"
#include "../include/repository.h"

#include <iostream>
#include <cstdlib>
#include <filesystem>

int handleInit() {
    const auto gitDir = initRepository(std::filesystem::current_path());
    std::cout << "Initialized empty Git repository in " << gitDir.string() << "/\n";
    return EXIT_SUCCESS;
}
