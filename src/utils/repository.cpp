#include "../include/repository.h"
#include "../include/constants.h"
#include "../include/sha1_utils.h"

#include <fstream>
#include <stdexcept>

namespace {

void writeTextFile(const std::filesystem::path& path, const std::string& text) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out) {
        throw std::runtime_error("Cannot write " + path.string());
    }
    out << text;
    out.flush();
    if (!out) {
        throw std::runtime_error("Failed to write " + path.string());
    }
}

std::optional<std::string> readFirstLine(const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in) {
        return std::nullopt;
    }
    std::string line;
    std::getline(in, line);
    while (!line.empty() && (line.back() == '\r' || line.back() == ' ')) {
        line.pop_back();
    }
    return line;
}

} // namespace

std::filesystem::path initRepository(const std::filesystem::path& worktree) {
    const auto gitDir = worktree / constants::GIT_DIR;
    std::filesystem::create_directories(gitDir / constants::OBJECTS_DIR_NAME);
    std::filesystem::create_directories(gitDir / constants::REFS_DIR_NAME / constants::HEADS_DIR_NAME);
    std::filesystem::create_directories(gitDir / constants::REFS_DIR_NAME / constants::TAGS_DIR_NAME);

    const auto headPath = gitDir / constants::HEAD_FILE_NAME;
    if (!std::filesystem::exists(headPath)) {
        writeSymbolicHead(gitDir, constants::DEFAULT_BRANCH_REF);
    }
    return gitDir;
}

bool isValidRefName(std::string_view refName) {
    if (refName == constants::HEAD_FILE_NAME) {
        return true;
    }
    if (refName.substr(0, 5) != "refs/" || refName.back() == '/') {
        return false;
    }
    size_t start = 0;
    while (start <= refName.size()) {
        size_t end = refName.find('/', start);
        if (end == std::string_view::npos) end = refName.size();
        const auto component = refName.substr(start, end - start);
        if (component.empty() || component == "." || component == ".." ||
            component.find_first_of(std::string_view("\\\0 ~^:?*[", 9)) != std::string_view::npos) {
            return false;
        }
        start = end + 1;
    }
    return true;
}

void writeRef(const std::filesystem::path& gitDir, std::string_view refName, std::string_view sha1Hex) {
    if (!isValidRefName(refName)) {
        throw std::invalid_argument("invalid ref name '" + std::string(refName) + "'");
    }
    writeTextFile(gitDir / std::string(refName), normalizeSha1Hex(sha1Hex) + "\n");
}

void writeSymbolicHead(const std::filesystem::path& gitDir, std::string_view refName) {
    if (!isValidRefName(refName)) {
        throw std::invalid_argument("invalid ref name '" + std::string(refName) + "'");
    }
    writeTextFile(gitDir / constants::HEAD_FILE_NAME, "ref: " + std::string(refName) + "\n");
}

std::optional<std::string> readRef(const std::filesystem::path& gitDir, std::string_view refName) {
    if (!isValidRefName(refName)) {
        return std::nullopt;
    }
    auto line = readFirstLine(gitDir / std::string(refName));
    if (!line) {
        return std::nullopt;
    }
    if (line->rfind("ref: ", 0) == 0) {
        const std::string target = line->substr(5);
        if (target == constants::HEAD_FILE_NAME || !isValidRefName(target)) {
            return std::nullopt;
        }
        line = readFirstLine(gitDir / target);
        if (!line) {
            return std::nullopt; // Unborn branch.
        }
    }
    if (!isSha1Hex(*line)) {
        return std::nullopt;
    }
    return normalizeSha1Hex(*line);
}
