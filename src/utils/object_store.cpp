#include "../include/object_store.h"
#include "../include/constants.h"
#include "../include/errors.h"
#include "../include/sha1_utils.h"
#include "../include/zlib_utils.h"

#include <fstream>
#include <iterator>
#include <random>
#include <stdexcept>

#include <fcntl.h>
#include <unistd.h>

namespace {

// Flushes a written file to stable storage before it is renamed into place.
void syncFile(const std::filesystem::path& path) {
    const int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        throw std::runtime_error("Cannot reopen " + path.string() + " for sync");
    }
    const int rc = ::fsync(fd);
    ::close(fd);
    if (rc != 0) {
        throw std::runtime_error("Failed to sync " + path.string());
    }
}

} // namespace

ObjectStore::ObjectStore(std::filesystem::path gitDir) : m_gitDir(std::move(gitDir)) {}

std::filesystem::path ObjectStore::objectPath(std::string_view sha1Hex) const {
    const std::string hex = normalizeSha1Hex(sha1Hex);
    // Construct path from SHA: e.g., "ff/123..." for SHA "ff123...".
    return m_gitDir / constants::OBJECTS_DIR_NAME / hex.substr(0, 2) / hex.substr(2);
}

bool ObjectStore::contains(std::string_view sha1Hex) const {
    return std::filesystem::is_regular_file(objectPath(sha1Hex));
}

std::string ObjectStore::put(ObjectKind kind, std::span<const std::byte> payload) const {
    // 1. Calculate the object's address from its canonical encoding.
    const std::vector<std::byte> encoded = encodeObject(kind, payload);
    const std::string sha1Hex = calculateSha1Hex(encoded);
    const auto filePath = objectPath(sha1Hex);

    // Already stored: content addressing makes the existing file identical.
    if (std::filesystem::exists(filePath)) {
        return sha1Hex;
    }

    // 2. Compress the encoding using zlib.
    std::vector<std::byte> compressedData;
    if (!compressZlib(encoded, compressedData)) {
        throw std::runtime_error("Compression failed for object " + sha1Hex);
    }

    // 3. Write to a sibling temporary file, then rename it over the final name.
    std::filesystem::create_directories(filePath.parent_path());
    const auto tempPath = filePath.parent_path() /
                          ("tmp_obj_" + sha1Hex.substr(2, 8) + "_" + std::to_string(std::random_device{}()));
    {
        std::ofstream outFile(tempPath, std::ios::binary | std::ios::trunc);
        if (!outFile) {
            throw std::runtime_error("Cannot create " + tempPath.string());
        }
        outFile.write(reinterpret_cast<const char*>(compressedData.data()),
                      static_cast<std::streamsize>(compressedData.size()));
        outFile.close();
        if (!outFile) {
            std::filesystem::remove(tempPath);
            throw std::runtime_error("Failed to write object " + sha1Hex);
        }
    }
    try {
        syncFile(tempPath);
    } catch (const std::runtime_error&) {
        std::filesystem::remove(tempPath);
        throw;
    }
    std::filesystem::rename(tempPath, filePath);

    return sha1Hex;
}

RawObject ObjectStore::get(std::string_view sha1Hex) const {
    const std::string hex = normalizeSha1Hex(sha1Hex);
    const auto path = objectPath(hex);
    if (!std::filesystem::is_regular_file(path)) {
        throw ObjectNotFound(hex);
    }

    std::ifstream objectFile(path, std::ios::binary);
    if (!objectFile) {
        throw ObjectNotFound(hex);
    }
    std::vector<char> raw((std::istreambuf_iterator<char>(objectFile)), std::istreambuf_iterator<char>());
    auto compressedData = std::as_bytes(std::span{raw.data(), raw.size()});

    std::vector<std::byte> encoded;
    if (!decompressZlib(compressedData, encoded)) {
        throw IntegrityError(hex, "stored data does not inflate");
    }

    // The address is the hash of the encoding, so verify before trusting the header.
    const std::string actual = calculateSha1Hex(encoded);
    if (actual != hex) {
        throw IntegrityError(hex, "content hashes to " + actual);
    }

    try {
        return decodeObject(encoded);
    } catch (const MalformedObject& e) {
        throw IntegrityError(hex, e.what());
    }
}
