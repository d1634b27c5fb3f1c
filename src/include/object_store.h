#pragma once

#include "object_codec.h"

#include <filesystem>
#include <string>
#include <string_view>
#include <span>

/**
 * @class ObjectStore
 * @brief Loose-object database rooted at an explicit `.git` directory.
 *
 * Objects live at `<gitdir>/objects/<first 2 hex>/<remaining 38 hex>` as the
 * zlib-compressed canonical encoding. The store has no internal locking;
 * callers serialize operations against one directory.
 */
class ObjectStore {
public:
    explicit ObjectStore(std::filesystem::path gitDir);

    /**
     * @brief Persists an object and returns its address.
     *
     * Writing an object that is already present is a no-op that returns the
     * same address. A new object is written to a temporary file, synced to disk
     * and renamed into place, so the returned address always refers to a
     * complete file.
     *
     * @throws std::runtime_error if compression or the filesystem write fails.
     */
    std::string put(ObjectKind kind, std::span<const std::byte> payload) const;

    /**
     * @brief Reads an object back.
     * @throws ObjectNotFound if no object is stored under `sha1Hex`.
     * @throws IntegrityError if the stored bytes do not inflate, decode, or hash back to `sha1Hex`.
     * @throws MalformedObject if `sha1Hex` is not a valid object name.
     */
    RawObject get(std::string_view sha1Hex) const;

    /// Presence check; never inspects the stored bytes.
    bool contains(std::string_view sha1Hex) const;

    /// Path of the file that holds (or would hold) the given object.
    std::filesystem::path objectPath(std::string_view sha1Hex) const;

    const std::filesystem::path& gitDir() const { return m_gitDir; }

private:
    std::filesystem::path m_gitDir;
};
