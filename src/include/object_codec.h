#pragma once

#include <string>
#include <string_view>
#include <vector>
#include <optional>
#include <cstddef>
#include <span>

/**
 * @file
 * @brief Canonical encodings of Git objects and their content addresses.
 *
 * An object is stored and hashed as `"<kind> <length>\0<payload>"`. Tree and
 * commit payloads have their own structure, encoded and parsed here as well.
 */

/// The kinds of object the store understands.
enum class ObjectKind {
    BLOB,
    TREE,
    COMMIT,
    TAG
};

/// A decoded object: its kind and its payload without the header.
struct RawObject {
    ObjectKind kind;
    std::vector<std::byte> payload;
};

/** @struct TreeEntry
 *  @brief Represents a single entry (file or directory) within a Git tree object.
 */
struct TreeEntry {
    std::string mode;                 ///< File mode (e.g., "100644" for blob, "40000" for tree).
    std::string filename;             ///< The name of the file or subdirectory.
    std::vector<std::byte> sha1Bytes; ///< The 20-byte raw SHA-1 hash of the blob or subtree.
};

/** @struct CommitData
 *  @brief The fields of a commit object.
 */
struct CommitData {
    std::string treeSha;                 ///< 40-hex address of the root tree.
    std::vector<std::string> parentShas; ///< Parent addresses; the first is the primary parent.
    std::string author;                  ///< "<name> <email> <seconds> <tz>", passed through verbatim.
    std::string committer;               ///< Same format as author.
    std::string message;                 ///< Everything after the blank line, verbatim.
};

/// Returns the header spelling of a kind ("blob", "tree", "commit", "tag").
std::string_view kindToString(ObjectKind kind);

/// Parses a header kind; std::nullopt for anything unknown.
std::optional<ObjectKind> kindFromString(std::string_view name);

/**
 * @brief Builds the canonical encoding `"<kind> <len>\0" + payload`.
 */
std::vector<std::byte> encodeObject(ObjectKind kind, std::span<const std::byte> payload);

/**
 * @brief Computes the 40-hex content address of an object.
 * Pure function of kind and payload bytes.
 */
std::string addressOf(ObjectKind kind, std::span<const std::byte> payload);

/**
 * @brief Splits a canonical encoding back into kind and payload.
 * @throws MalformedObject if the header is not `<kind> <digits>\0`, the kind is
 *         unknown, or the payload length differs from the declared length.
 */
RawObject decodeObject(std::span<const std::byte> encoded);

/**
 * @brief Kind of the object a tree entry with the given mode points at.
 * "40000" is a tree, "160000" a commit (submodule), everything else a blob.
 */
ObjectKind kindForMode(std::string_view mode);

/**
 * @brief Orders tree entries the way Git does.
 * Names are compared as raw bytes, with a subtree's name compared as if it ended in '/'.
 */
bool treeEntryLess(const TreeEntry& lhs, const TreeEntry& rhs);

/**
 * @brief Encodes a tree payload, sorting the entries into canonical order first.
 * Format for each entry: "<mode> <filename>\0<sha1_bytes>".
 * @throws MalformedObject on duplicate or empty names, or an address that is not 20 bytes.
 */
std::vector<std::byte> encodeTree(std::vector<TreeEntry> entries);

/**
 * @brief Parses the binary content of a Git tree object into a vector of TreeEntry structs.
 *
 * @param treeContent The tree object's payload (after the header). Empty is a valid empty tree.
 * @throws MalformedObject if an entry is truncated or lacks its separators.
 */
std::vector<TreeEntry> parseTree(std::span<const std::byte> treeContent);

/**
 * @brief Encodes a commit payload: tree, parents in order, author, committer, blank line, message.
 */
std::vector<std::byte> encodeCommit(const CommitData& commit);

/**
 * @brief Parses a commit payload.
 * Header lines may appear in any order; unknown headers and their continuation
 * lines (e.g. gpgsig) are skipped.
 * @throws MalformedObject if there is no valid `tree` line.
 */
CommitData parseCommit(std::span<const std::byte> commitContent);

/**
 * @brief Formats a file mode for display, matching `git ls-tree` output.
 * Ensures the mode is 6 digits (e.g., "40000" becomes "040000").
 */
std::string formatModeForDisplay(std::string_view mode);

/// Views a string's characters as bytes.
std::span<const std::byte> asBytes(std::string_view text);

/// Copies bytes into a std::string.
std::string bytesToString(std::span<const std::byte> bytes);
