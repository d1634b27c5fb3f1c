#pragma once

#include <stdexcept>
#include <string>

/**
 * @file
 * @brief Exception types raised by the object store, codecs, protocol client and pack decoder.
 *
 * Every error derives from GitError, so command handlers can report any failure
 * of the core with a single catch clause. The messages name the failing
 * address, ref, URL or pack offset where one is known.
 */

/// Base class of every error raised by the core.
class GitError : public std::runtime_error {
public:
    explicit GitError(const std::string& message) : std::runtime_error(message) {}
};

/// An object encoding (header, tree or commit payload) could not be parsed.
class MalformedObject : public GitError {
public:
    explicit MalformedObject(const std::string& message) : GitError("malformed object: " + message) {}
};

/// The requested address is not present in the object store.
class ObjectNotFound : public GitError {
public:
    explicit ObjectNotFound(const std::string& sha1Hex)
        : GitError("object not found: " + sha1Hex), m_sha1(sha1Hex) {}

    const std::string& sha1() const { return m_sha1; }

private:
    std::string m_sha1;
};

/// A stored object no longer hashes to the address it is stored under.
class IntegrityError : public GitError {
public:
    IntegrityError(const std::string& sha1Hex, const std::string& detail)
        : GitError("integrity check failed for " + sha1Hex + ": " + detail) {}
};

/// A tree was requested from an input with no entries at all.
class EmptyTree : public GitError {
public:
    EmptyTree() : GitError("cannot build a tree from an empty entry list") {}
};

/// A commit references a parent commit that is not in the store.
class DanglingParent : public GitError {
public:
    explicit DanglingParent(const std::string& sha1Hex)
        : GitError("commit parent " + sha1Hex + " does not exist") {}
};

/// A commit references a tree that is not in the store.
class DanglingTree : public GitError {
public:
    explicit DanglingTree(const std::string& sha1Hex)
        : GitError("commit tree " + sha1Hex + " does not exist") {}
};

/// The transport failed or the remote answered with a non-success status.
class RemoteUnreachable : public GitError {
public:
    explicit RemoteUnreachable(const std::string& message) : GitError("remote unreachable: " + message) {}
};

/// The remote answered with something that is not the expected smart-protocol format.
class ProtocolError : public GitError {
public:
    explicit ProtocolError(const std::string& message) : GitError("protocol error: " + message) {}
};

/// The remote advertised no refs.
class EmptyRepository : public GitError {
public:
    explicit EmptyRepository(const std::string& url) : GitError("remote repository " + url + " is empty") {}
};

/// The packfile stream violates the pack or delta format.
class MalformedPack : public GitError {
public:
    explicit MalformedPack(const std::string& message) : GitError("malformed pack: " + message) {}
};

/// A ref-delta names a base object that is neither decoded yet nor in the store.
class UnresolvedBaseDelta : public GitError {
public:
    UnresolvedBaseDelta(const std::string& baseSha1Hex, std::size_t offset)
        : GitError("delta at pack offset " + std::to_string(offset) +
                   " references unresolved base " + baseSha1Hex) {}
};

/// The trailing pack checksum does not match the received bytes.
class PackCorrupt : public GitError {
public:
    PackCorrupt(const std::string& expectedHex, const std::string& actualHex)
        : GitError("pack checksum mismatch: trailer " + expectedHex + ", computed " + actualHex) {}
};
