#pragma once

#include "object_codec.h"
#include "object_store.h"

#include <cstddef>
#include <cstdint>
#include <map>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

// Entry type tags as encoded in bits 4-6 of an entry header.
enum class PackEntryType {
    COMMIT = 1,
    TREE = 2,
    BLOB = 3,
    TAG = 4,
    OFS_DELTA = 6,  // Delta referencing a base object by its offset in the same packfile.
    REF_DELTA = 7   // Delta referencing a base object by its SHA-1 hash.
};

// Metadata for one object after it has been decoded from the packfile.
struct PackedObject {
    std::string sha1;         // Address of the object (after delta resolution).
    ObjectKind kind;          // Kind of the resolved object.
    size_t size;              // Payload size of the resolved object.
    size_t offset_in_packfile; // Where the entry starts in the packfile.
    bool was_delta;           // True if the entry was stored as a delta.
};

// Outcome of decoding a whole packfile.
struct PackDecodeResult {
    std::vector<PackedObject> objects; // Every entry, in pack order.
    size_t written_count = 0;          // Objects newly written to the store.
    size_t duplicate_count = 0;        // Objects the store already had.
};

/**
 * @brief Applies delta instructions to a base object to reconstruct a target object.
 *
 * The instruction stream starts with the base size and the result size as
 * little-endian base-128 integers, followed by copy opcodes (high bit set;
 * bits 0-3 select offset bytes and bits 4-6 size bytes, size 0 meaning 0x10000)
 * and insert opcodes (1-127 literal bytes follow).
 *
 * @throws MalformedPack if the stream is truncated, uses the reserved opcode 0,
 *         copies outside the base, or disagrees with the declared sizes.
 */
std::vector<std::byte> applyDelta(std::span<const std::byte> base, std::span<const std::byte> delta);

/**
 * @class PackfileDecoder
 * @brief Decodes a packfile into the object store.
 *
 * Entries are decoded in a single forward pass. Each base entry is stored as
 * soon as it is inflated; each delta entry is resolved immediately against a
 * base found through the offset table (offset deltas) or the address table and
 * the store (ref deltas), so delta chains of any depth resolve without recursion.
 */
class PackfileDecoder {
public:
    /**
     * @param packfile The entire packfile: header, entries and trailing SHA-1.
     * @param store Destination for every decoded object.
     */
    PackfileDecoder(std::span<const std::byte> packfile, const ObjectStore& store);

    /**
     * @brief Decodes every entry, persists the objects and verifies the trailer.
     *
     * @throws MalformedPack on a bad header, truncated or corrupt entry, size
     *         mismatch, invalid delta, or an offset delta whose base is not an earlier entry.
     * @throws UnresolvedBaseDelta if a ref delta's base is neither in the pack so far nor in the store.
     * @throws PackCorrupt if the trailing checksum does not match.
     */
    PackDecodeResult decode();

private:
    std::span<const std::byte> m_packfile; // Non-owning view of the packfile data.
    const ObjectStore& m_store;
    size_t m_cursor;                       // Current read position within the packfile.
    size_t m_entries_end;                  // Start of the trailing checksum.

    // Every resolved object stays available as a base for later deltas.
    std::map<size_t, std::string> m_offset_to_sha;            // entry offset -> sha1
    std::unordered_map<std::string, RawObject> m_objects;     // sha1 -> kind and payload

    uint8_t read_byte();
    uint32_t read_big_endian_32();
    uint32_t verify_header();
    size_t read_offset_delta(size_t entry_offset);
    std::vector<std::byte> inflate_entry(size_t expected_size, size_t entry_offset);
    const RawObject& ref_delta_base(const std::string& base_sha1, size_t entry_offset);
    void verify_trailer() const;
};
