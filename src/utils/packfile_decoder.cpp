#include "../include/packfile_decoder.h"
#include "../include/constants.h"
#include "../include/errors.h"
#include "../include/sha1_utils.h"
#include "../include/zlib_utils.h"

#include <algorithm>
#include <optional>

namespace {

std::optional<ObjectKind> kindForEntryType(uint8_t type) {
    switch (static_cast<PackEntryType>(type)) {
        case PackEntryType::COMMIT: return ObjectKind::COMMIT;
        case PackEntryType::TREE: return ObjectKind::TREE;
        case PackEntryType::BLOB: return ObjectKind::BLOB;
        case PackEntryType::TAG: return ObjectKind::TAG;
        default: return std::nullopt;
    }
}

/**
 * @brief Reads a little-endian base-128 integer from a delta stream.
 *
 * The most significant bit of each byte is a continuation flag; the lower 7
 * bits carry data, least significant group first.
 */
uint64_t read_delta_size(std::span<const std::byte> data, size_t& cursor) {
    uint64_t value = 0;
    int shift = 0;
    uint8_t current_byte = 0;
    do {
        if (cursor >= data.size()) {
            throw MalformedPack("delta header truncated");
        }
        if (shift > 63) {
            throw MalformedPack("delta size does not fit in 64 bits");
        }
        current_byte = std::to_integer<uint8_t>(data[cursor++]);
        value |= static_cast<uint64_t>(current_byte & 0x7F) << shift;
        shift += 7;
    } while ((current_byte & 0x80) != 0);
    return value;
}

} // namespace

std::vector<std::byte> applyDelta(std::span<const std::byte> base, std::span<const std::byte> delta) {
    size_t cursor = 0;

    // 1. The header repeats the base size and announces the result size.
    const uint64_t base_size = read_delta_size(delta, cursor);
    if (base_size != base.size()) {
        throw MalformedPack("delta expects a base of " + std::to_string(base_size) +
                            " bytes, base has " + std::to_string(base.size()));
    }
    const uint64_t target_size = read_delta_size(delta, cursor);

    std::vector<std::byte> result;
    result.reserve(static_cast<size_t>(std::min<uint64_t>(target_size, 1u << 24)));

    auto next = [&]() -> uint64_t {
        if (cursor >= delta.size()) {
            throw MalformedPack("copy instruction truncated");
        }
        return std::to_integer<uint64_t>(delta[cursor++]);
    };

    // 2. Process the instructions until the end of the stream.
    while (cursor < delta.size()) {
        const uint8_t control = std::to_integer<uint8_t>(delta[cursor++]);

        if ((control & 0x80) != 0) {
            // Copy: bits 0-3 say which offset bytes follow, bits 4-6 which size bytes.
            uint64_t offset = 0;
            uint64_t size = 0;
            for (int i = 0; i < 4; ++i) {
                if ((control & (1 << i)) != 0) offset |= next() << (8 * i);
            }
            for (int i = 0; i < 3; ++i) {
                if ((control & (0x10 << i)) != 0) size |= next() << (8 * i);
            }
            if (size == 0) {
                size = 0x10000;
            }

            if (offset + size > base.size()) {
                throw MalformedPack("copy of " + std::to_string(size) + " bytes at offset " +
                                    std::to_string(offset) + " exceeds base of " + std::to_string(base.size()) + " bytes");
            }
            if (result.size() + size > target_size) {
                throw MalformedPack("delta produces more than the declared " + std::to_string(target_size) + " bytes");
            }
            result.insert(result.end(), base.begin() + offset, base.begin() + offset + size);
        } else if (control != 0) {
            // Insert: the control byte is the number of literal bytes that follow.
            const size_t add_size = control;
            if (cursor + add_size > delta.size()) {
                throw MalformedPack("insert instruction reads past the end of the delta");
            }
            if (result.size() + add_size > target_size) {
                throw MalformedPack("delta produces more than the declared " + std::to_string(target_size) + " bytes");
            }
            result.insert(result.end(), delta.begin() + cursor, delta.begin() + cursor + add_size);
            cursor += add_size;
        } else {
            throw MalformedPack("reserved delta opcode 0");
        }
    }

    if (result.size() != target_size) {
        throw MalformedPack("delta produced " + std::to_string(result.size()) + " bytes, declared " +
                            std::to_string(target_size));
    }
    return result;
}

PackfileDecoder::PackfileDecoder(std::span<const std::byte> packfile, const ObjectStore& store)
    : m_packfile(packfile), m_store(store), m_cursor(0), m_entries_end(0) {}

PackDecodeResult PackfileDecoder::decode() {
    if (m_packfile.size() < constants::PACK_HEADER_SIZE + constants::PACK_TRAILER_SIZE) {
        throw MalformedPack("packfile of " + std::to_string(m_packfile.size()) + " bytes is too short");
    }
    m_cursor = 0;
    m_entries_end = m_packfile.size() - constants::PACK_TRAILER_SIZE;
    m_offset_to_sha.clear();
    m_objects.clear();

    const uint32_t num_objects = verify_header();
    PackDecodeResult result;
    result.objects.reserve(num_objects);

    for (uint32_t i = 0; i < num_objects; ++i) {
        const size_t entry_offset = m_cursor;
        if (entry_offset >= m_entries_end) {
            throw MalformedPack("pack ends after " + std::to_string(i) + " of " +
                                std::to_string(num_objects) + " entries");
        }

        // 1. Decode the entry header: type in bits 4-6, size in the low 4 bits
        //    followed by 7 bits per continuation byte.
        uint8_t header_byte = read_byte();
        const uint8_t type = (header_byte >> 4) & 0x7;
        uint64_t size = header_byte & 0x0F;
        int shift = 4;
        while ((header_byte & 0x80) != 0) {
            if (shift > 57) {
                throw MalformedPack("entry size at offset " + std::to_string(entry_offset) + " overflows");
            }
            header_byte = read_byte();
            size |= static_cast<uint64_t>(header_byte & 0x7F) << shift;
            shift += 7;
        }

        // 2. Obtain the object's kind and payload, resolving deltas against their base.
        RawObject object;
        bool was_delta = false;
        if (auto kind = kindForEntryType(type)) {
            object.kind = *kind;
            object.payload = inflate_entry(size, entry_offset);
        } else if (type == static_cast<uint8_t>(PackEntryType::OFS_DELTA)) {
            const size_t base_offset = read_offset_delta(entry_offset);
            auto base_it = m_offset_to_sha.find(base_offset);
            if (base_it == m_offset_to_sha.end()) {
                throw MalformedPack("offset delta at " + std::to_string(entry_offset) +
                                    " points at " + std::to_string(base_offset) + ", which is not an entry");
            }
            const std::vector<std::byte> delta = inflate_entry(size, entry_offset);
            const RawObject& base = m_objects.at(base_it->second);
            object.kind = base.kind;
            object.payload = applyDelta(base.payload, delta);
            was_delta = true;
        } else if (type == static_cast<uint8_t>(PackEntryType::REF_DELTA)) {
            if (m_cursor + constants::SHA1_RAW_LENGTH > m_entries_end) {
                throw MalformedPack("ref delta at " + std::to_string(entry_offset) + " truncated");
            }
            const std::string base_sha1 = bytesToHex(m_packfile.subspan(m_cursor, constants::SHA1_RAW_LENGTH));
            m_cursor += constants::SHA1_RAW_LENGTH;
            const std::vector<std::byte> delta = inflate_entry(size, entry_offset);
            const RawObject& base = ref_delta_base(base_sha1, entry_offset);
            object.kind = base.kind;
            object.payload = applyDelta(base.payload, delta);
            was_delta = true;
        } else {
            throw MalformedPack("unknown entry type " + std::to_string(type) + " at offset " +
                                std::to_string(entry_offset));
        }

        // 3. Persist, skipping objects the store already holds.
        const std::string sha1 = addressOf(object.kind, object.payload);
        if (m_store.contains(sha1)) {
            ++result.duplicate_count;
        } else {
            m_store.put(object.kind, object.payload);
            ++result.written_count;
        }

        result.objects.push_back({sha1, object.kind, object.payload.size(), entry_offset, was_delta});
        m_offset_to_sha[entry_offset] = sha1;
        m_objects.emplace(sha1, std::move(object));
    }

    verify_trailer();
    return result;
}

uint8_t PackfileDecoder::read_byte() {
    if (m_cursor >= m_entries_end) {
        throw MalformedPack("unexpected end of entry data at offset " + std::to_string(m_cursor));
    }
    return std::to_integer<uint8_t>(m_packfile[m_cursor++]);
}

/**
 * @brief Reads a standard 32-bit big-endian (network byte order) integer.
 * Advances the internal member cursor `m_cursor` by 4 bytes.
 */
uint32_t PackfileDecoder::read_big_endian_32() {
    uint32_t value = 0;
    for (int i = 0; i < 4; ++i) {
        value = (value << 8) | read_byte();
    }
    return value;
}

/**
 * @brief Verifies the 12-byte packfile header and returns the entry count.
 * The header must consist of the magic signature "PACK" followed by a 32-bit
 * version number (2 or 3) and the 32-bit number of entries.
 */
uint32_t PackfileDecoder::verify_header() {
    for (char expected : constants::PACK_SIGNATURE) {
        if (read_byte() != static_cast<uint8_t>(expected)) {
            throw MalformedPack("missing PACK signature");
        }
    }

    const uint32_t version = read_big_endian_32();
    if (version != 2 && version != 3) {
        throw MalformedPack("unsupported pack version " + std::to_string(version));
    }

    return read_big_endian_32();
}

/**
 * @brief Reads the base distance of an offset delta and returns the base's offset.
 *
 * Unlike sizes, the distance is big-endian, and every continuation adds one
 * before shifting so that each encoding length covers a distinct range.
 */
size_t PackfileDecoder::read_offset_delta(size_t entry_offset) {
    uint8_t current_byte = read_byte();
    uint64_t distance = current_byte & 0x7F;
    while ((current_byte & 0x80) != 0) {
        if (distance > (UINT64_MAX >> 7) - 1) {
            throw MalformedPack("offset delta at " + std::to_string(entry_offset) + " overflows");
        }
        current_byte = read_byte();
        distance = ((distance + 1) << 7) | (current_byte & 0x7F);
    }

    // Bases always precede their deltas; anything else would allow cycles.
    if (distance == 0 || distance > entry_offset) {
        throw MalformedPack("offset delta at " + std::to_string(entry_offset) +
                            " has invalid base distance " + std::to_string(distance));
    }
    return entry_offset - static_cast<size_t>(distance);
}

std::vector<std::byte> PackfileDecoder::inflate_entry(size_t expected_size, size_t entry_offset) {
    auto inflated = inflateStreamPrefix(m_packfile.subspan(m_cursor, m_entries_end - m_cursor), expected_size);
    if (!inflated) {
        throw MalformedPack("entry at offset " + std::to_string(entry_offset) +
                            " is not a valid zlib stream of " + std::to_string(expected_size) + " bytes");
    }
    if (inflated->data.size() != expected_size) {
        throw MalformedPack("entry at offset " + std::to_string(entry_offset) + " inflates to " +
                            std::to_string(inflated->data.size()) + " bytes, header declares " +
                            std::to_string(expected_size));
    }
    m_cursor += inflated->bytesConsumed;
    return std::move(inflated->data);
}

const RawObject& PackfileDecoder::ref_delta_base(const std::string& base_sha1, size_t entry_offset) {
    auto it = m_objects.find(base_sha1);
    if (it != m_objects.end()) {
        return it->second;
    }
    // A base outside the pack must already be in the store.
    if (!m_store.contains(base_sha1)) {
        throw UnresolvedBaseDelta(base_sha1, entry_offset);
    }
    return m_objects.emplace(base_sha1, m_store.get(base_sha1)).first->second;
}

void PackfileDecoder::verify_trailer() const {
    if (m_cursor != m_entries_end) {
        throw MalformedPack(std::to_string(m_entries_end - m_cursor) + " unexpected bytes after the last entry");
    }
    const std::string computed = calculateSha1Hex(m_packfile.first(m_entries_end));
    const std::string trailer = bytesToHex(m_packfile.subspan(m_entries_end));
    if (computed != trailer) {
        throw PackCorrupt(trailer, computed);
    }
}
