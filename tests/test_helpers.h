#pragma once

#include "object_codec.h"
#include "pkt_line_utils.h"
#include "sha1_utils.h"
#include "transport.h"
#include "zlib_utils.h"

#include <cstdint>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>
#include <unistd.h>

namespace fs = std::filesystem;

// Scratch directory under the system temp dir, removed with everything in it.
class TempDir {
public:
    TempDir() {
        static int counter = 0;
        m_path = fs::temp_directory_path() /
                 ("packgit_test_" + std::to_string(getpid()) + "_" + std::to_string(counter++));
        fs::remove_all(m_path);
        fs::create_directories(m_path);
    }
    ~TempDir() {
        std::error_code ec;
        fs::remove_all(m_path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const fs::path& path() const { return m_path; }

private:
    fs::path m_path;
};

inline std::vector<std::byte> toBytes(const std::string& text) {
    auto bytes = asBytes(text);
    return std::vector<std::byte>(bytes.begin(), bytes.end());
}

inline std::string readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

inline void writeFile(const fs::path& path, const std::string& content) {
    fs::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << content;
}

// Little-endian base-128 size, as found at the start of a delta.
inline std::string deltaSize(uint64_t value) {
    std::string out;
    do {
        uint8_t byte = value & 0x7F;
        value >>= 7;
        if (value != 0) byte |= 0x80;
        out.push_back(static_cast<char>(byte));
    } while (value != 0);
    return out;
}

// Assembles a packfile entry by entry. Offsets returned by the add* methods are
// the positions of the entries, usable as offset-delta bases.
class PackBuilder {
public:
    size_t addObject(ObjectKind kind, const std::string& payload) {
        uint8_t type = 3;
        switch (kind) {
            case ObjectKind::COMMIT: type = 1; break;
            case ObjectKind::TREE: type = 2; break;
            case ObjectKind::BLOB: type = 3; break;
            case ObjectKind::TAG: type = 4; break;
        }
        const size_t offset = m_body.size();
        writeEntryHeader(type, payload.size());
        appendCompressed(payload);
        ++m_count;
        return offset;
    }

    size_t addOfsDelta(size_t baseOffset, const std::string& delta) {
        const size_t offset = m_body.size();
        writeEntryHeader(6, delta.size());
        // Big-endian with +1 bias on every continuation byte.
        uint64_t distance = offset - baseOffset;
        std::string encoded(1, static_cast<char>(distance & 0x7F));
        while (distance >>= 7) {
            --distance;
            encoded.insert(encoded.begin(), static_cast<char>(0x80 | (distance & 0x7F)));
        }
        m_body += encoded;
        appendCompressed(delta);
        ++m_count;
        return offset;
    }

    size_t addRefDelta(const std::string& baseSha1Hex, const std::string& delta) {
        const size_t offset = m_body.size();
        writeEntryHeader(7, delta.size());
        m_body += bytesToString(hexToBytes(baseSha1Hex));
        appendCompressed(delta);
        ++m_count;
        return offset;
    }

    // Appends raw bytes to the entry area, e.g. to simulate junk.
    void appendRaw(const std::string& bytes) { m_body += bytes; }

    std::vector<std::byte> build(uint32_t version = 2) const {
        std::string header = "PACK";
        for (uint32_t value : {version, m_count}) {
            for (int shift = 24; shift >= 0; shift -= 8) {
                header.push_back(static_cast<char>((value >> shift) & 0xFF));
            }
        }
        std::string pack = m_body;
        pack.replace(0, header.size(), header);
        std::vector<std::byte> bytes = toBytes(pack);
        const auto trailer = calculateSha1(bytes);
        bytes.insert(bytes.end(), trailer.begin(), trailer.end());
        return bytes;
    }

private:
    // Placeholder for the 12-byte header, so entry offsets are pack offsets.
    std::string m_body = std::string(12, '\0');
    uint32_t m_count = 0;

    void writeEntryHeader(uint8_t type, size_t size) {
        uint8_t byte = static_cast<uint8_t>((type << 4) | (size & 0x0F));
        size >>= 4;
        while (size != 0) {
            m_body.push_back(static_cast<char>(byte | 0x80));
            byte = size & 0x7F;
            size >>= 7;
        }
        m_body.push_back(static_cast<char>(byte));
    }

    void appendCompressed(const std::string& data) {
        std::vector<std::byte> compressed;
        if (!compressZlib(asBytes(data), compressed)) {
            throw std::runtime_error("compression failed");
        }
        m_body += bytesToString(compressed);
    }
};

// Transport that serves canned responses and records what was asked of it.
class MockTransport : public Transport {
public:
    HttpResponse refsResponse;
    HttpResponse packResponse;
    std::vector<std::string> getUrls;
    std::vector<std::string> postUrls;
    std::string lastPostBody;
    HttpHeaders lastPostHeaders;

    HttpResponse get(const std::string& url, const HttpHeaders&) override {
        getUrls.push_back(url);
        return refsResponse;
    }

    HttpResponse post(const std::string& url, const std::string& body, const HttpHeaders& headers) override {
        postUrls.push_back(url);
        lastPostBody = body;
        lastPostHeaders = headers;
        return packResponse;
    }
};

// An upload-pack response: NAK followed by the pack on side-band 1.
inline std::string sideBandResponse(const std::vector<std::byte>& pack) {
    std::string response = createPktLine("NAK\n");
    const std::string data = bytesToString(pack);
    for (size_t pos = 0; pos < data.size(); pos += 1000) {
        response += createPktLine("\x01" + data.substr(pos, 1000));
    }
    response += createPktLine("");
    return response;
}

// An info/refs body with the service banner; the first ref line carries `capabilities`.
inline std::string refAdvertisement(const std::vector<std::pair<std::string, std::string>>& refs,
                                    const std::string& capabilities) {
    std::string body = createPktLine("# service=git-upload-pack\n") + createPktLine("");
    bool first = true;
    for (const auto& [sha, name] : refs) {
        std::string line = sha + " " + name;
        if (first) {
            line += std::string(1, '\0') + capabilities;
            first = false;
        }
        body += createPktLine(line + "\n");
    }
    body += createPktLine("");
    return body;
}
