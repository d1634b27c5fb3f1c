#include "../include/sha1_utils.h"
#include "../include/constants.h"
#include "../include/errors.h"

#include <openssl/sha.h>
#include <algorithm>
#include <cctype>
#include <stdexcept>
#include <span>

namespace {

int hexDigitValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::vector<std::byte> calculateSha1(std::span<const std::byte> data) {
    std::vector<std::byte> hash(SHA_DIGEST_LENGTH);
    SHA1(reinterpret_cast<const unsigned char*>(data.data()), data.size(),
         reinterpret_cast<unsigned char*>(hash.data()));
    return hash;
}

std::string bytesToHex(std::span<const std::byte> bytes) {
    static constexpr char digits[] = "0123456789abcdef";
    std::string result;
    result.reserve(bytes.size() * 2);
    for (const auto byte : bytes) {
        const auto value = std::to_integer<unsigned int>(byte);
        result.push_back(digits[value >> 4]);
        result.push_back(digits[value & 0x0F]);
    }
    return result;
}

std::string calculateSha1Hex(std::span<const std::byte> data) {
    return bytesToHex(calculateSha1(data));
}

std::vector<std::byte> hexToBytes(std::string_view hex) {
    if (hex.length() % 2 != 0) {
        throw std::invalid_argument("Hex string must have an even number of characters");
    }
    std::vector<std::byte> bytes;
    bytes.reserve(hex.length() / 2);
    for (size_t i = 0; i < hex.length(); i += 2) {
        const int high = hexDigitValue(hex[i]);
        const int low = hexDigitValue(hex[i + 1]);
        if (high < 0 || low < 0) {
            throw std::invalid_argument("Invalid hex character in '" + std::string(hex) + "'");
        }
        bytes.push_back(static_cast<std::byte>((high << 4) | low));
    }
    return bytes;
}

bool isSha1Hex(std::string_view hex) {
    return hex.length() == constants::SHA1_HEX_LENGTH &&
           std::all_of(hex.begin(), hex.end(), [](char c) { return hexDigitValue(c) >= 0; });
}

std::string normalizeSha1Hex(std::string_view hex) {
    if (!isSha1Hex(hex)) {
        throw MalformedObject("'" + std::string(hex) + "' is not a valid object name");
    }
    std::string normalized(hex);
    std::transform(normalized.begin(), normalized.end(), normalized.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return normalized;
}
