#pragma once
#include <string>
#include <string_view>
#include <vector>
#include <span>

/**
 * @brief Calculates the raw 20-byte SHA-1 hash of a data span.
 * This is a low-level function that uses OpenSSL.
 */
std::vector<std::byte> calculateSha1(std::span<const std::byte> data);

/**
 * @brief Converts a span of raw bytes to its lowercase hexadecimal string representation.
 */
std::string bytesToHex(std::span<const std::byte> bytes);

/**
 * @brief A convenience function to calculate the SHA-1 hash and return it as a hex string.
 */
std::string calculateSha1Hex(std::span<const std::byte> data);

/**
 * @brief Converts a hexadecimal string back into a vector of raw bytes.
 * @throws std::invalid_argument if the string has an odd length or a non-hex character.
 */
std::vector<std::byte> hexToBytes(std::string_view hex);

/**
 * @brief Checks that a string is a 40-character hex SHA-1 (either case).
 */
bool isSha1Hex(std::string_view hex);

/**
 * @brief Lowercases a hex SHA-1 after validating it.
 * @throws MalformedObject if `hex` is not a 40-character hex string.
 */
std::string normalizeSha1Hex(std::string_view hex);
