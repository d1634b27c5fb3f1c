#pragma once
#include <vector>
#include <span>
#include <cstddef>
#include <optional>

/**
 * @brief Decompresses a complete zlib stream.
 * The output buffer grows as needed; trailing bytes after the end of the stream are an error.
 * @param input The compressed data.
 * @param output A vector that will be cleared and filled with the decompressed data.
 * @return True on success, false if a zlib error occurs or the stream is truncated.
 */
bool decompressZlib(std::span<const std::byte> input, std::vector<std::byte>& output);

/**
 * @brief Compresses a data span using zlib.
 * @param input The raw data to compress.
 * @param output A vector that will be cleared and filled with the compressed data.
 * @return True on success, false if a zlib error occurs.
 */
bool compressZlib(std::span<const std::byte> input, std::vector<std::byte>& output);

/// Result of inflating a zlib stream embedded at the start of a larger buffer.
struct InflateResult {
    std::vector<std::byte> data; ///< The decompressed bytes.
    size_t bytesConsumed;        ///< Number of compressed input bytes the stream occupied.
};

/**
 * @brief Inflates the zlib stream that starts at the beginning of `input`.
 *
 * Packfiles concatenate one zlib stream per entry with no length prefix, so the
 * only way to find where an entry ends is to let zlib report how much input it
 * consumed when it reached the end of the stream.
 *
 * @param input Buffer starting at the first byte of the stream; may extend past its end.
 * @param maxOutput Upper bound on the decompressed size. Producing more is treated as failure.
 * @return The inflated data and consumed byte count, or std::nullopt if the stream is
 *         corrupt, truncated, or inflates to more than `maxOutput` bytes.
 */
std::optional<InflateResult> inflateStreamPrefix(std::span<const std::byte> input, size_t maxOutput);
