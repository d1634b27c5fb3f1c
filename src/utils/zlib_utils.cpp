#include "../include/zlib_utils.h"
#include <zlib.h>

#include <algorithm>
#include <climits>
#include <cstdint>
#include <span>

namespace {

constexpr size_t INFLATE_CHUNK = 16 * 1024;

// Runs inflate until the end of the first zlib stream in `input`.
// Returns false on corruption, truncation, or output beyond `maxOutput`.
bool inflateStream(std::span<const std::byte> input, size_t maxOutput,
                   std::vector<std::byte>& output, size_t& consumed) {
    z_stream strm = {};
    strm.next_in = reinterpret_cast<Bytef*>(const_cast<std::byte*>(input.data()));
    strm.avail_in = static_cast<uInt>(std::min<size_t>(input.size(), UINT_MAX));

    if (inflateInit(&strm) != Z_OK) {
        return false;
    }

    output.clear();
    int ret = Z_OK;
    while (ret != Z_STREAM_END) {
        // Allow one byte past the limit so an oversized stream is detected, not truncated.
        const size_t room = std::min(INFLATE_CHUNK, maxOutput + 1 - output.size());
        if (room == 0) {
            inflateEnd(&strm);
            return false;
        }
        const size_t produced = output.size();
        output.resize(produced + room);
        strm.next_out = reinterpret_cast<Bytef*>(output.data() + produced);
        strm.avail_out = static_cast<uInt>(room);

        ret = inflate(&strm, Z_NO_FLUSH);
        output.resize(produced + (room - strm.avail_out));

        if (ret == Z_NEED_DICT || ret == Z_DATA_ERROR || ret == Z_MEM_ERROR || ret == Z_STREAM_ERROR) {
            inflateEnd(&strm);
            return false;
        }
        if (ret == Z_BUF_ERROR && strm.avail_in == 0) {
            inflateEnd(&strm); // Input ran out before the end of the stream.
            return false;
        }
        if (output.size() > maxOutput) {
            inflateEnd(&strm);
            return false;
        }
    }

    consumed = strm.total_in;
    inflateEnd(&strm);
    return true;
}

} // namespace

bool decompressZlib(std::span<const std::byte> input, std::vector<std::byte>& output) {
    size_t consumed = 0;
    if (!inflateStream(input, SIZE_MAX - 1, output, consumed)) {
        return false;
    }
    return consumed == input.size();
}

bool compressZlib(std::span<const std::byte> input, std::vector<std::byte>& output) {
    uLong sourceLen = input.size();
    uLongf destLen = compressBound(sourceLen);
    output.resize(destLen);

    int result = compress(
        reinterpret_cast<Bytef*>(output.data()), &destLen,
        reinterpret_cast<const Bytef*>(input.data()), sourceLen
    );

    if (result != Z_OK) {
        return false;
    }

    output.resize(destLen); // Shrink buffer to actual compressed size
    return true;
}

std::optional<InflateResult> inflateStreamPrefix(std::span<const std::byte> input, size_t maxOutput) {
    InflateResult result;
    result.bytesConsumed = 0;
    if (!inflateStream(input, maxOutput, result.data, result.bytesConsumed)) {
        return std::nullopt;
    }
    return result;
}
