#pragma once
#include <istream>
#include <vector>
#include <string>
#include <optional>
#include <cstddef>

/// Kinds of pkt-line packet.
enum class PacketType {
    DATA,  ///< A length-prefixed payload.
    FLUSH, ///< "0000", ends a section.
    DELIM  ///< "0001", protocol v2 section delimiter.
};

/// One packet read from a pkt-line stream.
struct Packet {
    PacketType type;
    std::vector<std::byte> payload; ///< Empty for FLUSH and DELIM.
};

/**
 * @class PktLineReader
 * @brief A stateful reader for Git's pkt-line formatted data streams.
 *
 * This class reads one "packet" at a time from a stream. A packet consists
 * of a 4-byte hex length prefix (which counts itself) followed by the payload.
 */
class PktLineReader {
private:
    std::istream& m_stream;
    bool m_is_finished;

public:
    explicit PktLineReader(std::istream& stream);

    /**
     * @brief Reads the next packet from the stream.
     * @return The packet, or std::nullopt once the stream is exhausted at a packet boundary.
     * @throws ProtocolError if the length prefix is not hex, is out of range, or the
     *         payload is shorter than announced.
     */
    std::optional<Packet> readNextPacket();
};

/**
 * @brief Encodes a string into the pkt-line format.
 * Prepends the payload length as a 4-character hex string.
 * @param line The payload to encode. An empty string creates a flush-pkt ("0000").
 * @return The pkt-line formatted string.
 */
std::string createPktLine(const std::string& line);

/**
 * @brief Extracts raw packfile data from a side-band multiplexed upload-pack response.
 *
 * Band 1 carries pack data and is concatenated; band 2 carries progress text,
 * echoed to stderr as "remote: ..."; band 3 carries a fatal remote error.
 * Acknowledgement lines (NAK / ACK) preceding the pack are skipped.
 *
 * @param response The full server response body.
 * @return The concatenated band-1 bytes.
 * @throws ProtocolError on malformed framing or a band-3 error message.
 */
std::vector<std::byte> extractPackfileData(const std::string& response);
