#include "../include/pkt_line_utils.h"
#include "../include/errors.h"

#include <iostream>
#include <sstream>
#include <iomanip>
#include <span>

namespace {

constexpr size_t MAX_PKT_LENGTH = 65520;

int hexValue(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

std::string trimNewline(std::string text) {
    if (!text.empty() && text.back() == '\n') {
        text.pop_back();
    }
    return text;
}

} // namespace

PktLineReader::PktLineReader(std::istream& stream) : m_stream(stream), m_is_finished(false) {}

std::optional<Packet> PktLineReader::readNextPacket() {
    if (m_is_finished) return std::nullopt;

    char length_hex[4];
    m_stream.read(length_hex, 4);

    // Zero bytes left is a clean end; a partial prefix is a truncated stream.
    if (m_stream.gcount() == 0) {
        m_is_finished = true;
        return std::nullopt;
    }
    if (m_stream.gcount() < 4) {
        m_is_finished = true;
        throw ProtocolError("truncated pkt-line length prefix");
    }

    size_t length = 0;
    for (char c : length_hex) {
        const int digit = hexValue(c);
        if (digit < 0) {
            m_is_finished = true;
            throw ProtocolError("invalid pkt-line length '" + std::string(length_hex, 4) + "'");
        }
        length = (length << 4) | static_cast<size_t>(digit);
    }

    if (length == 0) {
        return Packet{PacketType::FLUSH, {}};
    }
    if (length == 1) {
        return Packet{PacketType::DELIM, {}};
    }
    if (length < 4 || length > MAX_PKT_LENGTH) {
        m_is_finished = true;
        throw ProtocolError("pkt-line length " + std::to_string(length) + " out of range");
    }

    // Read data
    const size_t content_length = length - 4;
    std::vector<std::byte> content(content_length);
    m_stream.read(reinterpret_cast<char*>(content.data()), static_cast<std::streamsize>(content_length));

    if (static_cast<size_t>(m_stream.gcount()) < content_length) {
        m_is_finished = true;
        throw ProtocolError("pkt-line payload truncated");
    }

    return Packet{PacketType::DATA, std::move(content)};
}


std::string createPktLine(const std::string& line) {
    if (line.empty()) {
        return "0000"; // special case flush-pkt
    }

    size_t len = line.length() + 4;
    std::stringstream ss;
    ss << std::setw(4) << std::setfill('0') << std::hex << len << line;
    return ss.str();
}


std::vector<std::byte> extractPackfileData(const std::string& response) {
    std::istringstream data_stream(response);
    PktLineReader pktLineReader(data_stream);

    std::vector<std::byte> packfile;

    while (auto packet_opt = pktLineReader.readNextPacket()) {
        if (packet_opt->type != PacketType::DATA || packet_opt->payload.empty()) {
            continue;
        }
        const auto& packet_data = packet_opt->payload;

        std::byte band_id = packet_data[0];
        auto content_span = std::span(packet_data).subspan(1);

        if (band_id == std::byte{1}) { // \x01 : packfile data
            packfile.insert(packfile.end(), content_span.begin(), content_span.end());
        } else if (band_id == std::byte{2}) { // \x02 : progress messages
            std::string message(reinterpret_cast<const char*>(content_span.data()), content_span.size());
            std::cerr << "remote: " << message;
        } else if (band_id == std::byte{3}) { // \x03 : fatal error
            std::string error_message(reinterpret_cast<const char*>(content_span.data()), content_span.size());
            throw ProtocolError("remote reported: " + trimNewline(error_message));
        } else {
            // NAK / ACK lines of the negotiation are plain text before the pack.
            std::string line(reinterpret_cast<const char*>(packet_data.data()), packet_data.size());
            if (line.rfind("ERR ", 0) == 0) {
                throw ProtocolError("remote reported: " + trimNewline(line.substr(4)));
            }
        }
    }
    return packfile;
}
