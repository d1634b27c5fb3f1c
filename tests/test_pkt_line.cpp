#include <catch2/catch.hpp>
#include "test_helpers.h"

#include "errors.h"
#include "pkt_line_utils.h"

#include <sstream>

TEST_CASE("Pkt-line length counts its own prefix", "[pkt_line]") {
    CHECK(createPktLine("hello\n") == "000ahello\n");
    CHECK(createPktLine("") == "0000");
    CHECK(createPktLine(std::string(300, 'x')).substr(0, 4) == "0130");
}

TEST_CASE("Reader yields data, flush and delim packets", "[pkt_line]") {
    std::istringstream stream(createPktLine("first\n") + "0000" + "0001" + createPktLine("second"));
    PktLineReader reader(stream);

    auto packet = reader.readNextPacket();
    REQUIRE(packet);
    CHECK(packet->type == PacketType::DATA);
    CHECK(bytesToString(packet->payload) == "first\n");

    packet = reader.readNextPacket();
    REQUIRE(packet);
    CHECK(packet->type == PacketType::FLUSH);

    packet = reader.readNextPacket();
    REQUIRE(packet);
    CHECK(packet->type == PacketType::DELIM);

    packet = reader.readNextPacket();
    REQUIRE(packet);
    CHECK(bytesToString(packet->payload) == "second");

    CHECK_FALSE(reader.readNextPacket().has_value());
    CHECK_FALSE(reader.readNextPacket().has_value());
}

TEST_CASE("Reader rejects bad framing", "[pkt_line]") {
    SECTION("non-hex length") {
        std::istringstream stream("zzzzpayload");
        PktLineReader reader(stream);
        CHECK_THROWS_AS(reader.readNextPacket(), ProtocolError);
    }
    SECTION("length below the prefix size") {
        std::istringstream stream("0003");
        PktLineReader reader(stream);
        CHECK_THROWS_AS(reader.readNextPacket(), ProtocolError);
    }
    SECTION("truncated payload") {
        std::istringstream stream("0010short");
        PktLineReader reader(stream);
        CHECK_THROWS_AS(reader.readNextPacket(), ProtocolError);
    }
    SECTION("truncated length prefix") {
        std::istringstream stream("00");
        PktLineReader reader(stream);
        CHECK_THROWS_AS(reader.readNextPacket(), ProtocolError);
    }
}

TEST_CASE("Side-band data is demultiplexed", "[pkt_line]") {
    const std::string response = createPktLine("NAK\n") +
                                 createPktLine("\x02" "Counting objects: 3\n") +
                                 createPktLine("\x01" "PACK") +
                                 createPktLine("\x02" "done\n") +
                                 createPktLine("\x01" "more") +
                                 createPktLine("");
    CHECK(bytesToString(extractPackfileData(response)) == "PACKmore");
}

TEST_CASE("Side-band error channel raises ProtocolError", "[pkt_line]") {
    const std::string response = createPktLine("NAK\n") + createPktLine("\x01" "PA") +
                                 createPktLine("\x03" "upload-pack: not our ref\n");
    CHECK_THROWS_AS(extractPackfileData(response), ProtocolError);
}

TEST_CASE("ERR line raises ProtocolError", "[pkt_line]") {
    CHECK_THROWS_AS(extractPackfileData(createPktLine("ERR access denied\n")), ProtocolError);
}
