#include <catch2/catch.hpp>
#include "test_helpers.h"

#include "errors.h"
#include "object_store.h"
#include "packfile_decoder.h"

static const std::string HELLO_SHA = "b6fc4c620b67d95f953a5c1c1230aaab5db5a1b0";       // blob "hello"
static const std::string HELLO_WORLD_SHA = "95d09f2b10159347eece71399a7e2e907ea3df4f"; // blob "hello world"

// Delta turning "hello" into "hello world": copy 5 bytes from offset 0, insert " world".
static std::string helloWorldDelta() {
    return deltaSize(5) + deltaSize(11) + "\x90\x05" + "\x06" + " world";
}

// ---------------------------------------------------------------------------
// Delta application
// ---------------------------------------------------------------------------

TEST_CASE("Delta copies from the base and inserts literals", "[packfile]") {
    auto result = applyDelta(toBytes("hello"), toBytes(helloWorldDelta()));
    CHECK(bytesToString(result) == "hello world");
}

TEST_CASE("Copy with offset and size bytes", "[packfile]") {
    // Copy 5 bytes at offset 6 ("world"), then 1 byte at offset 5 (" "), then "hello".
    const std::string delta = deltaSize(11) + deltaSize(11) + "\x91\x06\x05" + "\x91\x05\x01" + "\x05" + "hello";
    CHECK(bytesToString(applyDelta(toBytes("hello world"), toBytes(delta))) == "world hello");
}

TEST_CASE("Copy size zero means 0x10000 bytes", "[packfile]") {
    const std::string base(0x10000, 'z');
    const std::string delta = deltaSize(0x10000) + deltaSize(0x10000) + "\x80";
    auto result = applyDelta(toBytes(base), toBytes(delta));
    CHECK(result.size() == 0x10000);
    CHECK(bytesToString(result) == base);
}

TEST_CASE("Invalid deltas raise MalformedPack", "[packfile]") {
    SECTION("copy past the end of the base") {
        const std::string delta = deltaSize(5) + deltaSize(10) + "\x90\x0a";
        CHECK_THROWS_AS(applyDelta(toBytes("hello"), toBytes(delta)), MalformedPack);
    }
    SECTION("base size mismatch") {
        CHECK_THROWS_AS(applyDelta(toBytes("hello!"), toBytes(helloWorldDelta())), MalformedPack);
    }
    SECTION("result size mismatch") {
        const std::string delta = deltaSize(5) + deltaSize(12) + "\x90\x05" + "\x06" + " world";
        CHECK_THROWS_AS(applyDelta(toBytes("hello"), toBytes(delta)), MalformedPack);
    }
    SECTION("reserved opcode") {
        const std::string delta = deltaSize(5) + deltaSize(1) + std::string(1, '\0');
        CHECK_THROWS_AS(applyDelta(toBytes("hello"), toBytes(delta)), MalformedPack);
    }
    SECTION("insert past the end of the delta") {
        const std::string delta = deltaSize(5) + deltaSize(6) + "\x06" + "abc";
        CHECK_THROWS_AS(applyDelta(toBytes("hello"), toBytes(delta)), MalformedPack);
    }
    SECTION("truncated copy instruction") {
        // Offset and size bytes are announced but missing.
        const std::string delta = deltaSize(5) + deltaSize(5) + "\x91";
        CHECK_THROWS_AS(applyDelta(toBytes("hello"), toBytes(delta)), MalformedPack);
    }
}

// ---------------------------------------------------------------------------
// Whole packs
// ---------------------------------------------------------------------------

TEST_CASE("Base objects are written to the store", "[packfile]") {
    TempDir tmp;
    ObjectStore store(tmp.path() / ".git");

    PackBuilder builder;
    builder.addObject(ObjectKind::BLOB, "hello");
    builder.addObject(ObjectKind::TREE, bytesToString(encodeTree({TreeEntry{"100644", "h", hexToBytes(HELLO_SHA)}})));
    const auto pack = builder.build();

    PackDecodeResult result = PackfileDecoder(pack, store).decode();
    REQUIRE(result.objects.size() == 2);
    CHECK(result.written_count == 2);
    CHECK(result.objects[0].sha1 == HELLO_SHA);
    CHECK(result.objects[0].offset_in_packfile == 12);
    CHECK(result.objects[1].kind == ObjectKind::TREE);
    CHECK(bytesToString(store.get(HELLO_SHA).payload) == "hello");
}

TEST_CASE("Ref delta against an earlier entry", "[packfile]") {
    TempDir tmp;
    ObjectStore store(tmp.path() / ".git");

    PackBuilder builder;
    builder.addObject(ObjectKind::BLOB, "hello");
    builder.addRefDelta(HELLO_SHA, helloWorldDelta());
    const auto pack = builder.build();

    PackDecodeResult result = PackfileDecoder(pack, store).decode();
    REQUIRE(result.objects.size() == 2);
    CHECK(result.objects[1].sha1 == HELLO_WORLD_SHA);
    CHECK(result.objects[1].was_delta);
    CHECK(result.objects[1].kind == ObjectKind::BLOB);
    CHECK(bytesToString(store.get(HELLO_WORLD_SHA).payload) == "hello world");
}

TEST_CASE("Ref delta against an object already in the store", "[packfile]") {
    TempDir tmp;
    ObjectStore store(tmp.path() / ".git");
    store.put(ObjectKind::BLOB, toBytes("hello"));

    PackBuilder builder;
    builder.addRefDelta(HELLO_SHA, helloWorldDelta());
    const auto pack = builder.build();

    PackfileDecoder(pack, store).decode();
    CHECK(bytesToString(store.get(HELLO_WORLD_SHA).payload) == "hello world");
}

TEST_CASE("Offset delta chains resolve", "[packfile]") {
    TempDir tmp;
    ObjectStore store(tmp.path() / ".git");

    PackBuilder builder;
    const size_t base = builder.addObject(ObjectKind::BLOB, "hello");
    const size_t first = builder.addOfsDelta(base, helloWorldDelta());
    builder.addOfsDelta(first, deltaSize(11) + deltaSize(12) + "\x90\x0b" + "\x01" + "!");
    const auto pack = builder.build(3);

    PackDecodeResult result = PackfileDecoder(pack, store).decode();
    REQUIRE(result.objects.size() == 3);
    CHECK(result.objects[2].was_delta);
    CHECK(bytesToString(store.get(result.objects[2].sha1).payload) == "hello world!");
    CHECK(result.objects[2].sha1 == addressOf(ObjectKind::BLOB, toBytes("hello world!")));
}

TEST_CASE("Objects already stored are counted as duplicates", "[packfile]") {
    TempDir tmp;
    ObjectStore store(tmp.path() / ".git");

    PackBuilder builder;
    builder.addObject(ObjectKind::BLOB, "hello");
    builder.addRefDelta(HELLO_SHA, helloWorldDelta());
    const auto pack = builder.build();

    PackfileDecoder(pack, store).decode();
    PackDecodeResult again = PackfileDecoder(pack, store).decode();
    CHECK(again.written_count == 0);
    CHECK(again.duplicate_count == 2);
}

TEST_CASE("Unknown ref delta base raises UnresolvedBaseDelta", "[packfile]") {
    TempDir tmp;
    ObjectStore store(tmp.path() / ".git");

    PackBuilder builder;
    builder.addRefDelta(HELLO_SHA, helloWorldDelta());
    const auto pack = builder.build();

    CHECK_THROWS_AS(PackfileDecoder(pack, store).decode(), UnresolvedBaseDelta);
    CHECK_FALSE(store.contains(HELLO_WORLD_SHA));
}

TEST_CASE("Offset delta must point at an earlier entry", "[packfile]") {
    TempDir tmp;
    ObjectStore store(tmp.path() / ".git");

    PackBuilder builder;
    builder.addObject(ObjectKind::BLOB, "hello");
    // Distance lands inside the header rather than on an entry.
    builder.addOfsDelta(4, helloWorldDelta());
    const auto pack = builder.build();

    CHECK_THROWS_AS(PackfileDecoder(pack, store).decode(), MalformedPack);
}

TEST_CASE("Checksum mismatch raises PackCorrupt", "[packfile]") {
    TempDir tmp;
    ObjectStore store(tmp.path() / ".git");

    PackBuilder builder;
    builder.addObject(ObjectKind::BLOB, "hello");
    auto pack = builder.build();
    pack.back() ^= std::byte{0xff};

    CHECK_THROWS_AS(PackfileDecoder(pack, store).decode(), PackCorrupt);
}

TEST_CASE("Malformed packs raise MalformedPack", "[packfile]") {
    TempDir tmp;
    ObjectStore store(tmp.path() / ".git");

    SECTION("bad signature") {
        PackBuilder builder;
        builder.addObject(ObjectKind::BLOB, "hello");
        auto pack = builder.build();
        pack[0] = std::byte{'K'};
        CHECK_THROWS_AS(PackfileDecoder(pack, store).decode(), MalformedPack);
    }
    SECTION("unsupported version") {
        PackBuilder builder;
        builder.addObject(ObjectKind::BLOB, "hello");
        CHECK_THROWS_AS(PackfileDecoder(builder.build(4), store).decode(), MalformedPack);
    }
    SECTION("too short") {
        auto pack = toBytes("PACK");
        CHECK_THROWS_AS(PackfileDecoder(pack, store).decode(), MalformedPack);
    }
    SECTION("junk after the last entry") {
        PackBuilder builder;
        builder.addObject(ObjectKind::BLOB, "hello");
        builder.appendRaw("junk");
        CHECK_THROWS_AS(PackfileDecoder(builder.build(), store).decode(), MalformedPack);
    }
    SECTION("reserved entry type") {
        PackBuilder builder;
        builder.appendRaw(std::string(1, '\x55'));
        auto pack = builder.build();
        // The entry area holds one header byte, so claim a single entry.
        pack[11] = std::byte{1};
        CHECK_THROWS_AS(PackfileDecoder(pack, store).decode(), MalformedPack);
    }
}
