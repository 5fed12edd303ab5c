//
// Byte cursor used by the chunk and file decoders
//

#include <doctest/doctest.h>
#include <vector>

#include <pngme/exceptions.hh>
#include "../src/libpngme/input.hh"

using namespace pngme;

TEST_CASE("reader over a byte buffer") {
    const std::vector<std::uint8_t> data{0x00, 0x00, 0x01, 0x02, 'I', 'E', 'N', 'D', 0xAA, 0xBB};

    SUBCASE("big-endian integers and chunk types") {
        reader in(data.data(), data.size());
        CHECK(in.read_u32be() == 0x0102u);
        CHECK(in.read_chunk_type() == "IEND");
        CHECK(in.tell() == 8);
        CHECK(in.remaining() == 2);
        CHECK_FALSE(in.at_end());
    }

    SUBCASE("partial read stops at end") {
        reader in(data.data(), data.size());
        (void)in.read_exact(8);
        std::uint8_t buf[4] = {};
        CHECK(in.read(buf, sizeof(buf)) == 2);
        CHECK(buf[0] == 0xAA);
        CHECK(buf[1] == 0xBB);
        CHECK(in.at_end());
        CHECK(in.read(buf, sizeof(buf)) == 0);
    }

    SUBCASE("read_exact refuses short input") {
        reader in(data.data(), data.size());
        (void)in.read_exact(6);
        CHECK_THROWS_AS((void)in.read_exact(5), parse_error);
        CHECK(in.tell() == 6);
        CHECK(in.read_exact(4) == std::vector<std::uint8_t>{'N', 'D', 0xAA, 0xBB});
    }

    SUBCASE("integer reads refuse short input") {
        reader in(data.data(), data.size());
        (void)in.read_exact(7);
        CHECK_THROWS_AS((void)in.read_u32be(), parse_error);
        CHECK_THROWS_AS((void)in.read_chunk_type(), parse_error);
    }

    SUBCASE("reads advance the position") {
        reader in(data.data(), data.size());
        std::uint8_t buf[3] = {};
        CHECK(in.read(buf, sizeof(buf)) == 3);
        CHECK(in.tell() == 3);
        CHECK(in.read_exact(5).size() == 5);
        CHECK(in.tell() == 8);
        CHECK(in.remaining() == 2);
        (void)in.read_exact(2);
        CHECK(in.at_end());
        CHECK(in.size() == data.size());
    }

    SUBCASE("empty buffer") {
        reader in(nullptr, 0);
        CHECK(in.at_end());
        CHECK(in.size() == 0);
        CHECK_THROWS_AS((void)in.read_u32be(), parse_error);
    }
}
