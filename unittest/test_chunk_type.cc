#include <doctest/doctest.h>
#include <pngme/chunk_type.hh>
#include <pngme/chunk_types.hh>
#include <pngme/exceptions.hh>

#include <array>
#include <sstream>
#include <unordered_map>
#include <set>

using namespace pngme;

TEST_SUITE("CHUNK_TYPE") {
    TEST_CASE("chunk type construction") {
        SUBCASE("from bytes") {
            std::array<std::uint8_t, 4> expected{82, 117, 83, 116};
            chunk_type t(expected);
            CHECK(t.bytes() == expected);
            CHECK(t.to_string() == "RuSt");
        }

        SUBCASE("from raw memory") {
            const std::uint8_t raw[] = {'I', 'H', 'D', 'R', 0xFF};
            auto t = chunk_type::from_bytes(raw);
            CHECK(t == chunk_types::IHDR);
        }

        SUBCASE("from string equals from bytes") {
            chunk_type by_bytes(std::array<std::uint8_t, 4>{82, 117, 83, 116});
            auto by_name = chunk_type::parse("RuSt");
            CHECK(by_bytes == by_name);
        }

        SUBCASE("default construction is four spaces") {
            chunk_type t;
            CHECK(t.to_string() == "    ");
            CHECK_FALSE(t.is_valid());
        }

        SUBCASE("raw construction accepts any byte") {
            chunk_type t(std::array<std::uint8_t, 4>{0x00, 0xFF, '1', 'a'});
            CHECK(t[0] == 0x00);
            CHECK(t[1] == 0xFF);
            CHECK_FALSE(t.is_valid());
        }
    }

    TEST_CASE("chunk type parsing") {
        SUBCASE("wrong length") {
            for (std::string_view text : {"", "Rus", "RuStx", "RuSt RuSt"}) {
                try {
                    (void)chunk_type::parse(text);
                    FAIL("Should have thrown for '" << text << "'");
                } catch (const chunk_type_error& e) {
                    CHECK(e.error_kind() == chunk_type_error::kind::invalid_length);
                    CHECK(e.length() == text.size());
                }
            }
        }

        SUBCASE("non-letter characters") {
            for (std::string_view text : {"Ru1t", "Ru t", "R_St", "@uSt", "RuS{"}) {
                try {
                    (void)chunk_type::parse(text);
                    FAIL("Should have thrown for '" << text << "'");
                } catch (const chunk_type_error& e) {
                    CHECK(e.error_kind() == chunk_type_error::kind::invalid_character);
                }
            }
        }

        SUBCASE("multi-byte UTF-8 is rejected by length") {
            CHECK_THROWS_AS((void)chunk_type::parse("R\xC3\xBCSt"), chunk_type_error);
        }

        SUBCASE("reserved bit set still parses") {
            auto t = chunk_type::parse("Rust");
            CHECK(t.to_string() == "Rust");
            CHECK_FALSE(t.is_valid());
        }

        SUBCASE("errors are parse errors") {
            CHECK_THROWS_AS((void)chunk_type::parse("Ru1t"), parse_error);
            CHECK_THROWS_AS((void)chunk_type::parse("Ru1t"), pngme_error);
        }
    }

    TEST_CASE("chunk type properties") {
        SUBCASE("critical") {
            CHECK(chunk_type::parse("RuSt").is_critical());
            CHECK_FALSE(chunk_type::parse("ruSt").is_critical());
        }

        SUBCASE("public") {
            CHECK(chunk_type::parse("RUSt").is_public());
            CHECK_FALSE(chunk_type::parse("RuSt").is_public());
        }

        SUBCASE("reserved bit") {
            CHECK(chunk_type::parse("RuSt").is_reserved_bit_valid());
            CHECK_FALSE(chunk_type::parse("Rust").is_reserved_bit_valid());
        }

        SUBCASE("safe to copy") {
            CHECK(chunk_type::parse("RuSt").is_safe_to_copy());
            CHECK_FALSE(chunk_type::parse("RuST").is_safe_to_copy());
        }

        SUBCASE("validity") {
            CHECK(chunk_type::parse("RuSt").is_valid());
            CHECK_FALSE(chunk_type::parse("Rust").is_valid());
        }

        SUBCASE("standard chunks") {
            CHECK(chunk_types::IHDR.is_critical());
            CHECK(chunk_types::IHDR.is_public());
            CHECK_FALSE(chunk_types::IHDR.is_safe_to_copy());
            CHECK(chunk_types::IEND.is_valid());

            CHECK_FALSE(chunk_types::tEXt.is_critical());
            CHECK(chunk_types::tEXt.is_public());
            CHECK(chunk_types::tEXt.is_safe_to_copy());

            CHECK_FALSE(chunk_types::gAMA.is_safe_to_copy());
        }

        SUBCASE("every letter combination with reserved bit clear is valid") {
            const std::string upper = "ABCDEFGHIJKLMNOPQRSTUVWXYZ";
            const std::string lower = "abcdefghijklmnopqrstuvwxyz";
            const std::string letters = upper + lower;
            for (char a : letters) {
                for (char c : upper) {
                    chunk_type t(a, 'x', c, 'Y');
                    CHECK(t.is_valid());
                }
                for (char c : lower) {
                    chunk_type t(a, 'x', c, 'Y');
                    CHECK_FALSE(t.is_valid());
                }
            }
        }

        SUBCASE("any non-letter byte makes the type invalid") {
            for (int v = 0; v < 256; ++v) {
                auto c = static_cast<std::uint8_t>(v);
                if (chunk_type::is_ascii_letter(c)) {
                    continue;
                }
                for (std::size_t pos = 0; pos < 4; ++pos) {
                    std::array<std::uint8_t, 4> bytes{'R', 'U', 'S', 'T'};
                    bytes[pos] = c;
                    CHECK_FALSE(chunk_type(bytes).is_valid());
                }
            }
        }
    }

    TEST_CASE("chunk type rendering") {
        SUBCASE("to_string") {
            CHECK(chunk_type::parse("RuSt").to_string() == "RuSt");
            CHECK(chunk_type::parse("RuSt").to_string_view() == "RuSt");
        }

        SUBCASE("stream output") {
            std::ostringstream oss;
            oss << chunk_type::parse("RuSt");
            CHECK(oss.str() == "RuSt");
        }

        SUBCASE("stream output escapes non-printable bytes") {
            std::ostringstream oss;
            oss << chunk_type(std::array<std::uint8_t, 4>{'A', 0x01, 'B', 0xFF});
            CHECK(oss.str() == "A\\x01B\\xff");
        }

        SUBCASE("hex stream output") {
            std::ostringstream oss;
            oss << std::hex << chunk_types::IHDR;
            CHECK(oss.str() == "0x49484452");
        }

        SUBCASE("uint32 is big-endian") {
            CHECK(chunk_types::IEND.to_uint32() == 0x49454E44u);
        }

        SUBCASE("comparison with names") {
            auto t = chunk_type::parse("RuSt");
            CHECK(t == "RuSt");
            CHECK(t != "RUST");
        }
    }

    TEST_CASE("chunk type in containers") {
        SUBCASE("hashable") {
            std::unordered_map<chunk_type, int> counts;
            counts[chunk_types::IDAT]++;
            counts[chunk_types::IDAT]++;
            counts[chunk_types::IEND]++;
            CHECK(counts.size() == 2);
            CHECK(counts[chunk_types::IDAT] == 2);
        }

        SUBCASE("ordered") {
            std::set<chunk_type> types{chunk_types::IHDR, chunk_types::IDAT, chunk_types::IEND};
            CHECK(types.size() == 3);
            CHECK(*types.begin() == chunk_types::IDAT);
        }
    }
}
