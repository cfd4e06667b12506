#include <doctest/doctest.h>
#include <pngchunk/chunk_type.hh>
#include <pngchunk/exceptions.hh>

#include <sstream>
#include <unordered_map>
#include <set>

using namespace pngchunk;

TEST_SUITE("CHUNK_TYPE") {
    TEST_CASE("chunk_type construction") {
        SUBCASE("from bytes") {
            std::array<std::uint8_t, 4> raw{82, 117, 83, 116};
            auto t = chunk_type::from_bytes(raw);
            CHECK(t.bytes() == raw);
            CHECK(t.to_string() == "RuSt");
        }

        SUBCASE("from raw pointer") {
            const char data[] = "IHDR";
            auto t = chunk_type::from_bytes(data);
            CHECK(t.to_string() == "IHDR");
        }

        SUBCASE("from string") {
            auto t = chunk_type::from_string("RuSt");
            std::array<std::uint8_t, 4> expected{82, 117, 83, 116};
            CHECK(t.bytes() == expected);
        }

        SUBCASE("literal") {
            constexpr auto t = "IEND"_ct;
            CHECK(t.to_string() == "IEND");
            CHECK(t == chunk_type::from_string("IEND"));
        }

        SUBCASE("from_bytes accepts non letters") {
            auto t = chunk_type::from_bytes("Ru1t");
            CHECK(t.to_string() == "Ru1t");
            CHECK_FALSE(t.is_alphabetic());
            CHECK_FALSE(t.is_valid());
        }
    }

    TEST_CASE("chunk_type from_string rejects bad input") {
        CHECK_THROWS_AS(chunk_type::from_string("Ru1t"), invalid_chunk_type);
        CHECK_THROWS_AS(chunk_type::from_string("Ru t"), invalid_chunk_type);
        CHECK_THROWS_AS(chunk_type::from_string("RuS"), invalid_chunk_type);
        CHECK_THROWS_AS(chunk_type::from_string("RuStX"), invalid_chunk_type);
        CHECK_THROWS_AS(chunk_type::from_string(""), invalid_chunk_type);
        CHECK_THROWS_AS(chunk_type::from_string("R\xC3\xA9t"), invalid_chunk_type);

        try {
            (void)chunk_type::from_string("12ab");
            FAIL("Should have thrown exception");
        } catch (const pngchunk_error& e) {
            CHECK(e.kind() == error_kind::invalid_chunk_type);
        }
    }

    TEST_CASE("chunk_type property bits") {
        SUBCASE("critical") {
            CHECK(chunk_type::from_string("RuSt").is_critical());
            CHECK_FALSE(chunk_type::from_string("ruSt").is_critical());
        }

        SUBCASE("public") {
            CHECK(chunk_type::from_string("RUSt").is_public());
            CHECK_FALSE(chunk_type::from_string("RuSt").is_public());
        }

        SUBCASE("reserved bit") {
            CHECK(chunk_type::from_string("RuSt").is_reserved_bit_valid());
            CHECK_FALSE(chunk_type::from_string("Rust").is_reserved_bit_valid());
        }

        SUBCASE("safe to copy") {
            CHECK(chunk_type::from_string("RuSt").is_safe_to_copy());
            CHECK_FALSE(chunk_type::from_string("RuST").is_safe_to_copy());
        }

        SUBCASE("standard chunks") {
            auto ihdr = chunk_type::from_string("IHDR");
            CHECK(ihdr.is_critical());
            CHECK(ihdr.is_public());
            CHECK_FALSE(ihdr.is_safe_to_copy());

            auto text = chunk_type::from_string("tEXt");
            CHECK_FALSE(text.is_critical());
            CHECK(text.is_public());
            CHECK(text.is_safe_to_copy());
        }
    }

    TEST_CASE("chunk_type validity") {
        CHECK(chunk_type::from_string("RuSt").is_valid());

        // Letters only, but the reserved bit is set
        auto reserved = chunk_type::from_string("Rust");
        CHECK(reserved.is_alphabetic());
        CHECK_FALSE(reserved.is_valid());

        CHECK_FALSE(chunk_type::from_bytes("Ru1t").is_valid());
    }

    TEST_CASE("chunk_type comparison and text") {
        auto a = chunk_type::from_string("RuSt");
        auto b = chunk_type::from_string("RuSt");
        auto c = chunk_type::from_string("RuSa");

        CHECK(a == b);
        CHECK(a != c);
        CHECK(c < a);
        CHECK(a == std::string_view("RuSt"));
        CHECK(a != std::string_view("rust"));
        CHECK(a != std::string_view("RuS"));
        CHECK(chunk_type::from_string(a.to_string()) == a);

        std::ostringstream os;
        os << a;
        CHECK(os.str() == "RuSt");

        std::ostringstream escaped;
        escaped << chunk_type::from_bytes("Ru\x01t");
        CHECK(escaped.str() == "Ru\\x01t");
    }

    TEST_CASE("chunk_type as container key") {
        std::unordered_map<chunk_type, int> counts;
        counts["IDAT"_ct]++;
        counts["IDAT"_ct]++;
        counts["IEND"_ct]++;
        CHECK(counts.size() == 2);
        CHECK(counts["IDAT"_ct] == 2);

        std::set<chunk_type> ordered{"tEXt"_ct, "IHDR"_ct, "IEND"_ct};
        CHECK(ordered.begin()->to_string() == "IEND");
    }
}
