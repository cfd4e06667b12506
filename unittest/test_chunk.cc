#include <doctest/doctest.h>
#include <pngchunk/chunk.hh>
#include <pngchunk/exceptions.hh>

#include <sstream>

#include "test_utils.hh"

using namespace pngchunk;

namespace {
    std::vector<std::byte> secret_chunk_bytes() {
        return raw_chunk(42, "RuSt", secret_message, secret_message_crc);
    }
}

TEST_SUITE("CHUNK") {
    TEST_CASE("chunk construction computes length and crc") {
        auto c = chunk::from_text(chunk_type::from_string("RuSt"), secret_message);
        CHECK(c.length() == 42);
        CHECK(c.crc() == secret_message_crc);
        CHECK(c.type().to_string() == "RuSt");
        CHECK(c.data() == to_bytes(secret_message));
        CHECK(c.encoded_size() == 54);
    }

    TEST_CASE("empty chunk") {
        chunk c("IEND"_ct, {});
        CHECK(c.length() == 0);
        CHECK(c.crc() == iend_crc);
        CHECK(c.as_bytes() == raw_chunk(0, "IEND", "", iend_crc));
    }

    TEST_CASE("decode valid chunk") {
        auto c = chunk::decode(secret_chunk_bytes());
        CHECK(c.length() == 42);
        CHECK(c.type().to_string() == "RuSt");
        CHECK(c.data_as_string() == secret_message);
        CHECK(c.crc() == secret_message_crc);
    }

    TEST_CASE("decode rejects wrong crc") {
        auto bytes = raw_chunk(42, "RuSt", secret_message, secret_message_crc - 1);
        CHECK_THROWS_AS(chunk::decode(bytes), invalid_crc);
    }

    TEST_CASE("encode then decode reproduces the chunk") {
        auto original = chunk::from_text("teSt"_ct, "hello");
        auto bytes = original.as_bytes();
        CHECK(bytes == raw_chunk(5, "teSt", "hello", 2716976590u));

        auto decoded = chunk::decode(bytes);
        CHECK(decoded == original);
        CHECK(decoded.as_bytes() == bytes);
    }

    TEST_CASE("single bit flips are detected") {
        const auto good = secret_chunk_bytes();

        // Type region [4, 8) and data region [8, 50)
        for (std::size_t pos = 4; pos < 50; ++pos) {
            for (int bit = 0; bit < 8; ++bit) {
                auto bytes = good;
                bytes[pos] ^= static_cast<std::byte>(1 << bit);
                try {
                    (void)chunk::decode(bytes);
                    FAIL("corruption at byte " << pos << " bit " << bit << " went unnoticed");
                } catch (const invalid_crc&) {
                } catch (const invalid_chunk_type&) {
                    // A type byte that is no longer a letter is caught first
                    CHECK(pos < 8);
                }
            }
        }
    }

    TEST_CASE("decode rejects short buffers") {
        auto bytes = secret_chunk_bytes();
        CHECK_THROWS_AS(chunk::decode(bytes.data(), 0), invalid_length);
        CHECK_THROWS_AS(chunk::decode(bytes.data(), 11), invalid_length);
    }

    TEST_CASE("decode rejects declared length beyond buffer") {
        SUBCASE("payload truncated") {
            auto bytes = secret_chunk_bytes();
            bytes.resize(30);
            CHECK_THROWS_AS(chunk::decode(bytes), invalid_length);
        }

        SUBCASE("huge declared length") {
            auto bytes = raw_chunk(0x7FFFFFFF, "RuSt", "", 0);
            CHECK_THROWS_AS(chunk::decode(bytes), invalid_length);
        }

        SUBCASE("length one past the end") {
            auto bytes = raw_chunk(6, "teSt", "hello", 2716976590u);
            CHECK_THROWS_AS(chunk::decode(bytes), invalid_length);
        }
    }

    TEST_CASE("decode rejects trailing bytes") {
        auto bytes = secret_chunk_bytes();
        bytes.push_back(std::byte{0});
        CHECK_THROWS_AS(chunk::decode(bytes), invalid_length);
    }

    TEST_CASE("read decodes the front of a longer buffer") {
        auto bytes = secret_chunk_bytes();
        auto tail = raw_chunk(0, "IEND", "", iend_crc);
        bytes.insert(bytes.end(), tail.begin(), tail.end());

        auto first = chunk::read(bytes.data(), bytes.size(), 0, parse_options{});
        CHECK(first.type().to_string() == "RuSt");
        CHECK(first.encoded_size() == 54);

        auto second = chunk::read(bytes.data() + 54, bytes.size() - 54, 54, parse_options{});
        CHECK(second.type().to_string() == "IEND");
    }

    TEST_CASE("decode rejects non letter chunk types") {
        auto bytes = raw_chunk(0, "Ru1t", "", 0);
        CHECK_THROWS_AS(chunk::decode(bytes), invalid_chunk_type);
    }

    TEST_CASE("reserved bit handling") {
        chunk reserved("Rust"_ct, to_bytes("hi"));
        auto bytes = reserved.as_bytes();

        SUBCASE("lenient mode warns") {
            int warnings = 0;
            parse_options opts;
            opts.on_warning = [&warnings](std::uint64_t offset, std::string_view category, std::string_view) {
                CHECK(offset == 0);
                CHECK(category == "reserved_bit");
                warnings++;
            };

            auto decoded = chunk::decode(bytes, opts);
            CHECK(warnings == 1);
            CHECK_FALSE(decoded.type().is_valid());
        }

        SUBCASE("lenient mode without handler") {
            CHECK_NOTHROW((void)chunk::decode(bytes));
        }

        SUBCASE("strict mode rejects") {
            parse_options opts;
            opts.strict = true;
            CHECK_THROWS_AS(chunk::decode(bytes, opts), invalid_chunk_type);
        }
    }

    TEST_CASE("data_as_string") {
        SUBCASE("utf-8 text") {
            auto c = chunk::from_text("teXt"_ct, "gr\xC3\xBC\xC3\x9F dich \xE2\x82\xAC \xF0\x9F\x98\x80");
            CHECK(c.data_as_string() == "gr\xC3\xBC\xC3\x9F dich \xE2\x82\xAC \xF0\x9F\x98\x80");
        }

        SUBCASE("empty payload") {
            chunk c("teXt"_ct, {});
            CHECK(c.data_as_string().empty());
        }

        SUBCASE("invalid sequences") {
            const char* bad[] = {
                "\xFF",             // never valid
                "abc\xC3",          // truncated sequence
                "\xC0\xAF",         // overlong '/'
                "\xED\xA0\x80",     // surrogate
                "\xF4\x90\x80\x80", // above U+10FFFF
                "\x80"              // lone continuation byte
            };
            for (const char* text : bad) {
                auto c = chunk::from_text("teXt"_ct, text);
                CHECK_THROWS_AS((void)c.data_as_string(), encoding_error);
            }
        }
    }

    TEST_CASE("chunk display") {
        SUBCASE("text payload") {
            std::ostringstream os;
            os << chunk::from_text("RuSt"_ct, secret_message);
            CHECK(os.str() == "Chunk Type: RuSt\nLength: 42\nData: " + secret_message + "\nCRC: 2882656334");
        }

        SUBCASE("text with line breaks and tabs") {
            std::ostringstream os;
            os << chunk::from_text("teXt"_ct, "line one\n\tline two\r\n");
            CHECK(os.str().find("Data: line one\n\tline two\r\n") != std::string::npos);
        }

        SUBCASE("valid utf-8 with control bytes is shown as binary") {
            // IHDR of a 1x1 RGBA image: every byte is below 0x80
            chunk ihdr("IHDR"_ct, {std::byte{0}, std::byte{0}, std::byte{0}, std::byte{1},
                                   std::byte{0}, std::byte{0}, std::byte{0}, std::byte{1},
                                   std::byte{8}, std::byte{6}, std::byte{0}, std::byte{0}, std::byte{0}});
            CHECK_NOTHROW((void)ihdr.data_as_string());

            std::ostringstream os;
            os << ihdr;
            auto text = os.str();
            CHECK(text.find("<13 bytes of binary data>") != std::string::npos);
            CHECK(text.find('\0') == std::string::npos);

            std::ostringstream del;
            del << chunk::from_text("teXt"_ct, "abc\x7F");
            CHECK(del.str().find("<4 bytes of binary data>") != std::string::npos);
        }

        SUBCASE("binary payload") {
            std::ostringstream os;
            os << chunk("biNa"_ct, {std::byte{0xFF}, std::byte{0x00}});
            CHECK(os.str().find("<2 bytes of binary data>") != std::string::npos);
        }
    }
}
