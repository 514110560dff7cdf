#include <iostream>
#include <cassert>
#include <sstream>
#include <vector>
#include "guid/guid.h"

static const std::vector<uint8_t> SAMPLE_BYTES = {
    0x6b, 0xa7, 0xb8, 0x14, 0x9d, 0xad, 0x41, 0xd1,
    0x80, 0xb4, 0x00, 0xc0, 0x4f, 0xd4, 0x30, 0xc8};

static GuidErrc parse_text_error(const std::string& text) {
    try {
        parse_text(text);
    } catch (const GuidError& e) {
        return e.code();
    }
    assert(false && "parse_text should have thrown");
    return GuidErrc::MalformedText;
}

void test_to_string() {
    std::vector<uint8_t> seq;
    for (uint8_t i = 0; i < 16; ++i) {
        seq.push_back(i);
    }
    GUID guid = parse_bytes(seq);
    assert(guid.to_string() == "00010203-0405-0607-0809-0a0b0c0d0e0f");

    // Zero value and values without version bits still render
    assert(GUID().to_string() == "00000000-0000-0000-0000-000000000000");
    std::vector<uint8_t> ff(16, 0xff);
    assert(parse_bytes(ff).to_string() == "ffffffff-ffff-ffff-ffff-ffffffffffff");

    std::stringstream ss;
    ss << parse_bytes(SAMPLE_BYTES);
    assert(ss.str() == "6ba7b814-9dad-41d1-80b4-00c04fd430c8");
}

void test_parse_bytes() {
    GUID guid = parse_bytes(SAMPLE_BYTES);
    for (size_t i = 0; i < GUID_SIZE; ++i) {
        assert(guid[i] == SAMPLE_BYTES[i]);
    }

    // No version/variant fix-up on raw input
    std::vector<uint8_t> zeros(16, 0);
    assert(parse_bytes(zeros) == GUID());
    assert(parse_bytes(zeros)[6] == 0x00);

    const uint8_t raw[16] = {0xde, 0xad, 0xbe, 0xef};
    assert(parse_bytes(raw, sizeof(raw)).to_string() == "deadbeef-0000-0000-0000-000000000000");

    for (size_t len : {0, 1, 15, 17, 32}) {
        std::vector<uint8_t> bad(len, 0xab);
        bool thrown = false;
        try {
            parse_bytes(bad);
        } catch (const GuidError& e) {
            thrown = true;
            assert(e.code() == GuidErrc::InvalidLength);
        }
        assert(thrown);
    }
}

void test_parse_text_forms() {
    GUID expected = parse_bytes(SAMPLE_BYTES);

    assert(parse_text("6ba7b814-9dad-41d1-80b4-00c04fd430c8") == expected);
    assert(parse_text("{6ba7b814-9dad-41d1-80b4-00c04fd430c8}") == expected);
    assert(parse_text("urn:uuid:6ba7b814-9dad-41d1-80b4-00c04fd430c8") == expected);
    assert(parse_text("urn:uuid:{6ba7b814-9dad-41d1-80b4-00c04fd430c8}") == expected);

    // A lone brace on either side is tolerated
    assert(parse_text("{6ba7b814-9dad-41d1-80b4-00c04fd430c8") == expected);
    assert(parse_text("6ba7b814-9dad-41d1-80b4-00c04fd430c8}") == expected);

    // Version digits 1-5 are all accepted in the third group
    assert(parse_text("6ba7b814-9dad-11d1-80b4-00c04fd430c8")[6] == 0x11);
    assert(parse_text("6ba7b814-9dad-51d1-80b4-00c04fd430c8")[6] == 0x51);
}

void test_parse_text_errors() {
    assert(parse_text_error("not-a-uuid") == GuidErrc::MalformedText);
    assert(parse_text_error("") == GuidErrc::MalformedText);
    assert(parse_text_error("6BA7B814-9DAD-41D1-80B4-00C04FD430C8") == GuidErrc::MalformedText);
    assert(parse_text_error("6ba7b814-9dad-61d1-80b4-00c04fd430c8") == GuidErrc::MalformedText);
    assert(parse_text_error("6ba7b814-9dad-01d1-80b4-00c04fd430c8") == GuidErrc::MalformedText);
    assert(parse_text_error("6ba7b8149dad41d180b400c04fd430c8") == GuidErrc::MalformedText);
    assert(parse_text_error("6ba7b814-9dad-41d1-80b4-00c04fd430c8 ") == GuidErrc::MalformedText);
    assert(parse_text_error("uuid:6ba7b814-9dad-41d1-80b4-00c04fd430c8") == GuidErrc::MalformedText);
    assert(parse_text_error("{{6ba7b814-9dad-41d1-80b4-00c04fd430c8}") == GuidErrc::MalformedText);

    // Letters past 'f' pass the pattern but not the hex decode
    assert(parse_text_error("6ba7b81g-9dad-41d1-80b4-00c04fd430c8") == GuidErrc::DecodeFailure);
    assert(parse_text_error("6ba7b814-9dad-41d1-80b4-00c04fd430cz") == GuidErrc::DecodeFailure);
}

void test_round_trip() {
    std::vector<uint8_t> bytes(16);
    for (int seed = 0; seed < 64; ++seed) {
        for (size_t i = 0; i < bytes.size(); ++i) {
            bytes[i] = static_cast<uint8_t>(seed * 37 + i * 11);
        }
        // Keep a valid version digit in the third group
        bytes[6] = static_cast<uint8_t>(0x10 * (1 + seed % 5) | (bytes[6] & 0x0f));

        GUID guid = parse_bytes(bytes);
        assert(parse_text(guid.to_string()) == guid);
    }
}

void test_error_names() {
    assert(std::string(guid_errc_name(GuidErrc::MalformedText)) == "MalformedText");
    assert(std::string(guid_errc_name(GuidErrc::DecodeFailure)) == "DecodeFailure");
    assert(std::string(guid_errc_name(GuidErrc::InvalidLength)) == "InvalidLength");
    assert(std::string(guid_errc_name(GuidErrc::InterfaceEnumerationFailure)) ==
           "InterfaceEnumerationFailure");

    try {
        parse_bytes(std::vector<uint8_t>(3, 0));
        assert(false && "parse_bytes should have thrown");
    } catch (const GuidError& e) {
        std::cout << "Caught " << guid_errc_name(e.code()) << std::endl;
        assert(std::string(e.what()).find("InvalidLength: ") == 0);
    }
}

void test_comparison() {
    std::vector<uint8_t> low(16, 0x00);
    std::vector<uint8_t> high(16, 0x00);
    high[15] = 0x01;
    assert(parse_bytes(low) < parse_bytes(high));
    assert(!(parse_bytes(high) < parse_bytes(low)));
    assert(parse_bytes(low) != parse_bytes(high));
}

int main() {
    try {
        std::cout << "--- GUID Value and Parse Test ---" << std::endl;
        test_to_string();
        test_parse_bytes();
        test_parse_text_forms();
        test_parse_text_errors();
        test_round_trip();
        test_error_names();
        test_comparison();
        std::cout << "Status: ALL TESTS PASSED!" << std::endl;
    } catch (const std::exception& e) {
        std::cerr << "Test failed with error: " << e.what() << std::endl;
        return 1;
    }
    return 0;
}
