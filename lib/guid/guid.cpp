#include "guid.h"

#include <algorithm>
#include <iomanip>
#include <regex>
#include <sstream>

using namespace std;

// Braces are matched independently, so "{...", "...}" and "{...}" all parse.
static const regex HEX_PATTERN(
    "(urn:uuid:)?\\{?([a-z0-9]{8})-([a-z0-9]{4})-"
    "([1-5][a-z0-9]{3})-([a-z0-9]{4})-([a-z0-9]{12})\\}?");

static int hex_value(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return 10 + c - 'a';
    }
    return -1;
}

static vector<uint8_t> decode_hex(const string& hex) {
    if (hex.size() % 2 != 0) {
        throw GuidError(GuidErrc::DecodeFailure, "odd length hex string");
    }

    vector<uint8_t> out;
    out.reserve(hex.size() / 2);
    for (size_t i = 0; i < hex.size(); i += 2) {
        int hi = hex_value(hex[i]);
        int lo = hex_value(hex[i + 1]);
        if (hi < 0 || lo < 0) {
            char bad = hi < 0 ? hex[i] : hex[i + 1];
            throw GuidError(GuidErrc::DecodeFailure,
                            string("invalid hex byte: '") + bad + "'");
        }
        out.push_back(static_cast<uint8_t>((hi << 4) | lo));
    }
    return out;
}

GUID::GUID() {
    bytes.fill(0);
}

GUID::GUID(const array<uint8_t, GUID_SIZE>& bytes) : bytes(bytes) {}

const array<uint8_t, GUID_SIZE>& GUID::data() const {
    return bytes;
}

uint8_t GUID::operator[](size_t index) const {
    return bytes.at(index);
}

string GUID::to_string() const {
    stringstream ss;
    ss << hex << setfill('0');
    for (size_t i = 0; i < GUID_SIZE; ++i) {
        ss << setw(2) << static_cast<int>(bytes[i]);
        if (i == 3 || i == 5 || i == 7 || i == 9) {
            ss << "-";
        }
    }
    return ss.str();
}

bool GUID::operator==(const GUID& other) const {
    return bytes == other.bytes;
}

bool GUID::operator!=(const GUID& other) const {
    return bytes != other.bytes;
}

bool GUID::operator<(const GUID& other) const {
    return bytes < other.bytes;
}

ostream& operator<<(ostream& os, const GUID& guid) {
    return os << guid.to_string();
}

GUID parse_text(const string& text) {
    smatch md;
    if (!regex_match(text, md, HEX_PATTERN)) {
        throw GuidError(GuidErrc::MalformedText, "Invalid GUID string: " + text);
    }

    string hash = md[2].str() + md[3].str() + md[4].str() + md[5].str() + md[6].str();
    vector<uint8_t> decoded = decode_hex(hash);
    return parse_bytes(decoded);
}

GUID parse_bytes(const vector<uint8_t>& bytes) {
    return parse_bytes(bytes.data(), bytes.size());
}

GUID parse_bytes(const uint8_t* data, size_t length) {
    if (length != GUID_SIZE) {
        throw GuidError(GuidErrc::InvalidLength,
                        "Given slice is not valid GUID sequence (" +
                            std::to_string(length) + " bytes)");
    }

    array<uint8_t, GUID_SIZE> bytes;
    copy(data, data + GUID_SIZE, bytes.begin());
    return GUID(bytes);
}
