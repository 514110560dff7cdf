#ifndef GUID_H
#define GUID_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <ostream>
#include <string>
#include <vector>

#include "guid_error.h"

const size_t GUID_SIZE = 16;

/**
 * Immutable 16-byte identifier.
 *
 * Values built by the generators carry the version 4 nibble in byte 6 and
 * the RFC 4122 variant bits in byte 8. Values built by parse_bytes() are
 * copied verbatim and are not checked for either.
 */
class GUID {
private:
    std::array<uint8_t, GUID_SIZE> bytes;

public:
    GUID();
    explicit GUID(const std::array<uint8_t, GUID_SIZE>& bytes);

    const std::array<uint8_t, GUID_SIZE>& data() const;
    uint8_t operator[](size_t index) const;

    // Canonical form: xxxxxxxx-xxxx-xxxx-xxxx-xxxxxxxxxxxx, lowercase
    std::string to_string() const;

    bool operator==(const GUID& other) const;
    bool operator!=(const GUID& other) const;
    bool operator<(const GUID& other) const;
};

std::ostream& operator<<(std::ostream& os, const GUID& guid);

/**
 * Parses the canonical text form, optionally wrapped in braces or prefixed
 * with "urn:uuid:". Only lowercase hex is accepted and the third group must
 * start with a version digit 1-5.
 *
 * Throws GuidError(MalformedText) when the text does not match and
 * GuidError(DecodeFailure) when a matched group is not valid hex.
 */
GUID parse_text(const std::string& text);

// Throws GuidError(InvalidLength) unless exactly GUID_SIZE bytes are given.
GUID parse_bytes(const std::vector<uint8_t>& bytes);
GUID parse_bytes(const uint8_t* data, size_t length);

#endif // GUID_H
