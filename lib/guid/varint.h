#ifndef VARINT_H
#define VARINT_H

#include <cstddef>
#include <cstdint>
#include <vector>

// Longest encoding of a 64-bit value in base-128 groups
const size_t MAX_VARINT_LEN64 = 10;

/**
 * Decodes one unsigned little-endian base-128 varint from the front of buf.
 * Returns false on empty input, truncated input or overflow; value then
 * holds whatever was accumulated before the failure.
 */
bool read_uvarint(const std::vector<uint8_t>& buf, uint64_t& value);

// Zig-zag signed variant of read_uvarint()
bool read_varint(const std::vector<uint8_t>& buf, int64_t& value);

#endif // VARINT_H
