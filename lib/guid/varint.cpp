#include "varint.h"

bool read_uvarint(const std::vector<uint8_t>& buf, uint64_t& value) {
    uint64_t x = 0;
    unsigned int shift = 0;

    for (size_t i = 0; i < MAX_VARINT_LEN64; ++i) {
        if (i >= buf.size()) {
            // Empty or ends mid-value
            value = x;
            return false;
        }

        uint8_t b = buf[i];
        if (b < 0x80) {
            if (i == MAX_VARINT_LEN64 - 1 && b > 1) {
                value = x;
                return false;
            }
            value = x | (static_cast<uint64_t>(b) << shift);
            return true;
        }
        x |= static_cast<uint64_t>(b & 0x7f) << shift;
        shift += 7;
    }

    value = x;
    return false;
}

bool read_varint(const std::vector<uint8_t>& buf, int64_t& value) {
    uint64_t ux = 0;
    bool ok = read_uvarint(buf, ux);

    uint64_t x = ux >> 1;
    if (ux & 1) {
        x = ~x;
    }
    value = static_cast<int64_t>(x);
    return ok;
}
