#include "guid_generator.h"
#include <array>
#include <chrono>
#include <iomanip>
#include <iostream>
#include <sstream>

#include "varint.h"

using namespace std;

static string format_hardware_addr(const vector<uint8_t>& addr) {
    stringstream ss;
    ss << hex << setfill('0');
    for (size_t i = 0; i < addr.size(); ++i) {
        if (i > 0) {
            ss << ":";
        }
        ss << setw(2) << static_cast<int>(addr[i]);
    }
    return ss.str();
}

GUID fill_guid(mt19937_64& gen) {
    uniform_int_distribution<int> dis(0, GUID_NIBBLE_RANGE - 1);

    array<uint8_t, GUID_SIZE> bytes;
    for (size_t i = 0; i < GUID_SIZE; ++i) {
        bytes[i] = static_cast<uint8_t>(dis(gen));
    }

    // ---------------------------------------------------------
    // Set Version (4) and Variant (RFC 4122) bits
    // ---------------------------------------------------------
    bytes[6] = (bytes[6] & 0x0F) | (GUID_VERSION << 4);
    bytes[8] = (bytes[8] | 0x40) & 0x7F;

    return GUID(bytes);
}

int64_t clock_seed() {
    return chrono::duration_cast<chrono::nanoseconds>(
        chrono::system_clock::now().time_since_epoch()
    ).count();
}

int64_t seed_from_interfaces(const vector<NetworkInterface>& interfaces) {
    const NetworkInterface& iface = select_seed_interface(interfaces);

    int64_t seed = 0;
    if (!read_varint(iface.hardware_addr, seed)) {
        cerr << "Could not decode seed from hardware address ["
             << format_hardware_addr(iface.hardware_addr) << "] of interface "
             << iface.name << ", using 0" << endl;
        seed = 0;
    } else {
        cout << "Derived seed " << seed << " from interface " << iface.name << endl;
    }
    return seed;
}

int64_t hardware_seed() {
    return seed_from_interfaces(list_network_interfaces());
}

GUID generate_random() {
    mt19937_64 gen(static_cast<uint64_t>(clock_seed()));
    return fill_guid(gen);
}

GUID generate_from_hardware() {
    mt19937_64 gen(static_cast<uint64_t>(hardware_seed()));
    return fill_guid(gen);
}

RandomGuidGenerator::RandomGuidGenerator() : gen(static_cast<uint64_t>(clock_seed())) {}

GUID RandomGuidGenerator::next_guid() {
    // std::mt19937_64 is not thread-safe by default
    lock_guard<mutex> lock(mtx);
    gen.seed(static_cast<uint64_t>(clock_seed()));
    return fill_guid(gen);
}

string RandomGuidGenerator::next_id_string() {
    return next_guid().to_string();
}

HardwareGuidGenerator::HardwareGuidGenerator() : seed(hardware_seed()), gen(static_cast<uint64_t>(seed)) {}

GUID HardwareGuidGenerator::next_guid() {
    lock_guard<mutex> lock(mtx);
    gen.seed(static_cast<uint64_t>(seed));
    return fill_guid(gen);
}

string HardwareGuidGenerator::next_id_string() {
    return next_guid().to_string();
}
