#ifndef GUID_GENERATOR_H
#define GUID_GENERATOR_H

#include <cstdint>
#include <mutex>
#include <random>
#include <string>

#include <vector>

#include "../id_generator.h"
#include "../network_util.h"
#include "guid.h"

/**
 * Fills a GUID from gen and stamps the version 4 and variant bits.
 *
 * Every byte is drawn from [0, 16), so before the fix-up each high nibble
 * is zero.
 */
GUID fill_guid(std::mt19937_64& gen);

// Nanoseconds since the Unix epoch, used as the per-call random seed
int64_t clock_seed();

/**
 * Seed derived from the hardware address of the interface chosen by
 * select_seed_interface(). Falls back to 0 when the address does not hold a
 * valid varint.
 *
 * @throws GuidError(InterfaceEnumerationFailure) if interfaces is empty.
 */
int64_t seed_from_interfaces(const std::vector<NetworkInterface>& interfaces);

// seed_from_interfaces() over list_network_interfaces()
int64_t hardware_seed();

// Pseudo-random version 4 GUID, seeded from the clock at call time
GUID generate_random();

// Version 4 GUID seeded from the machine's hardware address
GUID generate_from_hardware();

/**
 * Reseeds its engine from the clock on every call.
 * Two calls within one clock tick yield the same GUID.
 */
class RandomGuidGenerator : public IdGenerator {
private:
    std::mt19937_64 gen;
    std::mutex mtx;

public:
    RandomGuidGenerator();
    GUID next_guid();
    std::string next_id_string() override;
};

/**
 * Machine identifier: the hardware seed is derived once, and every call
 * reseeds with it, so all calls return the same GUID.
 */
class HardwareGuidGenerator : public IdGenerator {
private:
    int64_t seed;
    std::mt19937_64 gen;
    std::mutex mtx;

public:
    HardwareGuidGenerator();
    GUID next_guid();
    std::string next_id_string() override;
};

#endif // GUID_GENERATOR_H
