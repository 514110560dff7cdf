#ifndef ID_GENERATOR_H
#define ID_GENERATOR_H

#include <cstdint>
#include <string>

// ---------------------------------------------------------
// Shared Parameters for 128-bit ID Generators
// ---------------------------------------------------------
const uint8_t GUID_VERSION = 4;

// Each byte is drawn from [0, GUID_NIBBLE_RANGE)
const int GUID_NIBBLE_RANGE = 16;

/**
 * Base interface for all ID generators.
 */
class IdGenerator {
 public:
  virtual ~IdGenerator() = default;

  // Returns the ID as a raw 64-bit integer (if applicable).
  // 128-bit generators leave this at 0 and only implement next_id_string().
  virtual uint64_t next_id() { return 0; }

  // Returns the ID as a formatted string
  virtual std::string next_id_string() { return std::to_string(next_id()); }
};

#endif  // ID_GENERATOR_H
