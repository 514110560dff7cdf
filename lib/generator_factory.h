#ifndef GENERATOR_FACTORY_H
#define GENERATOR_FACTORY_H

#include <memory>
#include <string>

#include "id_generator.h"

/**
 * Builds the generator named by type:
 *   "GUID"     - RandomGuidGenerator
 *   "MAC_UUID" - HardwareGuidGenerator (throws GuidError if interfaces
 *                cannot be enumerated)
 * Any other value falls back to RandomGuidGenerator.
 */
std::unique_ptr<IdGenerator> make_id_generator(const std::string& type);

// Same as make_id_generator(), with the type read from GENERATOR_TYPE
std::unique_ptr<IdGenerator> make_id_generator_from_env();

#endif // GENERATOR_FACTORY_H
