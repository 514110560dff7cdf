#include "generator_factory.h"

#include <cstdlib>
#include <iostream>

#include "guid/guid_generator.h"

using namespace std;

unique_ptr<IdGenerator> make_id_generator(const string& type) {
    unique_ptr<IdGenerator> generator;

    if (type == "MAC_UUID") {
        cout << "Initializing hardware-seeded GUID generator..." << endl;
        generator = make_unique<HardwareGuidGenerator>();
    } else if (type == "GUID") {
        cout << "Initializing random GUID generator..." << endl;
        generator = make_unique<RandomGuidGenerator>();
    } else {
        cout << "Unknown generator type '" << type
             << "', initializing random GUID generator..." << endl;
        generator = make_unique<RandomGuidGenerator>();
    }
    return generator;
}

unique_ptr<IdGenerator> make_id_generator_from_env() {
    const char* gen_type_env = getenv("GENERATOR_TYPE");
    string gen_type = gen_type_env ? gen_type_env : "GUID";
    return make_id_generator(gen_type);
}
