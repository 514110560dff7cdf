#include "guid_error.h"

GuidError::GuidError(GuidErrc errc, const std::string& what)
    : std::runtime_error(std::string(guid_errc_name(errc)) + ": " + what), errc(errc) {}

GuidErrc GuidError::code() const {
    return errc;
}

const char* guid_errc_name(GuidErrc errc) {
    switch (errc) {
        case GuidErrc::MalformedText:
            return "MalformedText";
        case GuidErrc::DecodeFailure:
            return "DecodeFailure";
        case GuidErrc::InvalidLength:
            return "InvalidLength";
        case GuidErrc::InterfaceEnumerationFailure:
            return "InterfaceEnumerationFailure";
    }
    return "Unknown";
}
