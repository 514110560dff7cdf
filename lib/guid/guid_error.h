#ifndef GUID_ERROR_H
#define GUID_ERROR_H

#include <stdexcept>
#include <string>

enum class GuidErrc {
    MalformedText,
    DecodeFailure,
    InvalidLength,
    InterfaceEnumerationFailure
};

/**
 * Thrown by every fallible GUID operation. code() tells the failure kind,
 * what() starts with its guid_errc_name().
 */
class GuidError : public std::runtime_error {
private:
    GuidErrc errc;

public:
    GuidError(GuidErrc errc, const std::string& what);
    GuidErrc code() const;
};

const char* guid_errc_name(GuidErrc errc);

#endif // GUID_ERROR_H
