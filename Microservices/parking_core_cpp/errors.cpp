#include "errors.h"

namespace nprpark {

TariffError::TariffError(ErrorCode code, const std::string& message)
    : std::runtime_error(message), code_(code) {}

const char* errorCodeName(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_INTERVAL:      return "INVALID_INTERVAL";
        case ErrorCode::UNKNOWN_ZONE:          return "UNKNOWN_ZONE";
        case ErrorCode::NO_TARIFF_COVERAGE:    return "NO_TARIFF_COVERAGE";
        case ErrorCode::MALFORMED_TARIFF_DATA: return "MALFORMED_TARIFF_DATA";
        case ErrorCode::ADDRESS_NOT_FOUND:     return "ADDRESS_NOT_FOUND";
        case ErrorCode::ZONE_NOT_MAPPED:       return "ZONE_NOT_MAPPED";
    }
    return "INTERNAL_ERROR";
}

int httpStatusFor(ErrorCode code) {
    switch (code) {
        case ErrorCode::INVALID_INTERVAL:
            return 400;
        case ErrorCode::UNKNOWN_ZONE:
        case ErrorCode::ADDRESS_NOT_FOUND:
        case ErrorCode::ZONE_NOT_MAPPED:
            return 404;
        case ErrorCode::NO_TARIFF_COVERAGE:
            return 422;
        case ErrorCode::MALFORMED_TARIFF_DATA:
            return 500;
    }
    return 500;
}

} // namespace nprpark
