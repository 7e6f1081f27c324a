#pragma once

#include <stdexcept>
#include <string>

namespace nprpark {

enum class ErrorCode {
    INVALID_INTERVAL,
    UNKNOWN_ZONE,
    NO_TARIFF_COVERAGE,
    MALFORMED_TARIFF_DATA,
    ADDRESS_NOT_FOUND,
    ZONE_NOT_MAPPED
};

// Единственный тип исключения домена; код определяет HTTP-статус на границе API
class TariffError : public std::runtime_error {
public:
    TariffError(ErrorCode code, const std::string& message);

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

// "UNKNOWN_ZONE", "NO_TARIFF_COVERAGE", ...
const char* errorCodeName(ErrorCode code);

int httpStatusFor(ErrorCode code);

} // namespace nprpark
