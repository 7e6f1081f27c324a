#include "config.h"
#include <cerrno>
#include <cstdlib>

namespace nprpark {

namespace {

std::string envString(const char* name, const std::string& fallback) {
    const char* value = getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

int envPositiveInt(const char* name, int fallback) {
    const char* value = getenv(name);
    if (!value || !*value) {
        return fallback;
    }
    char* end = nullptr;
    errno = 0;
    long parsed = strtol(value, &end, 10);
    if (errno != 0 || *end != '\0' || parsed <= 0 || parsed > 1000000) {
        logEvent(LogLevel::WARN, std::string("Invalid value for ") + name + ", using default",
                 "", {{"value", value}, {"default", fallback}});
        return fallback;
    }
    return static_cast<int>(parsed);
}

} // namespace

Config::Config() {
    host = envString("HOST", "0.0.0.0");
    port = envPositiveInt("PORT", 5001);
    dataset_path = envString("DATASET_PATH", "data/dataset.json");
    zone_mapping_path = envString("ZONE_MAPPING_PATH", "data/zone_mapping.json");
    timezone = envString("TIMEZONE", "Europe/Amsterdam");
    timezone_db_path = envString("TIMEZONE_DB", "data/timezones.csv");
    max_span_days = envPositiveInt("MAX_SPAN_DAYS", 31);

    std::string level = envString("LOG_LEVEL", "INFO");
    if (!parseLogLevel(level, log_level)) {
        logEvent(LogLevel::WARN, "Invalid value for LOG_LEVEL, using default", "",
                 {{"value", level}, {"default", "INFO"}});
        log_level = LogLevel::INFO;
    }
}

} // namespace nprpark
