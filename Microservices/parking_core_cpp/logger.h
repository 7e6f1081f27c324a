#pragma once

#include <nlohmann/json.hpp>
#include <string>

namespace nprpark {

enum class LogLevel {
    DEBUG = 0,
    INFO,
    WARN,
    ERROR
};

void setLogLevel(LogLevel level);
LogLevel getLogLevel();
bool parseLogLevel(const std::string& text, LogLevel& out);
const char* logLevelName(LogLevel level);

// Одна JSON-строка на событие в stdout:
// {"timestamp", "level", "message", "traceId"?, "details"?}
void logEvent(LogLevel level, const std::string& message,
              const std::string& trace_id = "",
              const nlohmann::json& details = nullptr);

void logRequest(const std::string& method, const std::string& path, const std::string& trace_id);

// Текущее время UTC в ISO формате
std::string getCurrentTimestamp();

// UUID v4 для traceId
std::string generateUUID();

} // namespace nprpark
