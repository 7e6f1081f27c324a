#include "logger.h"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <random>
#include <sstream>

namespace nprpark {

namespace {

std::atomic<int> g_min_level(static_cast<int>(LogLevel::INFO));
std::mutex g_output_mutex;

} // namespace

void setLogLevel(LogLevel level) {
    g_min_level.store(static_cast<int>(level));
}

LogLevel getLogLevel() {
    return static_cast<LogLevel>(g_min_level.load());
}

bool parseLogLevel(const std::string& text, LogLevel& out) {
    std::string key(text);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    if (key == "DEBUG") {
        out = LogLevel::DEBUG;
    } else if (key == "INFO") {
        out = LogLevel::INFO;
    } else if (key == "WARN" || key == "WARNING") {
        out = LogLevel::WARN;
    } else if (key == "ERROR") {
        out = LogLevel::ERROR;
    } else {
        return false;
    }
    return true;
}

const char* logLevelName(LogLevel level) {
    switch (level) {
        case LogLevel::DEBUG: return "DEBUG";
        case LogLevel::INFO:  return "INFO";
        case LogLevel::WARN:  return "WARN";
        case LogLevel::ERROR: return "ERROR";
    }
    return "INFO";
}

void logEvent(LogLevel level, const std::string& message,
              const std::string& trace_id, const nlohmann::json& details) {
    if (static_cast<int>(level) < g_min_level.load()) {
        return;
    }

    nlohmann::json logEntry = {
        {"timestamp", getCurrentTimestamp()},
        {"level", logLevelName(level)},
        {"message", message}
    };
    if (!trace_id.empty()) {
        logEntry["traceId"] = trace_id;
    }
    if (!details.is_null()) {
        logEntry["details"] = details;
    }

    std::lock_guard<std::mutex> lock(g_output_mutex);
    std::cout << logEntry.dump() << std::endl;
}

void logRequest(const std::string& method, const std::string& path, const std::string& trace_id) {
    logEvent(LogLevel::INFO, "Request: " + method + " " + path, trace_id);
}

std::string getCurrentTimestamp() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    struct tm tm_utc;
    gmtime_r(&time_t, &tm_utc);
    std::stringstream ss;
    ss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%SZ");
    return ss.str();
}

std::string generateUUID() {
    static thread_local std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<> dis(0, 15);

    const char* chars = "0123456789abcdef";
    std::string uuid = "xxxxxxxx-xxxx-4xxx-yxxx-xxxxxxxxxxxx";

    for (char& c : uuid) {
        if (c == 'x') {
            c = chars[dis(gen)];
        } else if (c == 'y') {
            c = chars[(dis(gen) & 0x3) | 0x8];
        }
    }

    return uuid;
}

} // namespace nprpark
