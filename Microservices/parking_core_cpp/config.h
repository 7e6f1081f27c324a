#pragma once

#include "logger.h"
#include <string>

namespace nprpark {

// Конфигурация из переменных окружения
struct Config {
    std::string host;
    int port;
    std::string dataset_path;
    std::string zone_mapping_path;
    std::string timezone;           // регион из timezone_db_path или POSIX-описание
    std::string timezone_db_path;
    int max_span_days;
    LogLevel log_level;

    Config();
};

} // namespace nprpark
