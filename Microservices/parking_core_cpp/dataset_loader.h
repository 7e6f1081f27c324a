#pragma once

#include "zone_registry.h"
#include <memory>
#include <nlohmann/json.hpp>
#include <string>

namespace nprpark {

// Разбор нормализованного набора тарифов:
// { "zones": [...], "records": [ одна запись на (зона, структура, часть) ] }.
// Любая некорректная запись - TariffError(MALFORMED_TARIFF_DATA) с номером
// записи и именем поля; частичный снимок не создаётся.
std::shared_ptr<const Snapshot> parseDataset(const nlohmann::json& document,
                                             const std::string& source_path = "");

std::shared_ptr<const Snapshot> loadDatasetFile(const std::string& path);

} // namespace nprpark
