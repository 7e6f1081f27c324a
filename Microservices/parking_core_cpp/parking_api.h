#pragma once

#include "address_resolver.h"
#include "pricing_engine.h"
#include "tariff_model.h"
#include "zone_registry.h"
#include <nlohmann/json.hpp>
#include <string>

namespace nprpark {

struct ApiResponse {
    int status = 200;
    nlohmann::json body;
};

// Обработчики HTTP-маршрутов без привязки к серверу: тело запроса -> статус и JSON.
// Ответы в конверте {"data", "error", "traceId"}.
class ParkingApi {
public:
    ParkingApi(ZoneRegistry& registry, const PricingEngine& engine,
               const AddressResolver& resolver, const std::string& dataset_path);

    ApiResponse index() const;
    ApiResponse health() const;
    ApiResponse ready() const;

    ApiResponse calculate(const std::string& body, const std::string& trace_id) const;
    ApiResponse listZones(const std::string& trace_id) const;
    ApiResponse searchZones(const std::string& term, const std::string& trace_id) const;
    ApiResponse zoneTariff(const std::string& zone_id, const std::string& date,
                           const std::string& trace_id) const;
    ApiResponse reload(const std::string& trace_id);

private:
    ApiResponse success(const nlohmann::json& data, const std::string& trace_id) const;
    ApiResponse failure(int status, const std::string& code, const std::string& message,
                        const std::string& trace_id) const;

    ZoneRegistry& registry_;
    const PricingEngine& engine_;
    const AddressResolver& resolver_;
    std::string dataset_path_;
};

double centsToEuros(int64_t cents);

// Моменты выводятся местным временем пояса со смещением
nlohmann::json toJson(const CalculationResult& result, const TimeZone& zone);
nlohmann::json toJson(const LineItem& item, const TimeZone& zone);
nlohmann::json toJson(const TariffPart& part);
nlohmann::json toJson(const TariffStructure& structure);
nlohmann::json toJson(const ZoneSummary& zone);

} // namespace nprpark
