#include "parking_api.h"
#include "civil_time.h"
#include "errors.h"
#include "logger.h"
#include <cctype>
#include <exception>
#include <limits>

using json = nlohmann::json;

namespace nprpark {

namespace {

const char* const SERVICE_NAME = "npr-parking-core";
const char* const SERVICE_VERSION = "2.1.0";

json weekdayList(const TariffPart& part) {
    json days = json::array();
    for (int d = 0; d < DAYS_PER_WEEK; ++d) {
        Weekday day = static_cast<Weekday>(d);
        if (part.appliesOn(day)) {
            days.push_back(weekdayName(day));
        }
    }
    return days;
}

json optionalDate(bool present, CivilTime value) {
    return present ? json(formatDate(value)) : json(nullptr);
}

// Номер дома может прийти строкой ("12") или числом
bool readHouseNumber(const json& value, int& out) {
    if (value.is_number_unsigned()) {
        uint64_t number = value.get<uint64_t>();
        if (number > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            return false;
        }
        out = static_cast<int>(number);
        return true;
    }
    if (value.is_number_integer()) {
        int64_t number = value.get<int64_t>();
        if (number < 0 || number > std::numeric_limits<int>::max()) {
            return false;
        }
        out = static_cast<int>(number);
        return true;
    }
    if (value.is_string()) {
        const std::string text = value.get<std::string>();
        if (text.empty() || text.size() > 6) {
            return false;
        }
        int number = 0;
        for (char c : text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                return false;
            }
            number = number * 10 + (c - '0');
        }
        out = number;
        return true;
    }
    return false;
}

std::string optionalText(const json& request, const char* field) {
    if (request.contains(field) && request.at(field).is_string()) {
        return request.at(field).get<std::string>();
    }
    return "";
}

} // namespace

double centsToEuros(int64_t cents) {
    return static_cast<double>(cents) / 100.0;
}

json toJson(const LineItem& item, const TimeZone& zone) {
    return {
        {"structureId", item.structure_id},
        {"partId", item.part_id},
        {"intervalStart", zone.formatLocal(item.interval_start)},
        {"intervalEnd", zone.formatLocal(item.interval_end)},
        {"minutesCharged", item.minutes_charged},
        {"amount", centsToEuros(item.amount_cents)},
        {"amountCents", item.amount_cents}
    };
}

json toJson(const CalculationResult& result, const TimeZone& zone) {
    json items = json::array();
    for (const auto& item : result.line_items) {
        items.push_back(toJson(item, zone));
    }
    return {
        {"zoneId", result.zone_id},
        {"durationMinutes", result.duration_minutes},
        {"durationDisplay", formatDuration(result.duration_minutes)},
        {"graceMinutesApplied", result.grace_minutes_applied},
        {"totalAmount", centsToEuros(result.total_amount_cents)},
        {"totalAmountCents", result.total_amount_cents},
        {"vatAmount", centsToEuros(result.vat_amount_cents)},
        {"vatAmountCents", result.vat_amount_cents},
        {"currency", "EUR"},
        {"cappedByDailyMax", result.capped_by_daily_max},
        {"structureIds", result.structure_ids},
        {"lineItems", items}
    };
}

json toJson(const TariffPart& part) {
    json steps = json::array();
    for (const auto& step : part.steps) {
        steps.push_back({
            {"thresholdMinutes", step.threshold_minutes},
            {"amount", centsToEuros(step.amount_cents)}
        });
    }
    return {
        {"partId", part.part_id},
        {"priority", part.priority},
        {"weekdays", weekdayList(part)},
        {"allDay", part.all_day},
        {"windowStart", formatTimeOfDay(part.window_start)},
        {"windowEnd", formatTimeOfDay(part.window_end)},
        {"pricingKind", pricingKindName(part.pricing_kind)},
        {"unitAmount", centsToEuros(part.unit_amount_cents)},
        {"stepSizeMinutes", part.step_size_minutes},
        {"freeMinutes", part.free_minutes},
        {"steps", steps}
    };
}

json toJson(const TariffStructure& structure) {
    json parts = json::array();
    for (const auto& part : structure.parts) {
        parts.push_back(toJson(part));
    }
    return {
        {"structureId", structure.structure_id},
        {"zoneId", structure.zone_id},
        {"validFrom", formatDate(structure.valid_from)},
        {"validTo", optionalDate(structure.has_valid_to, structure.valid_to)},
        {"dailyMax", structure.has_daily_max ? json(centsToEuros(structure.daily_max_cents)) : json(nullptr)},
        {"vatPercentage", structure.vat_percentage},
        {"parts", parts}
    };
}

json toJson(const ZoneSummary& zone) {
    return {
        {"zoneId", zone.zone_id},
        {"description", zone.description},
        {"usageCategory", zone.usage_category},
        {"validFrom", formatDate(zone.valid_from)},
        {"validTo", optionalDate(zone.has_valid_to, zone.valid_to)},
        {"structureCount", zone.structure_count}
    };
}

ParkingApi::ParkingApi(ZoneRegistry& registry, const PricingEngine& engine,
                       const AddressResolver& resolver, const std::string& dataset_path)
    : registry_(registry), engine_(engine), resolver_(resolver), dataset_path_(dataset_path) {}

ApiResponse ParkingApi::success(const json& data, const std::string& trace_id) const {
    ApiResponse response;
    response.status = 200;
    response.body = {
        {"data", data},
        {"error", nullptr},
        {"traceId", trace_id}
    };
    return response;
}

ApiResponse ParkingApi::failure(int status, const std::string& code, const std::string& message,
                                const std::string& trace_id) const {
    ApiResponse response;
    response.status = status;
    response.body = {
        {"data", nullptr},
        {"error", {
            {"code", code},
            {"message", message}
        }},
        {"traceId", trace_id}
    };
    return response;
}

ApiResponse ParkingApi::index() const {
    ApiResponse response;
    response.body = {
        {"name", "NPR Parking API"},
        {"version", SERVICE_VERSION},
        {"description", "Parking cost calculation from NPR zone tariffs"},
        {"zonesLoaded", registry_.zoneCount()},
        {"endpoints", {
            {"POST /calculate", "Calculate parking cost for a zone or an address"},
            {"GET /zones", "List all zones"},
            {"GET /zones/search?q=<term>", "Search zones by id, description or usage"},
            {"GET /zones/<zoneId>/tariff?date=YYYY-MM-DD", "Tariff structures of a zone"},
            {"POST /admin/reload", "Reload the tariff dataset"},
            {"GET /healthz", "Liveness"},
            {"GET /readyz", "Readiness"}
        }},
        {"exampleRequest", {
            {"postcode", "1012 AB"},
            {"houseNumber", "1"},
            {"startTime", "2024-01-15T09:00:00"},
            {"endTime", "2024-01-15T17:00:00"}
        }}
    };
    return response;
}

ApiResponse ParkingApi::health() const {
    ApiResponse response;
    response.body = {
        {"status", "healthy"},
        {"timestamp", getCurrentTimestamp()},
        {"service", SERVICE_NAME}
    };
    return response;
}

ApiResponse ParkingApi::ready() const {
    // Оба счётчика из одного снимка
    std::shared_ptr<const Snapshot> snapshot = registry_.snapshot();
    size_t zones = snapshot->zoneCount();

    ApiResponse response;
    response.status = zones > 0 ? 200 : 503;
    response.body = {
        {"status", zones > 0 ? "ready" : "not_ready"},
        {"timestamp", getCurrentTimestamp()},
        {"data", {
            {"zonesLoaded", zones},
            {"records", snapshot->record_count},
            {"datasetLoadedAt", snapshot->loaded_at},
            {"maxSpanDays", engine_.getMaxSpanDays()},
            {"timeZone", engine_.timeZone().name()}
        }}
    };
    return response;
}

ApiResponse ParkingApi::calculate(const std::string& body, const std::string& trace_id) const {
    try {
        json request = json::parse(body);
        if (!request.is_object()) {
            return failure(400, "INVALID_REQUEST", "Request body must be a JSON object", trace_id);
        }

        for (const char* field : {"startTime", "endTime"}) {
            if (!request.contains(field) || !request.at(field).is_string()) {
                return failure(400, "INVALID_REQUEST",
                               std::string("Field '") + field + "' is required", trace_id);
            }
        }

        const TimeZone& zone = engine_.timeZone();
        Instant start, end;
        if (!zone.parseInstant(request.at("startTime").get<std::string>(), start) ||
            !zone.parseInstant(request.at("endTime").get<std::string>(), end)) {
            return failure(400, "INVALID_REQUEST",
                           "Invalid date/time format. Use ISO format (YYYY-MM-DDTHH:MM:SS)", trace_id);
        }

        std::string zone_id = optionalText(request, "zoneId");
        std::string detection = "zoneId";
        if (zone_id.empty()) {
            if (!request.contains("postcode") || !request.contains("houseNumber")) {
                return failure(400, "INVALID_REQUEST",
                               "Either 'zoneId' or 'postcode' and 'houseNumber' are required", trace_id);
            }
            AddressQuery query;
            query.postcode = optionalText(request, "postcode");
            if (!readHouseNumber(request.at("houseNumber"), query.house_number)) {
                return failure(400, "INVALID_REQUEST", "Field 'houseNumber' must be a number", trace_id);
            }
            query.house_letter = optionalText(request, "houseLetter");
            query.house_number_addition = optionalText(request, "houseNumberAddition");
            zone_id = resolver_.resolveZone(query);
            detection = "postcode";
        }

        CalculationResult result = engine_.calculate(zone_id, start, end);

        json data = toJson(result, zone);
        data["startTime"] = zone.formatLocal(start);
        data["endTime"] = zone.formatLocal(end);
        data["timeZone"] = zone.name();
        data["zoneDetection"] = detection;

        logEvent(LogLevel::INFO, "Parking cost calculated", trace_id, {
            {"zoneId", zone_id},
            {"durationMinutes", result.duration_minutes},
            {"lineItems", result.line_items.size()},
            {"totalAmount", centsToEuros(result.total_amount_cents)},
            {"cappedByDailyMax", result.capped_by_daily_max}
        });
        return success(data, trace_id);

    } catch (const TariffError& e) {
        logEvent(LogLevel::WARN, "Calculation rejected", trace_id, {
            {"code", errorCodeName(e.code())},
            {"message", e.what()}
        });
        return failure(httpStatusFor(e.code()), errorCodeName(e.code()), e.what(), trace_id);
    } catch (const json::parse_error&) {
        return failure(400, "JSON_PARSE_ERROR", "Invalid JSON format", trace_id);
    } catch (const std::exception& e) {
        logEvent(LogLevel::ERROR, std::string("Calculation failed: ") + e.what(), trace_id);
        return failure(500, "INTERNAL_ERROR", e.what(), trace_id);
    }
}

ApiResponse ParkingApi::listZones(const std::string& trace_id) const {
    json zones = json::array();
    for (const auto& zone : registry_.listZones()) {
        zones.push_back(toJson(zone));
    }
    json data = {
        {"zones", zones},
        {"total", zones.size()}
    };
    return success(data, trace_id);
}

ApiResponse ParkingApi::searchZones(const std::string& term, const std::string& trace_id) const {
    if (term.empty()) {
        return failure(400, "INVALID_REQUEST", "Query parameter 'q' is required", trace_id);
    }
    json results = json::array();
    for (const auto& zone : registry_.searchZones(term)) {
        results.push_back(toJson(zone));
    }
    json data = {
        {"query", term},
        {"results", results},
        {"count", results.size()}
    };
    return success(data, trace_id);
}

ApiResponse ParkingApi::zoneTariff(const std::string& zone_id, const std::string& date,
                                   const std::string& trace_id) const {
    try {
        std::shared_ptr<const Snapshot> snapshot = registry_.snapshot();
        std::vector<TariffStructure> structures;
        json data = {{"zoneId", zone_id}};

        if (date.empty()) {
            structures = snapshot->structuresForZone(zone_id);
            data["date"] = nullptr;
        } else {
            CivilTime day;
            if (!parseDate(date, day)) {
                return failure(400, "INVALID_REQUEST", "Query parameter 'date' must be YYYY-MM-DD", trace_id);
            }
            structures = snapshot->structuresForZone(zone_id, day);
            data["date"] = formatDate(day);
        }

        if (structures.empty()) {
            return failure(httpStatusFor(ErrorCode::NO_TARIFF_COVERAGE),
                           errorCodeName(ErrorCode::NO_TARIFF_COVERAGE),
                           "No tariff data found for zone " + zone_id, trace_id);
        }

        json list = json::array();
        for (const auto& structure : structures) {
            list.push_back(toJson(structure));
        }
        data["structures"] = list;
        return success(data, trace_id);

    } catch (const TariffError& e) {
        return failure(httpStatusFor(e.code()), errorCodeName(e.code()), e.what(), trace_id);
    }
}

ApiResponse ParkingApi::reload(const std::string& trace_id) {
    try {
        registry_.reload(dataset_path_);
        std::shared_ptr<const Snapshot> snapshot = registry_.snapshot();
        json data = {
            {"zonesLoaded", snapshot->zoneCount()},
            {"records", snapshot->record_count},
            {"loadedAt", snapshot->loaded_at},
            {"source", snapshot->source_path}
        };
        return success(data, trace_id);
    } catch (const TariffError& e) {
        return failure(httpStatusFor(e.code()), errorCodeName(e.code()), e.what(), trace_id);
    }
}

} // namespace nprpark
