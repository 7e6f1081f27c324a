#include "dataset_loader.h"
#include "errors.h"
#include "logger.h"
#include <algorithm>
#include <cmath>
#include <fstream>
#include <limits>
#include <map>
#include <sstream>
#include <utility>

using json = nlohmann::json;

namespace nprpark {

namespace {

typedef std::vector<std::pair<int, int> > WeekIntervals;

const int MINUTES_PER_WEEK = MINUTES_PER_DAY * DAYS_PER_WEEK;

[[noreturn]] void fail(const std::string& context, const std::string& message) {
    throw TariffError(ErrorCode::MALFORMED_TARIFF_DATA, context + ": " + message);
}

// Целое из JSON без молчаливого усечения до int
bool readInt(const json& value, int& out) {
    if (!value.is_number_integer()) {
        return false;
    }
    if (value.is_number_unsigned()) {
        uint64_t wide = value.get<uint64_t>();
        if (wide > static_cast<uint64_t>(std::numeric_limits<int>::max())) {
            return false;
        }
        out = static_cast<int>(wide);
        return true;
    }
    int64_t wide = value.get<int64_t>();
    if (wide < std::numeric_limits<int>::min() || wide > std::numeric_limits<int>::max()) {
        return false;
    }
    out = static_cast<int>(wide);
    return true;
}

// Типизированный доступ к полям одной записи с понятными ошибками
class FieldReader {
public:
    FieldReader(const json& object, const std::string& context)
        : object_(object), context_(context) {
        if (!object_.is_object()) {
            fail(context_, "expected an object");
        }
    }

    const std::string& context() const { return context_; }

    bool has(const char* field) const {
        return object_.contains(field) && !object_.at(field).is_null();
    }

    std::string requireString(const char* field) const {
        if (!has(field) || !object_.at(field).is_string()) {
            fail(context_, std::string("field '") + field + "' must be a string");
        }
        std::string value = object_.at(field).get<std::string>();
        if (value.empty()) {
            fail(context_, std::string("field '") + field + "' must not be empty");
        }
        return value;
    }

    std::string optionalString(const char* field, const std::string& fallback) const {
        if (!has(field)) {
            return fallback;
        }
        if (!object_.at(field).is_string()) {
            fail(context_, std::string("field '") + field + "' must be a string");
        }
        return object_.at(field).get<std::string>();
    }

    int optionalInt(const char* field, int fallback) const {
        if (!has(field)) {
            return fallback;
        }
        int value = 0;
        if (!readInt(object_.at(field), value)) {
            fail(context_, std::string("field '") + field + "' must be an integer within range");
        }
        return value;
    }

    int requireInt(const char* field) const {
        if (!has(field)) {
            fail(context_, std::string("field '") + field + "' is required");
        }
        return optionalInt(field, 0);
    }

    bool optionalBool(const char* field, bool fallback) const {
        if (!has(field)) {
            return fallback;
        }
        if (!object_.at(field).is_boolean()) {
            fail(context_, std::string("field '") + field + "' must be a boolean");
        }
        return object_.at(field).get<bool>();
    }

    double optionalNumber(const char* field, double fallback) const {
        if (!has(field)) {
            return fallback;
        }
        if (!object_.at(field).is_number()) {
            fail(context_, std::string("field '") + field + "' must be a number");
        }
        return object_.at(field).get<double>();
    }

    // Сумма в евро -> центы
    int64_t requireAmount(const char* field) const {
        if (!has(field)) {
            fail(context_, std::string("field '") + field + "' is required");
        }
        return amountCents(object_.at(field), field);
    }

    bool optionalAmount(const char* field, int64_t& cents) const {
        if (!has(field)) {
            return false;
        }
        cents = amountCents(object_.at(field), field);
        return true;
    }

    CivilTime requireDate(const char* field) const {
        CivilTime value;
        if (!parseDate(requireString(field), value)) {
            fail(context_, std::string("field '") + field + "' must be a date (YYYY-MM-DD or YYYYMMDD)");
        }
        return value;
    }

    bool optionalDate(const char* field, CivilTime& value) const {
        if (!has(field)) {
            return false;
        }
        value = requireDate(field);
        return true;
    }

    const json& at(const char* field) const { return object_.at(field); }

    int64_t amountCents(const json& value, const char* field) const {
        if (!value.is_number()) {
            fail(context_, std::string("field '") + field + "' must be a number");
        }
        double euros = value.get<double>();
        if (!std::isfinite(euros) || euros < 0.0) {
            fail(context_, std::string("field '") + field + "' must be a non-negative amount");
        }
        return static_cast<int64_t>(std::llround(euros * 100.0));
    }

private:
    const json& object_;
    std::string context_;
};

uint8_t parseWeekdaySet(const FieldReader& reader) {
    if (!reader.has("weekdays")) {
        fail(reader.context(), "field 'weekdays' is required");
    }
    const json& value = reader.at("weekdays");
    uint8_t mask = 0;

    if (value.is_string()) {
        std::string key = value.get<std::string>();
        if (key == "all" || key == "daily") {
            mask = 0x7F;
        } else if (key == "weekdays") {
            mask = 0x1F;
        } else if (key == "weekend") {
            mask = weekdayBit(Weekday::SATURDAY) | weekdayBit(Weekday::SUNDAY);
        } else {
            Weekday day;
            if (!parseWeekday(key, day)) {
                fail(reader.context(), "unknown weekday set '" + key + "'");
            }
            mask = weekdayBit(day);
        }
    } else if (value.is_array()) {
        for (const auto& item : value) {
            Weekday day;
            if (!item.is_string() || !parseWeekday(item.get<std::string>(), day)) {
                fail(reader.context(), "field 'weekdays' contains an unknown weekday");
            }
            mask |= weekdayBit(day);
        }
    } else {
        fail(reader.context(), "field 'weekdays' must be a list or a string");
    }

    if (mask == 0) {
        fail(reader.context(), "field 'weekdays' must name at least one day");
    }
    return mask;
}

std::vector<PriceStep> parseSteps(const FieldReader& reader, int step_size) {
    if (!reader.has("steps") || !reader.at("steps").is_array() || reader.at("steps").empty()) {
        fail(reader.context(), "stepped part requires a non-empty 'steps' list");
    }

    std::vector<PriceStep> steps;
    for (const auto& item : reader.at("steps")) {
        PriceStep step;
        if (item.is_array() && item.size() == 2 && item[0].is_number_integer()) {
            if (!readInt(item[0], step.threshold_minutes)) {
                fail(reader.context(), "step threshold is out of range");
            }
            step.amount_cents = reader.amountCents(item[1], "steps");
        } else if (item.is_object()) {
            FieldReader step_reader(item, reader.context() + ", step " + std::to_string(steps.size()));
            step.threshold_minutes = step_reader.requireInt("threshold");
            step.amount_cents = step_reader.requireAmount("amount");
        } else {
            fail(reader.context(), "each step must be [threshold_minutes, amount]");
        }

        size_t index = steps.size();
        if (step.threshold_minutes != static_cast<int>(index) * step_size) {
            std::ostringstream oss;
            oss << "step " << index << " must start at minute " << index * step_size;
            fail(reader.context(), oss.str());
        }
        if (!steps.empty() && step.amount_cents < steps.back().amount_cents) {
            fail(reader.context(), "step amounts must not decrease");
        }
        steps.push_back(step);
    }
    return steps;
}

TariffPart parsePart(const FieldReader& reader) {
    TariffPart part;
    part.part_id = reader.requireString("part_id");
    part.priority = reader.optionalInt("priority", 0);
    part.weekdays = parseWeekdaySet(reader);
    part.all_day = reader.optionalBool("all_day", false);

    if (part.all_day) {
        part.window_start = 0;
        part.window_end = MINUTES_PER_DAY;
    } else {
        if (!parseTimeOfDay(reader.requireString("window_start"), part.window_start)) {
            fail(reader.context(), "field 'window_start' must be HH:MM");
        }
        if (!parseTimeOfDay(reader.requireString("window_end"), part.window_end, true)) {
            fail(reader.context(), "field 'window_end' must be HH:MM");
        }
        if (part.window_start == part.window_end ||
            (part.window_start == 0 && part.window_end == MINUTES_PER_DAY)) {
            fail(reader.context(), "time window is empty or whole-day; use 'all_day' for whole days");
        }
    }

    if (!parsePricingKind(reader.requireString("pricing_kind"), part.pricing_kind)) {
        fail(reader.context(), "field 'pricing_kind' must be flat, linear or stepped");
    }

    part.step_size_minutes = reader.optionalInt("step_size_minutes", 0);
    if (part.pricing_kind != PricingKind::FLAT && part.step_size_minutes <= 0) {
        fail(reader.context(), "field 'step_size_minutes' must be positive for linear and stepped parts");
    }
    if (part.step_size_minutes < 0) {
        fail(reader.context(), "field 'step_size_minutes' must not be negative");
    }

    if (part.pricing_kind == PricingKind::STEPPED) {
        part.steps = parseSteps(reader, part.step_size_minutes);
        if (!reader.optionalAmount("unit_amount", part.unit_amount_cents)) {
            part.unit_amount_cents = part.steps.back().amount_cents;
        }
    } else {
        part.unit_amount_cents = reader.requireAmount("unit_amount");
    }

    part.free_minutes = reader.optionalInt("free_minutes", 0);
    if (part.free_minutes < 0) {
        fail(reader.context(), "field 'free_minutes' must not be negative");
    }
    return part;
}

WeekIntervals weekIntervals(const TariffPart& part) {
    WeekIntervals result;
    for (int d = 0; d < DAYS_PER_WEEK; ++d) {
        if (!part.appliesOn(static_cast<Weekday>(d))) {
            continue;
        }
        int base = d * MINUTES_PER_DAY;
        if (part.all_day) {
            result.push_back(std::make_pair(base, base + MINUTES_PER_DAY));
        } else if (!part.wrapsMidnight()) {
            result.push_back(std::make_pair(base + part.window_start, base + part.window_end));
        } else {
            result.push_back(std::make_pair(base + part.window_start, base + MINUTES_PER_DAY));
            int next = ((d + 1) % DAYS_PER_WEEK) * MINUTES_PER_DAY;
            if (part.window_end > 0) {
                result.push_back(std::make_pair(next, next + part.window_end));
            }
        }
    }
    return result;
}

bool coverageOverlaps(const TariffPart& a, const TariffPart& b) {
    WeekIntervals lhs = weekIntervals(a);
    WeekIntervals rhs = weekIntervals(b);
    for (const auto& x : lhs) {
        for (const auto& y : rhs) {
            if (x.first < y.second && y.first < x.second) {
                return true;
            }
        }
    }
    return false;
}

void validateStructure(TariffStructure& structure, const std::string& context) {
    if (structure.has_valid_to && structure.valid_to <= structure.valid_from) {
        fail(context, "validity interval is empty");
    }

    std::stable_sort(structure.parts.begin(), structure.parts.end(),
                     [](const TariffPart& a, const TariffPart& b) { return a.priority < b.priority; });

    for (size_t i = 0; i < structure.parts.size(); ++i) {
        for (size_t j = i + 1; j < structure.parts.size(); ++j) {
            const TariffPart& a = structure.parts[i];
            const TariffPart& b = structure.parts[j];
            if (a.priority == b.priority && coverageOverlaps(a, b)) {
                fail(context, "parts '" + a.part_id + "' and '" + b.part_id +
                              "' overlap with equal priority");
            }
        }
    }
}

bool sameStructureFields(const TariffStructure& a, const TariffStructure& b) {
    return a.valid_from == b.valid_from &&
           a.has_valid_to == b.has_valid_to &&
           (!a.has_valid_to || a.valid_to == b.valid_to) &&
           a.has_daily_max == b.has_daily_max &&
           (!a.has_daily_max || a.daily_max_cents == b.daily_max_cents) &&
           a.vat_percentage == b.vat_percentage;
}

std::vector<Zone> parseZones(const json& document) {
    if (!document.contains("zones") || !document.at("zones").is_array()) {
        fail("dataset", "'zones' must be a list");
    }

    std::vector<Zone> zones;
    const json& list = document.at("zones");
    for (size_t i = 0; i < list.size(); ++i) {
        FieldReader reader(list[i], "zone " + std::to_string(i));
        Zone zone;
        zone.zone_id = reader.requireString("zone_id");
        zone.description = reader.optionalString("description", "");
        zone.usage_category = reader.optionalString("usage_category", "");
        zone.valid_from = reader.requireDate("valid_from");
        zone.has_valid_to = reader.optionalDate("valid_to", zone.valid_to);
        if (zone.has_valid_to && zone.valid_to <= zone.valid_from) {
            fail(reader.context(), "validity interval is empty");
        }
        zones.push_back(zone);
    }

    std::stable_sort(zones.begin(), zones.end(), [](const Zone& a, const Zone& b) {
        return a.zone_id != b.zone_id ? a.zone_id < b.zone_id : a.valid_from < b.valid_from;
    });
    for (size_t i = 1; i < zones.size(); ++i) {
        const Zone& prev = zones[i - 1];
        if (prev.zone_id == zones[i].zone_id &&
            (!prev.has_valid_to || prev.valid_to > zones[i].valid_from)) {
            fail("zone '" + zones[i].zone_id + "'", "validity periods overlap");
        }
    }
    return zones;
}

} // namespace

std::shared_ptr<const Snapshot> parseDataset(const json& document, const std::string& source_path) {
    std::shared_ptr<Snapshot> snapshot = std::make_shared<Snapshot>();

    try {
        if (!document.is_object()) {
            fail("dataset", "expected an object with 'zones' and 'records'");
        }
        snapshot->zones = parseZones(document);

        if (!document.contains("records") || !document.at("records").is_array()) {
            fail("dataset", "'records' must be a list");
        }
        const json& records = document.at("records");

        // Порядок структур и частей сохраняется как в источнике
        std::vector<TariffStructure> builders;
        std::map<std::pair<std::string, std::string>, size_t> index_by_key;

        for (size_t i = 0; i < records.size(); ++i) {
            FieldReader reader(records[i], "record " + std::to_string(i));

            TariffStructure fields;
            fields.zone_id = reader.requireString("zone_id");
            fields.structure_id = reader.requireString("structure_id");
            fields.valid_from = reader.requireDate("structure_valid_from");
            fields.has_valid_to = reader.optionalDate("structure_valid_to", fields.valid_to);
            fields.has_daily_max = reader.optionalAmount("daily_max", fields.daily_max_cents);
            fields.vat_percentage = reader.optionalNumber("vat_percentage", 0.0);
            if (fields.vat_percentage < 0.0 || fields.vat_percentage > 100.0) {
                fail(reader.context(), "field 'vat_percentage' must be within 0..100");
            }

            if (!snapshot->hasZone(fields.zone_id)) {
                fail(reader.context(), "zone '" + fields.zone_id + "' is not declared in 'zones'");
            }

            TariffPart part = parsePart(reader);

            auto key = std::make_pair(fields.zone_id, fields.structure_id);
            auto found = index_by_key.find(key);
            if (found == index_by_key.end()) {
                index_by_key[key] = builders.size();
                builders.push_back(fields);
                found = index_by_key.find(key);
            } else if (!sameStructureFields(builders[found->second], fields)) {
                fail(reader.context(), "structure '" + fields.structure_id +
                                       "' fields differ from its earlier records");
            }

            TariffStructure& structure = builders[found->second];
            for (const auto& existing : structure.parts) {
                if (existing.part_id == part.part_id) {
                    fail(reader.context(), "duplicate part_id '" + part.part_id + "'");
                }
            }
            structure.parts.push_back(part);
        }

        for (auto& structure : builders) {
            validateStructure(structure, "structure '" + structure.structure_id + "'");
            snapshot->structures[structure.zone_id].push_back(structure);
        }

        for (auto& entry : snapshot->structures) {
            std::vector<TariffStructure>& list = entry.second;
            std::stable_sort(list.begin(), list.end(),
                             [](const TariffStructure& a, const TariffStructure& b) {
                                 return a.valid_from < b.valid_from;
                             });
            for (size_t i = 1; i < list.size(); ++i) {
                if (list[i - 1].validUntil() > list[i].valid_from) {
                    fail("zone '" + entry.first + "'", "structures '" + list[i - 1].structure_id +
                                                       "' and '" + list[i].structure_id + "' overlap");
                }
            }
        }

        snapshot->record_count = records.size();
    } catch (const json::exception& e) {
        throw TariffError(ErrorCode::MALFORMED_TARIFF_DATA, std::string("dataset: ") + e.what());
    }

    snapshot->source_path = source_path;
    snapshot->loaded_at = getCurrentTimestamp();
    return snapshot;
}

std::shared_ptr<const Snapshot> loadDatasetFile(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw TariffError(ErrorCode::MALFORMED_TARIFF_DATA, "Cannot open dataset file: " + path);
    }

    json document;
    try {
        document = json::parse(in);
    } catch (const json::parse_error& e) {
        throw TariffError(ErrorCode::MALFORMED_TARIFF_DATA,
                          "Dataset file " + path + " is not valid JSON: " + e.what());
    }
    return parseDataset(document, path);
}

} // namespace nprpark
