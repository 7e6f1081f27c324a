#pragma once

#include "civil_time.h"
#include <cstdint>
#include <string>
#include <vector>

namespace nprpark {

enum class PricingKind {
    FLAT,
    LINEAR,
    STEPPED
};

// Ступень тарифа: сумма (накопительная) действует начиная с threshold_minutes
struct PriceStep {
    int threshold_minutes;
    int64_t amount_cents;
};

struct TariffPart {
    std::string part_id;
    int priority = 0;              // меньше - важнее; при равенстве порядок объявления
    uint8_t weekdays = 0;          // бит на каждый Weekday
    int window_start = 0;          // минуты от полуночи
    int window_end = 0;            // 1440 = конец суток
    bool all_day = false;
    PricingKind pricing_kind = PricingKind::FLAT;
    int64_t unit_amount_cents = 0;
    int step_size_minutes = 0;
    int free_minutes = 0;
    std::vector<PriceStep> steps;  // только для STEPPED

    bool appliesOn(Weekday day) const;
    bool wrapsMidnight() const;
    bool covers(CivilTime t) const;
};

struct TariffStructure {
    std::string structure_id;
    std::string zone_id;
    CivilTime valid_from = 0;
    bool has_valid_to = false;
    CivilTime valid_to = 0;
    bool has_daily_max = false;
    int64_t daily_max_cents = 0;
    double vat_percentage = 0.0;
    std::vector<TariffPart> parts;  // отсортированы по priority (стабильно)

    CivilTime validUntil() const;
    bool isValidAt(CivilTime t) const;
    bool overlaps(CivilTime from, CivilTime to) const;

    // Первая подходящая часть в порядке приоритета, nullptr если покрытия нет
    const TariffPart* matchPart(CivilTime t) const;

    // Ближайшая граница окна какой-либо части строго после t в пределах суток t
    CivilTime nextWindowBoundary(CivilTime t) const;
};

struct Zone {
    std::string zone_id;
    std::string description;
    std::string usage_category;
    CivilTime valid_from = 0;
    bool has_valid_to = false;
    CivilTime valid_to = 0;

    bool isValidAt(CivilTime t) const;
};

struct ZoneSummary {
    std::string zone_id;
    std::string description;
    std::string usage_category;
    CivilTime valid_from = 0;
    bool has_valid_to = false;
    CivilTime valid_to = 0;
    size_t structure_count = 0;
};

struct CalculationRequest {
    std::string zone_id;
    Instant start_time = 0;
    Instant end_time = 0;
};

struct LineItem {
    std::string structure_id;
    std::string part_id;
    Instant interval_start = 0;
    Instant interval_end = 0;
    int64_t minutes_charged = 0;
    int64_t amount_cents = 0;
};

struct CalculationResult {
    std::string zone_id;
    int64_t total_amount_cents = 0;
    int64_t vat_amount_cents = 0;
    int64_t duration_minutes = 0;                 // реальные минуты между моментами
    int64_t grace_minutes_applied = 0;
    bool capped_by_daily_max = false;
    std::vector<std::string> structure_ids;
    std::vector<LineItem> line_items;
};

const char* pricingKindName(PricingKind kind);
bool parsePricingKind(const std::string& text, PricingKind& out);

uint8_t weekdayBit(Weekday day);

} // namespace nprpark
