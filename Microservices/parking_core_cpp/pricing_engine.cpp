#include "pricing_engine.h"
#include "errors.h"
#include "logger.h"
#include "pricing_rules.h"
#include <algorithm>
#include <cmath>
#include <limits>
#include <map>
#include <memory>

namespace nprpark {

PricingEngine::PricingEngine(const ZoneRegistry& registry, const TimeZone& zone, int max_span_days)
    : registry_(registry), zone_(zone), max_span_days_(max_span_days) {}

CalculationResult PricingEngine::calculate(const std::string& zone_id, Instant start, Instant end) const {
    CalculationRequest request;
    request.zone_id = zone_id;
    request.start_time = start;
    request.end_time = end;
    return calculate(request);
}

void PricingEngine::validateInterval(const CalculationRequest& request) const {
    if (request.end_time < request.start_time) {
        throw TariffError(ErrorCode::INVALID_INTERVAL, "End time must not be before start time");
    }
    int64_t max_minutes = static_cast<int64_t>(max_span_days_) * MINUTES_PER_DAY;
    if (request.end_time - request.start_time > max_minutes) {
        throw TariffError(ErrorCode::INVALID_INTERVAL,
                          "Interval exceeds the maximum span of " + std::to_string(max_span_days_) + " days");
    }
}

Instant PricingEngine::structureStart(const TariffStructure& structure) const {
    return zone_.toInstant(structure.valid_from);
}

Instant PricingEngine::structureEnd(const TariffStructure& structure) const {
    return structure.has_valid_to ? zone_.toInstant(structure.valid_to)
                                  : std::numeric_limits<Instant>::max();
}

CalculationResult PricingEngine::calculate(const CalculationRequest& request) const {
    validateInterval(request);

    // Весь расчёт идёт по одному снимку, даже если параллельно публикуется новый
    std::shared_ptr<const Snapshot> snapshot = registry_.snapshot();
    if (!snapshot->hasZone(request.zone_id)) {
        throw TariffError(ErrorCode::UNKNOWN_ZONE, "Zone '" + request.zone_id + "' is not known");
    }

    // Перевод назад может сделать местный конец раньше местного начала
    CivilTime local_start = zone_.toLocal(request.start_time);
    CivilTime local_end = zone_.toLocal(request.end_time);
    CivilTime local_from = std::min(local_start, local_end);
    CivilTime local_to = std::max(local_start, local_end);

    if (!snapshot->isZoneValidDuring(request.zone_id, local_from, local_to)) {
        throw TariffError(ErrorCode::NO_TARIFF_COVERAGE,
                          "Zone '" + request.zone_id + "' is not valid between " +
                          zone_.formatLocal(request.start_time) + " and " + zone_.formatLocal(request.end_time));
    }

    CalculationResult result;
    result.zone_id = request.zone_id;
    result.duration_minutes = request.end_time - request.start_time;
    if (result.duration_minutes == 0) {
        return result;
    }

    std::vector<const TariffStructure*> structures =
        snapshot->findStructures(request.zone_id, local_from, std::max(local_to, local_from + 1));

    if (structures.empty()) {
        throw TariffError(ErrorCode::NO_TARIFF_COVERAGE,
                          "Zone '" + request.zone_id + "' has no tariff structure between " +
                          zone_.formatLocal(request.start_time) + " and " + zone_.formatLocal(request.end_time));
    }

    GraceState grace;
    Instant cursor = request.start_time;

    for (const TariffStructure* structure : structures) {
        Instant structure_end = structureEnd(*structure);
        if (structure_end <= cursor) {
            continue;
        }
        if (structureStart(*structure) > cursor) {
            throw TariffError(ErrorCode::NO_TARIFF_COVERAGE,
                              "No tariff structure for zone '" + request.zone_id + "' at " +
                              zone_.formatLocal(cursor));
        }
        Instant segment_end = std::min(request.end_time, structure_end);

        std::vector<LineItem> items = priceStructure(*structure, cursor, segment_end, grace);
        if (applyDailyMax(*structure, items)) {
            result.capped_by_daily_max = true;
        }

        int64_t structure_total = 0;
        for (const auto& item : items) {
            structure_total += item.amount_cents;
        }
        result.total_amount_cents += structure_total;
        result.vat_amount_cents += static_cast<int64_t>(std::llround(
            structure_total * structure->vat_percentage / (100.0 + structure->vat_percentage)));

        result.structure_ids.push_back(structure->structure_id);
        result.line_items.insert(result.line_items.end(), items.begin(), items.end());

        cursor = segment_end;
        if (cursor >= request.end_time) {
            break;
        }
    }

    if (cursor < request.end_time) {
        throw TariffError(ErrorCode::NO_TARIFF_COVERAGE,
                          "No tariff structure for zone '" + request.zone_id + "' at " +
                          zone_.formatLocal(cursor));
    }

    result.grace_minutes_applied = grace.applied;

    logEvent(LogLevel::DEBUG, "Tariff calculated", "", {
        {"zoneId", result.zone_id},
        {"start", zone_.formatLocal(request.start_time)},
        {"end", zone_.formatLocal(request.end_time)},
        {"timeZone", zone_.name()},
        {"lineItems", result.line_items.size()},
        {"totalCents", result.total_amount_cents},
        {"capped", result.capped_by_daily_max}
    });
    return result;
}

Instant PricingEngine::chunkEnd(const TariffStructure& structure, const TariffPart* part,
                                Instant from, Instant to) const {
    int64_t day = dayIndex(zone_.toLocal(from));
    Instant end = from;
    while (true) {
        // До ближайшего перехода смещение постоянно, местные минуты равны реальным
        CivilTime local = zone_.toLocal(end);
        Instant boundary = end + (structure.nextWindowBoundary(local) - local);
        end = std::min(std::min(boundary, zone_.nextTransition(end)), to);
        if (end >= to) {
            break;
        }
        CivilTime local_end = zone_.toLocal(end);
        if (dayIndex(local_end) != day || structure.matchPart(local_end) != part) {
            break;
        }
    }
    return end;
}

std::vector<LineItem> PricingEngine::priceStructure(const TariffStructure& structure,
                                                    Instant from, Instant to,
                                                    GraceState& grace) const {
    std::vector<LineItem> items;
    Instant t = from;

    while (t < to) {
        CivilTime local = zone_.toLocal(t);
        const TariffPart* part = structure.matchPart(local);
        if (part == nullptr) {
            throw TariffError(ErrorCode::NO_TARIFF_COVERAGE,
                              "Structure '" + structure.structure_id + "' has no tariff part for " +
                              weekdayName(weekdayOf(local)) + " " + zone_.formatLocal(t));
        }

        // Фрагмент тянется, пока та же часть остаётся первой подходящей,
        // но не дальше конца интервала и местной полуночи
        Instant chunk_end = chunkEnd(structure, part, t, to);

        int64_t minutes = chunk_end - t;
        if (!grace.initialized) {
            grace.initialized = true;
            grace.remaining = part->free_minutes;
        }
        int64_t free_minutes = std::min(grace.remaining, minutes);
        grace.remaining -= free_minutes;
        grace.applied += free_minutes;

        LineItem item;
        item.structure_id = structure.structure_id;
        item.part_id = part->part_id;
        item.interval_start = t;
        item.interval_end = chunk_end;
        item.minutes_charged = minutes - free_minutes;
        item.amount_cents = priceMinutes(item.minutes_charged, *part);
        items.push_back(item);

        t = chunk_end;
    }
    return items;
}

bool PricingEngine::applyDailyMax(const TariffStructure& structure, std::vector<LineItem>& items) const {
    if (!structure.has_daily_max) {
        return false;
    }

    std::map<int64_t, std::vector<size_t> > by_day;
    for (size_t i = 0; i < items.size(); ++i) {
        by_day[dayIndex(zone_.toLocal(items[i].interval_start))].push_back(i);
    }

    bool capped = false;
    for (auto& entry : by_day) {
        std::vector<size_t>& indices = entry.second;
        int64_t day_total = 0;
        for (size_t idx : indices) {
            day_total += items[idx].amount_cents;
        }
        if (day_total <= structure.daily_max_cents) {
            continue;
        }

        int64_t excess = day_total - structure.daily_max_cents;
        int64_t distributed = 0;
        std::vector<int64_t> cut(items.size(), 0);
        for (size_t idx : indices) {
            cut[idx] = excess * items[idx].amount_cents / day_total;
            distributed += cut[idx];
        }

        // Остаток от округления вниз: по центу с самых крупных позиций
        std::vector<size_t> order(indices);
        std::stable_sort(order.begin(), order.end(), [&items](size_t a, size_t b) {
            return items[a].amount_cents > items[b].amount_cents;
        });
        int64_t remaining = excess - distributed;
        while (remaining > 0) {
            for (size_t idx : order) {
                if (remaining == 0) {
                    break;
                }
                if (items[idx].amount_cents - cut[idx] > 0) {
                    ++cut[idx];
                    --remaining;
                }
            }
        }

        for (size_t idx : indices) {
            items[idx].amount_cents -= cut[idx];
        }
        capped = true;
    }
    return capped;
}

} // namespace nprpark
