#include "tariff_model.h"
#include <algorithm>
#include <cctype>
#include <limits>

namespace nprpark {

uint8_t weekdayBit(Weekday day) {
    return static_cast<uint8_t>(1u << static_cast<int>(day));
}

bool TariffPart::appliesOn(Weekday day) const {
    return (weekdays & weekdayBit(day)) != 0;
}

bool TariffPart::wrapsMidnight() const {
    return !all_day && window_start > window_end;
}

bool TariffPart::covers(CivilTime t) const {
    Weekday day = weekdayOf(t);
    int minute = minuteOfDay(t);

    if (all_day) {
        return appliesOn(day);
    }
    if (!wrapsMidnight()) {
        return appliesOn(day) && minute >= window_start && minute < window_end;
    }
    // Окно через полночь относится к дню, в который оно начинается
    if (minute >= window_start && appliesOn(day)) {
        return true;
    }
    return minute < window_end && appliesOn(previousWeekday(day));
}

CivilTime TariffStructure::validUntil() const {
    return has_valid_to ? valid_to : std::numeric_limits<CivilTime>::max();
}

bool TariffStructure::isValidAt(CivilTime t) const {
    return valid_from <= t && t < validUntil();
}

bool TariffStructure::overlaps(CivilTime from, CivilTime to) const {
    return valid_from < to && from < validUntil();
}

const TariffPart* TariffStructure::matchPart(CivilTime t) const {
    for (const auto& part : parts) {
        if (part.covers(t)) {
            return &part;
        }
    }
    return nullptr;
}

CivilTime TariffStructure::nextWindowBoundary(CivilTime t) const {
    CivilTime day_start = startOfDay(t);
    int minute = minuteOfDay(t);
    int next = MINUTES_PER_DAY;

    for (const auto& part : parts) {
        if (part.all_day) {
            continue;
        }
        if (part.window_start > minute && part.window_start < next) {
            next = part.window_start;
        }
        if (part.window_end > minute && part.window_end < next) {
            next = part.window_end;
        }
    }
    return day_start + next;
}

bool Zone::isValidAt(CivilTime t) const {
    return valid_from <= t && (!has_valid_to || t < valid_to);
}

const char* pricingKindName(PricingKind kind) {
    switch (kind) {
        case PricingKind::FLAT:    return "flat";
        case PricingKind::LINEAR:  return "linear";
        case PricingKind::STEPPED: return "stepped";
    }
    return "unknown";
}

bool parsePricingKind(const std::string& text, PricingKind& out) {
    std::string key(text);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (key == "flat") {
        out = PricingKind::FLAT;
    } else if (key == "linear") {
        out = PricingKind::LINEAR;
    } else if (key == "stepped") {
        out = PricingKind::STEPPED;
    } else {
        return false;
    }
    return true;
}

} // namespace nprpark
