#include "time_zone.h"
#include <cstdio>
#include <cstdlib>
#include <limits>
#include <stdexcept>

namespace nprpark {

namespace {

namespace bg = boost::gregorian;
namespace blt = boost::local_time;
namespace bpt = boost::posix_time;

const Instant NO_TRANSITION = std::numeric_limits<Instant>::max();

// Вне этих лет boost не считает даты; действует базовое смещение
const CivilTime SUPPORTED_FROM = makeCivilTime(1900, 1, 1);
const CivilTime SUPPORTED_UNTIL = makeCivilTime(9999, 1, 1);

const bpt::ptime& epoch() {
    static const bpt::ptime value(bg::date(1970, 1, 1));
    return value;
}

bpt::ptime toPtime(int64_t m) {
    return epoch() + bpt::minutes(m);
}

int64_t toMinutes(const bpt::ptime& p) {
    return static_cast<int64_t>((p - epoch()).total_seconds() / 60);
}

bool inSupportedRange(int64_t m) {
    return m >= SUPPORTED_FROM && m < SUPPORTED_UNTIL;
}

} // namespace

TimeZone::TimeZone() : name_("UTC") {}

TimeZone::TimeZone(const std::string& name, blt::time_zone_ptr zone)
    : name_(name), zone_(zone) {}

TimeZone TimeZone::fromPosix(const std::string& posix_tz) {
    try {
        blt::time_zone_ptr zone(new blt::posix_time_zone(posix_tz));
        return TimeZone(posix_tz, zone);
    } catch (const std::exception& e) {
        throw std::runtime_error("Invalid POSIX time zone '" + posix_tz + "': " + e.what());
    }
}

TimeZone TimeZone::fromDatabase(const std::string& csv_path, const std::string& region) {
    blt::tz_database database;
    try {
        database.load_from_file(csv_path);
    } catch (const std::exception& e) {
        throw std::runtime_error("Cannot load time zone database '" + csv_path + "': " + e.what());
    }
    blt::time_zone_ptr zone = database.time_zone_from_region(region);
    if (!zone) {
        throw std::runtime_error("Time zone '" + region + "' is not in " + csv_path);
    }
    return TimeZone(region, zone);
}

TimeZone TimeZone::load(const std::string& name, const std::string& database_path) {
    if (name.empty() || name == "UTC") {
        return TimeZone();
    }
    // В POSIX-описании всегда есть смещение, в имени региона цифр нет
    if (name.find_first_of("0123456789") == std::string::npos) {
        return fromDatabase(database_path, name);
    }
    return fromPosix(name);
}

bool TimeZone::hasDst() const {
    return zone_ && zone_->has_dst();
}

int64_t TimeZone::baseOffsetMinutes() const {
    return zone_ ? zone_->base_utc_offset().total_seconds() / 60 : 0;
}

int64_t TimeZone::dstOffsetMinutes() const {
    return hasDst() ? zone_->dst_offset().total_seconds() / 60 : 0;
}

CivilTime TimeZone::toLocal(Instant t) const {
    if (!zone_) {
        return t;
    }
    if (!inSupportedRange(t)) {
        return t + baseOffsetMinutes();
    }
    blt::local_date_time local(toPtime(t), zone_);
    return toMinutes(local.local_time());
}

Instant TimeZone::toInstant(CivilTime local) const {
    int64_t base = baseOffsetMinutes();
    if (!hasDst() || !inSupportedRange(local)) {
        return local - base;
    }
    bpt::ptime p = toPtime(local);
    switch (blt::local_date_time::check_dst(p.date(), p.time_of_day(), zone_)) {
        case blt::is_in_dst:
        case blt::ambiguous:
            return local - base - dstOffsetMinutes();
        case blt::is_not_in_dst:
        case blt::invalid_time_label:
            break;
    }
    return local - base;
}

int TimeZone::offsetMinutes(Instant t) const {
    return static_cast<int>(toLocal(t) - t);
}

Instant TimeZone::nextTransition(Instant t) const {
    if (!hasDst() || !inSupportedRange(t)) {
        return NO_TRANSITION;
    }
    int year;
    unsigned month, day;
    civilFromDays(dayIndex(toLocal(t)), year, month, day);

    // Начало задано в стандартном времени, конец - в летнем
    int64_t base = baseOffsetMinutes();
    int64_t dst = dstOffsetMinutes();
    Instant next = NO_TRANSITION;
    for (int y = year; y <= year + 1 && y < 9999; ++y) {
        Instant start = toMinutes(zone_->dst_local_start_time(y)) - base;
        Instant end = toMinutes(zone_->dst_local_end_time(y)) - base - dst;
        if (start > t && start < next) {
            next = start;
        }
        if (end > t && end < next) {
            next = end;
        }
    }
    return next;
}

Instant TimeZone::resolve(const ParsedTimestamp& parsed) const {
    if (parsed.has_offset) {
        return parsed.wall - parsed.offset_minutes;
    }
    return toInstant(parsed.wall);
}

bool TimeZone::parseInstant(const std::string& text, Instant& out) const {
    ParsedTimestamp parsed;
    if (!parseTimestamp(text, parsed)) {
        return false;
    }
    out = resolve(parsed);
    return true;
}

std::string TimeZone::formatLocal(Instant t) const {
    CivilTime local = toLocal(t);
    int offset = static_cast<int>(local - t);
    int magnitude = std::abs(offset);
    char suffix[8];
    snprintf(suffix, sizeof(suffix), "%c%02d:%02d", offset < 0 ? '-' : '+', magnitude / 60, magnitude % 60);
    return formatTimestamp(local) + suffix;
}

} // namespace nprpark
