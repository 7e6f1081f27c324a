#include "civil_time.h"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <sstream>

namespace nprpark {

namespace {

int64_t floorDiv(int64_t a, int64_t b) {
    int64_t q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) {
        --q;
    }
    return q;
}

bool isLeapYear(int year) {
    return (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
}

unsigned daysInMonth(int year, unsigned month) {
    static const unsigned kDays[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    if (month == 2 && isLeapYear(year)) {
        return 29;
    }
    return kDays[month - 1];
}

bool readDigits(const std::string& text, size_t& pos, int count, int& value) {
    if (pos + count > text.size()) {
        return false;
    }
    value = 0;
    for (int i = 0; i < count; ++i) {
        char c = text[pos + i];
        if (c < '0' || c > '9') {
            return false;
        }
        value = value * 10 + (c - '0');
    }
    pos += count;
    return true;
}

bool expectChar(const std::string& text, size_t& pos, char c) {
    if (pos < text.size() && text[pos] == c) {
        ++pos;
        return true;
    }
    return false;
}

bool validDate(int year, int month, int day) {
    if (month < 1 || month > 12 || day < 1) {
        return false;
    }
    return static_cast<unsigned>(day) <= daysInMonth(year, static_cast<unsigned>(month));
}

} // namespace

int64_t daysFromCivil(int year, unsigned month, unsigned day) {
    year -= month <= 2 ? 1 : 0;
    const int64_t era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void civilFromDays(int64_t days, int& year, unsigned& month, unsigned& day) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = doy - (153 * mp + 2) / 5 + 1;
    month = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int>(static_cast<int64_t>(yoe) + era * 400) + (month <= 2 ? 1 : 0);
}

CivilTime makeCivilTime(int year, unsigned month, unsigned day, int hour, int minute) {
    return daysFromCivil(year, month, day) * MINUTES_PER_DAY + hour * 60 + minute;
}

int64_t dayIndex(CivilTime t) {
    return floorDiv(t, MINUTES_PER_DAY);
}

CivilTime startOfDay(CivilTime t) {
    return dayIndex(t) * MINUTES_PER_DAY;
}

int minuteOfDay(CivilTime t) {
    return static_cast<int>(t - startOfDay(t));
}

Weekday weekdayOf(CivilTime t) {
    // 1970-01-01 - четверг
    int64_t shifted = dayIndex(t) + 3;
    int wd = static_cast<int>(shifted - floorDiv(shifted, DAYS_PER_WEEK) * DAYS_PER_WEEK);
    return static_cast<Weekday>(wd);
}

Weekday previousWeekday(Weekday day) {
    int wd = static_cast<int>(day);
    return static_cast<Weekday>((wd + DAYS_PER_WEEK - 1) % DAYS_PER_WEEK);
}

bool parseTimestamp(const std::string& text, ParsedTimestamp& out) {
    size_t pos = 0;
    int year, month, day, hour, minute, second = 0;

    if (!readDigits(text, pos, 4, year) || !expectChar(text, pos, '-') ||
        !readDigits(text, pos, 2, month) || !expectChar(text, pos, '-') ||
        !readDigits(text, pos, 2, day)) {
        return false;
    }
    if (!expectChar(text, pos, 'T') && !expectChar(text, pos, ' ')) {
        return false;
    }
    if (!readDigits(text, pos, 2, hour) || !expectChar(text, pos, ':') ||
        !readDigits(text, pos, 2, minute)) {
        return false;
    }
    if (expectChar(text, pos, ':')) {
        if (!readDigits(text, pos, 2, second)) {
            return false;
        }
        if (expectChar(text, pos, '.')) {
            size_t digits_start = pos;
            while (pos < text.size() && std::isdigit(static_cast<unsigned char>(text[pos]))) {
                ++pos;
            }
            if (pos == digits_start) {
                return false;
            }
        }
    }

    bool has_offset = false;
    int offset_minutes = 0;
    if (expectChar(text, pos, 'Z')) {
        has_offset = true;
    } else if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
        int sign = text[pos] == '-' ? -1 : 1;
        ++pos;
        int off_h, off_m;
        if (!readDigits(text, pos, 2, off_h)) {
            return false;
        }
        expectChar(text, pos, ':');
        if (!readDigits(text, pos, 2, off_m) || off_h > 23 || off_m > 59) {
            return false;
        }
        has_offset = true;
        offset_minutes = sign * (off_h * 60 + off_m);
    }

    if (pos != text.size()) {
        return false;
    }
    if (!validDate(year, month, day) || hour > 23 || minute > 59 || second > 59) {
        return false;
    }
    // Правила перехода на летнее время известны только для этих лет
    if (year < 1900 || year > 9998) {
        return false;
    }

    out.wall = makeCivilTime(year, month, day, hour, minute);
    out.has_offset = has_offset;
    out.offset_minutes = offset_minutes;
    return true;
}

bool parseDate(const std::string& text, CivilTime& out) {
    size_t pos = 0;
    int year, month, day;
    if (text.size() == 8) {
        if (!readDigits(text, pos, 4, year) || !readDigits(text, pos, 2, month) ||
            !readDigits(text, pos, 2, day)) {
            return false;
        }
    } else if (text.size() == 10) {
        if (!readDigits(text, pos, 4, year) || !expectChar(text, pos, '-') ||
            !readDigits(text, pos, 2, month) || !expectChar(text, pos, '-') ||
            !readDigits(text, pos, 2, day)) {
            return false;
        }
    } else {
        return false;
    }
    if (!validDate(year, month, day)) {
        return false;
    }
    out = makeCivilTime(year, month, day);
    return true;
}

bool parseTimeOfDay(const std::string& text, int& minutes, bool allow_end_of_day) {
    int h = 0, m = 0;
    size_t pos = 0;
    if (text.size() == 4) {
        if (!readDigits(text, pos, 1, h)) {
            return false;
        }
    } else if (!readDigits(text, pos, 2, h)) {
        return false;
    }
    if (!expectChar(text, pos, ':') || !readDigits(text, pos, 2, m) || pos != text.size()) {
        return false;
    }
    if (h == 24 && m == 0 && allow_end_of_day) {
        minutes = MINUTES_PER_DAY;
        return true;
    }
    if (h > 23 || m > 59) {
        return false;
    }
    minutes = h * 60 + m;
    return true;
}

bool parseWeekday(const std::string& text, Weekday& out) {
    std::string key(text);
    std::transform(key.begin(), key.end(), key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    static const char* const kShort[] = {"mon", "tue", "wed", "thu", "fri", "sat", "sun"};
    static const char* const kLong[] = {"monday", "tuesday", "wednesday", "thursday",
                                        "friday", "saturday", "sunday"};
    // Сокращения из исходных наборов NPR
    static const char* const kDutch[] = {"ma", "di", "wo", "do", "vr", "za", "zo"};

    for (int i = 0; i < DAYS_PER_WEEK; ++i) {
        if (key == kShort[i] || key == kLong[i] || key == kDutch[i]) {
            out = static_cast<Weekday>(i);
            return true;
        }
    }
    return false;
}

std::string formatTimestamp(CivilTime t) {
    int year;
    unsigned month, day;
    civilFromDays(dayIndex(t), year, month, day);
    int mod = minuteOfDay(t);
    char buf[32];
    snprintf(buf, sizeof(buf), "%04d-%02u-%02uT%02d:%02d:00", year, month, day, mod / 60, mod % 60);
    return buf;
}

std::string formatDate(CivilTime t) {
    int year;
    unsigned month, day;
    civilFromDays(dayIndex(t), year, month, day);
    char buf[16];
    snprintf(buf, sizeof(buf), "%04d-%02u-%02u", year, month, day);
    return buf;
}

std::string formatTimeOfDay(int minutes) {
    char buf[8];
    snprintf(buf, sizeof(buf), "%02d:%02d", minutes / 60, minutes % 60);
    return buf;
}

const char* weekdayName(Weekday day) {
    switch (day) {
        case Weekday::MONDAY:    return "mon";
        case Weekday::TUESDAY:   return "tue";
        case Weekday::WEDNESDAY: return "wed";
        case Weekday::THURSDAY:  return "thu";
        case Weekday::FRIDAY:    return "fri";
        case Weekday::SATURDAY:  return "sat";
        case Weekday::SUNDAY:    return "sun";
    }
    return "?";
}

std::string formatDuration(int64_t minutes) {
    std::ostringstream oss;
    int64_t hours = minutes / 60;
    int64_t rest = minutes % 60;
    if (hours > 0) {
        oss << hours << (hours == 1 ? " hour" : " hours");
        if (rest == 0) {
            return oss.str();
        }
        oss << " ";
    }
    oss << rest << (rest == 1 ? " minute" : " minutes");
    return oss.str();
}

} // namespace nprpark
