#pragma once

#include <cstdint>
#include <string>

namespace nprpark {

// Локальное гражданское время зоны: минуты с 1970-01-01 00:00 (без секунд)
typedef int64_t CivilTime;

// Абсолютный момент: минуты UTC с 1970-01-01 00:00
typedef int64_t Instant;

const int MINUTES_PER_DAY = 1440;
const int DAYS_PER_WEEK = 7;

enum class Weekday {
    MONDAY = 0,
    TUESDAY,
    WEDNESDAY,
    THURSDAY,
    FRIDAY,
    SATURDAY,
    SUNDAY
};

// Алгоритмы Howard Hinnant для пролептического григорианского календаря
int64_t daysFromCivil(int year, unsigned month, unsigned day);
void civilFromDays(int64_t days, int& year, unsigned& month, unsigned& day);

CivilTime makeCivilTime(int year, unsigned month, unsigned day, int hour = 0, int minute = 0);

int64_t dayIndex(CivilTime t);
CivilTime startOfDay(CivilTime t);
int minuteOfDay(CivilTime t);
Weekday weekdayOf(CivilTime t);
Weekday previousWeekday(Weekday day);

// Метка времени как она записана: настенное время и, если есть, смещение от UTC
struct ParsedTimestamp {
    CivilTime wall = 0;
    bool has_offset = false;
    int offset_minutes = 0;
};

// ISO-подобные форматы: "YYYY-MM-DDTHH:MM[:SS[.fff]]", пробел вместо 'T',
// опционально "Z" или "+HH:MM". Годы 1900-9998. Перевод в момент - TimeZone::resolve.
bool parseTimestamp(const std::string& text, ParsedTimestamp& out);

// "YYYY-MM-DD" или формат NPR "YYYYMMDD"
bool parseDate(const std::string& text, CivilTime& out);

// "HH:MM"; "24:00" допустим только как конец окна
bool parseTimeOfDay(const std::string& text, int& minutes, bool allow_end_of_day = false);

bool parseWeekday(const std::string& text, Weekday& out);

std::string formatTimestamp(CivilTime t);
std::string formatDate(CivilTime t);
std::string formatTimeOfDay(int minutes);
const char* weekdayName(Weekday day);

// "2 hours 30 minutes"
std::string formatDuration(int64_t minutes);

} // namespace nprpark
