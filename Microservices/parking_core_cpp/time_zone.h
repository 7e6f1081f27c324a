#pragma once

#include "civil_time.h"
#include <boost/date_time/local_time/local_time.hpp>
#include <string>

namespace nprpark {

// Часовой пояс тарифов на boost::local_time. Расчёт длительности идёт по моментам (Instant),
// а дни недели, окна и полночь определяются по местному времени пояса.
class TimeZone {
public:
    // UTC
    TimeZone();

    // POSIX-описание в нотации boost: "CET+01CEST+01,M3.5.0/02:00,M10.5.0/03:00"
    static TimeZone fromPosix(const std::string& posix_tz);

    // Регион из csv в формате boost date_time_zonespec.csv
    static TimeZone fromDatabase(const std::string& csv_path, const std::string& region);

    // "UTC" или пустое имя; имя региона ("Europe/Amsterdam") - из базы; иначе POSIX-описание.
    // Ошибки: std::runtime_error
    static TimeZone load(const std::string& name, const std::string& database_path);

    const std::string& name() const { return name_; }

    CivilTime toLocal(Instant t) const;

    // Неоднозначное время при переводе назад - первое (летнее) вхождение,
    // несуществующее время при переводе вперёд - по стандартному смещению
    Instant toInstant(CivilTime local) const;

    int offsetMinutes(Instant t) const;

    // Ближайший переход летнего времени строго после t; INT64_MAX если переходов нет
    Instant nextTransition(Instant t) const;

    // Метка без смещения - местное время пояса
    Instant resolve(const ParsedTimestamp& parsed) const;
    bool parseInstant(const std::string& text, Instant& out) const;

    // "YYYY-MM-DDTHH:MM:00+HH:MM"
    std::string formatLocal(Instant t) const;

private:
    TimeZone(const std::string& name, boost::local_time::time_zone_ptr zone);

    bool hasDst() const;
    int64_t baseOffsetMinutes() const;
    int64_t dstOffsetMinutes() const;

    std::string name_;
    boost::local_time::time_zone_ptr zone_;  // пустой указатель - UTC
};

} // namespace nprpark
