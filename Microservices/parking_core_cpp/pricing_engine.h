#pragma once

#include "tariff_model.h"
#include "time_zone.h"
#include "zone_registry.h"
#include <string>
#include <vector>

namespace nprpark {

class PricingEngine {
public:
    explicit PricingEngine(const ZoneRegistry& registry, const TimeZone& zone = TimeZone(),
                           int max_span_days = 31);

    // Ошибки: TariffError с INVALID_INTERVAL, UNKNOWN_ZONE или NO_TARIFF_COVERAGE
    CalculationResult calculate(const CalculationRequest& request) const;
    CalculationResult calculate(const std::string& zone_id, Instant start, Instant end) const;

    int getMaxSpanDays() const { return max_span_days_; }
    const TimeZone& timeZone() const { return zone_; }

    // Ограничение суточного максимума одной структуры по местным суткам; true если что-то срезано.
    // Срез распределяется пропорционально, остаток центов - с самых крупных позиций.
    bool applyDailyMax(const TariffStructure& structure, std::vector<LineItem>& items) const;

private:
    struct GraceState {
        bool initialized = false;
        int64_t remaining = 0;
        int64_t applied = 0;
    };

    void validateInterval(const CalculationRequest& request) const;

    std::vector<LineItem> priceStructure(const TariffStructure& structure,
                                         Instant from, Instant to,
                                         GraceState& grace) const;

    // Конец фрагмента: та же часть и те же местные сутки
    Instant chunkEnd(const TariffStructure& structure, const TariffPart* part,
                     Instant from, Instant to) const;

    Instant structureStart(const TariffStructure& structure) const;
    Instant structureEnd(const TariffStructure& structure) const;

    const ZoneRegistry& registry_;
    TimeZone zone_;
    int max_span_days_;
};

} // namespace nprpark
