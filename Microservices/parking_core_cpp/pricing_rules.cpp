#include "pricing_rules.h"
#include "errors.h"

namespace nprpark {

namespace {

void requireStepSize(const TariffPart& part) {
    if (part.step_size_minutes <= 0) {
        throw TariffError(ErrorCode::MALFORMED_TARIFF_DATA,
                          "Tariff part '" + part.part_id + "' has no positive step size");
    }
}

} // namespace

int64_t priceFlat(int64_t minutes, const TariffPart& part) {
    return minutes > 0 ? part.unit_amount_cents : 0;
}

int64_t priceLinear(int64_t minutes, const TariffPart& part) {
    if (minutes <= 0) {
        return 0;
    }
    requireStepSize(part);
    int64_t steps = (minutes + part.step_size_minutes - 1) / part.step_size_minutes;
    return steps * part.unit_amount_cents;
}

int64_t priceStepped(int64_t minutes, const TariffPart& part) {
    if (minutes <= 0) {
        return 0;
    }
    requireStepSize(part);
    if (part.steps.empty()) {
        throw TariffError(ErrorCode::MALFORMED_TARIFF_DATA,
                          "Stepped tariff part '" + part.part_id + "' has no steps");
    }

    int64_t index = minutes / part.step_size_minutes;
    int64_t last_index = static_cast<int64_t>(part.steps.size()) - 1;
    if (index <= last_index) {
        return part.steps[index].amount_cents;
    }

    int64_t last = part.steps.back().amount_cents;
    int64_t marginal = last_index > 0 ? last - part.steps[last_index - 1].amount_cents : last;
    return last + (index - last_index) * marginal;
}

int64_t priceMinutes(int64_t minutes, const TariffPart& part) {
    switch (part.pricing_kind) {
        case PricingKind::FLAT:
            return priceFlat(minutes, part);
        case PricingKind::LINEAR:
            return priceLinear(minutes, part);
        case PricingKind::STEPPED:
            return priceStepped(minutes, part);
    }
    return 0;
}

} // namespace nprpark
