#include "errors.h"
#include "pricing_rules.h"
#include "tariff_fixtures.h"
#include <gtest/gtest.h>

using namespace nprpark;
using namespace nprpark::testing_support;

namespace {

TariffPart steppedPart() {
    TariffPart part = allDayPart("STEP", PricingKind::STEPPED, 0);
    part.step_size_minutes = 60;
    part.steps = {{0, 100}, {60, 300}, {120, 500}};
    return part;
}

} // namespace

TEST(PricingRulesTest, FlatChargesOnceAnyMinuteIsChargeable) {
    TariffPart part = allDayPart("FLAT", PricingKind::FLAT, 300);
    EXPECT_EQ(priceFlat(0, part), 0);
    EXPECT_EQ(priceFlat(1, part), 300);
    EXPECT_EQ(priceFlat(120, part), 300);
    EXPECT_EQ(priceFlat(10000, part), 300);
}

TEST(PricingRulesTest, LinearRoundsPartialStepsUp) {
    TariffPart part = allDayPart("LIN", PricingKind::LINEAR, 300, ALL_DAYS, 60);
    EXPECT_EQ(priceLinear(0, part), 0);
    EXPECT_EQ(priceLinear(1, part), 300);
    EXPECT_EQ(priceLinear(60, part), 300);
    EXPECT_EQ(priceLinear(61, part), 600);
    EXPECT_EQ(priceLinear(180, part), 900);
}

TEST(PricingRulesTest, LinearIsFlatWithinAStepAndNonDecreasing) {
    TariffPart part = allDayPart("LIN", PricingKind::LINEAR, 125, ALL_DAYS, 10);
    for (int64_t minutes = 0; minutes < 600; ++minutes) {
        int64_t now = priceLinear(minutes, part);
        int64_t next = priceLinear(minutes + 1, part);
        EXPECT_LE(now, next) << "at " << minutes;
        if (minutes > 0 && (minutes - 1) / 10 == minutes / 10) {
            EXPECT_EQ(now, next) << "at " << minutes;
        }
    }
}

TEST(PricingRulesTest, SteppedPicksStepByElapsedDuration) {
    TariffPart part = steppedPart();
    EXPECT_EQ(priceStepped(0, part), 0);
    EXPECT_EQ(priceStepped(30, part), 100);
    EXPECT_EQ(priceStepped(60, part), 300);
    EXPECT_EQ(priceStepped(119, part), 300);
    EXPECT_EQ(priceStepped(150, part), 500);
}

TEST(PricingRulesTest, SteppedContinuesAtLastMarginalAmount) {
    TariffPart part = steppedPart();
    EXPECT_EQ(priceStepped(180, part), 700);
    EXPECT_EQ(priceStepped(240, part), 900);

    TariffPart single = allDayPart("ONE", PricingKind::STEPPED, 0, ALL_DAYS, 30);
    single.steps = {{0, 200}};
    EXPECT_EQ(priceStepped(29, single), 200);
    EXPECT_EQ(priceStepped(90, single), 800);
}

TEST(PricingRulesTest, SteppedIsNonDecreasing) {
    TariffPart part = steppedPart();
    for (int64_t minutes = 0; minutes < 400; ++minutes) {
        EXPECT_LE(priceStepped(minutes, part), priceStepped(minutes + 1, part)) << "at " << minutes;
    }
}

TEST(PricingRulesTest, DispatchFollowsPricingKind) {
    EXPECT_EQ(priceMinutes(150, steppedPart()), 500);
    EXPECT_EQ(priceMinutes(90, allDayPart("L", PricingKind::LINEAR, 300)), 600);
    EXPECT_EQ(priceMinutes(90, allDayPart("F", PricingKind::FLAT, 300)), 300);
}

TEST(PricingRulesTest, MissingStepSizeIsMalformedData) {
    TariffPart part = allDayPart("LIN", PricingKind::LINEAR, 300, ALL_DAYS, 0);
    try {
        priceLinear(10, part);
        FAIL() << "expected TariffError";
    } catch (const TariffError& e) {
        EXPECT_EQ(e.code(), ErrorCode::MALFORMED_TARIFF_DATA);
    }
}
