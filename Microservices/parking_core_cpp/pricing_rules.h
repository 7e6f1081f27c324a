#pragma once

#include "tariff_model.h"
#include <cstdint>

namespace nprpark {

// Чистые функции (minutes, part) -> сумма в центах, без состояния.
// minutes - уже уменьшенные на льготный период минуты фрагмента.

// Фиксированная сумма, если есть хотя бы одна оплачиваемая минута
int64_t priceFlat(int64_t minutes, const TariffPart& part);

// ceil(minutes / step) * unit: неполный шаг округляется вверх
int64_t priceLinear(int64_t minutes, const TariffPart& part);

// Сумма ступени floor(minutes / step); за пределами расписания -
// маржинальная сумма последней ступени за каждый следующий шаг
int64_t priceStepped(int64_t minutes, const TariffPart& part);

int64_t priceMinutes(int64_t minutes, const TariffPart& part);

} // namespace nprpark
