#pragma once

#include "Sample.h"
#include "TradingCalendar.h"

#include <cstddef>
#include <cstdint>
#include <vector>

struct SyntheticPriceGeneratorConfig
{
    size_t points = 20;
    double start_price = 100.;
    double floor_price = 90.;
    uint32_t seed = 42;
};

/*
    Random walk on trading instants: each step moves 30..600 s forward,
    steps landing outside a session are moved to the next session open,
    and the price changes by -1%..+1%. A price that falls below the floor
    is reset into [floor, floor + 10).

    Same seed, same samples.
*/
class SyntheticPriceGenerator
{
public:
    SyntheticPriceGenerator(const TradingCalendar & calendar, SyntheticPriceGeneratorConfig config);

    // sorted by timestamp, the first sample is at start (moved to the next session open if needed)
    std::vector<Sample> generate(Timestamp start) const;

private:
    const TradingCalendar & m_calendar;
    const SyntheticPriceGeneratorConfig m_config;
};
