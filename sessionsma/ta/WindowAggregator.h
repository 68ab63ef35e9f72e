#pragma once

#include "PriceLookup.h"
#include "Timestamp.h"
#include "TradingCalendar.h"

#include <cstddef>
#include <functional>
#include <optional>

struct WindowAggregate
{
    double sum = 0.;
    size_t points = 0;

    // 0 when no trading second had a price
    double sma() const;
};

/*
    Simple moving average over the trading seconds of a trailing window.

    The primary walk goes back from `now` to `now - window` over trading instants.
    If `now` is an afternoon instant later than that day's morning close and fewer
    than `window` points were collected, a continuation walk starts from the
    morning close and collects at most
    `window - points` more trading instants, with no lower time bound.

    Instants priced at PriceLookup::s_no_data_price are visited but not counted.
*/
class WindowAggregator
{
public:
    using InstantCallback = std::function<void(Timestamp)>;

    WindowAggregator(const TradingCalendar & calendar);

    // on_instant gets every visited trading instant in visit order
    WindowAggregate compute(
            const PriceLookup & lookup,
            std::optional<Timestamp> now,
            Timestamp window,
            double fallback_price,
            const InstantCallback & on_instant = {}) const;

private:
    const TradingCalendar & m_calendar;
};
