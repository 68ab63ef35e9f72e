#pragma once

#include "Timestamp.h"
#include "TradingCalendar.h"

#include <optional>

/*
    Walks time backwards one second at a time and yields trading instants only.

    After every step, a non-trading position above zero is moved to
    TradingCalendar::previous_session_close() if that is earlier, so midday
    breaks, nights and weekends are not scanned second by second.

    Stops below the lower bound, below zero, or when the budget is spent.
    The budget is counted in yielded instants.
*/
class BacktrackCursor
{
public:
    BacktrackCursor(
            const TradingCalendar & calendar,
            Timestamp start,
            std::optional<Timestamp> lower_bound,
            std::optional<double> budget = std::nullopt);

    std::optional<Timestamp> next();

    Timestamp position() const { return m_position; }

private:
    bool exhausted() const;
    void step_back();

private:
    const TradingCalendar & m_calendar;

    Timestamp m_position;
    const std::optional<Timestamp> m_lower_bound;
    std::optional<double> m_budget;
};
