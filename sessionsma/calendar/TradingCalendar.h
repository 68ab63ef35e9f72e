#pragma once

#include "Timestamp.h"
#include "TradingHours.h"

#include <optional>
#include <ostream>
#include <string>

enum class SessionLabel
{
    Morning,
    Afternoon,
};

std::ostream & operator<<(std::ostream & os, SessionLabel label);
std::string to_string(SessionLabel label);

/*
    Monday-Friday calendar with two sessions per day in local time.
    Saturday and Sunday have no sessions at all.
*/
class TradingCalendar
{
public:
    TradingCalendar(TradingHours hours = {});

    bool is_trading_day(Timestamp ts) const;
    bool is_trading_instant(Timestamp ts) const;

    // Where a backward walk standing on a non-trading instant can jump to:
    //  - inside the midday break hours: that day's morning close
    //  - before the morning open hour or from the afternoon close hour on:
    //    the previous weekday's afternoon close
    // Empty when no rule applies or the target would not be strictly earlier than ts.
    std::optional<Timestamp> previous_session_close(Timestamp ts) const;

    // ts itself for a trading instant
    Timestamp next_session_open(Timestamp ts) const;

    // half-day label: morning before noon, afternoon from noon on
    SessionLabel session_of(Timestamp ts) const;

    const TradingHours & hours() const { return m_hours; }

private:
    static bool is_weekend(int weekday);

    int weekday_after(Timestamp ts, int day_offset) const;

private:
    const TradingHours m_hours;
};
