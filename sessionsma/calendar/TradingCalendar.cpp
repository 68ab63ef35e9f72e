#include "TradingCalendar.h"

#include "DateTimeConverter.h"

#include <sstream>

namespace {

constexpr int s_noon_hour = 12;

int hour_of(std::chrono::seconds time_of_day)
{
    return static_cast<int>(std::chrono::duration_cast<std::chrono::hours>(time_of_day).count());
}

double as_double(std::chrono::seconds time_of_day)
{
    return static_cast<double>(time_of_day.count());
}

} // namespace

std::ostream & operator<<(std::ostream & os, SessionLabel label)
{
    switch (label) {
    case SessionLabel::Morning:
        os << "morning";
        break;
    case SessionLabel::Afternoon:
        os << "afternoon";
        break;
    }
    return os;
}

std::string to_string(SessionLabel label)
{
    std::stringstream os;
    os << label;
    return os.str();
}

TradingCalendar::TradingCalendar(TradingHours hours)
    : m_hours(hours)
{
}

bool TradingCalendar::is_weekend(int weekday)
{
    // tm_wday: 0 is Sunday, 6 is Saturday
    return weekday == 0 || weekday == 6;
}

int TradingCalendar::weekday_after(Timestamp ts, int day_offset) const
{
    const auto day = DateTimeConverter::at_time_of_day(ts, day_offset, m_hours.morning_open);
    return DateTimeConverter::local_tm(day).tm_wday;
}

bool TradingCalendar::is_trading_day(Timestamp ts) const
{
    return !is_weekend(DateTimeConverter::local_tm(ts).tm_wday);
}

bool TradingCalendar::is_trading_instant(Timestamp ts) const
{
    if (!is_trading_day(ts)) {
        return false;
    }

    const double sod = DateTimeConverter::seconds_of_day(ts);
    const bool in_morning = as_double(m_hours.morning_open) <= sod && sod <= as_double(m_hours.morning_close);
    const bool in_afternoon = as_double(m_hours.afternoon_open) <= sod && sod <= as_double(m_hours.afternoon_close);
    return in_morning || in_afternoon;
}

std::optional<Timestamp> TradingCalendar::previous_session_close(Timestamp ts) const
{
    const int hour = DateTimeConverter::local_tm(ts).tm_hour;

    std::optional<Timestamp> target;
    if (hour_of(m_hours.morning_close) <= hour && hour < hour_of(m_hours.afternoon_open)) {
        target = DateTimeConverter::at_time_of_day(ts, 0, m_hours.morning_close);
    }
    else if (hour < hour_of(m_hours.morning_open) || hour >= hour_of(m_hours.afternoon_close)) {
        int offset = -1;
        while (is_weekend(weekday_after(ts, offset))) {
            --offset;
        }
        target = DateTimeConverter::at_time_of_day(ts, offset, m_hours.afternoon_close);
    }

    if (!target.has_value() || *target >= ts) {
        return std::nullopt;
    }
    return target;
}

Timestamp TradingCalendar::next_session_open(Timestamp ts) const
{
    if (is_trading_instant(ts)) {
        return ts;
    }

    if (is_trading_day(ts)) {
        const double sod = DateTimeConverter::seconds_of_day(ts);
        if (sod < as_double(m_hours.morning_open)) {
            return DateTimeConverter::at_time_of_day(ts, 0, m_hours.morning_open);
        }
        if (sod < as_double(m_hours.afternoon_open)) {
            return DateTimeConverter::at_time_of_day(ts, 0, m_hours.afternoon_open);
        }
    }

    int offset = 1;
    while (is_weekend(weekday_after(ts, offset))) {
        ++offset;
    }
    return DateTimeConverter::at_time_of_day(ts, offset, m_hours.morning_open);
}

SessionLabel TradingCalendar::session_of(Timestamp ts) const
{
    return DateTimeConverter::local_tm(ts).tm_hour < s_noon_hour ? SessionLabel::Morning : SessionLabel::Afternoon;
}
