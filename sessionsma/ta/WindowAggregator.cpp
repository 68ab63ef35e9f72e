#include "WindowAggregator.h"

#include "BacktrackCursor.h"
#include "DateTimeConverter.h"
#include "Logger.h"

double WindowAggregate::sma() const
{
    if (points == 0) {
        return 0.;
    }
    return sum / static_cast<double>(points);
}

WindowAggregator::WindowAggregator(const TradingCalendar & calendar)
    : m_calendar(calendar)
{
}

WindowAggregate WindowAggregator::compute(
        const PriceLookup & lookup,
        std::optional<Timestamp> now,
        Timestamp window,
        double fallback_price,
        const InstantCallback & on_instant) const
{
    WindowAggregate res;
    if (!now.has_value()) {
        return res;
    }

    const auto consume = [&](BacktrackCursor & cursor) {
        while (const auto instant = cursor.next()) {
            const double price = lookup.resolve_price(*instant, fallback_price);
            if (price > PriceLookup::s_no_data_price) {
                res.sum += price;
                res.points += 1;
            }
            if (on_instant) {
                on_instant(*instant);
            }
        }
    };

    BacktrackCursor primary(m_calendar, *now, *now - window);
    consume(primary);

    // TODO: trigger on the time left in the window instead of the point count,
    // windows longer than a trading day re-collect this morning otherwise
    const auto primary_points = static_cast<double>(res.points);
    const auto morning_close = DateTimeConverter::at_time_of_day(*now, 0, m_calendar.hours().morning_close);
    // a morning close past noon can be later than `now`
    const bool after_morning_close = morning_close < *now;
    if (m_calendar.session_of(*now) == SessionLabel::Afternoon && after_morning_close && primary_points < window.count()) {
        LOG_DEBUG("Continuing from morning close {} for {} more points",
                  DateTimeConverter::date_time(morning_close),
                  window.count() - primary_points);

        BacktrackCursor continuation(m_calendar, morning_close, std::nullopt, window.count() - primary_points);
        consume(continuation);
    }

    return res;
}
