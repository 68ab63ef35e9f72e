#include "BacktrackCursor.h"

namespace {
constexpr Timestamp s_step{1.};
} // namespace

BacktrackCursor::BacktrackCursor(
        const TradingCalendar & calendar,
        Timestamp start,
        std::optional<Timestamp> lower_bound,
        std::optional<double> budget)
    : m_calendar(calendar)
    , m_position(start)
    , m_lower_bound(lower_bound)
    , m_budget(budget)
{
}

bool BacktrackCursor::exhausted() const
{
    if (m_position.count() < 0.) {
        return true;
    }
    if (m_lower_bound.has_value() && m_position < *m_lower_bound) {
        return true;
    }
    return m_budget.has_value() && *m_budget <= 0.;
}

void BacktrackCursor::step_back()
{
    m_position -= s_step;

    if (m_position.count() > 0. && !m_calendar.is_trading_instant(m_position)) {
        if (const auto jump_to = m_calendar.previous_session_close(m_position); jump_to.has_value()) {
            m_position = *jump_to;
        }
    }
}

std::optional<Timestamp> BacktrackCursor::next()
{
    while (!exhausted()) {
        const Timestamp current = m_position;
        const bool is_trading = m_calendar.is_trading_instant(current);
        step_back();

        if (is_trading) {
            if (m_budget.has_value()) {
                *m_budget -= 1.;
            }
            return current;
        }
    }
    return std::nullopt;
}
