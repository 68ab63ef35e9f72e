#include "AuditRowBuilder.h"

#include "DateTimeConverter.h"

#include <set>
#include <utility>

AuditRowBuilder::AuditRowBuilder(const TradingCalendar & calendar, const PriceLookup & lookup)
    : m_calendar(calendar)
    , m_lookup(lookup)
{
}

std::vector<AuditRow> AuditRowBuilder::build(
        const std::vector<Timestamp> & visited,
        Timestamp now,
        double sma,
        double fallback_price) const
{
    std::set<std::string> dates;
    size_t morning_count = 0;
    size_t afternoon_count = 0;
    for (const auto & ts : visited) {
        dates.insert(DateTimeConverter::date(ts));
        if (m_calendar.session_of(ts) == SessionLabel::Morning) {
            ++morning_count;
        }
        else {
            ++afternoon_count;
        }
    }
    const bool window_crosses_day = dates.size() > 1;
    const bool window_crosses_session = morning_count > 0 && afternoon_count > 0;
    const std::string now_date = DateTimeConverter::date(now);

    std::vector<AuditRow> rows;
    rows.reserve(visited.size());
    for (const auto & ts : visited) {
        AuditRow row;
        row.index = rows.size() + 1;
        row.timestamp = ts;
        row.date_time = DateTimeConverter::date_time(ts);
        row.gap_from_now = now - ts;
        row.session = m_calendar.session_of(ts);
        row.is_trading = m_calendar.is_trading_instant(ts);
        row.price = m_lookup.resolve_price(ts, fallback_price);
        row.sma = row.price > PriceLookup::s_no_data_price ? sma : 0.;
        row.point_kind = m_lookup.has_sample_near(ts) ? PointKind::Original : PointKind::Supplemental;
        row.boundary.crosses_day = window_crosses_day && DateTimeConverter::date(ts) != now_date;
        row.boundary.crosses_session = window_crosses_session;
        rows.push_back(std::move(row));
    }
    return rows;
}
