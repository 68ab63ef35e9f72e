#pragma once

#include "AuditRow.h"
#include "PriceLookup.h"
#include "TradingCalendar.h"

#include <vector>

class AuditRowBuilder
{
public:
    AuditRowBuilder(const TradingCalendar & calendar, const PriceLookup & lookup);

    std::vector<AuditRow> build(
            const std::vector<Timestamp> & visited,
            Timestamp now,
            double sma,
            double fallback_price) const;

private:
    const TradingCalendar & m_calendar;
    const PriceLookup & m_lookup;
};
