#pragma once

#include "EngineConfig.h"
#include "IAuditSink.h"
#include "PriceSeries.h"
#include "Timestamp.h"
#include "TradingCalendar.h"
#include "WindowAggregator.h"

#include <memory>
#include <optional>

/*
    Bounded-memory SMA over the trading seconds of a trailing window.

    Single writer: update() and get() must be serialized by the caller.
*/
class MovingAverageEngine
{
public:
    // throws std::invalid_argument if !config.is_valid()
    MovingAverageEngine(const EngineConfig & config);

    void update(Timestamp timestamp, double price);

    // 0 before the first update or when no trading second in the window has a price
    double get();

    bool is_trading_instant(Timestamp timestamp) const;

    // rows are produced only while a sink is attached, nullptr detaches
    void set_audit_sink(std::shared_ptr<IAuditSink> sink);

    const PriceSeries & series() const { return m_series; }
    const EngineConfig & config() const { return m_config; }
    std::optional<Timestamp> now() const { return m_now; }

private:
    double fallback_price() const;

private:
    const EngineConfig m_config;

    TradingCalendar m_calendar;
    PriceSeries m_series;
    WindowAggregator m_aggregator;

    // timestamp of the latest update() call
    std::optional<Timestamp> m_now;

    std::shared_ptr<IAuditSink> m_audit_sink;
};
