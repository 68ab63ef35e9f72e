#include "MovingAverageEngine.h"

#include "AuditRowBuilder.h"
#include "DateTimeConverter.h"
#include "Logger.h"
#include "PriceLookup.h"

#include <nlohmann/json.hpp>

#include <stdexcept>
#include <utility>
#include <vector>

namespace {
const EngineConfig & validated(const EngineConfig & config)
{
    if (!config.is_valid()) {
        throw std::invalid_argument("Invalid engine config: " + config.to_json().dump());
    }
    return config;
}
} // namespace

MovingAverageEngine::MovingAverageEngine(const EngineConfig & config)
    : m_config(validated(config))
    , m_calendar(m_config.trading_hours)
    , m_series(m_config.capacity)
    , m_aggregator(m_calendar)
{
    LOG_DEBUG("Engine created: {}", m_config.to_json().dump());
}

void MovingAverageEngine::update(Timestamp timestamp, double price)
{
    m_now = timestamp;
    m_series.push_sample(Sample{.timestamp = timestamp, .price = price});
}

double MovingAverageEngine::fallback_price() const
{
    if (m_series.empty()) {
        return m_config.default_price;
    }
    return m_series.samples().back().price;
}

double MovingAverageEngine::get()
{
    if (!m_now.has_value()) {
        return 0.;
    }

    const PriceLookup lookup(m_series);
    const double fallback = fallback_price();

    std::vector<Timestamp> visited;
    WindowAggregator::InstantCallback on_instant;
    if (m_audit_sink) {
        on_instant = [&visited](Timestamp ts) { visited.push_back(ts); };
    }

    const auto aggregate = m_aggregator.compute(lookup, m_now, m_config.window, fallback, on_instant);
    const double sma = aggregate.sma();

    LOG_DEBUG("SMA at {}: {} over {} points",
              DateTimeConverter::date_time(*m_now),
              sma,
              aggregate.points);

    if (m_audit_sink && !visited.empty()) {
        const AuditRowBuilder builder(m_calendar, lookup);
        m_audit_sink->on_window(builder.build(visited, *m_now, sma, fallback));
    }

    return sma;
}

bool MovingAverageEngine::is_trading_instant(Timestamp timestamp) const
{
    return m_calendar.is_trading_instant(timestamp);
}

void MovingAverageEngine::set_audit_sink(std::shared_ptr<IAuditSink> sink)
{
    m_audit_sink = std::move(sink);
}
