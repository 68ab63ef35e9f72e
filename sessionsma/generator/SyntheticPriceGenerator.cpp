#include "SyntheticPriceGenerator.h"

#include "DateTimeConverter.h"
#include "Logger.h"

#include <algorithm>
#include <random>

namespace {
constexpr int s_min_step_s = 30;
constexpr int s_max_step_s = 600;
constexpr double s_max_change_pct = 1.;
constexpr double s_floor_reset_range = 10.;
} // namespace

SyntheticPriceGenerator::SyntheticPriceGenerator(const TradingCalendar & calendar, SyntheticPriceGeneratorConfig config)
    : m_calendar(calendar)
    , m_config(config)
{
}

std::vector<Sample> SyntheticPriceGenerator::generate(Timestamp start) const
{
    std::vector<Sample> res;
    if (m_config.points == 0) {
        return res;
    }

    Timestamp ts = m_calendar.next_session_open(start);
    if (ts != start) {
        LOG_INFO("Start moved to the next session open: {}", DateTimeConverter::date_time(ts));
    }

    std::mt19937 gen{m_config.seed};
    std::uniform_int_distribution<int> step_dist{s_min_step_s, s_max_step_s};
    std::uniform_real_distribution<double> change_dist{-s_max_change_pct, s_max_change_pct};
    std::uniform_real_distribution<double> reset_dist{0., s_floor_reset_range};

    double price = m_config.start_price;
    res.reserve(m_config.points);
    res.push_back(Sample{.timestamp = ts, .price = price});

    for (size_t i = 1; i < m_config.points; ++i) {
        ts = m_calendar.next_session_open(ts + Timestamp{static_cast<double>(step_dist(gen))});

        price *= 1. + change_dist(gen) / 100.;
        if (price < m_config.floor_price) {
            price = m_config.floor_price + reset_dist(gen);
        }

        res.push_back(Sample{.timestamp = ts, .price = price});
    }

    std::stable_sort(res.begin(), res.end(), [](const Sample & l, const Sample & r) {
        return l.timestamp < r.timestamp;
    });

    LOG_INFO("Generated {} samples", res.size());
    return res;
}
