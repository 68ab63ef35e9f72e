#include "PriceLookup.h"

#include <algorithm>
#include <cmath>
#include <iterator>

PriceLookup::PriceLookup(const PriceSeries & series)
{
    const auto & samples = series.samples();
    m_sorted.reserve(samples.size());
    for (size_t i = 0; i < samples.size(); ++i) {
        m_sorted.push_back(Entry{.timestamp = samples[i].timestamp, .price = samples[i].price, .storage_index = i});
    }
    std::sort(m_sorted.begin(), m_sorted.end(), [](const Entry & l, const Entry & r) {
        if (l.timestamp != r.timestamp) {
            return l.timestamp < r.timestamp;
        }
        if (l.price != r.price) {
            return l.price < r.price;
        }
        return l.storage_index < r.storage_index;
    });
}

const PriceLookup::Entry * PriceLookup::exact_match(Timestamp ts) const
{
    // the scan range is twice the tolerance, the exact check is done on the difference
    const auto by_ts = [](const Entry & e, Timestamp t) { return e.timestamp < t; };
    auto it = std::lower_bound(m_sorted.begin(), m_sorted.end(), ts - 2 * s_match_tolerance, by_ts);

    const Entry * res = nullptr;
    for (; it != m_sorted.end() && it->timestamp < ts + 2 * s_match_tolerance; ++it) {
        if (std::abs((it->timestamp - ts).count()) >= s_match_tolerance.count()) {
            continue;
        }
        if (res == nullptr || it->storage_index < res->storage_index) {
            res = &*it;
        }
    }
    return res;
}

bool PriceLookup::has_sample_near(Timestamp ts) const
{
    return exact_match(ts) != nullptr;
}

double PriceLookup::resolve_price(Timestamp ts, double fallback) const
{
    if (m_sorted.empty()) {
        return fallback;
    }

    if (const auto * match = exact_match(ts); match != nullptr) {
        return match->price;
    }

    if (ts < m_sorted.front().timestamp) {
        return s_no_data_price;
    }

    const auto it = std::upper_bound(m_sorted.begin(), m_sorted.end(), ts, [](Timestamp t, const Entry & e) {
        return t < e.timestamp;
    });
    return std::prev(it)->price;
}
