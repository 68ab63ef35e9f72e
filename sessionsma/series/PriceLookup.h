#pragma once

#include "PriceSeries.h"
#include "Timestamp.h"

#include <cstddef>
#include <vector>

/*
    Forward-fill price resolution over a snapshot of a PriceSeries.
    The price between two samples is the price of the earlier one.

    Construction sorts the snapshot once, every lookup is O(log n).
*/
class PriceLookup
{
public:
    // not a price: the instant predates everything the series remembers
    static constexpr double s_no_data_price = 0.;
    static constexpr Timestamp s_match_tolerance{0.1};

    PriceLookup(const PriceSeries & series);

    // 1. the first stored sample (storage order) closer than s_match_tolerance
    // 2. s_no_data_price before the earliest sample
    // 3. the latest sample at or before ts
    // fallback is returned only for an empty series
    double resolve_price(Timestamp ts, double fallback) const;

    // whether a stored sample lies closer than s_match_tolerance to ts
    bool has_sample_near(Timestamp ts) const;

    bool empty() const { return m_sorted.empty(); }

private:
    struct Entry
    {
        Timestamp timestamp;
        double price;
        size_t storage_index;
    };

    const Entry * exact_match(Timestamp ts) const;

private:
    // by timestamp, then by price
    std::vector<Entry> m_sorted;
};
