#pragma once

#include "Sample.h"

#include <cstddef>
#include <vector>

/*
    Keeps at most `capacity` samples.

    When a push overflows the capacity the samples are sorted by time and
    split by count into early (20%), middle (30%) and recent (50%) tiers.
    Every tier is thinned to an evenly spaced subsequence, sized from the capacity:
    early 10%, middle 30%, recent the rest. So the old history gets sparse
    and the recent one stays dense.

    Provides guarantee: the sample with the latest timestamp ever pushed
    is present after every push.
*/
class PriceSeries
{
public:
    PriceSeries(size_t capacity);

    void push_sample(const Sample & sample);

    // in storage order: insertion order until the first downsampling, time order after it
    const std::vector<Sample> & samples() const { return m_samples; }

    size_t size() const { return m_samples.size(); }
    bool empty() const { return m_samples.empty(); }
    size_t capacity() const { return m_capacity; }

    // index i*size/keep for i in [0, keep), duplicates are possible when keep > size
    static std::vector<Sample> evenly_spaced(const std::vector<Sample> & tier, size_t keep);

private:
    void downsample();

private:
    const size_t m_capacity;

    std::vector<Sample> m_samples;
};
