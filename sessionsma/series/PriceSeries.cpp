#include "PriceSeries.h"

#include "DateTimeConverter.h"
#include "Logger.h"

#include <algorithm>
#include <utility>

namespace {

constexpr double s_early_tier_share = 0.2;
constexpr double s_middle_tier_end_share = 0.5;

constexpr double s_early_keep_share = 0.1;
constexpr double s_middle_keep_share = 0.3;

} // namespace

std::ostream & operator<<(std::ostream & os, const Sample & sample)
{
    os << "{ts: " << DateTimeConverter::date_time(sample.timestamp) << ", price: " << sample.price << "}";
    return os;
}

PriceSeries::PriceSeries(size_t capacity)
    : m_capacity(capacity)
{
    m_samples.reserve(m_capacity + 1);
}

void PriceSeries::push_sample(const Sample & sample)
{
    m_samples.push_back(sample);

    if (m_samples.size() > m_capacity) {
        downsample();
    }
}

std::vector<Sample> PriceSeries::evenly_spaced(const std::vector<Sample> & tier, size_t keep)
{
    std::vector<Sample> res;
    if (tier.empty()) {
        return res;
    }

    res.reserve(keep);
    for (size_t i = 0; i < keep; ++i) {
        res.push_back(tier[i * tier.size() / keep]);
    }
    return res;
}

void PriceSeries::downsample()
{
    std::vector<Sample> sorted = m_samples;
    std::stable_sort(sorted.begin(), sorted.end(), [](const Sample & l, const Sample & r) {
        return l.timestamp < r.timestamp;
    });

    const auto total = sorted.size();
    const auto early_end = static_cast<size_t>(static_cast<double>(total) * s_early_tier_share);
    const auto middle_end = static_cast<size_t>(static_cast<double>(total) * s_middle_tier_end_share);

    const auto capacity = static_cast<double>(m_capacity);
    const auto early_keep = std::max<long>(1, static_cast<long>(capacity * s_early_keep_share));
    const auto middle_keep = std::max<long>(1, static_cast<long>(capacity * s_middle_keep_share));
    // negative for a capacity of 1, nothing is taken from the recent tier then
    const auto recent_keep = std::max<long>(0, static_cast<long>(m_capacity) - early_keep - middle_keep);

    const std::vector<Sample> early(sorted.begin(), sorted.begin() + early_end);
    const std::vector<Sample> middle(sorted.begin() + early_end, sorted.begin() + middle_end);
    const std::vector<Sample> recent(sorted.begin() + middle_end, sorted.end());

    std::vector<Sample> res = evenly_spaced(early, static_cast<size_t>(early_keep));
    const auto middle_selection = evenly_spaced(middle, static_cast<size_t>(middle_keep));
    const auto recent_selection = evenly_spaced(recent, static_cast<size_t>(recent_keep));
    res.insert(res.end(), middle_selection.begin(), middle_selection.end());
    res.insert(res.end(), recent_selection.begin(), recent_selection.end());

    const Sample & latest = sorted.back();
    if (std::find(res.begin(), res.end(), latest) == res.end()) {
        if (res.empty()) {
            res.push_back(latest);
        }
        else {
            // the slot is taken over, its previous sample is dropped
            res.back() = latest;
        }
    }

    LOG_DEBUG("Downsampled {} samples to {}, latest: {}", total, res.size(), latest);

    m_samples = std::move(res);
}
