#include "confidence.hpp"
#include <algorithm>
#include <numeric>

ConfidenceTier ClassifyConfidence(double confidence) {
    if (confidence >= kHighConfidence) return ConfidenceTier::High;
    if (confidence >= kMediumConfidence) return ConfidenceTier::Medium;
    return ConfidenceTier::Low;
}

ConfidenceStats ComputeConfidenceStats(const std::vector<TextRegion>& regions) {
    ConfidenceStats stats;
    if (regions.empty()) return stats;

    std::vector<double> values;
    values.reserve(regions.size());
    for (const auto& region : regions) {
        values.push_back(region.Confidence());
        switch (region.Tier()) {
            case ConfidenceTier::High: ++stats.high; break;
            case ConfidenceTier::Medium: ++stats.medium; break;
            case ConfidenceTier::Low: ++stats.low; break;
        }
    }
    std::sort(values.begin(), values.end());

    stats.count = values.size();
    stats.min = values.front();
    stats.max = values.back();
    stats.avg = std::accumulate(values.begin(), values.end(), 0.0) / static_cast<double>(values.size());

    const size_t mid = values.size() / 2;
    stats.median = (values.size() % 2 == 1) ? values[mid] : (values[mid - 1] + values[mid]) / 2.0;
    return stats;
}
