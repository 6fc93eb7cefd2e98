#pragma once
#include "ocr_types.hpp"
#include <vector>

constexpr double kHighConfidence = 0.60;
constexpr double kMediumConfidence = 0.30;

ConfidenceTier ClassifyConfidence(double confidence);

// All-zero stats for an empty list.
ConfidenceStats ComputeConfidenceStats(const std::vector<TextRegion>& regions);
