#pragma once
#include "ocr_types.hpp"
#include <opencv2/core.hpp>
#include <array>
#include <optional>
#include <vector>

// Parses a caller's [x, y, width, height] list; throws InvalidInputError unless it has exactly four entries.
std::array<int, 4> ParseRegionArray(const std::vector<int>& values);

// Intersection of the requested rectangle with the image, or nullopt when it is empty.
std::optional<cv::Rect> ClampRegion(const std::array<int, 4>& region, const cv::Size& image_size);

cv::Mat CropToRegion(const cv::Mat& image, const cv::Rect& clamped);

// Trims boxes to [0, width] x [0, height] of the image the engine saw.
std::vector<TextRegion> ClipToImage(const std::vector<TextRegion>& regions, const cv::Size& image_size);

// Moves boxes from crop coordinates back to full-image coordinates.
std::vector<TextRegion> OffsetRegions(const std::vector<TextRegion>& regions, const cv::Point& origin);
