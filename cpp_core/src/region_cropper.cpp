#include "region_cropper.hpp"
#include <algorithm>
#include <cstdint>
#include <string>

std::array<int, 4> ParseRegionArray(const std::vector<int>& values) {
    if (values.size() != 4) {
        throw InvalidInputError("Region must be [x, y, width, height], got " + std::to_string(values.size()) + " values");
    }
    return {values[0], values[1], values[2], values[3]};
}

std::optional<cv::Rect> ClampRegion(const std::array<int, 4>& region, const cv::Size& image_size) {
    // 64-bit so x + width cannot overflow for extreme inputs.
    const int64_t x0 = std::max<int64_t>(0, region[0]);
    const int64_t y0 = std::max<int64_t>(0, region[1]);
    const int64_t x1 = std::min<int64_t>(image_size.width, static_cast<int64_t>(region[0]) + region[2]);
    const int64_t y1 = std::min<int64_t>(image_size.height, static_cast<int64_t>(region[1]) + region[3]);

    if (x1 - x0 <= 0 || y1 - y0 <= 0) return std::nullopt;
    return cv::Rect(static_cast<int>(x0), static_cast<int>(y0), static_cast<int>(x1 - x0), static_cast<int>(y1 - y0));
}

cv::Mat CropToRegion(const cv::Mat& image, const cv::Rect& clamped) {
    return image(clamped).clone();
}

std::vector<TextRegion> ClipToImage(const std::vector<TextRegion>& regions, const cv::Size& image_size) {
    std::vector<TextRegion> clipped;
    clipped.reserve(regions.size());
    for (const auto& region : regions) {
        const BBox& b = region.Box();
        const int x0 = std::clamp(b.x, 0, image_size.width);
        const int y0 = std::clamp(b.y, 0, image_size.height);
        const int x1 = std::clamp(b.x + std::max(0, b.width), 0, image_size.width);
        const int y1 = std::clamp(b.y + std::max(0, b.height), 0, image_size.height);
        BBox box{x0, y0, x1 - x0, y1 - y0};
        clipped.push_back(box == b ? region : region.WithBox(box));
    }
    return clipped;
}

std::vector<TextRegion> OffsetRegions(const std::vector<TextRegion>& regions, const cv::Point& origin) {
    std::vector<TextRegion> moved;
    moved.reserve(regions.size());
    for (const auto& region : regions) {
        moved.push_back(region.Translated(origin.x, origin.y));
    }
    return moved;
}
