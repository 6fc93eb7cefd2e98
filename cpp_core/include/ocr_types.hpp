#pragma once
#include <opencv2/core.hpp>
#include <array>
#include <cstdint>
#include <optional>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

// Canonical engines the service can actually execute.
enum class EngineId {
    Tesseract,
    PaddleOcr
};

enum class ConfidenceTier {
    High,
    Medium,
    Low
};

/**
 * @brief Page segmentation hint forwarded to Tesseract.
 *
 * Values match tesseract::PageSegMode so they can be cast directly.
 */
enum class LayoutMode {
    Auto = 3,
    Vertical = 5,
    Dense = 6,
    Sparse = 11
};

enum class PreprocessProfile {
    None,
    Minimal,
    Default,
    Adaptive,
    HighContrast,
    LowContrast,
    Denoised
};

std::string EngineName(EngineId engine);
std::optional<EngineId> ParseEngine(const std::string& name);

std::string TierName(ConfidenceTier tier);

std::string LayoutName(LayoutMode mode);
std::optional<LayoutMode> ParseLayout(const std::string& name);

std::string ProfileName(PreprocessProfile profile);
std::optional<PreprocessProfile> ParseProfile(const std::string& name);

std::string ToLower(std::string s);

// Short language codes accepted in requests.
const std::vector<std::string>& SupportedLanguages();

class InvalidInputError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class EngineUnavailableError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// Axis-aligned box in pixels.
struct BBox {
    int x = 0;
    int y = 0;
    int width = 0;
    int height = 0;

    bool operator==(const BBox& other) const {
        return x == other.x && y == other.y && width == other.width && height == other.height;
    }
};

/**
 * @class TextRegion
 * @brief One detection: text, box in original-image coordinates, confidence and its tier.
 *
 * Values are fixed at construction. Moving a box produces a new region.
 */
class TextRegion {
public:
    TextRegion(std::string text, const BBox& bbox, double confidence);

    const std::string& Text() const { return text_; }
    const BBox& Box() const { return bbox_; }
    double Confidence() const { return confidence_; }
    ConfidenceTier Tier() const { return tier_; }

    TextRegion Translated(int dx, int dy) const;
    TextRegion WithBox(const BBox& bbox) const;

private:
    std::string text_;
    BBox bbox_;
    double confidence_;
    ConfidenceTier tier_;
};

struct ConfidenceStats {
    size_t count = 0;
    double min = 0.0;
    double max = 0.0;
    double avg = 0.0;
    double median = 0.0;
    size_t high = 0;
    size_t medium = 0;
    size_t low = 0;
};

// Image reference: file path, encoded bytes (png/jpg/...), or a decoded image.
using ImageSource = std::variant<std::string, std::vector<uchar>, cv::Mat>;

struct ExtractionOptions {
    std::string language = "en";
    PreprocessProfile profile = PreprocessProfile::Default;
    LayoutMode layout = LayoutMode::Sparse;
    std::string engine = "paddleocr";
};

// Defaults for a full page: aggressive cleanup, sparse speech-bubble layout.
ExtractionOptions PageDefaults();
// Defaults for a user-selected crop: light cleanup, one dense block.
ExtractionOptions RegionDefaults();

struct OcrMetadata {
    ConfidenceStats confidence_stats;
    std::string engine_requested;
    std::string engine_used;
    std::optional<std::string> fallback_reason;
    PreprocessProfile profile = PreprocessProfile::Default;
    LayoutMode layout = LayoutMode::Sparse;
    std::string language;
    size_t total_detected = 0;
    size_t filtered_count = 0;
    size_t filtered_out = 0;
    std::optional<std::array<int, 4>> region;
    std::optional<BBox> clamped_region;
};

struct OcrResponse {
    bool success = false;
    std::vector<TextRegion> regions;
    OcrMetadata metadata;
    std::string error;

    static OcrResponse Failure(const std::string& message);
};

struct EngineInfo {
    std::string name;
    bool canonical = false;
    bool installed = false;
    std::optional<std::string> routes_to;  // engine a request for this name runs on now
    std::vector<std::string> languages;    // empty when nothing can serve the name
    std::string description;
};
