#include "ocr_types.hpp"
#include "confidence.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

const std::vector<std::string>& SupportedLanguages() {
    static const std::vector<std::string> kCodes = {"en", "de", "ru", "fr", "es", "it", "pt", "ja", "zh", "ko"};
    return kCodes;
}

std::string EngineName(EngineId engine) {
    switch (engine) {
        case EngineId::Tesseract: return "tesseract";
        case EngineId::PaddleOcr: return "paddleocr";
    }
    return "unknown";
}

std::optional<EngineId> ParseEngine(const std::string& name) {
    const std::string lowered = ToLower(name);
    if (lowered == "tesseract") return EngineId::Tesseract;
    if (lowered == "paddleocr") return EngineId::PaddleOcr;
    return std::nullopt;
}

std::string TierName(ConfidenceTier tier) {
    switch (tier) {
        case ConfidenceTier::High: return "high";
        case ConfidenceTier::Medium: return "medium";
        case ConfidenceTier::Low: return "low";
    }
    return "low";
}

std::string LayoutName(LayoutMode mode) {
    switch (mode) {
        case LayoutMode::Auto: return "auto";
        case LayoutMode::Vertical: return "vertical";
        case LayoutMode::Dense: return "dense";
        case LayoutMode::Sparse: return "sparse";
    }
    return "sparse";
}

std::optional<LayoutMode> ParseLayout(const std::string& name) {
    const std::string lowered = ToLower(name);
    if (lowered == "auto" || lowered == "3") return LayoutMode::Auto;
    if (lowered == "vertical" || lowered == "5") return LayoutMode::Vertical;
    if (lowered == "dense" || lowered == "6") return LayoutMode::Dense;
    if (lowered == "sparse" || lowered == "11") return LayoutMode::Sparse;
    return std::nullopt;
}

std::string ProfileName(PreprocessProfile profile) {
    switch (profile) {
        case PreprocessProfile::None: return "none";
        case PreprocessProfile::Minimal: return "minimal";
        case PreprocessProfile::Default: return "default";
        case PreprocessProfile::Adaptive: return "adaptive";
        case PreprocessProfile::HighContrast: return "high_contrast";
        case PreprocessProfile::LowContrast: return "low_contrast";
        case PreprocessProfile::Denoised: return "denoised";
    }
    return "default";
}

std::optional<PreprocessProfile> ParseProfile(const std::string& name) {
    static const PreprocessProfile kAll[] = {
        PreprocessProfile::None, PreprocessProfile::Minimal, PreprocessProfile::Default,
        PreprocessProfile::Adaptive, PreprocessProfile::HighContrast,
        PreprocessProfile::LowContrast, PreprocessProfile::Denoised
    };
    const std::string lowered = ToLower(name);
    for (PreprocessProfile profile : kAll) {
        if (ProfileName(profile) == lowered) return profile;
    }
    return std::nullopt;
}

TextRegion::TextRegion(std::string text, const BBox& bbox, double confidence)
    : text_(std::move(text)),
      bbox_(bbox),
      confidence_(std::clamp(confidence, 0.0, 1.0)),
      tier_(ClassifyConfidence(confidence_)) {
    if (text_.empty()) {
        throw std::invalid_argument("TextRegion requires non-empty text");
    }
}

TextRegion TextRegion::Translated(int dx, int dy) const {
    BBox moved = bbox_;
    moved.x += dx;
    moved.y += dy;
    return WithBox(moved);
}

TextRegion TextRegion::WithBox(const BBox& bbox) const {
    return TextRegion(text_, bbox, confidence_);
}

ExtractionOptions PageDefaults() {
    ExtractionOptions options;
    options.profile = PreprocessProfile::Default;
    options.layout = LayoutMode::Sparse;
    return options;
}

ExtractionOptions RegionDefaults() {
    ExtractionOptions options;
    options.profile = PreprocessProfile::Minimal;
    options.layout = LayoutMode::Dense;
    return options;
}

OcrResponse OcrResponse::Failure(const std::string& message) {
    OcrResponse response;
    response.success = false;
    response.error = message;
    return response;
}
