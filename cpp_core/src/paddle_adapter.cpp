#include "paddle_adapter.hpp"
#include "preprocess_utils.hpp"
#include <cmath>
#include <stdexcept>
#include <utility>

namespace {

void AppendDetection(AdapterOutput& out, const std::string& text, float score, const PaddleUtils::RawBox& raw) {
    if (text.find_first_not_of(" \t\r\n") == std::string::npos) return;
    if (!std::isfinite(score) || score < kPaddleMinConfidence) return;

    std::optional<BBox> box = PaddleUtils::BoxFromRaw(raw);
    if (!box) return;

    out.regions.emplace_back(text, *box, static_cast<double>(score));
}

struct OutputNormalizer {
    AdapterOutput operator()(const std::vector<PaddleUtils::LegacyEntry>& entries) const {
        AdapterOutput out;
        out.total_detected = entries.size();
        for (const auto& entry : entries) {
            if (!entry.recognition) continue;
            AppendDetection(out, entry.recognition->first, entry.recognition->second, entry.box);
        }
        return out;
    }

    AdapterOutput operator()(const PaddleUtils::StructuredResult& result) const {
        AdapterOutput out;
        out.total_detected = result.texts.size();
        for (size_t i = 0; i < result.texts.size(); ++i) {
            if (i >= result.scores.size() || i >= result.polygons.size()) continue;
            AppendDetection(out, result.texts[i], result.scores[i], result.polygons[i]);
        }
        return out;
    }
};

}

AdapterOutput NormalizePolygonOutput(const PaddleUtils::EngineOutput& output) {
    return std::visit(OutputNormalizer{}, output);
}

PaddleAdapter::PaddleAdapter(std::shared_ptr<PolygonRecognizer> recognizer)
    : recognizer_(std::move(recognizer)) {
    if (!recognizer_) {
        throw std::invalid_argument("PaddleAdapter requires a recognizer");
    }
}

AdapterOutput PaddleAdapter::Extract(const cv::Mat& image, const AdapterRequest& request) {
    cv::Mat bgr = PreprocessUtils::ToBgr(image);
    request.sink->OnPreprocessed("paddleocr_bgr", bgr);

    return NormalizePolygonOutput(recognizer_->Predict(bgr));
}
