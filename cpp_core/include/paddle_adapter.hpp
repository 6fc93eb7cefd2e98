#pragma once
#include "ocr_adapter.hpp"
#include "paddle_ocr_engine.hpp"
#include <memory>

constexpr float kPaddleMinConfidence = 0.15f;

// Either result shape -> regions. Every entry counts toward total_detected,
// including the ones dropped for low confidence or a shape that cannot be read.
AdapterOutput NormalizePolygonOutput(const PaddleUtils::EngineOutput& output);

/**
 * @class PaddleAdapter
 * @brief Feeds the raw image (alpha stripped, 3-channel BGR) to a PolygonRecognizer.
 *
 * Preprocessing profiles do not apply to this engine.
 */
class PaddleAdapter : public OcrAdapter {
public:
    explicit PaddleAdapter(std::shared_ptr<PolygonRecognizer> recognizer);

    EngineId Engine() const override { return EngineId::PaddleOcr; }
    AdapterOutput Extract(const cv::Mat& image, const AdapterRequest& request) override;

private:
    std::shared_ptr<PolygonRecognizer> recognizer_;
};
