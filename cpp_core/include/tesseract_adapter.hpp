#pragma once
#include "ocr_adapter.hpp"
#include "tesseract_engine.hpp"
#include <memory>

constexpr float kTesseractMinConfidence = 15.0f;

// Word table -> regions; entries with blank text, confidence under the floor
// or missing columns are dropped.
AdapterOutput NormalizeWordTable(const WordTable& table);

/**
 * @class TesseractAdapter
 * @brief Preprocesses with the requested profile, then reads words from a WordRecognizer.
 */
class TesseractAdapter : public OcrAdapter {
public:
    explicit TesseractAdapter(std::shared_ptr<WordRecognizer> recognizer);

    EngineId Engine() const override { return EngineId::Tesseract; }
    AdapterOutput Extract(const cv::Mat& image, const AdapterRequest& request) override;

private:
    std::shared_ptr<WordRecognizer> recognizer_;
};
