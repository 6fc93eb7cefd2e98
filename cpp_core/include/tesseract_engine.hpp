#pragma once
#include "ocr_types.hpp"
#include <opencv2/core.hpp>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tesseract {
class TessBaseAPI;
}

/**
 * @brief Per-word recognition output as parallel arrays.
 *
 * Confidence is on Tesseract's 0-100 scale; boxes are left/top/width/height.
 * Arrays are expected to have equal length; consumers must not assume it.
 */
struct WordTable {
    std::vector<std::string> text;
    std::vector<float> confidence;
    std::vector<int> left;
    std::vector<int> top;
    std::vector<int> width;
    std::vector<int> height;
};

/**
 * @class WordRecognizer
 * @brief Word-level recognizer over a prepared single-channel image.
 */
class WordRecognizer {
public:
    virtual ~WordRecognizer() = default;
    virtual WordTable RecognizeWords(const cv::Mat& gray, LayoutMode layout) = 0;
};

// Application language code -> traineddata name ("en" -> "eng"); unknown codes pass through.
std::string TesseractLanguageFor(const std::string& language);
bool TessdataHasLanguage(const std::string& tessdata_dir, const std::string& tess_language);
bool TessdataHasAnyLanguage(const std::string& tessdata_dir);

/**
 * @class TesseractEngine
 * @brief Owns one TessBaseAPI initialized for a single language.
 *
 * TessBaseAPI is not re-entrant, so calls on one instance are serialized.
 */
class TesseractEngine : public WordRecognizer {
public:
    TesseractEngine(const std::string& tessdata_dir, const std::string& tess_language);
    ~TesseractEngine() override;

    TesseractEngine(const TesseractEngine&) = delete;
    TesseractEngine& operator=(const TesseractEngine&) = delete;

    WordTable RecognizeWords(const cv::Mat& gray, LayoutMode layout) override;

private:
    std::unique_ptr<tesseract::TessBaseAPI> api_;
    std::string language_;
    std::mutex api_mutex_;
};
