#include "tesseract_adapter.hpp"
#include "preprocess_utils.hpp"
#include <stdexcept>
#include <utility>

namespace {
std::string Trim(const std::string& s) {
    const char* ws = " \t\r\n\f\v";
    const auto begin = s.find_first_not_of(ws);
    if (begin == std::string::npos) return "";
    const auto end = s.find_last_not_of(ws);
    return s.substr(begin, end - begin + 1);
}
}

AdapterOutput NormalizeWordTable(const WordTable& table) {
    AdapterOutput output;
    output.total_detected = table.text.size();

    for (size_t i = 0; i < table.text.size(); ++i) {
        if (i >= table.confidence.size() || i >= table.left.size() || i >= table.top.size() ||
            i >= table.width.size() || i >= table.height.size()) {
            continue;
        }

        std::string text = Trim(table.text[i]);
        const float conf = table.confidence[i];
        if (text.empty() || conf < kTesseractMinConfidence) continue;

        BBox box{table.left[i], table.top[i], table.width[i], table.height[i]};
        output.regions.emplace_back(std::move(text), box, conf / 100.0);
    }
    return output;
}

TesseractAdapter::TesseractAdapter(std::shared_ptr<WordRecognizer> recognizer)
    : recognizer_(std::move(recognizer)) {
    if (!recognizer_) {
        throw std::invalid_argument("TesseractAdapter requires a recognizer");
    }
}

AdapterOutput TesseractAdapter::Extract(const cv::Mat& image, const AdapterRequest& request) {
    cv::Mat prepared = PreprocessUtils::ApplyProfile(image, request.profile);
    request.sink->OnPreprocessed("tesseract_" + ProfileName(request.profile), prepared);

    WordTable table = recognizer_->RecognizeWords(prepared, request.layout);
    return NormalizeWordTable(table);
}
