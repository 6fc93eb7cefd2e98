#include "tesseract_engine.hpp"
#include <tesseract/baseapi.h>
#include <tesseract/resultiterator.h>
#include <filesystem>
#include <iostream>
#include <map>
#include <stdexcept>

std::string TesseractLanguageFor(const std::string& language) {
    static const std::map<std::string, std::string> kLanguages = {
        {"en", "eng"}, {"de", "deu"}, {"ru", "rus"}, {"fr", "fra"}, {"es", "spa"},
        {"it", "ita"}, {"pt", "por"}, {"ja", "jpn"}, {"zh", "chi_sim"}, {"ko", "kor"}
    };
    auto it = kLanguages.find(ToLower(language));
    return it != kLanguages.end() ? it->second : language;
}

bool TessdataHasLanguage(const std::string& tessdata_dir, const std::string& tess_language) {
    std::error_code ec;
    return std::filesystem::is_regular_file(std::filesystem::path(tessdata_dir) / (tess_language + ".traineddata"), ec);
}

bool TessdataHasAnyLanguage(const std::string& tessdata_dir) {
    std::error_code ec;
    if (tessdata_dir.empty() || !std::filesystem::is_directory(tessdata_dir, ec)) return false;
    for (const auto& entry : std::filesystem::directory_iterator(tessdata_dir, ec)) {
        if (entry.path().extension() == ".traineddata") return true;
    }
    return false;
}

TesseractEngine::TesseractEngine(const std::string& tessdata_dir, const std::string& tess_language)
    : api_(std::make_unique<tesseract::TessBaseAPI>()), language_(tess_language) {
    std::cout << "[Tesseract] Initializing language '" << tess_language << "' from " << tessdata_dir << std::endl;
    if (api_->Init(tessdata_dir.c_str(), tess_language.c_str(), tesseract::OEM_LSTM_ONLY) != 0) {
        throw std::runtime_error("Failed to initialize Tesseract with language '" + tess_language +
                                 "' and data path '" + tessdata_dir + "'");
    }
    api_->SetVariable("user_defined_dpi", "300");
}

TesseractEngine::~TesseractEngine() {
    if (api_) {
        api_->End();
    }
}

WordTable TesseractEngine::RecognizeWords(const cv::Mat& gray, LayoutMode layout) {
    if (gray.empty() || gray.type() != CV_8UC1) {
        throw std::invalid_argument("Tesseract expects a non-empty 8-bit single-channel image");
    }
    cv::Mat pixels = gray.isContinuous() ? gray : gray.clone();

    std::lock_guard<std::mutex> lock(api_mutex_);
    api_->SetPageSegMode(static_cast<tesseract::PageSegMode>(layout));
    api_->SetImage(pixels.data, pixels.cols, pixels.rows, 1, static_cast<int>(pixels.step[0]));

    if (api_->Recognize(nullptr) != 0) {
        api_->Clear();
        throw std::runtime_error("Tesseract recognition failed (" + language_ + ")");
    }

    WordTable table;
    std::unique_ptr<tesseract::ResultIterator> iter(api_->GetIterator());
    if (!iter) {
        api_->Clear();
        return table;
    }

    const tesseract::PageIteratorLevel level = tesseract::RIL_WORD;
    do {
        if (iter->Empty(level)) continue;

        std::unique_ptr<char[]> word(iter->GetUTF8Text(level));
        int x1 = 0, y1 = 0, x2 = 0, y2 = 0;
        if (!iter->BoundingBox(level, &x1, &y1, &x2, &y2)) continue;

        table.text.emplace_back(word ? word.get() : "");
        table.confidence.push_back(iter->Confidence(level));
        table.left.push_back(x1);
        table.top.push_back(y1);
        table.width.push_back(x2 - x1);
        table.height.push_back(y2 - y1);
    } while (iter->Next(level));

    api_->Clear();
    return table;
}
