#include "paddle_ocr_engine.hpp"
#include <iostream>
#include <fstream>
#include <filesystem>
#include <algorithm>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace {
const char* kDetectionDir = "ocr_detection_multilingual";
const char* kMultilingualRecognitionDir = "ocr_recognition_multilingual";
const char* kDictionaryFile = "ppocrv5_dict.txt";
}

PaddleModelPaths ResolvePaddleModels(const std::string& models_dir, const std::string& language) {
    namespace fs = std::filesystem;
    const fs::path root(models_dir);

    fs::path rec_dir = root / ("ocr_recognition_" + language);
    if (language.empty() || !fs::exists(rec_dir / "inference.onnx")) {
        rec_dir = root / kMultilingualRecognitionDir;
    }

    PaddleModelPaths paths;
    paths.detection_model = (root / kDetectionDir / "inference.onnx").string();
    paths.recognition_model = (rec_dir / "inference.onnx").string();
    paths.dictionary = (rec_dir / kDictionaryFile).string();
    return paths;
}

bool PaddleModelsPresent(const PaddleModelPaths& paths) {
    std::error_code ec;
    return std::filesystem::is_regular_file(paths.detection_model, ec)
        && std::filesystem::is_regular_file(paths.recognition_model, ec)
        && std::filesystem::is_regular_file(paths.dictionary, ec);
}

PaddleOcrEngine::PaddleOcrEngine(std::shared_ptr<Ort::Env> env, Ort::SessionOptions& session_options, const PaddleModelPaths& paths)
    : env_(std::move(env)) {
    Ort::AllocatorWithDefaultOptions allocator;

    std::cout << "[PaddleOCR] Loading detection model: " << paths.detection_model << std::endl;
    det_session_ = std::make_unique<Ort::Session>(*env_, paths.detection_model.c_str(), session_options);

    std::cout << "[PaddleOCR] Loading recognition model: " << paths.recognition_model << std::endl;
    rec_session_ = std::make_unique<Ort::Session>(*env_, paths.recognition_model.c_str(), session_options);

    det_input_names_str_.push_back(det_session_->GetInputNameAllocated(0, allocator).get());
    det_output_names_str_.push_back(det_session_->GetOutputNameAllocated(0, allocator).get());
    det_input_names_.push_back(det_input_names_str_[0].c_str());
    det_output_names_.push_back(det_output_names_str_[0].c_str());

    rec_input_names_str_.push_back(rec_session_->GetInputNameAllocated(0, allocator).get());
    rec_output_names_str_.push_back(rec_session_->GetOutputNameAllocated(0, allocator).get());
    rec_input_names_.push_back(rec_input_names_str_[0].c_str());
    rec_output_names_.push_back(rec_output_names_str_[0].c_str());

    LoadCharset(paths.dictionary);
}

void PaddleOcrEngine::LoadCharset(const std::string& path) {
    std::ifstream file(path, std::ios::binary);  // Use binary to avoid newline translation
    if (!file.is_open()) {
        throw std::runtime_error("Could not open charset file: " + path);
    }

    charset_.clear();
    charset_.push_back("");  // CTC blank token

    std::string line;
    while (std::getline(file, line)) {
        // Remove trailing \r or \n (handles Windows and Unix)
        while (!line.empty() && (line.back() == '\r' || line.back() == '\n')) {
            line.pop_back();
        }
        if (!line.empty()) {
            charset_.push_back(line);
        }
    }

    charset_.push_back(" ");  // space class appended by the recognition head
    std::cout << "[PaddleOCR] Loaded charset with " << charset_.size() << " characters." << std::endl;
}

PaddleUtils::EngineOutput PaddleOcrEngine::Predict(const cv::Mat& bgr_image) {
    PaddleUtils::StructuredResult result;

    auto [resized, scale] = PaddleUtils::ResizeKeepRatio(bgr_image);
    cv::Mat blob = PaddleUtils::NormalizeImageNet(resized);

    auto memory_info = Ort::MemoryInfo::CreateCpu(OrtArenaAllocator, OrtMemTypeDefault);
    std::vector<int64_t> det_input_dims = {1, 3, static_cast<int64_t>(resized.rows), static_cast<int64_t>(resized.cols)};
    Ort::Value input_tensor = Ort::Value::CreateTensor<float>(
        memory_info, blob.ptr<float>(), blob.total(), det_input_dims.data(), det_input_dims.size()
    );

    auto det_outputs = det_session_->Run(
        Ort::RunOptions{nullptr}, det_input_names_.data(), &input_tensor, 1, det_output_names_.data(), 1
    );

    const float* prob_map = det_outputs[0].GetTensorData<float>();
    std::vector<std::vector<cv::Point>> boxes = PaddleUtils::PostprocessDetection(prob_map, bgr_image.size(), resized.size(), scale);

    for (const auto& box : boxes) {
        cv::Mat crop = PaddleUtils::WarpQuad(bgr_image, box);
        if (crop.empty()) continue;

        std::vector<cv::Mat> chunks = PaddleUtils::SplitWideCrop(crop);
        std::stringstream ss;
        float score_sum = 0.0f;
        int scored_chunks = 0;

        for (const auto& chunk : chunks) {
            cv::Mat rec_blob = PaddleUtils::PreprocessRecognition(chunk);
            if (rec_blob.empty()) continue;
            std::vector<int64_t> rec_input_dims = {1, 3, 48, 320};
            Ort::Value rec_input_tensor = Ort::Value::CreateTensor<float>(
                memory_info, rec_blob.ptr<float>(), rec_blob.total(), rec_input_dims.data(), rec_input_dims.size()
            );

            auto rec_outputs = rec_session_->Run(
                Ort::RunOptions{nullptr}, rec_input_names_.data(), &rec_input_tensor, 1, rec_output_names_.data(), 1
            );

            const float* preds = rec_outputs[0].GetTensorData<float>();
            auto preds_shape = rec_outputs[0].GetTensorTypeAndShapeInfo().GetShape();
            PaddleUtils::RecognizedText piece = PaddleUtils::DecodeRecognition(preds, preds_shape, charset_);
            if (piece.text.empty()) continue;

            if (ss.tellp() > 0) ss << " ";
            ss << piece.text;
            score_sum += piece.score;
            ++scored_chunks;
        }

        std::vector<cv::Point2f> quad;
        for (const auto& p : box) quad.emplace_back(static_cast<float>(p.x), static_cast<float>(p.y));

        result.texts.push_back(ss.str());
        result.scores.push_back(scored_chunks > 0 ? score_sum / scored_chunks : 0.0f);
        result.polygons.emplace_back(std::move(quad));
    }
    return result;
}
