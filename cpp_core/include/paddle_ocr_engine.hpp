#pragma once
#include "paddle_utils.hpp"
#include <string>
#include <vector>
#include <memory>
#include <onnxruntime_cxx_api.h>

/**
 * @class PolygonRecognizer
 * @brief Whole-image detector + recognizer that reports quads with text and score.
 */
class PolygonRecognizer {
public:
    virtual ~PolygonRecognizer() = default;
    virtual PaddleUtils::EngineOutput Predict(const cv::Mat& bgr_image) = 0;
};

struct PaddleModelPaths {
    std::string detection_model;
    std::string recognition_model;
    std::string dictionary;
};

// Language-specific recognition model when present, the multilingual one otherwise.
PaddleModelPaths ResolvePaddleModels(const std::string& models_dir, const std::string& language);
bool PaddleModelsPresent(const PaddleModelPaths& paths);

/**
 * @class PaddleOcrEngine
 * @brief Manages the PaddleOCR ONNX models for text detection and recognition.
 */
class PaddleOcrEngine : public PolygonRecognizer {
public:
    PaddleOcrEngine(std::shared_ptr<Ort::Env> env, Ort::SessionOptions& session_options, const PaddleModelPaths& paths);
    PaddleUtils::EngineOutput Predict(const cv::Mat& bgr_image) override;

private:
    void LoadCharset(const std::string& path);

    std::shared_ptr<Ort::Env> env_;
    std::unique_ptr<Ort::Session> det_session_;
    std::unique_ptr<Ort::Session> rec_session_;

    std::vector<std::string> det_input_names_str_;
    std::vector<std::string> det_output_names_str_;
    std::vector<const char*> det_input_names_;
    std::vector<const char*> det_output_names_;

    std::vector<std::string> rec_input_names_str_;
    std::vector<std::string> rec_output_names_str_;
    std::vector<const char*> rec_input_names_;
    std::vector<const char*> rec_output_names_;

    std::vector<std::string> charset_;
};
