#pragma once
#include "ocr_types.hpp"
#include <opencv2/opencv.hpp>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// This namespace encapsulates stateless helper functions for PaddleOCR.
namespace PaddleUtils {

    // A detection box as the polygon engine reports it: a point list (4-point
    // quad or 2-point rectangle) or a flat [x1, y1, x2, y2] rectangle.
    using RawBox = std::variant<std::vector<cv::Point2f>, cv::Vec4f>;

    // Older result shape: one [polygon, (text, confidence)] pair per detection.
    struct LegacyEntry {
        RawBox box;
        std::optional<std::pair<std::string, float>> recognition;
    };

    // Newer result shape: parallel arrays, one slot per detection.
    struct StructuredResult {
        std::vector<std::string> texts;
        std::vector<float> scores;
        std::vector<RawBox> polygons;
    };

    using EngineOutput = std::variant<std::vector<LegacyEntry>, StructuredResult>;

    struct RecognizedText {
        std::string text;
        float score = 0.0f;
    };

    // Axis-aligned box over min/max of the coordinates; nullopt for shapes that cannot be reduced.
    std::optional<BBox> BoxFromRaw(const RawBox& box);

    std::pair<cv::Mat, float> ResizeKeepRatio(const cv::Mat& img, int max_side = 960);
    cv::Mat NormalizeImageNet(const cv::Mat& img);
    std::vector<std::vector<cv::Point>> PostprocessDetection(const float* prob_map, const cv::Size& original_shape, const cv::Size& resized_shape, float scale);
    cv::Mat WarpQuad(const cv::Mat& bgr_image, const std::vector<cv::Point>& quad);
    std::vector<cv::Mat> SplitWideCrop(const cv::Mat& crop, int chunk_width = 320, int overlap = 64);
    cv::Mat PreprocessRecognition(const cv::Mat& img);
    RecognizedText DecodeRecognition(const float* preds, const std::vector<int64_t>& preds_shape, const std::vector<std::string>& charset);
}
