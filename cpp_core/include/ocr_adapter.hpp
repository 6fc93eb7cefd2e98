#pragma once
#include "ocr_types.hpp"
#include "diagnostics_sink.hpp"
#include <opencv2/core.hpp>
#include <string>
#include <vector>

struct AdapterRequest {
    std::string language = "en";
    PreprocessProfile profile = PreprocessProfile::Default;
    LayoutMode layout = LayoutMode::Sparse;
    DiagnosticsSink* sink = &NullDiagnosticsSink::Instance();
};

struct AdapterOutput {
    std::vector<TextRegion> regions;  // after confidence/empty-text filtering
    size_t total_detected = 0;        // before filtering
};

/**
 * @class OcrAdapter
 * @brief Runs one OCR backend and converts its native output into TextRegion values.
 *
 * Each adapter prepares the image the way its backend needs it. Boxes are
 * relative to the image passed to Extract.
 */
class OcrAdapter {
public:
    virtual ~OcrAdapter() = default;
    virtual EngineId Engine() const = 0;
    virtual AdapterOutput Extract(const cv::Mat& image, const AdapterRequest& request) = 0;
};
