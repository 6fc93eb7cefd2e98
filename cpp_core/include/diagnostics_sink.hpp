#pragma once
#include "ocr_types.hpp"
#include <opencv2/core.hpp>
#include <atomic>
#include <string>
#include <vector>

/**
 * @class DiagnosticsSink
 * @brief Receives intermediate images and results from every request.
 *
 * The pipeline always calls the sink; what it does with the data is the caller's choice.
 * Implementations must tolerate calls from several worker threads at once.
 */
class DiagnosticsSink {
public:
    virtual ~DiagnosticsSink() = default;
    virtual void OnPreprocessed(const std::string& label, const cv::Mat& image) = 0;
    virtual void OnRegions(EngineId engine, const std::vector<TextRegion>& regions) = 0;
};

class NullDiagnosticsSink : public DiagnosticsSink {
public:
    void OnPreprocessed(const std::string&, const cv::Mat&) override {}
    void OnRegions(EngineId, const std::vector<TextRegion>&) override {}

    static NullDiagnosticsSink& Instance();
};

/**
 * @class ImageDumpSink
 * @brief Writes every prepared image as a numbered PNG into a directory.
 */
class ImageDumpSink : public DiagnosticsSink {
public:
    explicit ImageDumpSink(const std::string& directory);

    void OnPreprocessed(const std::string& label, const cv::Mat& image) override;
    void OnRegions(EngineId engine, const std::vector<TextRegion>& regions) override;

private:
    std::string directory_;
    std::atomic<int> counter_{0};
};
