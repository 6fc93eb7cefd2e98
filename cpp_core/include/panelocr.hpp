#pragma once
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "ocr_types.hpp"
#include "engine_config.hpp"
#include "engine_registry.hpp"
#include "diagnostics_sink.hpp"
#include "worker_pool.hpp"

/**
 * @class PanelOCR
 * @brief Comic/manga page and region text extraction over interchangeable OCR engines.
 *
 * Every public extraction call returns an OcrResponse and never throws; OCR work
 * runs on an internal bounded worker pool.
 */
class PanelOCR {
public:
    using ProgressCallback = std::function<void(size_t completed, size_t total)>;

    PanelOCR(std::shared_ptr<EngineRegistry> registry, size_t worker_threads, size_t max_queued,
             DiagnosticsSink* sink = nullptr);

    // Registry with the installed Tesseract/PaddleOCR providers.
    static std::unique_ptr<PanelOCR> Create(const EngineConfig& config, DiagnosticsSink* sink = nullptr);

    OcrResponse ExtractPage(const ImageSource& image, const ExtractionOptions& options = PageDefaults());
    OcrResponse ExtractRegion(const ImageSource& image, const std::vector<int>& region,
                              const ExtractionOptions& options = RegionDefaults());

    std::future<OcrResponse> ExtractPageAsync(ImageSource image, ExtractionOptions options = PageDefaults());
    std::future<OcrResponse> ExtractRegionAsync(ImageSource image, std::vector<int> region,
                                                ExtractionOptions options = RegionDefaults());

    // Responses come back in input order; progress fires as each one is collected.
    std::vector<OcrResponse> ExtractBatch(const std::vector<std::string>& image_paths,
                                          const ExtractionOptions& options = PageDefaults(),
                                          const ProgressCallback& progress = nullptr);

    std::vector<EngineInfo> ListEngines() const;
    bool IsOcrAvailable() const;

private:
    OcrResponse Process(const ImageSource& image, const std::optional<std::vector<int>>& region,
                        const ExtractionOptions& options);

    std::shared_ptr<EngineRegistry> registry_;
    DiagnosticsSink* sink_;
    std::unique_ptr<WorkerPool> pool_;
};

cv::Mat LoadImage(const ImageSource& source);
