#include "panelocr.hpp"
#include "confidence.hpp"
#include "engine_factory.hpp"
#include "engine_router.hpp"
#include "region_cropper.hpp"
#include <opencv2/imgcodecs.hpp>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace {

struct ImageLoader {
    cv::Mat operator()(const std::string& path) const {
        if (path.empty() || !std::filesystem::exists(path)) {
            throw InvalidInputError("Image not found: " + path);
        }
        cv::Mat image = cv::imread(path, cv::IMREAD_UNCHANGED);
        if (image.empty()) {
            throw InvalidInputError("Failed to load image at: " + path);
        }
        return image;
    }

    cv::Mat operator()(const std::vector<uchar>& buffer) const {
        if (buffer.empty()) {
            throw InvalidInputError("Empty image buffer");
        }
        cv::Mat image = cv::imdecode(buffer, cv::IMREAD_UNCHANGED);
        if (image.empty()) {
            throw InvalidInputError("Could not decode image buffer (" + std::to_string(buffer.size()) + " bytes)");
        }
        return image;
    }

    cv::Mat operator()(const cv::Mat& image) const {
        if (image.empty()) {
            throw InvalidInputError("Empty image");
        }
        return image;
    }
};

std::string Describe(const ImageSource& image) {
    if (const auto* path = std::get_if<std::string>(&image)) {
        return std::filesystem::path(*path).filename().string();
    }
    return "<in-memory image>";
}

}

cv::Mat LoadImage(const ImageSource& source) {
    return std::visit(ImageLoader{}, source);
}

PanelOCR::PanelOCR(std::shared_ptr<EngineRegistry> registry, size_t worker_threads, size_t max_queued,
                   DiagnosticsSink* sink)
    : registry_(std::move(registry)),
      sink_(sink != nullptr ? sink : &NullDiagnosticsSink::Instance()),
      pool_(std::make_unique<WorkerPool>(worker_threads, max_queued)) {
    if (!registry_) {
        throw std::invalid_argument("PanelOCR requires an engine registry");
    }
    std::cout << "[PanelOCR] Worker pool ready with " << pool_->ThreadCount() << " threads" << std::endl;
}

std::unique_ptr<PanelOCR> PanelOCR::Create(const EngineConfig& config, DiagnosticsSink* sink) {
    auto registry = std::make_shared<EngineRegistry>(MakeDefaultProviders(config));
    return std::make_unique<PanelOCR>(registry, ResolveWorkerThreads(config), config.max_queued, sink);
}

OcrResponse PanelOCR::ExtractPage(const ImageSource& image, const ExtractionOptions& options) {
    return ExtractPageAsync(image, options).get();
}

OcrResponse PanelOCR::ExtractRegion(const ImageSource& image, const std::vector<int>& region,
                                    const ExtractionOptions& options) {
    return ExtractRegionAsync(image, region, options).get();
}

std::future<OcrResponse> PanelOCR::ExtractPageAsync(ImageSource image, ExtractionOptions options) {
    try {
        return pool_->Submit([this, image = std::move(image), options = std::move(options)]() {
            return Process(image, std::nullopt, options);
        });
    } catch (const std::exception& e) {
        std::promise<OcrResponse> failed;
        failed.set_value(OcrResponse::Failure(e.what()));
        return failed.get_future();
    }
}

std::future<OcrResponse> PanelOCR::ExtractRegionAsync(ImageSource image, std::vector<int> region,
                                                      ExtractionOptions options) {
    try {
        return pool_->Submit([this, image = std::move(image), region = std::move(region), options = std::move(options)]() {
            return Process(image, region, options);
        });
    } catch (const std::exception& e) {
        std::promise<OcrResponse> failed;
        failed.set_value(OcrResponse::Failure(e.what()));
        return failed.get_future();
    }
}

std::vector<OcrResponse> PanelOCR::ExtractBatch(const std::vector<std::string>& image_paths,
                                                const ExtractionOptions& options,
                                                const ProgressCallback& progress) {
    const size_t total = image_paths.size();
    std::cout << "[PanelOCR] Starting OCR for " << total << " pages" << std::endl;

    std::vector<std::future<OcrResponse>> pending;
    pending.reserve(total);
    for (const auto& path : image_paths) {
        pending.push_back(ExtractPageAsync(path, options));
    }

    std::vector<OcrResponse> responses;
    responses.reserve(total);
    for (size_t i = 0; i < total; ++i) {
        responses.push_back(pending[i].get());
        if (progress) progress(i + 1, total);
    }

    std::cout << "[PanelOCR] OCR completed for " << total << " pages" << std::endl;
    return responses;
}

std::vector<EngineInfo> PanelOCR::ListEngines() const {
    static const std::pair<const char*, const char*> kEngines[] = {
        {"tesseract", "Tesseract word-level recognition, fast on clean printed text"},
        {"paddleocr", "PaddleOCR detection and recognition on ONNX Runtime, best for stylized lettering"},
        {"trocr", "Transformer recognizer, served by a canonical engine"},
        {"easyocr", "EasyOCR, served by a canonical engine"},
        {"hybrid", "Combined engines, served by a canonical engine"}
    };
    const EngineAvailability availability = registry_->Availability();

    std::vector<EngineInfo> engines;
    for (const auto& [name, description] : kEngines) {
        EngineInfo info;
        info.name = name;
        info.description = description;
        std::optional<EngineId> canonical = ParseEngine(name);
        info.canonical = canonical.has_value();
        info.installed = canonical && availability.IsAvailable(*canonical);

        Resolution resolution = ResolveEngine(name, availability);
        if (const auto* dispatch = std::get_if<Dispatch>(&resolution)) {
            info.routes_to = EngineName(dispatch->engine);
            info.languages = SupportedLanguages();
        }
        engines.push_back(std::move(info));
    }
    return engines;
}

bool PanelOCR::IsOcrAvailable() const {
    return registry_->Availability().Any();
}

OcrResponse PanelOCR::Process(const ImageSource& image_source, const std::optional<std::vector<int>>& region,
                              const ExtractionOptions& options) {
    const auto start = std::chrono::steady_clock::now();
    const std::string label = Describe(image_source);

    OcrResponse response;
    OcrMetadata& meta = response.metadata;
    meta.engine_requested = ToLower(options.engine);
    meta.profile = options.profile;
    meta.layout = options.layout;
    meta.language = options.language;

    try {
        cv::Mat image = LoadImage(image_source);
        cv::Mat working = image;
        cv::Point origin(0, 0);

        if (region) {
            const std::array<int, 4> requested = ParseRegionArray(*region);
            meta.region = requested;

            std::optional<cv::Rect> clamped = ClampRegion(requested, image.size());
            if (!clamped) {
                std::cout << "[PanelOCR] Region [" << requested[0] << ", " << requested[1] << ", " << requested[2]
                          << ", " << requested[3] << "] lies outside " << label << " (" << image.cols << "x"
                          << image.rows << "), returning no regions" << std::endl;
                Resolution resolution = ResolveEngine(options.engine, registry_->Availability());
                if (const auto* dispatch = std::get_if<Dispatch>(&resolution)) {
                    meta.engine_used = EngineName(dispatch->engine);
                    meta.fallback_reason = dispatch->fallback_reason;
                }
                response.success = true;
                return response;
            }

            meta.clamped_region = BBox{clamped->x, clamped->y, clamped->width, clamped->height};
            working = CropToRegion(image, *clamped);
            origin = clamped->tl();
        }

        AdapterRequest request;
        request.language = options.language;
        request.profile = options.profile;
        request.layout = options.layout;
        request.sink = sink_;

        RoutedOutput routed = RouteAndRun(options.engine, registry_->Availability(),
            [&](EngineId engine) {
                std::shared_ptr<OcrAdapter> adapter = registry_->Acquire(engine, options.language);
                return adapter->Extract(working, request);
            });

        std::vector<TextRegion> regions = OffsetRegions(ClipToImage(routed.output.regions, working.size()), origin);
        sink_->OnRegions(routed.engine_used, regions);

        meta.engine_used = EngineName(routed.engine_used);
        meta.fallback_reason = routed.fallback_reason;
        meta.total_detected = routed.output.total_detected;
        meta.filtered_count = regions.size();
        meta.filtered_out = meta.total_detected >= regions.size() ? meta.total_detected - regions.size() : 0;
        meta.confidence_stats = ComputeConfidenceStats(regions);

        response.regions = std::move(regions);
        response.success = true;

        const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        std::cout << "[PanelOCR] " << label << ": " << response.regions.size() << "/" << meta.total_detected
                  << " regions kept via " << meta.engine_used << " in " << elapsed.count() << "ms" << std::endl;
        return response;
    } catch (const InvalidInputError& e) {
        std::cerr << "[PanelOCR] Invalid input for " << label << ": " << e.what() << std::endl;
        return OcrResponse::Failure(e.what());
    } catch (const EngineUnavailableError& e) {
        std::cerr << "[PanelOCR] " << e.what() << std::endl;
        return OcrResponse::Failure(e.what());
    } catch (const std::exception& e) {
        std::cerr << "[PanelOCR] Error processing " << label << ": " << e.what() << std::endl;
        return OcrResponse::Failure(e.what());
    }
}
