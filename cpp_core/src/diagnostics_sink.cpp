#include "diagnostics_sink.hpp"
#include <opencv2/imgcodecs.hpp>
#include <filesystem>
#include <iomanip>
#include <iostream>
#include <sstream>

NullDiagnosticsSink& NullDiagnosticsSink::Instance() {
    static NullDiagnosticsSink instance;
    return instance;
}

ImageDumpSink::ImageDumpSink(const std::string& directory) : directory_(directory) {
    std::filesystem::create_directories(directory_);
}

void ImageDumpSink::OnPreprocessed(const std::string& label, const cv::Mat& image) {
    if (image.empty()) return;

    std::ostringstream name;
    name << std::setw(4) << std::setfill('0') << counter_++ << "_" << label << ".png";
    const std::filesystem::path out_path = std::filesystem::path(directory_) / name.str();

    if (!cv::imwrite(out_path.string(), image)) {
        std::cerr << "[Debug] Failed to write " << out_path << std::endl;
    }
}

void ImageDumpSink::OnRegions(EngineId engine, const std::vector<TextRegion>& regions) {
    std::ostringstream ss;
    ss << "[Debug] " << EngineName(engine) << " kept " << regions.size() << " regions\n";
    for (const auto& region : regions) {
        const BBox& b = region.Box();
        ss << "  \"" << region.Text() << "\" [" << b.x << ", " << b.y << ", " << b.width << ", " << b.height
           << "] " << std::fixed << std::setprecision(2) << region.Confidence() << " " << TierName(region.Tier()) << "\n";
    }
    std::cout << ss.str() << std::flush;
}
