#include "panelocr.hpp"
#include "response_json.hpp"
#include <algorithm>
#include <chrono>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct CliOverrides {
    std::optional<std::string> models_dir;
    std::optional<std::string> tessdata_dir;
    std::optional<size_t> worker_threads;
    bool use_cuda = false;
};

void saveResult(const nlohmann::json& result, const std::string& image_path, const std::string& output_dir) {
    if (output_dir.empty()) {
        std::cout << result.dump(2) << std::endl;
        return;
    }

    std::filesystem::create_directories(output_dir);
    std::filesystem::path out_path = std::filesystem::path(output_dir) /
                                     std::filesystem::path(image_path).filename().replace_extension(".json");

    std::ofstream ofs(out_path);
    if (ofs.is_open()) {
        ofs << result.dump(2) << std::endl;
        std::cout << "✓ Saved: " << out_path << std::endl;
    } else {
        std::cerr << "✗ Failed to save: " << out_path << std::endl;
    }
}

std::vector<int> parseRegion(const std::string& value) {
    std::vector<int> region;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t consumed = 0;
        int number = std::stoi(item, &consumed);
        if (consumed != item.size()) {
            throw std::invalid_argument("not an integer: " + item);
        }
        region.push_back(number);
    }
    return region;
}

void showUsage(const char* program_name) {
    std::cout << "PanelOCR - Text extraction for comic and manga pages\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " [OPTIONS] <image_files...>\n\n";
    std::cout << "Options:\n";
    std::cout << "  -h, --help              Show this help message\n";
    std::cout << "  -r, --region X,Y,W,H    Extract only this rectangle of each image\n";
    std::cout << "  -e, --engine NAME       tesseract, paddleocr, trocr, easyocr, hybrid (default: paddleocr)\n";
    std::cout << "  -l, --lang CODE         Language code: en, de, ru, fr, es, it, pt, ja, zh, ko (default: en)\n";
    std::cout << "  -p, --profile NAME      none, minimal, default, adaptive, high_contrast, low_contrast, denoised\n";
    std::cout << "      --layout NAME       sparse, dense, auto, vertical (or PSM 11, 6, 3, 5)\n";
    std::cout << "  -o, --output DIR        Save one JSON result per image into DIR (default: print)\n";
    std::cout << "  -m, --models DIR        PaddleOCR models directory (default: ../../models)\n";
    std::cout << "  -t, --tessdata DIR      Tesseract traineddata directory (default: $TESSDATA_PREFIX)\n";
    std::cout << "  -c, --cuda              Enable CUDA acceleration\n";
    std::cout << "      --config FILE       JSON configuration file\n";
    std::cout << "      --threads N         Worker threads\n";
    std::cout << "      --debug-dir DIR     Dump every preprocessed image into DIR\n";
    std::cout << "      --list-engines      Show engines and where requests for them are routed\n\n";
    std::cout << "Examples:\n";
    std::cout << "  " << program_name << " page01.png page02.png            # Full pages, JSON to stdout\n";
    std::cout << "  " << program_name << " -o results/ *.png                # Save results/page01.json, ...\n";
    std::cout << "  " << program_name << " -r 120,80,300,200 page01.png     # One speech bubble\n";
    std::cout << "  " << program_name << " -e tesseract -l ja --layout vertical page01.png\n";
}

}

int main(int argc, char* argv[]) {
    if (argc < 2) {
        showUsage(argv[0]);
        return 1;
    }

    std::vector<std::string> input_files;
    std::string output_dir;
    std::string config_path;
    std::string debug_dir;
    std::optional<std::string> engine;
    std::optional<std::string> language;
    std::optional<PreprocessProfile> profile;
    std::optional<LayoutMode> layout;
    std::optional<std::vector<int>> region;
    CliOverrides overrides;
    bool list_engines = false;

    // Parse command line arguments
    try {
        for (int i = 1; i < argc; ++i) {
            std::string arg = argv[i];

            if (arg == "-h" || arg == "--help") {
                showUsage(argv[0]);
                return 0;
            } else if ((arg == "-o" || arg == "--output") && i + 1 < argc) {
                output_dir = argv[++i];
            } else if ((arg == "-m" || arg == "--models") && i + 1 < argc) {
                overrides.models_dir = argv[++i];
            } else if ((arg == "-t" || arg == "--tessdata") && i + 1 < argc) {
                overrides.tessdata_dir = argv[++i];
            } else if ((arg == "-e" || arg == "--engine") && i + 1 < argc) {
                engine = argv[++i];
            } else if ((arg == "-l" || arg == "--lang") && i + 1 < argc) {
                language = argv[++i];
            } else if ((arg == "-p" || arg == "--profile") && i + 1 < argc) {
                std::string name = argv[++i];
                profile = ParseProfile(name);
                if (!profile) {
                    std::cerr << "Unknown preprocessing profile: " << name << std::endl;
                    return 1;
                }
            } else if (arg == "--layout" && i + 1 < argc) {
                std::string name = argv[++i];
                layout = ParseLayout(name);
                if (!layout) {
                    std::cerr << "Unknown layout: " << name << std::endl;
                    return 1;
                }
            } else if ((arg == "-r" || arg == "--region") && i + 1 < argc) {
                region = parseRegion(argv[++i]);
            } else if (arg == "--config" && i + 1 < argc) {
                config_path = argv[++i];
            } else if (arg == "--threads" && i + 1 < argc) {
                int threads = std::stoi(argv[++i]);
                if (threads < 1) {
                    std::cerr << "--threads must be at least 1" << std::endl;
                    return 1;
                }
                overrides.worker_threads = static_cast<size_t>(threads);
            } else if (arg == "--debug-dir" && i + 1 < argc) {
                debug_dir = argv[++i];
            } else if (arg == "-c" || arg == "--cuda") {
                overrides.use_cuda = true;
            } else if (arg == "--list-engines") {
                list_engines = true;
            } else if (!arg.empty() && arg[0] == '-') {
                std::cerr << "Unknown option: " << arg << std::endl;
                return 1;
            } else {
                input_files.push_back(arg);
            }
        }
    } catch (const std::exception& e) {
        std::cerr << "Invalid argument: " << e.what() << std::endl;
        return 1;
    }

    if (!list_engines && input_files.empty()) {
        std::cerr << "Error: No input files specified." << std::endl;
        showUsage(argv[0]);
        return 1;
    }

    try {
        EngineConfig config;
        ApplyEnvironment(config);
        if (!config_path.empty()) {
            LoadConfigFile(config_path, config);
        }
        if (overrides.models_dir) config.models_dir = *overrides.models_dir;
        if (overrides.tessdata_dir) config.tessdata_dir = *overrides.tessdata_dir;
        if (overrides.worker_threads) config.worker_threads = *overrides.worker_threads;
        if (overrides.use_cuda) config.use_cuda = true;

        std::unique_ptr<ImageDumpSink> dump_sink;
        if (!debug_dir.empty()) {
            dump_sink = std::make_unique<ImageDumpSink>(debug_dir);
        }

        std::unique_ptr<PanelOCR> ocr = PanelOCR::Create(config, dump_sink.get());

        if (list_engines) {
            std::cout << ToJson(ocr->ListEngines()).dump(2) << std::endl;
            if (input_files.empty()) return 0;
        }

        if (!ocr->IsOcrAvailable()) {
            std::cerr << "Warning: no OCR engine is installed (models: " << config.models_dir
                      << ", tessdata: " << config.tessdata_dir << ")" << std::endl;
        }

        ExtractionOptions options = region ? RegionDefaults() : PageDefaults();
        options.engine = engine.value_or(config.default_engine);
        options.language = language.value_or(config.default_language);
        if (profile) options.profile = *profile;
        if (layout) options.layout = *layout;

        std::cout << "\n=== Processing " << input_files.size() << " files ===" << std::endl;
        auto start = std::chrono::steady_clock::now();

        std::vector<OcrResponse> responses;
        if (region) {
            for (size_t i = 0; i < input_files.size(); ++i) {
                std::cout << "[" << (i + 1) << "/" << input_files.size() << "] Processing: "
                          << std::filesystem::path(input_files[i]).filename() << std::endl;
                responses.push_back(ocr->ExtractRegion(input_files[i], *region, options));
            }
        } else {
            responses = ocr->ExtractBatch(input_files, options, [&](size_t completed, size_t total) {
                std::cout << "[" << completed << "/" << total << "] Done: "
                          << std::filesystem::path(input_files[completed - 1]).filename() << std::endl;
            });
        }

        auto duration = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
        std::cout << "⏱ Processed in " << duration.count() << "ms" << std::endl;

        size_t failures = 0;
        for (size_t i = 0; i < responses.size(); ++i) {
            if (!responses[i].success) ++failures;
            saveResult(ToJson(responses[i]), input_files[i], output_dir);
        }

        std::cout << "\n ✓ Completed processing " << input_files.size() << " files";
        if (failures > 0) std::cout << " (" << failures << " failed)";
        std::cout << std::endl;
        return failures == 0 ? 0 : 1;

    } catch (const std::exception& e) {
        std::cerr << "Fatal error: " << e.what() << std::endl;
        return 1;
    }
}
