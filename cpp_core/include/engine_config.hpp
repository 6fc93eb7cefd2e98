#pragma once
#include <cstddef>
#include <string>

struct EngineConfig {
    std::string models_dir = "../../models";
    std::string tessdata_dir = "/usr/share/tesseract-ocr/5/tessdata";
    bool use_cuda = false;
    size_t worker_threads = 0;   // 0 = derive from hardware_concurrency
    size_t max_queued = 64;
    std::string default_language = "en";
    std::string default_engine = "paddleocr";
};

// TESSDATA_PREFIX overrides the built-in tessdata location.
void ApplyEnvironment(EngineConfig& config);

// Overlays keys present in a JSON file; throws std::runtime_error on unreadable or malformed files.
void LoadConfigFile(const std::string& path, EngineConfig& config);

size_t ResolveWorkerThreads(const EngineConfig& config);
