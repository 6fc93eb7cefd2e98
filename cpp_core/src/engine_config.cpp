#include "engine_config.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <cstdlib>
#include <fstream>
#include <stdexcept>
#include <thread>

using json = nlohmann::json;

void ApplyEnvironment(EngineConfig& config) {
    const char* prefix = std::getenv("TESSDATA_PREFIX");
    if (prefix != nullptr && *prefix != '\0') {
        config.tessdata_dir = prefix;
    }
}

void LoadConfigFile(const std::string& path, EngineConfig& config) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw std::runtime_error("Could not open config file: " + path);
    }

    json j;
    try {
        file >> j;
    } catch (const json::parse_error& e) {
        throw std::runtime_error("Invalid JSON in " + path + ": " + e.what());
    }
    if (!j.is_object()) {
        throw std::runtime_error("Config root must be an object: " + path);
    }

    try {
        if (j.contains("models_dir")) config.models_dir = j.at("models_dir").get<std::string>();
        if (j.contains("tessdata_dir")) config.tessdata_dir = j.at("tessdata_dir").get<std::string>();
        if (j.contains("use_cuda")) config.use_cuda = j.at("use_cuda").get<bool>();
        if (j.contains("worker_threads")) config.worker_threads = j.at("worker_threads").get<size_t>();
        if (j.contains("max_queued")) config.max_queued = j.at("max_queued").get<size_t>();
        if (j.contains("language")) config.default_language = j.at("language").get<std::string>();
        if (j.contains("engine")) config.default_engine = j.at("engine").get<std::string>();
    } catch (const json::type_error& e) {
        throw std::runtime_error("Bad value type in " + path + ": " + e.what());
    }
}

size_t ResolveWorkerThreads(const EngineConfig& config) {
    if (config.worker_threads > 0) return config.worker_threads;
    unsigned int cores = std::thread::hardware_concurrency();
    if (cores == 0) cores = 4;
    // Engines run their own intra-op threads; keep request workers few.
    return std::max<size_t>(2, cores / 3);
}
