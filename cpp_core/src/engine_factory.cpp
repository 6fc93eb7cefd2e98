#include "engine_factory.hpp"
#include "paddle_adapter.hpp"
#include "paddle_ocr_engine.hpp"
#include "tesseract_adapter.hpp"
#include "tesseract_engine.hpp"
#include <onnxruntime_cxx_api.h>
#include <algorithm>
#include <iostream>
#include <memory>
#include <thread>
#include <utility>

namespace {

Ort::SessionOptions MakeSessionOptions(bool use_cuda) {
    Ort::SessionOptions session_options;

    // Several requests may run the model at once; keep each session to a share of the cores.
    int num_cores = static_cast<int>(std::thread::hardware_concurrency());
    if (num_cores == 0) num_cores = 4;
    int threads_per_model = std::max(2, num_cores / 3);
    int inter_op_threads = std::max(1, num_cores / 6);

    std::cout << "[PaddleOCR] Threading config: " << num_cores << " cores detected, using "
              << threads_per_model << " intra-op threads per session" << std::endl;

    session_options.SetIntraOpNumThreads(threads_per_model);
    session_options.SetInterOpNumThreads(inter_op_threads);

    if (use_cuda) {
        OrtCUDAProviderOptions cuda_options{};
        session_options.AppendExecutionProvider_CUDA(cuda_options);
    }
    return session_options;
}

}

std::map<EngineId, EngineProvider> MakeDefaultProviders(const EngineConfig& config) {
    std::map<EngineId, EngineProvider> providers;

    const std::string tessdata_dir = config.tessdata_dir;
    providers[EngineId::Tesseract] = EngineProvider{
        [tessdata_dir]() { return TessdataHasAnyLanguage(tessdata_dir); },
        [tessdata_dir](const std::string& language) -> std::shared_ptr<OcrAdapter> {
            auto engine = std::make_shared<TesseractEngine>(tessdata_dir, TesseractLanguageFor(language));
            return std::make_shared<TesseractAdapter>(std::move(engine));
        }
    };

    const std::string models_dir = config.models_dir;
    const bool use_cuda = config.use_cuda;
    // Shared by every PaddleOCR session; each engine keeps a reference.
    auto env = std::make_shared<Ort::Env>(ORT_LOGGING_LEVEL_WARNING, "panelocr");
    providers[EngineId::PaddleOcr] = EngineProvider{
        [models_dir]() { return PaddleModelsPresent(ResolvePaddleModels(models_dir, "")); },
        [models_dir, use_cuda, env](const std::string& language) -> std::shared_ptr<OcrAdapter> {
            Ort::SessionOptions session_options = MakeSessionOptions(use_cuda);
            auto engine = std::make_shared<PaddleOcrEngine>(env, session_options, ResolvePaddleModels(models_dir, language));
            return std::make_shared<PaddleAdapter>(std::move(engine));
        }
    };

    return providers;
}
