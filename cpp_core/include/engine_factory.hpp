#pragma once
#include "engine_config.hpp"
#include "engine_registry.hpp"
#include <map>

// Providers backed by the installed Tesseract data and PaddleOCR ONNX models.
std::map<EngineId, EngineProvider> MakeDefaultProviders(const EngineConfig& config);
