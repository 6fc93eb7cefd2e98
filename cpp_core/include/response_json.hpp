#pragma once
#include "ocr_types.hpp"
#include <nlohmann/json.hpp>
#include <vector>

nlohmann::json ToJson(const TextRegion& region);
nlohmann::json ToJson(const ConfidenceStats& stats);
nlohmann::json ToJson(const OcrResponse& response);
nlohmann::json ToJson(const std::vector<EngineInfo>& engines);
