#pragma once
#include "ocr_types.hpp"
#include "ocr_adapter.hpp"
#include <array>
#include <functional>
#include <optional>
#include <string>
#include <variant>

struct EngineAvailability {
    bool tesseract = false;
    bool paddleocr = false;

    bool IsAvailable(EngineId engine) const {
        return engine == EngineId::Tesseract ? tesseract : paddleocr;
    }
    bool Any() const { return tesseract || paddleocr; }
};

// How a requested engine name is treated before any availability check.
enum class RequestKind {
    Tesseract,
    PaddleOcr,
    Alias   // hybrid, trocr, easyocr and any unrecognized name
};

struct ResolutionRule {
    RequestKind kind;
    EngineId preferred;
    EngineId fallback;
};

struct Dispatch {
    EngineId engine;
    std::optional<std::string> fallback_reason;
};

struct NoEngine {
    std::string error;
};

using Resolution = std::variant<Dispatch, NoEngine>;

const std::array<ResolutionRule, 3>& ResolutionTable();

RequestKind ClassifyRequest(const std::string& requested);

// Pure function of (requested name, availability).
Resolution ResolveEngine(const std::string& requested, const EngineAvailability& availability);

EngineId OtherEngine(EngineId engine);

struct RoutedOutput {
    EngineId engine_used;
    std::optional<std::string> fallback_reason;
    AdapterOutput output;
};

/**
 * @brief Resolves the engine, runs the attempt, and on a runtime failure
 * retries once on the other canonical engine when it is available.
 *
 * Throws EngineUnavailableError when nothing can run, InvalidInputError
 * unchanged, and std::runtime_error naming the original failure otherwise.
 */
RoutedOutput RouteAndRun(const std::string& requested,
                         const EngineAvailability& availability,
                         const std::function<AdapterOutput(EngineId)>& attempt);
