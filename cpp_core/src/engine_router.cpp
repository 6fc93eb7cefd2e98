#include "engine_router.hpp"
#include <iostream>
#include <set>
#include <stdexcept>

namespace {

const std::set<std::string>& KnownAliases() {
    static const std::set<std::string> kAliases = {"hybrid", "trocr", "easyocr"};
    return kAliases;
}

std::string Quote(const std::string& s) {
    return "'" + s + "'";
}

std::string AliasReason(const std::string& requested, EngineId chosen) {
    if (KnownAliases().count(requested) > 0) {
        return "Engine " + Quote(requested) + " is not implemented; using " + Quote(EngineName(chosen)) + " instead";
    }
    return "Unknown engine " + Quote(requested) + "; using " + Quote(EngineName(chosen)) + " instead";
}

}

const std::array<ResolutionRule, 3>& ResolutionTable() {
    static const std::array<ResolutionRule, 3> kTable = {{
        {RequestKind::Tesseract, EngineId::Tesseract, EngineId::PaddleOcr},
        {RequestKind::PaddleOcr, EngineId::PaddleOcr, EngineId::Tesseract},
        {RequestKind::Alias,     EngineId::PaddleOcr, EngineId::Tesseract},
    }};
    return kTable;
}

RequestKind ClassifyRequest(const std::string& requested) {
    std::optional<EngineId> engine = ParseEngine(requested);
    if (!engine) return RequestKind::Alias;
    return *engine == EngineId::Tesseract ? RequestKind::Tesseract : RequestKind::PaddleOcr;
}

EngineId OtherEngine(EngineId engine) {
    return engine == EngineId::Tesseract ? EngineId::PaddleOcr : EngineId::Tesseract;
}

Resolution ResolveEngine(const std::string& requested, const EngineAvailability& availability) {
    const std::string name = ToLower(requested);
    const RequestKind kind = ClassifyRequest(name);

    const ResolutionRule* rule = nullptr;
    for (const auto& candidate : ResolutionTable()) {
        if (candidate.kind == kind) {
            rule = &candidate;
            break;
        }
    }
    if (rule == nullptr) {
        return NoEngine{"No resolution rule for engine " + Quote(name)};
    }

    for (EngineId engine : {rule->preferred, rule->fallback}) {
        if (!availability.IsAvailable(engine)) continue;

        if (kind == RequestKind::Alias) {
            return Dispatch{engine, AliasReason(name, engine)};
        }
        if (engine != rule->preferred) {
            return Dispatch{engine, "Engine " + Quote(name) + " is not installed; using " + Quote(EngineName(engine)) + " instead"};
        }
        return Dispatch{engine, std::nullopt};
    }
    return NoEngine{"OCR not available: no OCR engine is installed (requested " + Quote(name) + ")"};
}

RoutedOutput RouteAndRun(const std::string& requested,
                         const EngineAvailability& availability,
                         const std::function<AdapterOutput(EngineId)>& attempt) {
    Resolution resolution = ResolveEngine(requested, availability);
    if (const auto* none = std::get_if<NoEngine>(&resolution)) {
        throw EngineUnavailableError(none->error);
    }
    const Dispatch dispatch = std::get<Dispatch>(resolution);

    RoutedOutput routed{dispatch.engine, dispatch.fallback_reason, {}};
    try {
        routed.output = attempt(dispatch.engine);
        return routed;
    } catch (const InvalidInputError&) {
        throw;
    } catch (const std::exception& e) {
        const std::string failure = "Engine " + Quote(EngineName(dispatch.engine)) + " failed: " + e.what();
        const EngineId alternate = OtherEngine(dispatch.engine);
        if (!availability.IsAvailable(alternate)) {
            std::cerr << "[Router] " << failure << " (no alternate engine)" << std::endl;
            throw std::runtime_error(failure);
        }

        std::cerr << "[Router] " << failure << "; retrying with " << EngineName(alternate) << std::endl;
        std::string reason = failure + "; retried with " + Quote(EngineName(alternate));
        if (dispatch.fallback_reason) {
            reason = *dispatch.fallback_reason + ". " + reason;
        }

        try {
            routed.output = attempt(alternate);
        } catch (const InvalidInputError&) {
            throw;
        } catch (const std::exception& retry_error) {
            throw std::runtime_error(failure + "; fallback " + Quote(EngineName(alternate)) +
                                     " also failed: " + retry_error.what());
        }
        routed.engine_used = alternate;
        routed.fallback_reason = reason;
        return routed;
    }
}
