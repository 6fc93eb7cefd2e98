#include "response_json.hpp"

using json = nlohmann::json;

json ToJson(const TextRegion& region) {
    const BBox& b = region.Box();
    return json{
        {"text", region.Text()},
        {"bbox", {b.x, b.y, b.width, b.height}},
        {"confidence", region.Confidence()},
        {"confidence_tier", TierName(region.Tier())}
    };
}

json ToJson(const ConfidenceStats& stats) {
    return json{
        {"count", stats.count},
        {"min", stats.min},
        {"max", stats.max},
        {"avg", stats.avg},
        {"median", stats.median},
        {"distribution", {{"high", stats.high}, {"medium", stats.medium}, {"low", stats.low}}}
    };
}

json ToJson(const OcrResponse& response) {
    if (!response.success) {
        return json{{"success", false}, {"error", response.error}};
    }

    json regions = json::array();
    for (const auto& region : response.regions) {
        regions.push_back(ToJson(region));
    }

    const OcrMetadata& meta = response.metadata;
    json metadata = {
        {"confidence_stats", ToJson(meta.confidence_stats)},
        {"engine_requested", meta.engine_requested},
        {"engine_used", meta.engine_used},
        {"fallback_reason", meta.fallback_reason ? json(*meta.fallback_reason) : json(nullptr)},
        {"preprocessing", ProfileName(meta.profile)},
        {"psm", static_cast<int>(meta.layout)},
        {"layout", LayoutName(meta.layout)},
        {"language", meta.language},
        {"total_detected", meta.total_detected},
        {"total_extracted", meta.total_detected},
        {"filtered_count", meta.filtered_count},
        {"filtered_out", meta.filtered_out}
    };
    if (meta.region) {
        metadata["region"] = *meta.region;
    }
    if (meta.clamped_region) {
        const BBox& c = *meta.clamped_region;
        metadata["clamped_region"] = {c.x, c.y, c.width, c.height};
    }

    return json{{"success", true}, {"regions", regions}, {"metadata", metadata}};
}

json ToJson(const std::vector<EngineInfo>& engines) {
    json list = json::array();
    for (const auto& engine : engines) {
        list.push_back({
            {"name", engine.name},
            {"canonical", engine.canonical},
            {"installed", engine.installed},
            {"routes_to", engine.routes_to ? json(*engine.routes_to) : json(nullptr)},
            {"languages", engine.languages},
            {"description", engine.description}
        });
    }
    return json{{"success", true}, {"engines", list}};
}
