#pragma once
#include "ocr_adapter.hpp"
#include "engine_router.hpp"
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <utility>

struct EngineProvider {
    std::function<bool()> is_available;
    std::function<std::shared_ptr<OcrAdapter>(const std::string& language)> create;
};

/**
 * @class EngineRegistry
 * @brief Lazily builds and caches one adapter per (engine, language).
 *
 * Construction loads models, so concurrent first requests for the same key
 * wait on a single shared future instead of building duplicates. A failed
 * construction is evicted and retried by the next request.
 */
class EngineRegistry {
public:
    explicit EngineRegistry(std::map<EngineId, EngineProvider> providers);

    bool IsAvailable(EngineId engine) const;
    EngineAvailability Availability() const;

    // Blocks until the adapter is ready; rethrows the construction error.
    std::shared_ptr<OcrAdapter> Acquire(EngineId engine, const std::string& language);

    size_t CachedCount() const;

private:
    using Key = std::pair<EngineId, std::string>;
    using AdapterFuture = std::shared_future<std::shared_ptr<OcrAdapter>>;

    std::map<EngineId, EngineProvider> providers_;
    mutable std::mutex mutex_;
    std::map<Key, AdapterFuture> cache_;
};
