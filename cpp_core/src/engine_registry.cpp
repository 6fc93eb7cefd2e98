#include "engine_registry.hpp"
#include <iostream>
#include <exception>
#include <stdexcept>
#include <utility>

EngineRegistry::EngineRegistry(std::map<EngineId, EngineProvider> providers)
    : providers_(std::move(providers)) {}

bool EngineRegistry::IsAvailable(EngineId engine) const {
    auto it = providers_.find(engine);
    if (it == providers_.end() || !it->second.is_available) return false;
    return it->second.is_available();
}

EngineAvailability EngineRegistry::Availability() const {
    EngineAvailability availability;
    availability.tesseract = IsAvailable(EngineId::Tesseract);
    availability.paddleocr = IsAvailable(EngineId::PaddleOcr);
    return availability;
}

std::shared_ptr<OcrAdapter> EngineRegistry::Acquire(EngineId engine, const std::string& language) {
    auto provider = providers_.find(engine);
    if (provider == providers_.end() || !provider->second.create) {
        throw EngineUnavailableError("No provider registered for " + EngineName(engine));
    }

    // Language codes are case-insensitive; "EN" and "en" share one instance.
    const std::string lang = ToLower(language);
    const Key key{engine, lang};
    std::promise<std::shared_ptr<OcrAdapter>> promise;
    AdapterFuture future;
    bool owner = false;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        auto it = cache_.find(key);
        if (it != cache_.end()) {
            future = it->second;
        } else {
            future = promise.get_future().share();
            cache_.emplace(key, future);
            owner = true;
        }
    }

    if (!owner) {
        return future.get();
    }

    // Build outside the lock so other keys are not held up by model loading.
    std::cout << "[Registry] Creating " << EngineName(engine) << " engine for language '" << lang << "'" << std::endl;
    std::exception_ptr error;
    try {
        std::shared_ptr<OcrAdapter> adapter = provider->second.create(lang);
        if (!adapter) {
            throw std::runtime_error(EngineName(engine) + " provider returned no engine");
        }
        promise.set_value(adapter);
        return future.get();
    } catch (const std::exception& e) {
        std::cerr << "[Registry] Failed to create " << EngineName(engine) << " for '" << lang << "': " << e.what() << std::endl;
        error = std::current_exception();
    } catch (...) {
        std::cerr << "[Registry] Failed to create " << EngineName(engine) << " for '" << lang << "': unknown error" << std::endl;
        error = std::current_exception();
    }

    {
        std::lock_guard<std::mutex> lock(mutex_);
        cache_.erase(key);
    }
    promise.set_exception(error);
    return future.get();
}

size_t EngineRegistry::CachedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cache_.size();
}
