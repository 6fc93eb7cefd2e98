#include "engine_registry.hpp"
#include "test_fakes.hpp"
#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

using namespace testing_fakes;

TEST(EngineRegistryTest, AvailabilityComesFromProviders) {
    std::map<EngineId, EngineProvider> providers;
    providers[EngineId::Tesseract] = BlobTesseractProvider();
    providers[EngineId::PaddleOcr] = MissingProvider();
    EngineRegistry registry(std::move(providers));

    EXPECT_TRUE(registry.IsAvailable(EngineId::Tesseract));
    EXPECT_FALSE(registry.IsAvailable(EngineId::PaddleOcr));
    EngineAvailability availability = registry.Availability();
    EXPECT_TRUE(availability.tesseract);
    EXPECT_FALSE(availability.paddleocr);
    EXPECT_TRUE(availability.Any());
}

TEST(EngineRegistryTest, UnregisteredEngineIsUnavailable) {
    EngineRegistry registry(std::map<EngineId, EngineProvider>{});
    EXPECT_FALSE(registry.Availability().Any());
    EXPECT_THROW(registry.Acquire(EngineId::Tesseract, "en"), EngineUnavailableError);
}

TEST(EngineRegistryTest, CachesOneAdapterPerLanguage) {
    std::atomic<int> created{0};
    std::map<EngineId, EngineProvider> providers;
    providers[EngineId::PaddleOcr] = AvailableProvider([&created]() -> std::shared_ptr<OcrAdapter> {
        ++created;
        return std::make_shared<PaddleAdapter>(std::make_shared<BlobPolygonRecognizer>());
    });
    EngineRegistry registry(std::move(providers));

    auto en1 = registry.Acquire(EngineId::PaddleOcr, "en");
    auto en2 = registry.Acquire(EngineId::PaddleOcr, "en");
    auto ja = registry.Acquire(EngineId::PaddleOcr, "ja");

    EXPECT_EQ(en1.get(), en2.get());
    EXPECT_NE(en1.get(), ja.get());
    EXPECT_EQ(created.load(), 2);
    EXPECT_EQ(registry.CachedCount(), 2u);
}

TEST(EngineRegistryTest, ConcurrentFirstUseConstructsOnce) {
    std::atomic<int> created{0};
    std::map<EngineId, EngineProvider> providers;
    providers[EngineId::Tesseract] = AvailableProvider([&created]() -> std::shared_ptr<OcrAdapter> {
        ++created;
        // Slow model load widens the race window.
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        return std::make_shared<TesseractAdapter>(std::make_shared<BlobWordRecognizer>());
    });
    EngineRegistry registry(std::move(providers));

    constexpr int kThreads = 8;
    std::vector<std::shared_ptr<OcrAdapter>> results(kThreads);
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&registry, &results, i]() {
            results[i] = registry.Acquire(EngineId::Tesseract, "en");
        });
    }
    for (auto& t : threads) t.join();

    EXPECT_EQ(created.load(), 1);
    for (const auto& adapter : results) {
        ASSERT_NE(adapter, nullptr);
        EXPECT_EQ(adapter.get(), results[0].get());
    }
}

TEST(EngineRegistryTest, FailedConstructionIsRetriedNextTime) {
    std::atomic<int> attempts{0};
    std::map<EngineId, EngineProvider> providers;
    providers[EngineId::Tesseract] = AvailableProvider([&attempts]() -> std::shared_ptr<OcrAdapter> {
        if (attempts++ == 0) {
            throw std::runtime_error("traineddata is corrupt");
        }
        return std::make_shared<TesseractAdapter>(std::make_shared<BlobWordRecognizer>());
    });
    EngineRegistry registry(std::move(providers));

    EXPECT_THROW(registry.Acquire(EngineId::Tesseract, "de"), std::runtime_error);
    EXPECT_EQ(registry.CachedCount(), 0u);

    auto adapter = registry.Acquire(EngineId::Tesseract, "de");
    ASSERT_NE(adapter, nullptr);
    EXPECT_EQ(attempts.load(), 2);
    EXPECT_EQ(registry.CachedCount(), 1u);
}

TEST(EngineRegistryTest, ProviderReturningNothingIsAnError) {
    std::map<EngineId, EngineProvider> providers;
    providers[EngineId::PaddleOcr] = AvailableProvider([]() -> std::shared_ptr<OcrAdapter> { return nullptr; });
    EngineRegistry registry(std::move(providers));

    EXPECT_THROW(registry.Acquire(EngineId::PaddleOcr, "en"), std::runtime_error);
    EXPECT_EQ(registry.CachedCount(), 0u);
}

TEST(EngineRegistryTest, LanguageCaseSharesOneAdapter) {
    std::atomic<int> created{0};
    std::vector<std::string> seen;
    std::map<EngineId, EngineProvider> providers;
    providers[EngineId::PaddleOcr] = EngineProvider{
        []() { return true; },
        [&created, &seen](const std::string& language) -> std::shared_ptr<OcrAdapter> {
            ++created;
            seen.push_back(language);
            return std::make_shared<PaddleAdapter>(std::make_shared<BlobPolygonRecognizer>());
        }
    };
    EngineRegistry registry(std::move(providers));

    auto upper = registry.Acquire(EngineId::PaddleOcr, "EN");
    auto lower = registry.Acquire(EngineId::PaddleOcr, "en");

    EXPECT_EQ(upper.get(), lower.get());
    EXPECT_EQ(created.load(), 1);
    EXPECT_EQ(registry.CachedCount(), 1u);
    ASSERT_EQ(seen.size(), 1u);
    EXPECT_EQ(seen[0], "en");
}

TEST(EngineRegistryTest, NonStandardThrowIsEvictedAndRetried) {
    std::atomic<int> attempts{0};
    std::map<EngineId, EngineProvider> providers;
    providers[EngineId::Tesseract] = AvailableProvider([&attempts]() -> std::shared_ptr<OcrAdapter> {
        if (attempts++ == 0) {
            throw 42;
        }
        return std::make_shared<TesseractAdapter>(std::make_shared<BlobWordRecognizer>());
    });
    EngineRegistry registry(std::move(providers));

    EXPECT_THROW(registry.Acquire(EngineId::Tesseract, "en"), int);
    EXPECT_EQ(registry.CachedCount(), 0u);

    auto adapter = registry.Acquire(EngineId::Tesseract, "en");
    ASSERT_NE(adapter, nullptr);
    EXPECT_EQ(attempts.load(), 2);
}
