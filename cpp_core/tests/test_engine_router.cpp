#include "engine_router.hpp"
#include <gtest/gtest.h>
#include <stdexcept>
#include <vector>

namespace {

EngineAvailability Only(bool tesseract, bool paddleocr) {
    EngineAvailability availability;
    availability.tesseract = tesseract;
    availability.paddleocr = paddleocr;
    return availability;
}

AdapterOutput OneRegion(const std::string& text) {
    AdapterOutput out;
    out.regions.emplace_back(text, BBox{0, 0, 5, 5}, 0.8);
    out.total_detected = 1;
    return out;
}

Dispatch ExpectDispatch(const Resolution& resolution) {
    EXPECT_TRUE(std::holds_alternative<Dispatch>(resolution));
    if (const auto* dispatch = std::get_if<Dispatch>(&resolution)) return *dispatch;
    return Dispatch{EngineId::Tesseract, std::string("no engine")};
}

}

TEST(EngineRouterTest, CanonicalRequestWithEngineInstalledHasNoReason) {
    Dispatch d = ExpectDispatch(ResolveEngine("Tesseract", Only(true, true)));
    EXPECT_EQ(d.engine, EngineId::Tesseract);
    EXPECT_FALSE(d.fallback_reason.has_value());

    Dispatch p = ExpectDispatch(ResolveEngine("paddleocr", Only(true, true)));
    EXPECT_EQ(p.engine, EngineId::PaddleOcr);
    EXPECT_FALSE(p.fallback_reason.has_value());
}

TEST(EngineRouterTest, AliasWithOnlyTesseractRoutesToTesseract) {
    Dispatch d = ExpectDispatch(ResolveEngine("trocr", Only(true, false)));
    EXPECT_EQ(d.engine, EngineId::Tesseract);
    ASSERT_TRUE(d.fallback_reason.has_value());
    EXPECT_NE(d.fallback_reason->find("trocr"), std::string::npos);
    EXPECT_NE(d.fallback_reason->find("tesseract"), std::string::npos);
}

TEST(EngineRouterTest, AliasPrefersPaddleOcr) {
    for (const char* name : {"hybrid", "easyocr", "trocr", "something-else"}) {
        Dispatch d = ExpectDispatch(ResolveEngine(name, Only(true, true)));
        EXPECT_EQ(d.engine, EngineId::PaddleOcr) << name;
        ASSERT_TRUE(d.fallback_reason.has_value()) << name;
        EXPECT_NE(d.fallback_reason->find(name), std::string::npos);
    }
}

TEST(EngineRouterTest, MissingCanonicalEngineFallsBackToTheOther) {
    Dispatch d = ExpectDispatch(ResolveEngine("paddleocr", Only(true, false)));
    EXPECT_EQ(d.engine, EngineId::Tesseract);
    ASSERT_TRUE(d.fallback_reason.has_value());
    EXPECT_NE(d.fallback_reason->find("paddleocr"), std::string::npos);

    Dispatch t = ExpectDispatch(ResolveEngine("tesseract", Only(false, true)));
    EXPECT_EQ(t.engine, EngineId::PaddleOcr);
    EXPECT_TRUE(t.fallback_reason.has_value());
}

TEST(EngineRouterTest, NothingInstalledIsNoEngine) {
    for (const char* name : {"tesseract", "paddleocr", "hybrid"}) {
        Resolution r = ResolveEngine(name, Only(false, false));
        ASSERT_TRUE(std::holds_alternative<NoEngine>(r)) << name;
        EXPECT_NE(std::get<NoEngine>(r).error.find("OCR not available"), std::string::npos);
    }
}

TEST(EngineRouterTest, ResolutionIsDeterministic) {
    for (const char* name : {"tesseract", "paddleocr", "trocr", "HYBRID", "nope"}) {
        for (int mask = 0; mask < 4; ++mask) {
            EngineAvailability availability = Only((mask & 1) != 0, (mask & 2) != 0);
            Resolution a = ResolveEngine(name, availability);
            Resolution b = ResolveEngine(name, availability);
            ASSERT_EQ(a.index(), b.index());
            if (const auto* da = std::get_if<Dispatch>(&a)) {
                const auto& db = std::get<Dispatch>(b);
                EXPECT_EQ(da->engine, db.engine);
                EXPECT_EQ(da->fallback_reason, db.fallback_reason);
            } else {
                EXPECT_EQ(std::get<NoEngine>(a).error, std::get<NoEngine>(b).error);
            }
        }
    }
}

TEST(EngineRouterTest, TableCoversEveryRequestKind) {
    const auto& table = ResolutionTable();
    EXPECT_EQ(table[0].kind, RequestKind::Tesseract);
    EXPECT_EQ(table[2].kind, RequestKind::Alias);
    EXPECT_EQ(table[2].preferred, EngineId::PaddleOcr);
    EXPECT_EQ(ClassifyRequest("easyocr"), RequestKind::Alias);
    EXPECT_EQ(ClassifyRequest("PaddleOCR"), RequestKind::PaddleOcr);
}

TEST(EngineRouterTest, RuntimeFailureRetriesOnceOnOtherEngine) {
    std::vector<EngineId> calls;
    RoutedOutput routed = RouteAndRun("paddleocr", Only(true, true), [&](EngineId engine) {
        calls.push_back(engine);
        if (engine == EngineId::PaddleOcr) throw std::runtime_error("decoder failure");
        return OneRegion("ok");
    });

    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0], EngineId::PaddleOcr);
    EXPECT_EQ(calls[1], EngineId::Tesseract);
    EXPECT_EQ(routed.engine_used, EngineId::Tesseract);
    ASSERT_TRUE(routed.fallback_reason.has_value());
    EXPECT_NE(routed.fallback_reason->find("decoder failure"), std::string::npos);
    ASSERT_EQ(routed.output.regions.size(), 1u);
}

TEST(EngineRouterTest, RetryReasonKeepsEarlierAliasReason) {
    RoutedOutput routed = RouteAndRun("hybrid", Only(true, true), [&](EngineId engine) {
        if (engine == EngineId::PaddleOcr) throw std::runtime_error("boom");
        return OneRegion("ok");
    });
    ASSERT_TRUE(routed.fallback_reason.has_value());
    EXPECT_NE(routed.fallback_reason->find("hybrid"), std::string::npos);
    EXPECT_NE(routed.fallback_reason->find("boom"), std::string::npos);
}

TEST(EngineRouterTest, FailureWithoutAlternateSurfacesOriginalError) {
    int calls = 0;
    try {
        RouteAndRun("tesseract", Only(true, false), [&](EngineId) -> AdapterOutput {
            ++calls;
            throw std::runtime_error("native crash");
        });
        FAIL() << "expected an exception";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("native crash"), std::string::npos);
    }
    EXPECT_EQ(calls, 1);
}

TEST(EngineRouterTest, BothEnginesFailingStopsAfterOneHop) {
    int calls = 0;
    try {
        RouteAndRun("paddleocr", Only(true, true), [&](EngineId engine) -> AdapterOutput {
            ++calls;
            throw std::runtime_error(engine == EngineId::PaddleOcr ? "first" : "second");
        });
        FAIL() << "expected an exception";
    } catch (const std::runtime_error& e) {
        const std::string what = e.what();
        EXPECT_NE(what.find("first"), std::string::npos);
        EXPECT_NE(what.find("second"), std::string::npos);
    }
    EXPECT_EQ(calls, 2);
}

TEST(EngineRouterTest, InvalidInputIsNotRetried) {
    int calls = 0;
    EXPECT_THROW(
        RouteAndRun("paddleocr", Only(true, true), [&](EngineId) -> AdapterOutput {
            ++calls;
            throw InvalidInputError("bad image");
        }),
        InvalidInputError);
    EXPECT_EQ(calls, 1);
}

TEST(EngineRouterTest, NoEngineThrowsUnavailable) {
    EXPECT_THROW(
        RouteAndRun("paddleocr", Only(false, false), [](EngineId) { return AdapterOutput{}; }),
        EngineUnavailableError);
}
