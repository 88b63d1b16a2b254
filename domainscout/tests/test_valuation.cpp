#include <catch2/catch_test_macros.hpp>
#include "../src/valuation.hpp"
#include "../src/explainer.hpp"
#include <thread>
#include <vector>

TEST_CASE("Valuation of reference domains", "[valuation]") {
    ValuationEngine engine;

    SECTION("Short premium .com") {
        auto result = engine.evaluate("app.com");
        REQUIRE(result.estimated_value == 522);
        REQUIRE(result.currency == "USD");
        REQUIRE(result.confidence == Confidence::High);
        REQUIRE(result.factors.length_score == 10.0);
        REQUIRE(result.factors.character_score == 6.0);
        REQUIRE(result.factors.word_score == 5.0);
        REQUIRE(result.factors.suffix_score == 5.0);
        REQUIRE(result.reasoning ==
                "Very short domain (premium); Brandable name; Easy to pronounce; "
                "Contains valuable keywords");
    }

    SECTION("Digits drag the value down") {
        auto result = engine.evaluate("test123.com");
        REQUIRE(result.estimated_value == 60);
        REQUIRE(result.confidence == Confidence::Medium);
        REQUIRE(result.factors.character_score == 3.0);
        REQUIRE(result.factors.has_digits);
        REQUIRE_FALSE(result.factors.brandable);
        REQUIRE(result.reasoning == "Easy to pronounce; Contains numbers (reduces value)");
    }

    SECTION("Long names") {
        auto result = engine.evaluate("verylongdomainnamethatishard.com");
        REQUIRE(result.estimated_value == 64);
        REQUIRE(result.confidence == Confidence::Medium);
        REQUIRE(result.factors.length == 28);
        REQUIRE(result.factors.length_score == 1.0);
        REQUIRE_FALSE(result.factors.brandable);
    }

    SECTION("Hyphenated names") {
        auto result = engine.evaluate("test-domain.com");
        REQUIRE(result.estimated_value == 41);
        REQUIRE(result.confidence == Confidence::Medium);
        REQUIRE(result.factors.has_hyphen);
        REQUIRE(result.factors.character_score == 3.5);
    }

    SECTION("Blockchain suffix") {
        auto result = engine.evaluate("myname.eth");
        REQUIRE(result.estimated_value == 251);
        REQUIRE(result.confidence == Confidence::High);
        REQUIRE(result.factors.suffix_score == 4.5);
        REQUIRE(result.factors.word_score == 1.0);
    }

    SECTION("Compound keyword names") {
        REQUIRE(engine.evaluate("webapp.com").estimated_value == 385);
        REQUIRE(engine.evaluate("webhub.io").estimated_value == 279);
        REQUIRE(engine.evaluate("gethub.com").estimated_value == 277);
        REQUIRE(engine.evaluate("shop.net").estimated_value == 331);
    }

    SECTION("Unknown suffix and no vowels") {
        auto result = engine.evaluate("xyz.zz");
        REQUIRE(result.estimated_value == 48);
        REQUIRE(result.confidence == Confidence::Medium);
        REQUIRE(result.factors.suffix_score == 1.0);
        REQUIRE_FALSE(result.factors.pronounceable);
        REQUIRE(result.reasoning == "Very short domain (premium)");
    }

    SECTION("Mixed case keeps its penalty") {
        auto result = engine.evaluate("MyApp.com");
        REQUIRE(result.estimated_value == 370);
        REQUIRE(result.factors.character_score == 5.5);
    }

    SECTION("Non-ASCII names are measured in bytes") {
        // "münchen" is seven code points, eight bytes
        auto result = engine.evaluate("m\xC3\xBC" "nchen.com");
        REQUIRE(result.factors.length == 8);
        REQUIRE(result.factors.length_score == 4.0);
        REQUIRE(result.factors.character_score == 6.0);
        REQUIRE_FALSE(result.factors.pronounceable);
        REQUIRE(result.estimated_value == 96);
        REQUIRE(result.confidence == Confidence::Medium);
    }

    SECTION("Nothing notable falls back to the standard rationale") {
        auto result = engine.evaluate("bcdfgh.org");
        REQUIRE(result.estimated_value == 86);
        REQUIRE(result.confidence == Confidence::Low);
        REQUIRE(result.reasoning == Explainer::kFallback);
    }
}

TEST_CASE("Valuation bounds", "[valuation]") {
    ValuationEngine engine;

    SECTION("Clamped at the floor") {
        auto result = engine.evaluate("a-1.xyz");
        REQUIRE(result.estimated_value == 10);
        REQUIRE(result.confidence == Confidence::Low);
    }

    SECTION("Empty name still values") {
        auto result = engine.evaluate(".com");
        REQUIRE(result.estimated_value == 240);
        REQUIRE(result.factors.length == 0);
    }

    SECTION("Every estimate stays in range") {
        for (const auto& domain : {"a.com", "x.io", "zzzzzzzzzzzzzzzzzzzzzzzzzz.tk",
                                   "1-2-3-4.biz", "blockchaincryptoappweb.com"}) {
            auto result = engine.evaluate(domain);
            REQUIRE(result.estimated_value >= 10);
            REQUIRE(result.estimated_value <= 1000000);
        }
    }
}

TEST_CASE("Malformed input degrades instead of failing", "[valuation]") {
    ValuationEngine engine;

    ValuationResult result;
    REQUIRE_NOTHROW(result = engine.evaluate("localhost"));
    REQUIRE(result.estimated_value == 10);
    REQUIRE(result.confidence == Confidence::Low);
    REQUIRE(result.reasoning == "Invalid domain format");
    REQUIRE(result.factors == FactorSet{});

    REQUIRE_NOTHROW(result = engine.evaluate(""));
    REQUIRE(result.estimated_value == 10);
}

TEST_CASE("Value calculation", "[valuation]") {
    SECTION("Word score applies even when the multiplier is zeroed") {
        FactorSet factors;
        factors.length_score = 10.0;
        factors.character_score = 0.0;
        factors.suffix_score = 5.0;
        factors.word_score = 5.0;
        REQUIRE(ValuationEngine::calculate_value(factors) == 50.0);
    }

    SECTION("Ceiling") {
        FactorSet factors;
        factors.length_score = 10.0;
        factors.character_score = 5.0;
        factors.suffix_score = 5.0;
        factors.word_score = 1e6;
        REQUIRE(ValuationEngine::calculate_value(factors) == ValuationEngine::kMaxValue);
    }
}

TEST_CASE("Confidence levels", "[valuation]") {
    FactorSet factors;
    factors.length = 3;
    factors.brandable = true;
    factors.pronounceable = true;
    factors.suffix_score = 5.0;
    REQUIRE(ValuationEngine::determine_confidence(factors) == Confidence::High);

    factors.brandable = false;
    factors.suffix_score = 1.0;
    REQUIRE(ValuationEngine::determine_confidence(factors) == Confidence::Medium);

    factors.length = 12;
    factors.pronounceable = false;
    factors.has_digits = true;
    REQUIRE(ValuationEngine::determine_confidence(factors) == Confidence::Low);

    REQUIRE(confidence_string(Confidence::High) == "high");
    REQUIRE(confidence_string(Confidence::Medium) == "medium");
    REQUIRE(confidence_string(Confidence::Low) == "low");
}

TEST_CASE("Tokenization context adds rationale only", "[valuation]") {
    ValuationEngine engine;

    TokenizationContext ctx;
    ctx.domain = "app.com";
    ctx.is_tokenized = true;
    ctx.chain = "ethereum";

    auto plain = engine.evaluate("app.com");
    auto enriched = engine.evaluate("app.com", ctx);

    REQUIRE(enriched.estimated_value == plain.estimated_value);
    REQUIRE(enriched.confidence == plain.confidence);
    REQUIRE(enriched.factors == plain.factors);
    REQUIRE(enriched.reasoning == plain.reasoning + "; Tokenized on ethereum");

    auto untouched = engine.evaluate("app.com", std::nullopt);
    REQUIRE(untouched.reasoning == plain.reasoning);
}

TEST_CASE("Custom tables change scoring", "[valuation]") {
    auto tables = ValuationTables::defaults();
    tables.suffix_premiums[".zz"] = 1.0;

    ValuationEngine engine(tables);
    auto result = engine.evaluate("xyz.zz");
    REQUIRE(result.factors.suffix_score == 5.0);
    REQUIRE(result.estimated_value > ValuationEngine().evaluate("xyz.zz").estimated_value);
}

TEST_CASE("Evaluation is deterministic across threads", "[valuation]") {
    ValuationEngine engine;
    const std::vector<std::string> domains = {
        "app.com", "test123.com", "myname.eth", "webhub.io", "test-domain.com"
    };

    std::vector<int64_t> expected;
    for (const auto& d : domains) {
        expected.push_back(engine.evaluate(d).estimated_value);
    }

    constexpr int kThreads = 8;
    std::vector<std::vector<int64_t>> seen(kThreads);
    std::vector<std::thread> workers;
    for (int t = 0; t < kThreads; t++) {
        workers.emplace_back([&, t]() {
            for (int round = 0; round < 50; round++) {
                for (const auto& d : domains) {
                    seen[t].push_back(engine.evaluate(d).estimated_value);
                }
            }
        });
    }
    for (auto& w : workers) {
        w.join();
    }

    for (const auto& values : seen) {
        REQUIRE(values.size() == domains.size() * 50);
        for (size_t i = 0; i < values.size(); i++) {
            REQUIRE(values[i] == expected[i % domains.size()]);
        }
    }
}
