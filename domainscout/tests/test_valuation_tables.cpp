#include <catch2/catch_test_macros.hpp>
#include "../src/valuation_tables.hpp"
#include <cstdio>
#include <fstream>
#include <stdexcept>

TEST_CASE("Default tables", "[tables]") {
    auto tables = ValuationTables::defaults();

    REQUIRE(tables.premium_words.size() == 28);
    REQUIRE(tables.dictionary_words.count("app") == 1);
    REQUIRE(tables.brand_prefixes.front() == "web");
    REQUIRE(tables.brand_suffixes.back() == "max");
    REQUIRE(tables.suffix_premiums.at(".com") == 1.0);
    REQUIRE(tables.suffix_premiums.at(".eth") == 0.9);
    REQUIRE(tables.suffix_premiums.count(".xyz") == 0);

    for (const auto& entry : tables.suffix_premiums) {
        REQUIRE(entry.second >= 0.0);
        REQUIRE(entry.second <= 1.0);
    }
}

TEST_CASE("Tables from JSON", "[tables]") {
    SECTION("Missing keys keep defaults") {
        auto tables = ValuationTables::from_json(nlohmann::json::object());
        auto defaults = ValuationTables::defaults();
        REQUIRE(tables.premium_words == defaults.premium_words);
        REQUIRE(tables.suffix_premiums == defaults.suffix_premiums);
    }

    SECTION("Overrides replace whole lists") {
        auto doc = nlohmann::json::parse(R"({
            "premium_words": ["Rocket", "moon"],
            "suffix_premiums": {"COM": 0.9, ".xyz": 0.4}
        })");

        auto tables = ValuationTables::from_json(doc);
        REQUIRE(tables.premium_words == std::vector<std::string>{"rocket", "moon"});
        REQUIRE(tables.suffix_premiums.size() == 2);
        REQUIRE(tables.suffix_premiums.at(".com") == 0.9);
        REQUIRE(tables.suffix_premiums.at(".xyz") == 0.4);
        REQUIRE(tables.dictionary_words.count("app") == 1);
    }

    SECTION("Coefficients outside the unit interval are rejected") {
        auto doc = nlohmann::json::parse(R"({"suffix_premiums": {".com": 1.5}})");
        REQUIRE_THROWS_AS(ValuationTables::from_json(doc), std::runtime_error);

        doc = nlohmann::json::parse(R"({"suffix_premiums": {".com": -0.1}})");
        REQUIRE_THROWS_AS(ValuationTables::from_json(doc), std::runtime_error);
    }

    SECTION("Wrong types are rejected") {
        REQUIRE_THROWS_AS(ValuationTables::from_json(nlohmann::json::array()), std::runtime_error);
        REQUIRE_THROWS_AS(ValuationTables::from_json(nlohmann::json::parse(R"({"premium_words": "app"})")),
                          std::runtime_error);
        REQUIRE_THROWS_AS(ValuationTables::from_json(nlohmann::json::parse(R"({"brand_prefixes": [1, 2]})")),
                          std::runtime_error);
        REQUIRE_THROWS_AS(ValuationTables::from_json(nlohmann::json::parse(R"({"suffix_premiums": {".com": "high"}})")),
                          std::runtime_error);
    }
}

TEST_CASE("Tables from file", "[tables]") {
    SECTION("Missing file") {
        REQUIRE_THROWS_AS(ValuationTables::load_file("/nonexistent/tables.json"), std::runtime_error);
    }

    SECTION("Malformed file") {
        std::string path = "domainscout_bad_tables.json";
        {
            std::ofstream out(path);
            out << "{ not json";
        }
        REQUIRE_THROWS_AS(ValuationTables::load_file(path), std::runtime_error);
        std::remove(path.c_str());
    }

    SECTION("Valid file") {
        std::string path = "domainscout_tables.json";
        {
            std::ofstream out(path);
            out << R"({"brand_suffixes": ["hub"]})";
        }
        auto tables = ValuationTables::load_file(path);
        REQUIRE(tables.brand_suffixes == std::vector<std::string>{"hub"});
        std::remove(path.c_str());
    }
}
