#include "valuation_tables.hpp"
#include "util.hpp"
#include <spdlog/spdlog.h>
#include <fmt/format.h>
#include <fstream>
#include <stdexcept>

ValuationTables ValuationTables::defaults() {
    ValuationTables tables;

    tables.premium_words = {
        "app", "web", "tech", "crypto", "blockchain", "ai", "ml", "data",
        "cloud", "api", "dev", "code", "digital", "online", "smart",
        "auto", "health", "finance", "bank", "pay", "shop", "store",
        "game", "play", "social", "network", "security", "privacy"
    };

    tables.dictionary_words = {
        "app", "web", "net", "tech", "data", "info", "news", "shop", "store",
        "game", "play", "work", "home", "life", "love", "time", "world",
        "best", "new", "top", "first", "last", "good", "great", "super"
    };

    tables.brand_prefixes = {"web", "app", "my", "get", "the", "new", "top", "best"};
    tables.brand_suffixes = {"app", "web", "net", "tech", "hub", "lab", "pro", "max"};

    tables.suffix_premiums = {
        {".com", 1.0},
        {".net", 0.7},
        {".org", 0.6},
        {".io", 0.8},
        {".co", 0.6},
        {".app", 0.7},
        {".dev", 0.6},
        {".tech", 0.5},
        {".eth", 0.9},
        {".crypto", 0.8},
        {".nft", 0.7}
    };

    return tables;
}

std::vector<std::string> ValuationTables::read_string_list(const nlohmann::json& doc,
                                                           const char* key) {
    const auto& node = doc.at(key);
    if (!node.is_array()) {
        throw std::runtime_error(fmt::format("Valuation tables: '{}' must be an array", key));
    }

    std::vector<std::string> out;
    for (const auto& item : node) {
        if (!item.is_string()) {
            throw std::runtime_error(
                fmt::format("Valuation tables: '{}' must contain only strings", key));
        }
        out.push_back(util::to_lower(item.get<std::string>()));
    }
    return out;
}

std::string ValuationTables::normalize_suffix(const std::string& suffix) {
    std::string lower = util::to_lower(util::trim(suffix));
    if (!lower.empty() && lower[0] != '.') {
        lower = "." + lower;
    }
    return lower;
}

ValuationTables ValuationTables::from_json(const nlohmann::json& doc) {
    if (!doc.is_object()) {
        throw std::runtime_error("Valuation tables document must be a JSON object");
    }

    ValuationTables tables = defaults();

    if (doc.contains("premium_words")) {
        tables.premium_words = read_string_list(doc, "premium_words");
    }
    if (doc.contains("dictionary_words")) {
        auto words = read_string_list(doc, "dictionary_words");
        tables.dictionary_words = std::unordered_set<std::string>(words.begin(), words.end());
    }
    if (doc.contains("brand_prefixes")) {
        tables.brand_prefixes = read_string_list(doc, "brand_prefixes");
    }
    if (doc.contains("brand_suffixes")) {
        tables.brand_suffixes = read_string_list(doc, "brand_suffixes");
    }

    if (doc.contains("suffix_premiums")) {
        const auto& premiums = doc["suffix_premiums"];
        if (!premiums.is_object()) {
            throw std::runtime_error("Valuation tables: 'suffix_premiums' must be an object");
        }

        tables.suffix_premiums.clear();
        for (const auto& [suffix, value] : premiums.items()) {
            if (!value.is_number()) {
                throw std::runtime_error(
                    fmt::format("Valuation tables: premium for '{}' is not a number", suffix));
            }
            double coefficient = value.get<double>();
            if (coefficient < 0.0 || coefficient > 1.0) {
                throw std::runtime_error(
                    fmt::format("Valuation tables: premium for '{}' must be within [0, 1], got {}",
                                suffix, coefficient));
            }
            tables.suffix_premiums[normalize_suffix(suffix)] = coefficient;
        }
    }

    return tables;
}

ValuationTables ValuationTables::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw std::runtime_error("Cannot open valuation tables file: " + path);
    }

    nlohmann::json doc;
    try {
        doc = nlohmann::json::parse(in);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error(
            fmt::format("Failed to parse valuation tables {}: {}", path, e.what()));
    }

    auto tables = from_json(doc);
    spdlog::info("Loaded valuation tables from {} ({} premium words, {} suffixes)",
                 path, tables.premium_words.size(), tables.suffix_premiums.size());
    return tables;
}
