#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <unordered_set>
#include <nlohmann/json.hpp>

// Read-only word lists and suffix coefficients consumed by the scoring model.
struct ValuationTables {
    std::vector<std::string> premium_words;
    std::unordered_set<std::string> dictionary_words;
    std::vector<std::string> brand_prefixes;
    std::vector<std::string> brand_suffixes;
    std::unordered_map<std::string, double> suffix_premiums;  // ".com" -> 1.0

    static ValuationTables defaults();

    // Keys missing from the document keep their default contents.
    static ValuationTables from_json(const nlohmann::json& doc);
    static ValuationTables load_file(const std::string& path);

private:
    static std::vector<std::string> read_string_list(const nlohmann::json& doc, const char* key);
    static std::string normalize_suffix(const std::string& suffix);
};
