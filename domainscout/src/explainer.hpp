#pragma once

#include "scoring.hpp"
#include "tokenization.hpp"
#include <string>
#include <vector>

class Explainer {
public:
    static constexpr const char* kFallback = "Standard domain name";
    static constexpr const char* kInvalidFormat = "Invalid domain format";

    // Clauses in priority order: length tier, brandable, pronounceable,
    // keywords, digit penalty, hyphen penalty.
    static std::vector<std::string> factor_clauses(const FactorSet& factors);
    static std::vector<std::string> tokenization_clauses(const TokenizationContext& ctx);

    static std::string explain(const FactorSet& factors);
    static std::string explain(const FactorSet& factors, const TokenizationContext& ctx);
};
