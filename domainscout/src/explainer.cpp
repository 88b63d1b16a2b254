#include "explainer.hpp"
#include "util.hpp"
#include <fmt/format.h>
#include <utility>

std::vector<std::string> Explainer::factor_clauses(const FactorSet& factors) {
    std::vector<std::string> reasons;

    if (factors.length <= 3) {
        reasons.push_back("Very short domain (premium)");
    } else if (factors.length <= 5) {
        reasons.push_back("Short and memorable");
    } else if (factors.length > 15) {
        reasons.push_back("Long domain name");
    }

    if (factors.brandable) {
        reasons.push_back("Brandable name");
    }

    if (factors.pronounceable) {
        reasons.push_back("Easy to pronounce");
    }

    if (factors.word_score > 2.0) {
        reasons.push_back("Contains valuable keywords");
    }

    if (factors.has_digits) {
        reasons.push_back("Contains numbers (reduces value)");
    }

    if (factors.has_hyphen) {
        reasons.push_back("Contains hyphens (reduces value)");
    }

    return reasons;
}

std::vector<std::string> Explainer::tokenization_clauses(const TokenizationContext& ctx) {
    std::vector<std::string> reasons;
    if (!ctx.is_tokenized) {
        return reasons;
    }

    reasons.push_back(ctx.chain.empty() ? "Tokenized" : "Tokenized on " + ctx.chain);

    if (ctx.defi && ctx.defi->is_collateral) {
        reasons.push_back(fmt::format("Used as collateral on {} (${:.0f} collateral, ${:.0f} borrowed)",
                                      ctx.defi->lending_platform,
                                      ctx.defi->collateral_value,
                                      ctx.defi->borrowed_amount));
    }
    if (ctx.defi && ctx.defi->yield_generation) {
        reasons.push_back("Generating yield");
    }

    return reasons;
}

std::string Explainer::explain(const FactorSet& factors) {
    auto reasons = factor_clauses(factors);
    if (reasons.empty()) {
        return kFallback;
    }
    return util::join(reasons, "; ");
}

std::string Explainer::explain(const FactorSet& factors, const TokenizationContext& ctx) {
    auto reasons = factor_clauses(factors);
    if (reasons.empty()) {
        reasons.push_back(kFallback);
    }

    for (auto& clause : tokenization_clauses(ctx)) {
        reasons.push_back(std::move(clause));
    }

    return util::join(reasons, "; ");
}
