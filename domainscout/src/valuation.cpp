#include "valuation.hpp"
#include "explainer.hpp"
#include "lexical.hpp"
#include <spdlog/spdlog.h>
#include <algorithm>
#include <utility>

std::string confidence_string(Confidence confidence) {
    switch (confidence) {
        case Confidence::Low: return "low";
        case Confidence::Medium: return "medium";
        case Confidence::High: return "high";
        default: return "unknown";
    }
}

ValuationEngine::ValuationEngine(ValuationTables tables)
    : tables_(std::move(tables))
    , scorer_(tables_)
{}

ValuationResult ValuationEngine::evaluate(const std::string& domain) const {
    return evaluate(domain, std::nullopt);
}

ValuationResult ValuationEngine::evaluate(const std::string& domain,
                                          const std::optional<TokenizationContext>& tokenization) const {
    ValuationResult result;

    ValuationInput input = LexicalAnalyzer::split_domain(domain);
    if (!input.has_suffix()) {
        // Nothing to score without a suffix; report the floor at low confidence
        result.estimated_value = static_cast<int64_t>(kMinValue);
        result.confidence = Confidence::Low;
        result.reasoning = Explainer::kInvalidFormat;
        spdlog::debug("Valuation of '{}' degraded: no suffix", domain);
        return result;
    }

    result.factors = analyze(input);
    result.estimated_value = static_cast<int64_t>(calculate_value(result.factors));
    result.confidence = determine_confidence(result.factors);
    result.reasoning = tokenization
        ? Explainer::explain(result.factors, *tokenization)
        : Explainer::explain(result.factors);

    spdlog::debug("Valued {} at {} {} ({} confidence)", domain, result.estimated_value,
                  result.currency, confidence_string(result.confidence));
    return result;
}

FactorSet ValuationEngine::analyze(const ValuationInput& input) const {
    return scorer_.score(input);
}

double ValuationEngine::calculate_value(const FactorSet& factors) {
    double multiplier = 1.0;
    multiplier *= (factors.length_score / 10.0) * 2.0;
    multiplier *= (factors.character_score / 5.0);
    multiplier *= (factors.suffix_score / 5.0);
    // Additive; must stay after the terms above, which may zero the multiplier
    multiplier += (factors.word_score / 10.0);

    if (factors.brandable) multiplier *= 1.5;
    if (factors.pronounceable) multiplier *= 1.2;

    if (factors.has_digits) multiplier *= 0.7;
    if (factors.has_hyphen) multiplier *= 0.6;

    double value = kBaseValue * multiplier;
    return std::clamp(value, kMinValue, kMaxValue);
}

Confidence ValuationEngine::determine_confidence(const FactorSet& factors) {
    int score = 0;

    if (factors.length <= 5) score += 2;
    if (factors.brandable) score += 2;
    if (factors.pronounceable) score += 1;
    if (factors.suffix_score >= 4.0) score += 2;
    if (!factors.has_digits && !factors.has_hyphen) score += 1;

    if (score >= 6) return Confidence::High;
    if (score >= 3) return Confidence::Medium;
    return Confidence::Low;
}
