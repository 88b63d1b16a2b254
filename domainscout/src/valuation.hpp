#pragma once

#include "scoring.hpp"
#include "tokenization.hpp"
#include "valuation_tables.hpp"
#include <string>
#include <optional>
#include <cstdint>

enum class Confidence {
    Low,
    Medium,
    High
};

std::string confidence_string(Confidence confidence);

struct ValuationResult {
    int64_t estimated_value = 0;
    std::string currency = "USD";
    Confidence confidence = Confidence::Low;
    FactorSet factors;
    std::string reasoning;
};

// Stateless after construction; evaluate() may be called from any thread.
class ValuationEngine {
public:
    static constexpr double kBaseValue = 100.0;
    static constexpr double kMinValue = 10.0;
    static constexpr double kMaxValue = 1000000.0;

    explicit ValuationEngine(ValuationTables tables = ValuationTables::defaults());

    ValuationEngine(const ValuationEngine&) = delete;
    ValuationEngine& operator=(const ValuationEngine&) = delete;

    ValuationResult evaluate(const std::string& domain) const;

    // Tokenization context only adds rationale; the estimate is unchanged.
    ValuationResult evaluate(const std::string& domain,
                             const std::optional<TokenizationContext>& tokenization) const;

    FactorSet analyze(const ValuationInput& input) const;

    static double calculate_value(const FactorSet& factors);
    static Confidence determine_confidence(const FactorSet& factors);

private:
    const ValuationTables tables_;
    const FactorScorer scorer_;
};
