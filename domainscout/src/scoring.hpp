#pragma once

#include "lexical.hpp"
#include "valuation_tables.hpp"
#include <string>

struct FactorSet {
    int length = 0;
    double length_score = 0.0;
    double character_score = 0.0;
    double word_score = 0.0;
    double suffix_score = 0.0;
    bool pronounceable = false;
    bool brandable = false;
    bool has_digits = false;
    bool has_hyphen = false;

    bool operator==(const FactorSet& other) const;
};

// Turns lexical signals into the four sub-scores and the two gates.
// Each score keeps its own scale; the aggregator's weights reconcile them.
class FactorScorer {
public:
    explicit FactorScorer(const ValuationTables& tables);
    FactorScorer(ValuationTables&&) = delete;  // tables must outlive the scorer

    FactorSet score(const ValuationInput& input) const;

    static double length_score(int length);
    static double character_score(const LabelSignals& signals);
    double word_score(const std::string& name, int length) const;
    double suffix_score(const std::string& suffix) const;
    static bool is_pronounceable(const LabelSignals& signals);
    static bool is_brandable(const LabelSignals& signals);

private:
    const ValuationTables& tables_;

    bool is_dictionary_word(const std::string& lower_name) const;
    bool is_compound_word(const std::string& lower_name, int length) const;
};
