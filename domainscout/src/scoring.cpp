#include "scoring.hpp"
#include "util.hpp"
#include <algorithm>

bool FactorSet::operator==(const FactorSet& other) const {
    return length == other.length &&
           length_score == other.length_score &&
           character_score == other.character_score &&
           word_score == other.word_score &&
           suffix_score == other.suffix_score &&
           pronounceable == other.pronounceable &&
           brandable == other.brandable &&
           has_digits == other.has_digits &&
           has_hyphen == other.has_hyphen;
}

FactorScorer::FactorScorer(const ValuationTables& tables)
    : tables_(tables) {}

FactorSet FactorScorer::score(const ValuationInput& input) const {
    LabelSignals signals = LexicalAnalyzer::analyze_label(input.name);

    FactorSet factors;
    factors.length = signals.length;
    factors.has_digits = signals.has_digits;
    factors.has_hyphen = signals.has_hyphen;

    factors.length_score = length_score(signals.length);
    factors.character_score = character_score(signals);
    factors.word_score = word_score(input.name, signals.length);
    factors.suffix_score = suffix_score(input.suffix);
    factors.pronounceable = is_pronounceable(signals);
    factors.brandable = is_brandable(signals);

    return factors;
}

double FactorScorer::length_score(int length) {
    // Resale market prices length in coarse tiers
    if (length <= 3) return 10.0;
    if (length <= 5) return 8.0;
    if (length <= 7) return 6.0;
    if (length <= 10) return 4.0;
    if (length <= 15) return 2.0;
    return 1.0;
}

double FactorScorer::character_score(const LabelSignals& signals) {
    double score = 5.0;

    if (signals.has_digits) score -= 2.0;
    if (signals.has_hyphen) score -= 1.5;
    if (signals.all_letters) score += 1.0;
    if (signals.mixed_case) score -= 0.5;

    return std::max(0.0, score);
}

double FactorScorer::word_score(const std::string& name, int length) const {
    double score = 0.0;
    std::string lower = util::to_lower(name);

    // Every listed word found anywhere in the label counts once
    for (const auto& word : tables_.premium_words) {
        if (!word.empty() && lower.find(word) != std::string::npos) {
            score += 3.0;
        }
    }

    if (is_dictionary_word(lower)) {
        score += 2.0;
    }

    if (is_compound_word(lower, length)) {
        score += 1.0;
    }

    return score;
}

double FactorScorer::suffix_score(const std::string& suffix) const {
    auto it = tables_.suffix_premiums.find(suffix);
    if (it == tables_.suffix_premiums.end()) {
        return 1.0;
    }
    return it->second * 5.0;
}

bool FactorScorer::is_pronounceable(const LabelSignals& signals) {
    if (signals.vowels == 0) {
        return false;
    }

    double ratio = static_cast<double>(signals.consonants) / signals.vowels;
    return ratio >= 0.5 && ratio <= 4.0;
}

bool FactorScorer::is_brandable(const LabelSignals& signals) {
    if (signals.length < 3 || signals.length > 12) return false;
    if (signals.has_digits || signals.has_hyphen) return false;
    return is_pronounceable(signals);
}

bool FactorScorer::is_dictionary_word(const std::string& lower_name) const {
    return tables_.dictionary_words.count(lower_name) > 0;
}

bool FactorScorer::is_compound_word(const std::string& lower_name, int length) const {
    if (length < 6) {
        return false;
    }

    auto long_enough = [length](const std::string& affix) {
        return length > static_cast<int>(affix.size()) + 2;
    };

    for (const auto& prefix : tables_.brand_prefixes) {
        if (util::starts_with(lower_name, prefix) && long_enough(prefix)) {
            return true;
        }
    }

    for (const auto& suffix : tables_.brand_suffixes) {
        if (util::ends_with(lower_name, suffix) && long_enough(suffix)) {
            return true;
        }
    }

    return false;
}
