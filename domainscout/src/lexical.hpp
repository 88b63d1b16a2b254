#pragma once

#include <string>
#include <vector>

// Domain split at the final '.' into the scored label and its suffix.
struct ValuationInput {
    std::string name;    // everything before the final '.'
    std::string suffix;  // '.' + final label, lower-cased; empty when no '.'

    bool has_suffix() const { return !suffix.empty(); }
};

// Structural signals computed over the label's code points.
struct LabelSignals {
    int length = 0;  // UTF-8 bytes
    bool has_digits = false;
    bool has_hyphen = false;
    bool all_letters = true;
    bool mixed_case = false;
    int vowels = 0;
    int consonants = 0;
};

class LexicalAnalyzer {
public:
    static ValuationInput split_domain(const std::string& domain);
    static LabelSignals analyze_label(const std::string& name);

    // Malformed sequences decode to U+FFFD, one per offending byte.
    static std::vector<char32_t> decode_utf8(const std::string& text);

    // Lower-cases every code point is_upper() recognises; other bytes,
    // including malformed ones, are copied as they are.
    static std::string to_lower(const std::string& text);

    static bool is_digit(char32_t cp);
    static bool is_letter(char32_t cp);
    static bool is_upper(char32_t cp);
    static bool is_lower(char32_t cp);

private:
    static bool is_vowel(char32_t cp);
};
