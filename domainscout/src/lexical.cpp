#include "lexical.hpp"
#include "util.hpp"

namespace {

struct CodeRange {
    char32_t first;
    char32_t last;
};

// Decimal digit blocks outside ASCII that show up in internationalised labels.
const CodeRange kDigitRanges[] = {
    {0x0660, 0x0669},  // Arabic-Indic
    {0x06F0, 0x06F9},  // Extended Arabic-Indic
    {0x0966, 0x096F},  // Devanagari
    {0x09E6, 0x09EF},  // Bengali
    {0x0E50, 0x0E59},  // Thai
    {0xFF10, 0xFF19},  // Fullwidth
};

// Non-ASCII code points that are neither letters nor digits.
const CodeRange kNonLetterRanges[] = {
    {0x0080, 0x00BF},  // Latin-1 controls and punctuation
    {0x00D7, 0x00D7},
    {0x00F7, 0x00F7},
    {0x0300, 0x036F},  // combining diacritical marks
    {0x2000, 0x2BFF},  // punctuation, symbols, arrows, dingbats
    {0x3000, 0x303F},  // CJK punctuation
    {0xD800, 0xDFFF},  // surrogates
    {0xFE10, 0xFE6F},
    {0xFF00, 0xFF20},
    {0xFFF0, 0xFFFF},  // specials, includes U+FFFD
    {0x1F000, 0x1FAFF},  // emoji and pictographs
};

const CodeRange kUpperRanges[] = {
    {0x00C0, 0x00DE},
    {0x0391, 0x03A9},  // Greek
    {0x0400, 0x042F},  // Cyrillic
};

const CodeRange kLowerRanges[] = {
    {0x00DF, 0x00FF},
    {0x03B1, 0x03C9},
    {0x0430, 0x045F},
};

template <size_t N>
bool in_ranges(const CodeRange (&ranges)[N], char32_t cp) {
    for (const auto& r : ranges) {
        if (cp >= r.first && cp <= r.last) return true;
    }
    return false;
}

// Decodes one code point at text[i]; returns the number of bytes consumed.
// A malformed sequence consumes one byte and yields U+FFFD.
size_t decode_at(const std::string& text, size_t i, char32_t& cp) {
    unsigned char lead = static_cast<unsigned char>(text[i]);

    size_t extra = 0;
    if (lead < 0x80) {
        cp = lead;
        return 1;
    } else if ((lead & 0xE0) == 0xC0) {
        extra = 1;
        cp = lead & 0x1F;
    } else if ((lead & 0xF0) == 0xE0) {
        extra = 2;
        cp = lead & 0x0F;
    } else if ((lead & 0xF8) == 0xF0) {
        extra = 3;
        cp = lead & 0x07;
    } else {
        cp = 0xFFFD;
        return 1;
    }

    if (i + extra >= text.size()) {
        cp = 0xFFFD;
        return 1;
    }

    for (size_t k = 1; k <= extra; k++) {
        unsigned char cont = static_cast<unsigned char>(text[i + k]);
        if ((cont & 0xC0) != 0x80) {
            cp = 0xFFFD;
            return 1;
        }
        cp = (cp << 6) | (cont & 0x3F);
    }

    return extra + 1;
}

void append_utf8(std::string& out, char32_t cp) {
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

// Case mapping for the upper-case ranges above
char32_t lower_of(char32_t cp) {
    if (cp < 0x80) return cp + (U'a' - U'A');
    if (cp >= 0x0400 && cp <= 0x040F) return cp + 0x50;
    return cp + 0x20;
}

} // namespace

ValuationInput LexicalAnalyzer::split_domain(const std::string& domain) {
    ValuationInput input;

    size_t dot = domain.rfind('.');
    if (dot == std::string::npos) {
        input.name = domain;
        return input;
    }

    input.name = domain.substr(0, dot);
    input.suffix = util::to_lower(domain.substr(dot));
    return input;
}

LabelSignals LexicalAnalyzer::analyze_label(const std::string& name) {
    LabelSignals signals;
    signals.length = static_cast<int>(name.size());
    bool has_upper = false;
    bool has_lower = false;

    for (char32_t cp : decode_utf8(name)) {
        if (is_digit(cp)) signals.has_digits = true;
        if (cp == U'-') signals.has_hyphen = true;
        if (is_upper(cp)) has_upper = true;
        if (is_lower(cp)) has_lower = true;

        if (!is_letter(cp)) {
            signals.all_letters = false;
            continue;
        }

        if (is_vowel(cp)) {
            signals.vowels++;
        } else {
            signals.consonants++;
        }
    }

    signals.mixed_case = has_upper && has_lower;
    return signals;
}

std::vector<char32_t> LexicalAnalyzer::decode_utf8(const std::string& text) {
    std::vector<char32_t> out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        char32_t cp = 0;
        i += decode_at(text, i, cp);
        out.push_back(cp);
    }

    return out;
}

std::string LexicalAnalyzer::to_lower(const std::string& text) {
    std::string out;
    out.reserve(text.size());

    size_t i = 0;
    while (i < text.size()) {
        char32_t cp = 0;
        size_t used = decode_at(text, i, cp);
        if (is_upper(cp)) {
            append_utf8(out, lower_of(cp));
        } else {
            // Bytes that are not an upper-case letter pass through untouched
            out.append(text, i, used);
        }
        i += used;
    }

    return out;
}

bool LexicalAnalyzer::is_digit(char32_t cp) {
    if (cp < 0x80) return cp >= U'0' && cp <= U'9';
    return in_ranges(kDigitRanges, cp);
}

bool LexicalAnalyzer::is_letter(char32_t cp) {
    if (cp < 0x80) {
        return (cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z');
    }
    return !is_digit(cp) && !in_ranges(kNonLetterRanges, cp);
}

bool LexicalAnalyzer::is_upper(char32_t cp) {
    if (cp < 0x80) return cp >= U'A' && cp <= U'Z';
    return cp != 0x00D7 && in_ranges(kUpperRanges, cp);
}

bool LexicalAnalyzer::is_lower(char32_t cp) {
    if (cp < 0x80) return cp >= U'a' && cp <= U'z';
    return cp != 0x00F7 && in_ranges(kLowerRanges, cp);
}

bool LexicalAnalyzer::is_vowel(char32_t cp) {
    switch (cp) {
        case U'a': case U'e': case U'i': case U'o': case U'u':
        case U'A': case U'E': case U'I': case U'O': case U'U':
            return true;
        default:
            return false;
    }
}
