#include "asr/hallucination_filter.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <utility>

namespace asr {

namespace {

std::string to_lower_trimmed(const std::string& text) {
    const size_t a = text.find_first_not_of(" \t\r\n");
    if (a == std::string::npos) return {};
    const size_t b = text.find_last_not_of(" \t\r\n");
    std::string out = text.substr(a, b - a + 1);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

// Whole-word matches only; words are runs of ASCII letters and apostrophes
size_t count_word(const std::string& text, const std::string& word) {
    size_t n = 0;
    const auto is_word_char = [&text](size_t k) {
        const unsigned char c = static_cast<unsigned char>(text[k]);
        return std::isalpha(c) != 0 || c == '\'';
    };
    size_t i = 0;
    while (i < text.size()) {
        if (!is_word_char(i)) {
            ++i;
            continue;
        }
        size_t j = i;
        while (j < text.size() && is_word_char(j)) ++j;
        if (text.compare(i, j - i, word) == 0) ++n;
        i = j;
    }
    return n;
}

// ASCII letters, plus UTF-8 lead bytes of two- and three-byte letters.
// E2 (punctuation, music glyphs) and four-byte sequences (emoji) are not letters.
size_t count_alpha(const std::string& s) {
    size_t n = 0;
    for (unsigned char c : s) {
        if (c < 0x80) {
            if (std::isalpha(c)) ++n;
        } else if ((c >= 0xC2 && c <= 0xDF) || (c >= 0xE3 && c <= 0xEF)) {
            ++n;
        }
    }
    return n;
}

} // anonymous namespace

HallucinationFilter::HallucinationFilter() : rules_(default_rules()) {}

HallucinationFilter::HallucinationFilter(Rules rules) : rules_(std::move(rules)) {}

HallucinationFilter::Rules HallucinationFilter::default_rules() {
    Rules r;
    // Bracketed and parenthesised non-speech markers
    const char* markers[] = {
        "music", "blank_audio", "silence", "audio", "sigh", "crying", "laughter", "applause",
        "noise", "inaudible", "unintelligible", "background", "ambient", "static", "breathing",
        "cough", "sneeze", "whisper", "mumbl", "squeak", "click", "beep", "tone", "bell", "ring",
        "dramatic", "sad", "happy", "whistl", "humm", "mimick", "speaking", "foreign",
        "xbox", "windows",
    };
    for (const char* m : markers) {
        r.reject_patterns.push_back(std::string("[") + m);
        r.reject_patterns.push_back(std::string("(") + m);
    }
    // Music glyphs
    r.reject_patterns.push_back("\xE2\x99\xAA");      // U+266A
    r.reject_patterns.push_back("\xF0\x9F\x8E\xB5");  // U+1F3B5
    // Garbage tokens
    const char* garbage[] = {
        "...", "shh", "hmm", "hush", "fash", "shook", "whoosh",
    };
    r.reject_patterns.insert(r.reject_patterns.end(), std::begin(garbage), std::end(garbage));
    // Phrases the model produces on near-silent input
    const char* phrases[] = {
        "you are the only", "your house", "i'll show you", "yet the few", "a few days",
        "and you have", "thank you", "thanks for", "bye", "i'm sorry", "sorry",
        "please come", "come forward", "famous for", "you will be",
    };
    r.reject_patterns.insert(r.reject_patterns.end(), std::begin(phrases), std::end(phrases));

    r.filler_words = {"and", "the", "a", "an", "to", "of", "in", "is", "it", "you", "i"};
    return r;
}

bool HallucinationFilter::is_hallucination(const std::string& text) const {
    const std::string t = to_lower_trimmed(text);

    for (const auto& pattern : rules_.reject_patterns) {
        if (!pattern.empty() && t.find(pattern) != std::string::npos) {
            return true;
        }
    }

    if (t.size() <= rules_.max_rejected_length) {
        return true;
    }

    if (count_alpha(t) < rules_.min_alpha_chars) {
        return true;
    }

    // Repetition artifact ("and... and... and...")
    const size_t and_count = count_word(t, "and");
    if (and_count >= rules_.max_and_repeats) {
        return true;
    }

    std::istringstream iss(t);
    std::vector<std::string> words;
    for (std::string w; iss >> w;) words.push_back(w);
    if (!words.empty() && words.size() <= rules_.filler_max_words) {
        const bool all_filler = std::all_of(words.begin(), words.end(), [this](const std::string& w) {
            return std::find(rules_.filler_words.begin(), rules_.filler_words.end(), w) != rules_.filler_words.end();
        });
        if (all_filler) {
            return true;
        }
    }

    return false;
}

bool is_hallucination(const std::string& text) {
    static const HallucinationFilter filter;
    return filter.is_hallucination(text);
}

} // namespace asr
