#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace asr {

/**
 * @brief Rejects text Whisper tends to invent on silence or noise
 *
 * Heuristic, not exact. All rules are data in Rules so the pattern list can grow
 * without touching the classifier.
 */
class HallucinationFilter {
public:
    struct Rules {
        /// Lowercase substrings; any match rejects the text
        std::vector<std::string> reject_patterns;
        /// Words that cannot make up a short utterance on their own
        std::vector<std::string> filler_words;
        size_t max_rejected_length = 2;     ///< Trimmed length at or below this is rejected
        size_t min_alpha_chars = 3;         ///< Fewer letters than this is rejected
        size_t max_and_repeats = 3;         ///< the word "and" this many times or more is rejected
        size_t filler_max_words = 3;        ///< Filler check applies up to this many words
    };

    HallucinationFilter();
    explicit HallucinationFilter(Rules rules);

    bool is_hallucination(const std::string& text) const;

    const Rules& rules() const { return rules_; }

    /// Built-in marker, garbage and false-positive lists
    static Rules default_rules();

private:
    Rules rules_;
};

/// Classify with the default rules
bool is_hallucination(const std::string& text);

} // namespace asr
