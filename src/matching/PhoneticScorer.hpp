#pragma once

#include "ISimilarityScorer.hpp"
#include "../processing/ITextNormalizer.hpp"

#include <memory>
#include <string>

namespace matching
{

/**
 * @brief Binary sound-alike check based on American Soundex.
 *
 * score() is 1.0 when both strings produce the same Soundex code and 0.0 otherwise.
 * The whole string is encoded, spaces included: a space separates consonant groups
 * the same way a vowel does.
 *
 * Example:
 * @code
 * PhoneticScorer scorer;
 * scorer.encode("Robert");                          // "R163"
 * scorer.score("John Smith", "Jon Smyth");          // 1.0
 * @endcode
 */
class PhoneticScorer : public ISimilarityScorer
{
public:
    static constexpr std::size_t kCodeLength = 4;

    PhoneticScorer();
    ~PhoneticScorer() override;

    double score(const std::string& a, const std::string& b) const override;

    ScorerKind kind() const override { return ScorerKind::Phonetic; }

    /**
     * @brief Soundex code of a string.
     *
     * The text is NFKD-normalized and upper-cased; the first character is kept as is,
     * later consonants map to digits (BFPV=1, CGJKQSXZ=2, DT=3, L=4, MN=5, R=6).
     * Adjacent equal digits collapse, H and W are transparent, any other character
     * separates groups. Output is padded with '0' to four symbols.
     *
     * @return The code, or an empty string for empty input
     */
    std::string encode(const std::string& text) const;

private:
    std::unique_ptr<processing::ITextNormalizer> normalizer_;
};

} // namespace matching
