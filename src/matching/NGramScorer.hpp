#pragma once

#include "ISimilarityScorer.hpp"

#include <cstddef>
#include <map>
#include <string>

namespace matching
{

/**
 * @brief Character n-gram overlap similarity.
 *
 * Both strings are padded with (n - 1) '$' characters on each side and split into
 * overlapping n-grams over Unicode code points. The score is
 *
 *     shared / (grams(a) + grams(b) - shared)
 *
 * where shared n-grams are counted with multiplicity. Identical strings score 1.0,
 * strings without a common n-gram score 0.0.
 */
class NGramScorer : public ISimilarityScorer
{
public:
    static constexpr char32_t kPadChar = U'$';

    explicit NGramScorer(std::size_t n = 3);

    double score(const std::string& a, const std::string& b) const override;

    ScorerKind kind() const override { return ScorerKind::NGram; }

    std::size_t size() const noexcept { return n_; }

private:
    using GramCounts = std::map<std::u32string, std::size_t>;

    /// Returns the n-gram multiset of the padded string and stores the gram total in `total`.
    GramCounts split(const std::string& text, std::size_t& total) const;

    std::size_t n_;
};

} // namespace matching
