#pragma once

#include "ISimilarityScorer.hpp"

namespace matching
{

/**
 * @brief Normalized edit similarity.
 *
 * Wraps rapidfuzz::fuzz::ratio (Indel distance over code points, normalized by the
 * combined length) and rescales it from [0, 100] to [0.0, 1.0].
 */
class EditDistanceScorer : public ISimilarityScorer
{
public:
    double score(const std::string& a, const std::string& b) const override;

    ScorerKind kind() const override { return ScorerKind::Levenshtein; }
};

} // namespace matching
