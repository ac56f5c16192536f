#include "ISimilarityScorer.hpp"
#include "NGramScorer.hpp"
#include "PhoneticScorer.hpp"
#include "EditDistanceScorer.hpp"

#include <memory>

namespace matching
{

std::unique_ptr<ISimilarityScorer> createScorer(ScorerKind kind, const ScorerOptions& options)
{
    switch (kind)
    {
    case ScorerKind::NGram:
        return std::make_unique<NGramScorer>(options.ngram_size);
    case ScorerKind::Phonetic:
        return std::make_unique<PhoneticScorer>();
    case ScorerKind::Levenshtein:
        return std::make_unique<EditDistanceScorer>();
    default:
        return nullptr;
    }
}

std::string toString(ScorerKind kind)
{
    switch (kind)
    {
    case ScorerKind::NGram:
        return "ngram";
    case ScorerKind::Phonetic:
        return "phonetic";
    case ScorerKind::Levenshtein:
        return "levenshtein";
    default:
        return "unknown";
    }
}

std::string scoreColumnName(ScorerKind kind)
{
    // Phonetic results are a flag rather than a graded score
    if (kind == ScorerKind::Phonetic)
        return "phonetic_match";
    return toString(kind) + "_score";
}

std::string formColumnName(ScorerKind kind) { return "best_" + toString(kind) + "_form"; }

} // namespace matching
