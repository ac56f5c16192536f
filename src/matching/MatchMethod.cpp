#include "MatchMethod.hpp"
#include "MatchErrors.hpp"

namespace matching
{

MatchMethod parseMatchMethod(const std::string& name)
{
    if (name == "hybrid")
        return MatchMethod::Hybrid;
    if (name == "ngram")
        return MatchMethod::NGram;
    if (name == "phonetic")
        return MatchMethod::Phonetic;
    if (name == "levenshtein")
        return MatchMethod::Levenshtein;
    throw InvalidMethodError(name);
}

std::string toString(MatchMethod method)
{
    switch (method)
    {
    case MatchMethod::NGram:
        return "ngram";
    case MatchMethod::Phonetic:
        return "phonetic";
    case MatchMethod::Levenshtein:
        return "levenshtein";
    case MatchMethod::Hybrid:
        return "hybrid";
    default:
        return "unknown";
    }
}

std::optional<ScorerKind> scorerFor(MatchMethod method)
{
    switch (method)
    {
    case MatchMethod::NGram:
        return ScorerKind::NGram;
    case MatchMethod::Phonetic:
        return ScorerKind::Phonetic;
    case MatchMethod::Levenshtein:
        return ScorerKind::Levenshtein;
    default:
        return std::nullopt;
    }
}

} // namespace matching
