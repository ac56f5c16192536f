#include "CandidateMatcher.hpp"
#include "../processing/Diagnostics.hpp"

#include <plog/Log.h>

namespace matching
{

using processing::Diagnostics;

std::vector<MatchRecord> scoreCandidates(const std::string& query, const CandidateTable& candidates,
                                         const std::string& column, const AcronymDictionary& dictionary,
                                         const ISimilarityScorer& scorer)
{
    const TextColumn values = candidates.textColumn(column);
    const bool verbose = Diagnostics::IsVerbose();

    std::vector<MatchRecord> records;
    records.reserve(values.size());

    for (std::size_t row = 0; row < values.size(); ++row)
    {
        const std::string original = values[row];

        MatchRecord record{ row, 0.0, original };
        for (const auto& variation : expandAcronyms(original, dictionary))
        {
            double score = scorer.score(query, variation);
            if (score > record.score)
            {
                record.score = score;
                record.best_form = variation;
            }
        }

        if (verbose)
        {
            PLOG_DEBUG_(Diagnostics::kLogInstance)
                << "[CandidateMatcher] " << toString(scorer.kind()) << " row " << row << " "
                << Diagnostics::Preview(original) << " -> " << record.score << " via "
                << Diagnostics::Preview(record.best_form);
        }

        records.push_back(std::move(record));
    }

    return records;
}

CandidateTable matchCandidates(const std::string& query, const CandidateTable& candidates, const std::string& column,
                               const AcronymDictionary& dictionary, const ISimilarityScorer& scorer)
{
    std::vector<MatchRecord> records = scoreCandidates(query, candidates, column, dictionary, scorer);

    std::vector<CandidateTable::Value> scores;
    std::vector<CandidateTable::Value> forms;
    scores.reserve(records.size());
    forms.reserve(records.size());

    const bool binary = scorer.kind() == ScorerKind::Phonetic;
    for (auto& record : records)
    {
        if (binary)
            scores.emplace_back(record.score > 0.0 ? 1 : 0);
        else
            scores.emplace_back(record.score);
        forms.emplace_back(std::move(record.best_form));
    }

    CandidateTable result = candidates;
    result.setColumn(scoreColumnName(scorer.kind()), std::move(scores));
    result.setColumn(formColumnName(scorer.kind()), std::move(forms));
    return result;
}

CandidateTable matchCandidates(const std::string& query, const CandidateTable& candidates, const std::string& column,
                               const AcronymDictionary& dictionary, ScorerKind kind, const ScorerOptions& options)
{
    auto scorer = createScorer(kind, options);
    return matchCandidates(query, candidates, column, dictionary, *scorer);
}

} // namespace matching
