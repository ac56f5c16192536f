#include "TopMatches.hpp"
#include "CandidateMatcher.hpp"
#include "../processing/Diagnostics.hpp"

#include <algorithm>
#include <plog/Log.h>

namespace matching
{

using processing::Diagnostics;

namespace
{

void sortAndTruncate(std::vector<RankedMatch>& matches, int top_n)
{
    std::stable_sort(matches.begin(), matches.end(),
                     [](const RankedMatch& a, const RankedMatch& b) { return a.score > b.score; });

    const std::size_t limit = top_n > 0 ? static_cast<std::size_t>(top_n) : 0;
    if (matches.size() > limit)
        matches.resize(limit);
}

std::vector<RankedMatch> rankSingle(const std::string& query, const CandidateTable& candidates,
                                    const std::string& column, const AcronymDictionary& dictionary,
                                    ScorerKind kind, const RankingOptions& options)
{
    auto scorer = createScorer(kind, options.scorer);
    std::vector<MatchRecord> records = scoreCandidates(query, candidates, column, dictionary, *scorer);

    std::vector<RankedMatch> matches;
    matches.reserve(records.size());
    for (auto& record : records)
    {
        RankedMatch match;
        match.row = record.row;
        match.score = record.score;
        match.phonetic = kind == ScorerKind::Phonetic ? record.score : 0.0;
        match.best_form = std::move(record.best_form);
        matches.push_back(std::move(match));
    }

    sortAndTruncate(matches, options.top_n);
    return matches;
}

std::vector<RankedMatch> rankHybrid(const std::string& query, const CandidateTable& candidates,
                                    const std::string& column, const AcronymDictionary& dictionary,
                                    const RankingOptions& options)
{
    auto ngram_scorer = createScorer(ScorerKind::NGram, options.scorer);
    auto phonetic_scorer = createScorer(ScorerKind::Phonetic, options.scorer);

    std::vector<MatchRecord> ngram = scoreCandidates(query, candidates, column, dictionary, *ngram_scorer);
    std::vector<MatchRecord> phonetic = scoreCandidates(query, candidates, column, dictionary, *phonetic_scorer);

    // Both runs cover the same table in the same order, so joining on row is positional
    std::vector<RankedMatch> matches;
    for (std::size_t i = 0; i < ngram.size() && i < phonetic.size(); ++i)
    {
        if (phonetic[i].score != 1.0)
            continue;

        RankedMatch match;
        match.row = ngram[i].row;
        match.score = ngram[i].score;
        match.phonetic = phonetic[i].score;
        match.best_form = std::move(ngram[i].best_form);
        matches.push_back(std::move(match));
    }

    PLOG_DEBUG_IF_(Diagnostics::kLogInstance, Diagnostics::IsVerbose())
        << "[TopMatches] hybrid gate kept " << matches.size() << " of " << ngram.size() << " candidates";

    sortAndTruncate(matches, options.top_n);
    return matches;
}

} // namespace

std::vector<RankedMatch> rankCandidates(const std::string& query, const CandidateTable& candidates,
                                        const std::string& column, const AcronymDictionary& dictionary,
                                        const RankingOptions& options)
{
    PLOG_DEBUG << "[TopMatches] method=" << toString(options.method) << " top_n=" << options.top_n
               << " candidates=" << candidates.rowCount() << " query=" << Diagnostics::Preview(query);

    if (auto kind = scorerFor(options.method))
    {
        return rankSingle(query, candidates, column, dictionary, *kind, options);
    }
    return rankHybrid(query, candidates, column, dictionary, options);
}

CandidateTable findTopMatches(const std::string& query, const CandidateTable& candidates, const std::string& column,
                              const AcronymDictionary& dictionary, int top_n, MatchMethod method,
                              const ScorerOptions& scorer_options)
{
    RankingOptions options;
    options.top_n = top_n;
    options.method = method;
    options.scorer = scorer_options;

    const std::vector<RankedMatch> matches = rankCandidates(query, candidates, column, dictionary, options);

    std::vector<std::size_t> rows;
    std::vector<CandidateTable::Value> scores;
    std::vector<CandidateTable::Value> phonetic_flags;
    rows.reserve(matches.size());
    for (const auto& match : matches)
    {
        rows.push_back(match.row);
        scores.emplace_back(match.score);
        phonetic_flags.emplace_back(match.phonetic > 0.0 ? 1 : 0);
    }

    CandidateTable result = candidates.selectRows(rows);
    switch (method)
    {
    case MatchMethod::NGram:
        result.setColumn(scoreColumnName(ScorerKind::NGram), std::move(scores));
        break;
    case MatchMethod::Phonetic:
        result.setColumn(scoreColumnName(ScorerKind::Phonetic), std::move(phonetic_flags));
        break;
    case MatchMethod::Levenshtein:
        result.setColumn(scoreColumnName(ScorerKind::Levenshtein), std::move(scores));
        break;
    case MatchMethod::Hybrid:
        result.setColumn(scoreColumnName(ScorerKind::NGram), std::move(scores));
        result.setColumn(scoreColumnName(ScorerKind::Phonetic), std::move(phonetic_flags));
        break;
    }
    return result;
}

CandidateTable findTopMatches(const std::string& query, const CandidateTable& candidates, const std::string& column,
                              const AcronymDictionary& dictionary, int top_n, const std::string& method,
                              const ScorerOptions& scorer_options)
{
    return findTopMatches(query, candidates, column, dictionary, top_n, parseMatchMethod(method), scorer_options);
}

} // namespace matching
