#include "NGramScorer.hpp"
#include "../processing/TextUtils.hpp"

#include <algorithm>

namespace matching
{

NGramScorer::NGramScorer(std::size_t n) : n_(std::max<std::size_t>(n, 1))
{
}

NGramScorer::GramCounts NGramScorer::split(const std::string& text, std::size_t& total) const
{
    const std::u32string pad(n_ - 1, kPadChar);
    const std::u32string padded = pad + processing::utf8ToUtf32(text) + pad;

    GramCounts grams;
    total = 0;
    if (padded.size() < n_)
        return grams;

    for (std::size_t i = 0; i + n_ <= padded.size(); ++i)
    {
        ++grams[padded.substr(i, n_)];
        ++total;
    }
    return grams;
}

double NGramScorer::score(const std::string& a, const std::string& b) const
{
    std::size_t total_a = 0;
    std::size_t total_b = 0;
    const GramCounts grams_a = split(a, total_a);
    const GramCounts grams_b = split(b, total_b);

    std::size_t shared = 0;
    for (const auto& [gram, count] : grams_a)
    {
        auto it = grams_b.find(gram);
        if (it != grams_b.end())
        {
            shared += std::min(count, it->second);
        }
    }

    const std::size_t all = total_a + total_b - shared;
    if (all == 0)
    {
        // Only reachable for n == 1 with two empty strings
        return a == b ? 1.0 : 0.0;
    }

    return static_cast<double>(shared) / static_cast<double>(all);
}

} // namespace matching
