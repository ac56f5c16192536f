#include "EditDistanceScorer.hpp"
#include "../processing/TextUtils.hpp"

#include <rapidfuzz/fuzz.hpp>

namespace matching
{

double EditDistanceScorer::score(const std::string& a, const std::string& b) const
{
    // Compare code points, not UTF-8 bytes, so one accented letter counts as one edit
    const std::u32string lhs = processing::utf8ToUtf32(a);
    const std::u32string rhs = processing::utf8ToUtf32(b);
    return rapidfuzz::fuzz::ratio(lhs, rhs) / 100.0;
}

} // namespace matching
