#include "PhoneticScorer.hpp"
#include "../processing/NFKDTextNormalizer.hpp"
#include "../processing/TextUtils.hpp"

namespace matching
{

namespace
{

/// Soundex digit for an upper-case letter, or 0 when the character has no digit
char32_t soundexDigit(char32_t cp)
{
    switch (cp)
    {
    case U'B':
    case U'F':
    case U'P':
    case U'V':
        return U'1';
    case U'C':
    case U'G':
    case U'J':
    case U'K':
    case U'Q':
    case U'S':
    case U'X':
    case U'Z':
        return U'2';
    case U'D':
    case U'T':
        return U'3';
    case U'L':
        return U'4';
    case U'M':
    case U'N':
        return U'5';
    case U'R':
        return U'6';
    default:
        return 0;
    }
}

} // namespace

PhoneticScorer::PhoneticScorer() : normalizer_(std::make_unique<processing::NFKDTextNormalizer>())
{
}

PhoneticScorer::~PhoneticScorer() = default;

std::string PhoneticScorer::encode(const std::string& text) const
{
    if (text.empty())
        return {};

    const std::u32string upper = processing::utf8ToUtf32(normalizer_->toUpper(normalizer_->normalize(text)));
    if (upper.empty())
        return {};

    std::u32string code(1, upper.front());
    char32_t last = soundexDigit(upper.front());

    for (std::size_t i = 1; i < upper.size() && code.size() < kCodeLength; ++i)
    {
        const char32_t cp = upper[i];
        const char32_t digit = soundexDigit(cp);
        if (digit != 0)
        {
            if (digit != last)
                code.push_back(digit);
            last = digit;
        }
        else if (cp != U'H' && cp != U'W')
        {
            last = 0;
        }
    }

    code.resize(kCodeLength, U'0');
    return processing::utf32ToUtf8(code);
}

double PhoneticScorer::score(const std::string& a, const std::string& b) const
{
    return encode(a) == encode(b) ? 1.0 : 0.0;
}

} // namespace matching
