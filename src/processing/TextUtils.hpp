#pragma once

#include <string>
#include <vector>

namespace processing
{

inline constexpr char32_t kReplacementChar = U'\uFFFD';

/// UTF-8 to UTF-32 conversion. Each byte that does not start a valid sequence
/// becomes kReplacementChar; decoding resumes at the following byte.
std::u32string utf8ToUtf32(const std::string& utf8_str);

/// UTF-32 to UTF-8 conversion
std::string utf32ToUtf8(const std::u32string& utf32_str);

/// ASCII whitespace plus Unicode space/line/paragraph separators
bool isWhitespaceChar(char32_t cp);

/// Split on runs of whitespace. Leading and trailing whitespace yields no empty words.
std::vector<std::string> splitWords(const std::string& text);

/// Join words with a single ASCII space
std::string joinWords(const std::vector<std::string>& words);

} // namespace processing
