#include "TextUtils.hpp"
#include <utf8proc.h>

namespace processing
{

std::u32string utf8ToUtf32(const std::string& utf8_str)
{
    std::u32string result;
    if (utf8_str.empty())
        return result;
    
    const utf8proc_uint8_t* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.c_str());
    utf8proc_ssize_t len = static_cast<utf8proc_ssize_t>(utf8_str.size());
    
    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            // Invalid sequence: substitute and resync on the next byte
            result.push_back(kReplacementChar);
            ++pos;
            continue;
        }
        result.push_back(static_cast<char32_t>(codepoint));
        pos += bytes;
    }
    return result;
}

std::string utf32ToUtf8(const std::u32string& utf32_str)
{
    std::string result;
    for (char32_t cp : utf32_str)
    {
        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (bytes > 0)
        {
            result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
        }
    }
    return result;
}

bool isWhitespaceChar(char32_t cp)
{
    switch (cp)
    {
    case U' ':
    case U'\t':
    case U'\n':
    case U'\v':
    case U'\f':
    case U'\r':
    case U'\u001C':
    case U'\u001D':
    case U'\u001E':
    case U'\u001F':
    case U'\u0085':
        return true;
    default:
        break;
    }

    if (cp < 0x80)
        return false;

    utf8proc_category_t category = utf8proc_category(static_cast<utf8proc_int32_t>(cp));
    return category == UTF8PROC_CATEGORY_ZS || category == UTF8PROC_CATEGORY_ZL ||
           category == UTF8PROC_CATEGORY_ZP;
}

std::vector<std::string> splitWords(const std::string& text)
{
    std::vector<std::string> words;
    std::u32string current;

    for (char32_t cp : utf8ToUtf32(text))
    {
        if (isWhitespaceChar(cp))
        {
            if (!current.empty())
            {
                words.push_back(utf32ToUtf8(current));
                current.clear();
            }
        }
        else
        {
            current.push_back(cp);
        }
    }

    if (!current.empty())
        words.push_back(utf32ToUtf8(current));

    return words;
}

std::string joinWords(const std::vector<std::string>& words)
{
    std::string result;
    for (size_t i = 0; i < words.size(); ++i)
    {
        if (i > 0)
            result += ' ';
        result += words[i];
    }
    return result;
}

} // namespace processing
