#include "NFKDTextNormalizer.hpp"
#include "TextUtils.hpp"

#include <cstdlib>
#include <utf8proc.h>
#include <plog/Log.h>

namespace processing
{

std::string NFKDTextNormalizer::normalize(const std::string& text) const
{
    if (text.empty())
        return text;

    utf8proc_uint8_t* normalized = utf8proc_NFKD(reinterpret_cast<const utf8proc_uint8_t*>(text.c_str()));

    if (!normalized)
    {
        PLOG_WARNING << "NFKD normalization failed, using input unchanged";
        return text;
    }

    std::string nfkd_normalized(reinterpret_cast<char*>(normalized));
    std::free(normalized);

    return nfkd_normalized;
}

std::string NFKDTextNormalizer::toUpper(const std::string& text) const
{
    if (text.empty())
        return text;

    std::u32string codepoints = utf8ToUtf32(text);
    for (char32_t& cp : codepoints)
    {
        cp = static_cast<char32_t>(utf8proc_toupper(static_cast<utf8proc_int32_t>(cp)));
    }
    return utf32ToUtf8(codepoints);
}

} // namespace processing
