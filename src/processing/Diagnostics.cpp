#include "Diagnostics.hpp"

#include <algorithm>

namespace processing
{

std::atomic<bool> Diagnostics::verbose_{ false };
std::atomic<std::size_t> Diagnostics::max_preview_{ 80 };

void Diagnostics::SetVerbose(bool enabled) noexcept
{
    verbose_.store(enabled, std::memory_order_relaxed);
}

bool Diagnostics::IsVerbose() noexcept { return verbose_.load(std::memory_order_relaxed); }

void Diagnostics::SetMaxPreview(std::size_t chars) noexcept
{
    if (chars == 0)
        chars = 1;
    max_preview_.store(chars, std::memory_order_relaxed);
}

std::size_t Diagnostics::MaxPreview() noexcept { return max_preview_.load(std::memory_order_relaxed); }

std::string Diagnostics::Preview(std::string_view text)
{
    const std::size_t limit = MaxPreview();
    std::string out;
    out.reserve(std::min(text.size(), limit) + 16);
    out.push_back('"');

    std::size_t count = 0;
    for (char ch : text)
    {
        if (count >= limit)
        {
            break;
        }
        switch (ch)
        {
        case '\n':
            out += "\\n";
            break;
        case '\t':
            out += "\\t";
            break;
        case '"':
            out += "\\\"";
            break;
        default:
            if (static_cast<unsigned char>(ch) < 0x20)
                out.push_back('?');
            else
                out.push_back(ch);
            break;
        }
        ++count;
    }

    out.push_back('"');
    if (text.size() > limit)
    {
        out += "...(";
        out += std::to_string(text.size());
        out += " bytes)";
    }

    return out;
}

} // namespace processing
