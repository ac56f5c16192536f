#pragma once

#include <string>

namespace processing
{

class ITextNormalizer
{
public:
    virtual ~ITextNormalizer() = default;

    // Unicode compatibility decomposition (accents split off their base letters)
    [[nodiscard]] virtual std::string normalize(const std::string& text) const = 0;

    // Full Unicode upper-casing, code point by code point
    [[nodiscard]] virtual std::string toUpper(const std::string& text) const = 0;
};

} // namespace processing
