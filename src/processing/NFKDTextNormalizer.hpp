#pragma once

#include "ITextNormalizer.hpp"

namespace processing
{

class NFKDTextNormalizer : public ITextNormalizer
{
public:
    NFKDTextNormalizer() = default;
    ~NFKDTextNormalizer() override = default;

    NFKDTextNormalizer(const NFKDTextNormalizer&) = delete;
    NFKDTextNormalizer& operator=(const NFKDTextNormalizer&) = delete;

    [[nodiscard]] std::string normalize(const std::string& text) const override;
    [[nodiscard]] std::string toUpper(const std::string& text) const override;
};

} // namespace processing
