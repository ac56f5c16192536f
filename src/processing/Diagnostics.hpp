#pragma once

#include <atomic>
#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

/// Verbose trace channel for matching runs. Records go to plog instance kLogInstance,
/// which LogManager wires to the same sink as the main log.
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    static void SetMaxPreview(std::size_t chars) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    /// Single-line, clipped rendering of candidate text for log records.
    [[nodiscard]] static std::string Preview(std::string_view text);

private:
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
};

} // namespace processing
