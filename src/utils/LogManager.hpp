#pragma once

#include <memory>
#include <string>
#include <vector>

namespace plog
{
class IAppender;
}

namespace config
{
struct LoggingSettings;
}

namespace utils
{

/// Owns the plog appenders. The default logger (instance 0) and the diagnostics
/// channel (processing::Diagnostics::kLogInstance) share the same sinks.
class LogManager
{
public:
    static bool Initialize(const config::LoggingSettings& settings);

    static void Shutdown();

private:
    LogManager() = default;

    static bool PrepareLogDirectory(const std::string& file_path);

    static bool s_initialized;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
