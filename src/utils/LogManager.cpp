#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "../config/MatcherConfig.hpp"
#include "../processing/Diagnostics.hpp"

#include <filesystem>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

namespace
{
constexpr size_t kMaxFileSize = 5 * 1024 * 1024;
constexpr int kBackupCount = 3;
}

bool LogManager::s_initialized = false;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const config::LoggingSettings& settings)
{
    if (s_initialized)
        return true;

    const auto level = static_cast<plog::Severity>(settings.level);
    processing::Diagnostics::SetVerbose(settings.verbose);

    try
    {
        std::vector<plog::IAppender*> sinks;

        if (!settings.file.empty() && PrepareLogDirectory(settings.file))
        {
            auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
                settings.file.c_str(), kMaxFileSize, kBackupCount);
            sinks.push_back(file_appender.get());
            s_appenders.push_back(std::move(file_appender));
        }

        if (settings.console)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>(plog::streamStdErr);
            sinks.push_back(console_appender.get());
            s_appenders.push_back(std::move(console_appender));
        }

        for (auto* sink : sinks)
        {
            plog::init<0>(level, sink);
            // Diagnostics traces are debug records; the channel is opened only when asked for
            plog::init<processing::Diagnostics::kLogInstance>(settings.verbose ? plog::verbose : level, sink);
        }
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to initialize logging", ex.what());
        s_appenders.clear();
        return false;
    }

    s_initialized = true;
    PLOG_INFO << "[LogManager] Logging initialized (level " << plog::severityToString(level) << ")";
    return true;
}

void LogManager::Shutdown()
{
    // plog keeps raw pointers to the appenders; detach before releasing them
    if (auto logger = plog::get<0>())
        logger->setMaxSeverity(plog::none);
    if (auto logger = plog::get<processing::Diagnostics::kLogInstance>())
        logger->setMaxSeverity(plog::none);

    s_appenders.clear();
    s_initialized = false;
}

bool LogManager::PrepareLogDirectory(const std::string& file_path)
{
    std::filesystem::path parent = std::filesystem::path(file_path).parent_path();
    if (parent.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory",
                                     parent.string() + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace utils
