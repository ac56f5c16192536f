#pragma once

#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // Logger setup
    Configuration,  // TOML parsing, invalid config values
    Input,          // Candidate and acronym files
    Matching        // Invalid column or method at the call boundary
};

enum class ErrorSeverity
{
    Warning, // Input was degraded but the run continues
    Error    // The operation failed
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Input;
    ErrorSeverity severity = ErrorSeverity::Error;
    std::string message;
    std::string details;   // Path, parser message, offending value
    std::string timestamp; // Local wall clock, "YYYY-MM-DD HH:MM:SS"
};

/**
 * @brief Collects problems found by the loaders and the CLI
 *
 * Loaders report here instead of throwing. Each report is written to the plog
 * default logger and queued (oldest dropped past kMaxQueued). The CLI drains the
 * queue once, before exiting:
 *
 *   for (const auto& report : ErrorReporter::GetPendingErrors())
 *       std::cerr << ErrorReporter::Format(report) << '\n';
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, const std::string& message, const std::string& details = "");
    static void ReportWarning(ErrorCategory category, const std::string& message, const std::string& details = "");

    /// Returns every queued report, oldest first, and empties the queue.
    static std::vector<ErrorReport> GetPendingErrors();

    /// "[timestamp] [Category] Severity: message (details)"
    static std::string Format(const ErrorReport& report);

    static const char* CategoryToString(ErrorCategory category);
    static const char* SeverityToString(ErrorSeverity severity);

    static constexpr size_t kMaxQueued = 100;

private:
    static void Enqueue(ErrorReport report);
    static std::string CurrentTimestamp();

    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_queue;
};

} // namespace utils
