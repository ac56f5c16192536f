#include "ErrorReporter.hpp"
#include <plog/Log.h>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::deque<ErrorReport> ErrorReporter::s_queue;

void ErrorReporter::ReportError(ErrorCategory category, const std::string& message, const std::string& details)
{
    Enqueue(ErrorReport{ category, ErrorSeverity::Error, message, details, CurrentTimestamp() });
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& message, const std::string& details)
{
    Enqueue(ErrorReport{ category, ErrorSeverity::Warning, message, details, CurrentTimestamp() });
}

void ErrorReporter::Enqueue(ErrorReport report)
{
    const plog::Severity level = report.severity == ErrorSeverity::Warning ? plog::warning : plog::error;
    PLOG(level) << "[" << CategoryToString(report.category) << "] " << report.message
                << (report.details.empty() ? "" : " | Details: ") << report.details;

    std::lock_guard<std::mutex> lock(s_mutex);
    s_queue.push_back(std::move(report));
    while (s_queue.size() > kMaxQueued)
        s_queue.pop_front();
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> drained(std::make_move_iterator(s_queue.begin()), std::make_move_iterator(s_queue.end()));
    s_queue.clear();
    return drained;
}

std::string ErrorReporter::Format(const ErrorReport& report)
{
    std::ostringstream line;
    line << "[" << report.timestamp << "] [" << CategoryToString(report.category) << "] "
         << SeverityToString(report.severity) << ": " << report.message;
    if (!report.details.empty())
        line << " (" << report.details << ")";
    return line.str();
}

const char* ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Input:
        return "Input";
    case ErrorCategory::Matching:
        return "Matching";
    }
    return "Unknown";
}

const char* ErrorReporter::SeverityToString(ErrorSeverity severity)
{
    return severity == ErrorSeverity::Warning ? "Warning" : "Error";
}

std::string ErrorReporter::CurrentTimestamp()
{
    const std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm local{};
#ifdef _WIN32
    localtime_s(&local, &now);
#else
    localtime_r(&now, &local);
#endif
    std::ostringstream ss;
    ss << std::put_time(&local, "%Y-%m-%d %H:%M:%S");
    return ss.str();
}

} // namespace utils
