#include "ErrorReporter.hpp"

#include <plog/Log.h>

namespace civerify::utils
{

ErrorReport ErrorReporter::s_last;

std::string ErrorReporter::Format(const ErrorReport& report)
{
    std::string line = "[" + std::string(CategoryToString(report.category)) + "] " + report.user_message;
    if (!report.technical_details.empty())
    {
        line += " | " + report.technical_details;
    }
    return line;
}

void ErrorReporter::ReportError(ErrorCategory category, const std::string& user_message,
                                const std::string& technical_details)
{
    s_last = ErrorReport{ category, user_message, technical_details };
    PLOG_ERROR << Format(s_last);
}

void ErrorReporter::ReportWarning(ErrorCategory category, const std::string& user_message,
                                  const std::string& technical_details)
{
    s_last = ErrorReport{ category, user_message, technical_details };
    PLOG_WARNING << Format(s_last);
}

ErrorReport ErrorReporter::GetLastError() { return s_last; }

const char* ErrorReporter::CategoryToString(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "init";
    case ErrorCategory::CommandLine:
        return "cli";
    case ErrorCategory::Configuration:
        return "config";
    case ErrorCategory::Resolution:
        return "resolve";
    case ErrorCategory::Transport:
        return "github";
    default:
        return "unknown";
    }
}

} // namespace civerify::utils
