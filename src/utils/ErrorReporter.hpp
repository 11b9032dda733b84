#pragma once

#include <string>

namespace civerify::utils {

enum class ErrorCategory
{
    Initialization, // logging, startup
    CommandLine,    // invalid or conflicting arguments
    Configuration,  // TOML parsing, invalid config values
    Resolution,     // branch has no runs
    Transport       // GitHub API failures
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Initialization;
    std::string user_message;      // One-line message printed for the caller
    std::string technical_details; // Extra context, log only
};

/**
 * @brief Categorized diagnostics on top of plog
 *
 * Every report goes to the log. The most recent one is remembered so the
 * application can print it on its single ERROR/WARNING line before exiting.
 *
 * Usage:
 *   ErrorReporter::ReportError(ErrorCategory::Configuration,
 *                              "[verify] 'poll_secs' must be greater than 0, got -5");
 *   std::cerr << "ERROR: " << ErrorReporter::GetLastError().user_message << '\n';
 */
class ErrorReporter
{
public:
    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "");

    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "");

    // Empty user_message when nothing has been reported yet
    static ErrorReport GetLastError();

    static const char* CategoryToString(ErrorCategory category);

private:
    static std::string Format(const ErrorReport& report);

    static ErrorReport s_last;
};

} // namespace civerify::utils
