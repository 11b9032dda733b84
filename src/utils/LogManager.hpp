#pragma once

#include <plog/Severity.h>

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace plog
{
class IAppender;
}

namespace civerify::utils
{

// Owns the appenders behind the default plog instance. Diagnostics always go
// to stderr; stdout is reserved for the verification report.
class LogManager
{
public:
    struct Options
    {
        plog::Severity level = plog::warning;
        std::string filepath; // empty = stderr only
        bool append = true;
        std::size_t max_file_size = 10 * 1024 * 1024;
        int backup_count = 3;
    };

    static bool Initialize(const Options& options);

    // Mutes the logger before releasing its appenders
    static void Shutdown();

    static bool PrepareLogDirectory(const std::string& filepath);

    // Accepts none, fatal, error, warning/warn, info, debug, verbose (case-insensitive)
    static bool TryParseSeverity(const std::string& name, plog::Severity& out);

private:
    LogManager() = default;

    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace civerify::utils
