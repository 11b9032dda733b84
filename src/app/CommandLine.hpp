#pragma once

#include "../config/VerifyConfig.hpp"
#include "../github/ActionsTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace civerify::app
{

struct CommandLineOptions
{
    std::optional<std::string> owner;
    std::optional<std::string> repo;
    std::optional<std::string> branch;
    std::optional<github::RunId> runId;
    std::vector<std::string> requiredJobs;
    std::optional<int> timeoutSecs;
    std::optional<int> pollSecs;
    std::optional<std::string> configPath;
    std::optional<std::string> apiUrl;
    std::optional<std::string> logLevel;
    std::optional<std::string> logFile;
    bool ignoreRunConclusion = false;
    bool showHelp = false;
    bool showVersion = false;
};

class CommandLine
{
public:
    // Accepts "--name value" and "--name=value". Returns false with a message on
    // unknown options, missing or malformed values, and selector conflicts.
    static bool parse(int argc, const char* const* argv, CommandLineOptions& out, std::string& outError);

    // Lays command-line values over the loaded configuration
    static bool applyOverrides(const CommandLineOptions& options, config::VerifyConfig& config, std::string& outError);

    static std::string usage(const std::string& programName);
};

} // namespace civerify::app
