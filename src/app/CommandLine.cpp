#include "CommandLine.hpp"
#include "../utils/LogManager.hpp"

#include <charconv>
#include <sstream>

namespace civerify::app
{

namespace
{

template <typename T>
bool parsePositive(const std::string& text, T& out)
{
    if (text.empty())
        return false;
    T value{};
    const char* first = text.data();
    const char* last = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, value);
    if (ec != std::errc() || ptr != last || value <= 0)
        return false;
    out = value;
    return true;
}

} // namespace

bool CommandLine::parse(int argc, const char* const* argv, CommandLineOptions& out, std::string& outError)
{
    CommandLineOptions options;

    for (int i = 1; i < argc; ++i)
    {
        std::string arg = argv[i];
        std::optional<std::string> inlineValue;

        if (arg.rfind("--", 0) == 0)
        {
            auto eq = arg.find('=');
            if (eq != std::string::npos)
            {
                inlineValue = arg.substr(eq + 1);
                arg = arg.substr(0, eq);
            }
        }

        auto takeValue = [&](std::string& value) -> bool
        {
            if (inlineValue)
            {
                value = *inlineValue;
                return true;
            }
            if (i + 1 >= argc)
            {
                outError = arg + " requires a value";
                return false;
            }
            value = argv[++i];
            return true;
        };

        auto takeString = [&](std::optional<std::string>& target) -> bool
        {
            std::string value;
            if (!takeValue(value))
                return false;
            if (value.empty())
            {
                outError = arg + " must not be empty";
                return false;
            }
            target = std::move(value);
            return true;
        };

        auto takeSeconds = [&](std::optional<int>& target) -> bool
        {
            std::string value;
            if (!takeValue(value))
                return false;
            int seconds = 0;
            if (!parsePositive(value, seconds))
            {
                outError = arg + " expects a positive integer, got '" + value + "'";
                return false;
            }
            target = seconds;
            return true;
        };

        if (arg == "-h" || arg == "--help")
        {
            options.showHelp = true;
        }
        else if (arg == "--version")
        {
            options.showVersion = true;
        }
        else if (arg == "--owner")
        {
            if (!takeString(options.owner))
                return false;
        }
        else if (arg == "--repo")
        {
            if (!takeString(options.repo))
                return false;
        }
        else if (arg == "--branch")
        {
            if (!takeString(options.branch))
                return false;
        }
        else if (arg == "--run-id")
        {
            std::string value;
            if (!takeValue(value))
                return false;
            github::RunId id = 0;
            if (!parsePositive(value, id))
            {
                outError = "--run-id expects a positive integer, got '" + value + "'";
                return false;
            }
            options.runId = id;
        }
        else if (arg == "--required-job")
        {
            std::optional<std::string> name;
            if (!takeString(name))
                return false;
            options.requiredJobs.push_back(*name);
        }
        else if (arg == "--timeout-secs")
        {
            if (!takeSeconds(options.timeoutSecs))
                return false;
        }
        else if (arg == "--poll-secs")
        {
            if (!takeSeconds(options.pollSecs))
                return false;
        }
        else if (arg == "--config")
        {
            if (!takeString(options.configPath))
                return false;
        }
        else if (arg == "--api-url")
        {
            if (!takeString(options.apiUrl))
                return false;
        }
        else if (arg == "--log-level")
        {
            if (!takeString(options.logLevel))
                return false;
        }
        else if (arg == "--log-file")
        {
            if (!takeString(options.logFile))
                return false;
        }
        else if (arg == "--ignore-run-conclusion")
        {
            options.ignoreRunConclusion = true;
        }
        else
        {
            outError = "unknown argument '" + arg + "'";
            return false;
        }

        if (inlineValue && (arg == "--ignore-run-conclusion" || arg == "--help" || arg == "--version"))
        {
            outError = arg + " does not take a value";
            return false;
        }
    }

    if (!options.showHelp && !options.showVersion)
    {
        if (options.branch && options.runId)
        {
            outError = "--branch and --run-id are mutually exclusive";
            return false;
        }
        if (!options.branch && !options.runId)
        {
            outError = "one of --branch or --run-id is required";
            return false;
        }
    }

    out = std::move(options);
    return true;
}

bool CommandLine::applyOverrides(const CommandLineOptions& options, config::VerifyConfig& config,
                                 std::string& outError)
{
    if (options.owner)
        config.github.owner = *options.owner;
    if (options.repo)
        config.github.repo = *options.repo;
    if (options.apiUrl)
        config.github.api_url = *options.apiUrl;
    if (!options.requiredJobs.empty())
        config.verify.required_jobs = options.requiredJobs;
    if (options.timeoutSecs)
        config.verify.timeout_secs = *options.timeoutSecs;
    if (options.pollSecs)
        config.verify.poll_secs = *options.pollSecs;
    if (options.ignoreRunConclusion)
        config.verify.require_run_success = false;
    if (options.logFile)
        config.logging.file = *options.logFile;

    if (options.logLevel && !utils::LogManager::TryParseSeverity(*options.logLevel, config.logging.level))
    {
        outError = "unknown log level '" + *options.logLevel + "'";
        return false;
    }

    return config.validate(outError);
}

std::string CommandLine::usage(const std::string& programName)
{
    std::ostringstream oss;
    oss << "Usage: " << programName << " --owner OWNER --repo REPO (--branch BRANCH | --run-id ID) [options]\n"
        << "\n"
        << "Wait for a GitHub Actions run to finish and check that its required jobs succeeded.\n"
        << "\n"
        << "Options:\n"
        << "  --owner OWNER            Repository owner\n"
        << "  --repo REPO              Repository name\n"
        << "  --branch BRANCH          Check the latest run on BRANCH\n"
        << "  --run-id ID              Check the run with this id\n"
        << "  --required-job NAME      Job that must conclude success (repeatable)\n"
        << "  --timeout-secs N         Max seconds to wait for completion (default: 1800)\n"
        << "  --poll-secs N            Polling interval in seconds (default: 20)\n"
        << "  --ignore-run-conclusion  Only judge the required jobs, not the run conclusion\n"
        << "  --config PATH            TOML config file (default: ./ci-verify.toml if present)\n"
        << "  --api-url URL            GitHub API base URL (default: https://api.github.com)\n"
        << "  --log-level LEVEL        none, fatal, error, warning, info, debug, verbose\n"
        << "  --log-file PATH          Also write diagnostics to PATH\n"
        << "  -h, --help               Show this help message\n"
        << "  --version                Show version\n"
        << "\n"
        << "Environment:\n"
        << "  GITHUB_TOKEN, GH_TOKEN   Bearer token for higher API rate limits\n"
        << "\n"
        << "Exit codes:\n"
        << "  0 green, 1 not green, 2 required job missing, 3 timed out,\n"
        << "  4 no runs for branch, 5 GitHub request failed, 64 usage error\n";
    return oss.str();
}

} // namespace civerify::app
