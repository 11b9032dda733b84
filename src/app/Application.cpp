#include "Application.hpp"
#include "../config/ConfigManager.hpp"
#include "../github/GitHubActionsClient.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"
#include "../verify/Clock.hpp"
#include "../verify/ResultReporter.hpp"
#include "../verify/VerifySession.hpp"

#include <plog/Log.h>

#include <cstdlib>
#include <iostream>

#ifndef CIVERIFY_VERSION
#define CIVERIFY_VERSION "0.0.0"
#endif

namespace civerify::app
{

namespace
{

constexpr const char* kDefaultConfigPath = "ci-verify.toml";

} // namespace

Application::Application(int argc, char** argv)
    : argc_(argc)
    , argv_(argv)
{
}

Application::~Application() { utils::LogManager::Shutdown(); }

int Application::run()
{
    if (!parseCommandLineArgs())
    {
        return usageError(utils::ErrorReporter::GetLastError().user_message);
    }

    const std::string program = argc_ > 0 ? argv_[0] : "ci-verify";
    if (options_.showHelp)
    {
        std::cout << CommandLine::usage(program);
        return verify::exit_code::kSuccess;
    }
    if (options_.showVersion)
    {
        std::cout << "ci-verify " << CIVERIFY_VERSION << "\n";
        return verify::exit_code::kSuccess;
    }

    if (!initializeConfig())
    {
        return usageError(utils::ErrorReporter::GetLastError().user_message);
    }

    if (!initializeLogging())
    {
        std::cerr << "WARNING: " << utils::ErrorReporter::GetLastError().user_message << "\n";
    }

    // The only read of ambient state; everything below receives the token by value
    return runVerification(readTokenFromEnvironment());
}

std::string Application::readTokenFromEnvironment()
{
    for (const char* name : { "GITHUB_TOKEN", "GH_TOKEN" })
    {
        const char* value = std::getenv(name);
        if (value && *value)
        {
            return value;
        }
    }
    return {};
}

bool Application::parseCommandLineArgs()
{
    std::string error;
    if (!CommandLine::parse(argc_, argv_, options_, error))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::CommandLine, error);
        return false;
    }
    return true;
}

bool Application::initializeConfig()
{
    const bool explicitPath = options_.configPath.has_value();
    config::ConfigManager manager(options_.configPath.value_or(kDefaultConfigPath));

    if (!config_.registerWith(manager))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, manager.lastError());
        return false;
    }

    if (!manager.load(explicitPath))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, manager.lastError());
        return false;
    }

    std::string error;
    if (!CommandLine::applyOverrides(options_, config_, error))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, error);
        return false;
    }
    return true;
}

bool Application::initializeLogging()
{
    utils::LogManager::Options options;
    options.level = config_.logging.level;
    options.filepath = config_.logging.file;
    options.append = config_.logging.append;
    return utils::LogManager::Initialize(options);
}

int Application::runVerification(const std::string& token)
{
    github::ClientConfig clientConfig;
    clientConfig.api_url = config_.github.api_url;
    clientConfig.user_agent = config_.github.user_agent;
    clientConfig.token = token;
    clientConfig.session.connect_timeout_ms = config_.github.connect_timeout_ms;
    clientConfig.session.timeout_ms = config_.github.request_timeout_ms;

    PLOG_INFO << "ci-verify " << CIVERIFY_VERSION << " checking " << config_.github.owner << "/"
              << config_.github.repo << (token.empty() ? " (anonymous)" : " (authenticated)");

    github::GitHubActionsClient client(std::move(clientConfig));
    verify::SteadyClock clock;
    verify::ResultReporter reporter;

    verify::VerifyRequest request;
    request.repo = { config_.github.owner, config_.github.repo };
    request.selector = options_.runId ? verify::RunSelector::fromRunId(*options_.runId)
                                      : verify::RunSelector::fromBranch(*options_.branch);
    request.requiredJobs = config_.effectiveRequiredJobs();
    request.poll.timeout = std::chrono::seconds(config_.verify.timeout_secs);
    request.poll.interval = std::chrono::seconds(config_.verify.poll_secs);
    request.requireRunSuccess = config_.verify.require_run_success;

    verify::VerifySession session(client, clock, std::move(request),
                                  [&reporter](const verify::PollProgress& progress)
                                  { std::cout << reporter.progressLine(progress) << std::endl; });

    const verify::Outcome& outcome = session.run();
    if (outcome.kind == verify::Outcome::Kind::NotFound)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Resolution, outcome.errorMessage);
    }
    else if (outcome.kind == verify::Outcome::Kind::TransportFailure)
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Transport, "GitHub request failed",
                                          outcome.errorMessage);
    }

    verify::Report report = reporter.report(outcome);
    std::cout << report.text << std::flush;
    return report.exitCode;
}

int Application::usageError(const std::string& message)
{
    const std::string program = argc_ > 0 ? argv_[0] : "ci-verify";
    std::cerr << "ERROR: " << message << "\n"
              << "Run '" << program << " --help' for usage.\n";
    return verify::exit_code::kUsage;
}

} // namespace civerify::app
