#pragma once

#include <plog/Severity.h>

#include <string>
#include <vector>

namespace civerify::config
{

class ConfigManager;

struct GitHubSettings
{
    std::string owner;
    std::string repo;
    std::string api_url = "https://api.github.com";
    std::string user_agent = "ci-verify";
    int connect_timeout_ms = 10000;
    int request_timeout_ms = 30000;
};

struct VerifySettings
{
    std::vector<std::string> required_jobs; // empty = built-in default list
    int timeout_secs = 1800;
    int poll_secs = 20;
    bool require_run_success = true;
};

struct LoggingSettings
{
    plog::Severity level = plog::warning;
    std::string file; // empty = stderr only
    bool append = true;
};

// All tunables of one invocation. Defaults live here; the TOML file and then
// the command line override them.
struct VerifyConfig
{
    GitHubSettings github;
    VerifySettings verify;
    LoggingSettings logging;

    // The project's standard gating jobs
    static const std::vector<std::string>& DefaultRequiredJobs();

    std::vector<std::string> effectiveRequiredJobs() const;

    // Registers the [github], [verify] and [logging] sections
    bool registerWith(ConfigManager& manager);

    bool validate(std::string& outError) const;
};

} // namespace civerify::config
