#pragma once

#include "HttpCommon.hpp"
#include "IActionsClient.hpp"

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace civerify::github
{

struct ClientConfig
{
    std::string api_url = "https://api.github.com";
    std::string user_agent = "ci-verify";
    std::string token; // empty = anonymous requests
    SessionConfig session;
};

// Transport used by the client; defaults to the cpr-backed github::get
using HttpGetFunction =
    std::function<HttpResponse(const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg)>;

// GitHub Actions REST API client
class GitHubActionsClient : public IActionsClient
{
public:
    explicit GitHubActionsClient(ClientConfig config, HttpGetFunction httpGet = nullptr);
    ~GitHubActionsClient() override;

    GitHubActionsClient(const GitHubActionsClient&) = delete;
    GitHubActionsClient& operator=(const GitHubActionsClient&) = delete;

    std::optional<RunSummary> latestRunForBranch(const RepoRef& repo, const std::string& branch) override;
    RunSnapshot getRun(const RepoRef& repo, RunId id) override;
    std::vector<Job> listJobs(const RepoRef& repo, RunId id) override;

    // Page size used for the jobs listing (GitHub caps it at 100)
    static constexpr int kJobsPerPage = 100;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace civerify::github
