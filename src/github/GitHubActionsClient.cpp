#include "GitHubActionsClient.hpp"
#include "ActionsErrors.hpp"
#include "ActionsParser.hpp"

#include <plog/Log.h>

#include <iterator>

namespace civerify::github
{

struct GitHubActionsClient::Impl
{
    ClientConfig config;
    HttpGetFunction httpGet;
    ActionsParser parser;

    Impl(ClientConfig c, HttpGetFunction fn)
        : config(std::move(c))
        , httpGet(std::move(fn))
    {
        while (!config.api_url.empty() && config.api_url.back() == '/')
        {
            config.api_url.pop_back();
        }
        if (!httpGet)
        {
            httpGet = [](const std::string& url, const std::vector<Header>& headers, const SessionConfig& cfg)
            { return github::get(url, headers, cfg); };
        }
    }

    std::string repoUrl(const RepoRef& repo) const
    {
        return config.api_url + "/repos/" + url_escape(repo.owner) + "/" + url_escape(repo.repo);
    }

    std::vector<Header> headers() const
    {
        std::vector<Header> h{
            { "Accept", "application/vnd.github+json" },
            { "User-Agent", config.user_agent },
            { "X-GitHub-Api-Version", "2022-11-28" },
        };
        if (!config.token.empty())
        {
            h.push_back({ "Authorization", "Bearer " + config.token });
        }
        return h;
    }

    // Performs the GET and throws TransportError for anything but a 2xx answer
    std::string fetch(const std::string& url) const
    {
        PLOG_DEBUG << "GET " << url;
        HttpResponse response = httpGet(url, headers(), config.session);

        if (!response.error.empty())
        {
            throw TransportError("network error for " + url + ": " + response.error);
        }

        if (!response.ok())
        {
            std::string message = "HTTP " + std::to_string(response.status_code) + " for " + url;
            std::string detail = ActionsParser::errorMessage(response.text);
            if (!detail.empty())
            {
                message += " (" + detail + ")";
            }

            bool limited = (response.status_code == 403 || response.status_code == 429) &&
                           response.header("x-ratelimit-remaining") == "0";
            if (limited)
            {
                message += "; API rate limit exhausted";
                if (config.token.empty())
                {
                    message += ", set GITHUB_TOKEN or GH_TOKEN for a higher limit";
                }
            }
            throw TransportError(message, response.status_code);
        }

        return std::move(response.text);
    }
};

GitHubActionsClient::GitHubActionsClient(ClientConfig config, HttpGetFunction httpGet)
    : impl_(std::make_unique<Impl>(std::move(config), std::move(httpGet)))
{
}

GitHubActionsClient::~GitHubActionsClient() = default;

std::optional<RunSummary> GitHubActionsClient::latestRunForBranch(const RepoRef& repo, const std::string& branch)
{
    const std::string url = impl_->repoUrl(repo) + "/actions/runs?branch=" + url_escape(branch) + "&per_page=1";
    const std::string body = impl_->fetch(url);

    std::vector<RunSummary> runs;
    std::string error;
    if (!impl_->parser.parseRunList(body, runs, error))
    {
        throw TransportError("unexpected runs listing from " + url + ": " + error);
    }

    if (runs.empty())
    {
        return std::nullopt;
    }
    return runs.front();
}

RunSnapshot GitHubActionsClient::getRun(const RepoRef& repo, RunId id)
{
    const std::string url = impl_->repoUrl(repo) + "/actions/runs/" + std::to_string(id);
    const std::string body = impl_->fetch(url);

    RunSnapshot run;
    std::string error;
    if (!impl_->parser.parseRun(body, run, error))
    {
        throw TransportError("unexpected run payload from " + url + ": " + error);
    }
    return run;
}

std::vector<Job> GitHubActionsClient::listJobs(const RepoRef& repo, RunId id)
{
    const std::string base =
        impl_->repoUrl(repo) + "/actions/runs/" + std::to_string(id) + "/jobs?per_page=" + std::to_string(kJobsPerPage);

    std::vector<Job> jobs;
    for (int page = 1;; ++page)
    {
        const std::string url = base + "&page=" + std::to_string(page);
        const std::string body = impl_->fetch(url);

        JobsPage jobsPage;
        std::string error;
        if (!impl_->parser.parseJobsPage(body, jobsPage, error))
        {
            throw TransportError("unexpected jobs listing from " + url + ": " + error);
        }

        // Short-page detection uses the raw entry count, skipped entries included
        const std::size_t received = jobsPage.entryCount;
        jobs.insert(jobs.end(), std::make_move_iterator(jobsPage.jobs.begin()),
                    std::make_move_iterator(jobsPage.jobs.end()));

        if (received == 0 || received < static_cast<std::size_t>(kJobsPerPage) ||
            (jobsPage.totalCount > 0 && jobs.size() >= jobsPage.totalCount))
        {
            break;
        }
    }

    PLOG_DEBUG << "Run " << id << " has " << jobs.size() << " jobs";
    return jobs;
}

} // namespace civerify::github
