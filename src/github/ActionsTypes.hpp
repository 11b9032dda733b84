#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace civerify::github
{

// GitHub Actions workflow run id
using RunId = std::int64_t;

inline constexpr const char* kStatusCompleted = "completed";
inline constexpr const char* kConclusionSuccess = "success";

// Length of the abbreviated head revision shown in reports
inline constexpr std::size_t kShortShaLength = 7;

// owner/repo pair every API call is scoped to
struct RepoRef
{
    std::string owner;
    std::string repo;

    std::string slug() const { return owner + "/" + repo; }
};

// Top-level state of one workflow run, fetched fresh on every poll
struct RunSnapshot
{
    RunId id = 0;
    std::string status; // queued, in_progress, completed, waiting, ...
    std::optional<std::string> conclusion; // set once status == completed
    std::string headRevision; // first 7 characters of head_sha
    std::string reportUrl; // html_url

    bool isCompleted() const { return status == kStatusCompleted; }
};

// Entry of the runs listing used for branch resolution
struct RunSummary
{
    RunId id = 0;
    std::string htmlUrl;
};

// A job within a run
struct Job
{
    std::string name;
    std::string status;
    std::optional<std::string> conclusion;
};

// One page of /actions/runs/{id}/jobs
struct JobsPage
{
    std::size_t totalCount = 0;
    std::size_t entryCount = 0; // entries on the page, including ones dropped while parsing
    std::vector<Job> jobs;
};

// Renders an optional conclusion the way reports show it
inline std::string conclusionText(const std::optional<std::string>& conclusion)
{
    return conclusion ? *conclusion : std::string("null");
}

} // namespace civerify::github
