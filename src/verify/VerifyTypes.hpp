#pragma once

#include "../github/ActionsTypes.hpp"

#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace civerify::verify
{

using github::Job;
using github::RepoRef;
using github::RunId;
using github::RunSnapshot;

// Process exit codes, part of the external contract
namespace exit_code
{
inline constexpr int kSuccess = 0;
inline constexpr int kNotGreen = 1;
inline constexpr int kMissingJobs = 2;
inline constexpr int kTimedOut = 3;
inline constexpr int kNotFound = 4;
inline constexpr int kTransport = 5;
inline constexpr int kUsage = 64;
} // namespace exit_code

// Raised when a branch has no runs; terminal, never retried
class NotFoundError : public std::runtime_error
{
public:
    explicit NotFoundError(const std::string& branch)
        : std::runtime_error("No workflow runs found for branch '" + branch + "'.")
        , branch_(branch)
    {
    }

    const std::string& branch() const { return branch_; }

private:
    std::string branch_;
};

// Either an explicit run id or a branch whose latest run is wanted
struct RunSelector
{
    std::optional<RunId> runId;
    std::string branch;

    static RunSelector fromRunId(RunId id) { return RunSelector{ id, {} }; }

    static RunSelector fromBranch(std::string name) { return RunSelector{ std::nullopt, std::move(name) }; }

    bool isExplicit() const { return runId.has_value(); }
};

struct ResolvedRun
{
    RunId id = 0;
    std::string urlHint; // html_url from the runs listing, empty for explicit ids
};

struct PollSettings
{
    std::chrono::seconds timeout{ 1800 };
    std::chrono::seconds interval{ 20 };
};

// Observation emitted for every poll that found the run still running
struct PollProgress
{
    RunId runId = 0;
    std::string status;
    std::optional<std::string> conclusion;
    std::chrono::seconds elapsed{ 0 };
};

struct PollResult
{
    enum class Status
    {
        Completed,
        TimedOut
    };

    Status status = Status::TimedOut;
    std::optional<RunSnapshot> run; // set when Completed
    std::size_t fetches = 0;
    std::chrono::seconds elapsed{ 0 };
};

enum class VerdictKind
{
    Success,
    MissingJobs,
    FailedJobs,
    RunNotSuccessful,
    TimedOut
};

struct FailedJob
{
    std::string name;
    std::string conclusion; // "null" when the job never concluded

    bool operator==(const FailedJob&) const = default;
};

struct Verdict
{
    VerdictKind kind = VerdictKind::Success;
    std::vector<std::string> missingJobs; // required order
    std::vector<FailedJob> failedJobs; // required order, present jobs only

    bool operator==(const Verdict&) const = default;
};

// Everything the reporter needs about one finished invocation
struct Outcome
{
    enum class Kind
    {
        Verdict,
        NotFound,
        TransportFailure
    };

    Kind kind = Kind::Verdict;
    verify::Verdict verdict;
    RunId runId = 0;
    std::optional<RunSnapshot> run; // completed snapshot
    std::string urlHint;
    std::vector<Job> jobs;
    std::string errorMessage; // NotFound / TransportFailure detail
    std::chrono::seconds elapsed{ 0 };
};

struct Report
{
    std::string text;
    int exitCode = exit_code::kSuccess;
};

const char* toString(VerdictKind kind);

} // namespace civerify::verify
