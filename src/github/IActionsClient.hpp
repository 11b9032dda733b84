#pragma once

#include "ActionsTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace civerify::github
{

// Read-only view of the CI provider used by the verification core.
// Implementations throw TransportError when the provider cannot be reached or
// its answer cannot be decoded.
class IActionsClient
{
public:
    virtual ~IActionsClient() = default;

    // Most recent run on the branch, or nullopt if the branch has none
    virtual std::optional<RunSummary> latestRunForBranch(const RepoRef& repo, const std::string& branch) = 0;

    virtual RunSnapshot getRun(const RepoRef& repo, RunId id) = 0;

    // Every job of the run, across all pages
    virtual std::vector<Job> listJobs(const RepoRef& repo, RunId id) = 0;
};

} // namespace civerify::github
