#pragma once

#include "ActionsTypes.hpp"

#include <string>
#include <vector>

namespace civerify::github
{

// Parser for GitHub Actions REST payloads
class ActionsParser
{
public:
    ActionsParser() = default;
    ~ActionsParser() = default;

    // Parse a single run object (GET /actions/runs/{id})
    bool parseRun(const std::string& jsonContent, RunSnapshot& outRun, std::string& outError) const;

    // Parse the "workflow_runs" array of a runs listing, newest first
    bool parseRunList(const std::string& jsonContent, std::vector<RunSummary>& outRuns, std::string& outError) const;

    // Parse one page of a jobs listing
    bool parseJobsPage(const std::string& jsonContent, JobsPage& outPage, std::string& outError) const;

    // Extract the "message" field of a GitHub error body, empty if absent
    static std::string errorMessage(const std::string& jsonContent);
};

} // namespace civerify::github
