#pragma once

#include "VerifyTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace civerify::verify
{

// Compares a completed run's jobs against the required-job set.
//
// Precedence: missing required jobs, then required jobs that did not conclude
// success, then the run-level conclusion (unless requireRunSuccess is false).
// Matching is by exact name; when the provider reports a name twice the last
// entry wins. An empty required set trivially passes the job checks.
class JobEvaluator
{
public:
    Verdict evaluate(const std::vector<Job>& jobs, const std::vector<std::string>& required,
                     const std::optional<std::string>& runConclusion, bool requireRunSuccess = true) const;
};

} // namespace civerify::verify
