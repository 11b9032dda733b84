#include "JobEvaluator.hpp"

#include <unordered_map>

namespace civerify::verify
{

namespace
{

std::unordered_map<std::string, const Job*> indexByName(const std::vector<Job>& jobs)
{
    std::unordered_map<std::string, const Job*> lookup;
    for (const auto& job : jobs)
    {
        lookup[job.name] = &job;
    }
    return lookup;
}

} // namespace

Verdict JobEvaluator::evaluate(const std::vector<Job>& jobs, const std::vector<std::string>& required,
                               const std::optional<std::string>& runConclusion, bool requireRunSuccess) const
{
    const auto lookup = indexByName(jobs);

    Verdict verdict;
    for (const auto& name : required)
    {
        auto it = lookup.find(name);
        if (it == lookup.end())
        {
            verdict.missingJobs.push_back(name);
            continue;
        }

        const Job& job = *it->second;
        if (job.conclusion != github::kConclusionSuccess)
        {
            verdict.failedJobs.push_back({ name, github::conclusionText(job.conclusion) });
        }
    }

    if (!verdict.missingJobs.empty())
    {
        verdict.kind = VerdictKind::MissingJobs;
    }
    else if (!verdict.failedJobs.empty())
    {
        verdict.kind = VerdictKind::FailedJobs;
    }
    else if (requireRunSuccess && runConclusion != github::kConclusionSuccess)
    {
        verdict.kind = VerdictKind::RunNotSuccessful;
    }
    else
    {
        verdict.kind = VerdictKind::Success;
    }
    return verdict;
}

} // namespace civerify::verify
