#include "ResultReporter.hpp"

#include <sstream>

namespace civerify::verify
{

const char* toString(VerdictKind kind)
{
    switch (kind)
    {
    case VerdictKind::Success:
        return "Success";
    case VerdictKind::MissingJobs:
        return "MissingJobs";
    case VerdictKind::FailedJobs:
        return "FailedJobs";
    case VerdictKind::RunNotSuccessful:
        return "RunNotSuccessful";
    case VerdictKind::TimedOut:
        return "TimedOut";
    default:
        return "Unknown";
    }
}

int ResultReporter::exitCodeFor(const Outcome& outcome)
{
    switch (outcome.kind)
    {
    case Outcome::Kind::NotFound:
        return exit_code::kNotFound;
    case Outcome::Kind::TransportFailure:
        return exit_code::kTransport;
    case Outcome::Kind::Verdict:
        break;
    }

    switch (outcome.verdict.kind)
    {
    case VerdictKind::Success:
        return exit_code::kSuccess;
    case VerdictKind::FailedJobs:
    case VerdictKind::RunNotSuccessful:
        return exit_code::kNotGreen;
    case VerdictKind::MissingJobs:
        return exit_code::kMissingJobs;
    case VerdictKind::TimedOut:
        return exit_code::kTimedOut;
    }
    return exit_code::kNotGreen;
}

std::string ResultReporter::progressLine(const PollProgress& progress) const
{
    std::ostringstream oss;
    oss << "waiting: run_id=" << progress.runId << " status=" << progress.status
        << " conclusion=" << github::conclusionText(progress.conclusion) << " elapsed=" << progress.elapsed.count()
        << "s";
    return oss.str();
}

std::string ResultReporter::summaryLines(const Outcome& outcome)
{
    std::ostringstream oss;
    std::string url = outcome.urlHint;
    if (outcome.run)
    {
        const RunSnapshot& run = *outcome.run;
        oss << "run_id=" << run.id << " sha=" << run.headRevision << " status=" << run.status
            << " conclusion=" << github::conclusionText(run.conclusion) << "\n";
        if (!run.reportUrl.empty())
        {
            url = run.reportUrl;
        }
    }
    else
    {
        oss << "run_id=" << outcome.runId << "\n";
    }

    if (!url.empty())
    {
        oss << "url=" << url << "\n";
    }
    return oss.str();
}

std::string ResultReporter::jobListing(const Outcome& outcome)
{
    std::ostringstream oss;
    for (const auto& job : outcome.jobs)
    {
        oss << "- " << job.name << " | " << job.status << " | " << github::conclusionText(job.conclusion) << "\n";
    }
    return oss.str();
}

Report ResultReporter::report(const Outcome& outcome) const
{
    Report result;
    result.exitCode = exitCodeFor(outcome);

    std::ostringstream oss;
    switch (outcome.kind)
    {
    case Outcome::Kind::NotFound:
        oss << "ERROR: " << outcome.errorMessage << "\n";
        result.text = oss.str();
        return result;
    case Outcome::Kind::TransportFailure:
        oss << "ERROR: GitHub request failed: " << outcome.errorMessage << "\n";
        result.text = oss.str();
        return result;
    case Outcome::Kind::Verdict:
        break;
    }

    const Verdict& verdict = outcome.verdict;
    if (verdict.kind == VerdictKind::TimedOut)
    {
        oss << "ERROR: timed out waiting for run " << outcome.runId << " to complete (waited "
            << outcome.elapsed.count() << "s).\n";
        result.text = oss.str();
        return result;
    }

    oss << summaryLines(outcome);

    auto writeFailed = [&]()
    {
        if (verdict.failedJobs.empty())
            return;
        oss << "Required jobs not successful:\n";
        for (const auto& failed : verdict.failedJobs)
        {
            oss << "  - " << failed.name << ": " << failed.conclusion << "\n";
        }
    };

    switch (verdict.kind)
    {
    case VerdictKind::Success:
        oss << "OK: CI is green and all required jobs succeeded.\n";
        break;
    case VerdictKind::MissingJobs:
        oss << "ERROR: missing required jobs:\n";
        for (const auto& name : verdict.missingJobs)
        {
            oss << "  - " << name << "\n";
        }
        writeFailed();
        oss << "\nJobs seen:\n" << jobListing(outcome);
        break;
    case VerdictKind::FailedJobs:
    case VerdictKind::RunNotSuccessful:
        oss << "ERROR: CI not green.\n";
        writeFailed();
        oss << "\nJobs:\n" << jobListing(outcome);
        break;
    case VerdictKind::TimedOut:
        break;
    }

    result.text = oss.str();
    return result;
}

} // namespace civerify::verify
