#include "RunPoller.hpp"

#include <plog/Log.h>

namespace civerify::verify
{

RunPoller::RunPoller(github::IActionsClient& client, IClock& clock, PollObserver observer)
    : client_(client)
    , clock_(clock)
    , observer_(std::move(observer))
{
}

PollResult RunPoller::awaitCompletion(const RepoRef& repo, RunId runId, const PollSettings& settings) const
{
    PollResult result;
    const auto start = clock_.now();
    auto elapsedSince = [&]() { return std::chrono::duration_cast<std::chrono::seconds>(clock_.now() - start); };

    while (true)
    {
        // Reaching the deadline exactly counts as expired
        if (clock_.now() - start >= settings.timeout)
        {
            result.status = PollResult::Status::TimedOut;
            break;
        }

        RunSnapshot run = client_.getRun(repo, runId);
        ++result.fetches;

        if (run.isCompleted())
        {
            PLOG_INFO << "Run " << runId << " completed with conclusion "
                      << github::conclusionText(run.conclusion) << " after " << result.fetches << " polls";
            result.status = PollResult::Status::Completed;
            result.run = std::move(run);
            break;
        }

        PollProgress progress{ runId, run.status, run.conclusion, elapsedSince() };
        PLOG_DEBUG << "Run " << runId << " still " << run.status << ", sleeping " << settings.interval.count() << "s";
        if (observer_)
        {
            observer_(progress);
        }

        clock_.sleepFor(settings.interval);
    }

    result.elapsed = elapsedSince();
    if (result.status == PollResult::Status::TimedOut)
    {
        PLOG_WARNING << "Run " << runId << " did not complete within " << settings.timeout.count() << "s";
    }
    return result;
}

} // namespace civerify::verify
