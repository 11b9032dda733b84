#include "VerifySession.hpp"
#include "../github/ActionsErrors.hpp"

#include <plog/Log.h>

namespace civerify::verify
{

const char* toString(VerifySession::State state)
{
    switch (state)
    {
    case VerifySession::State::Resolving:
        return "RESOLVING";
    case VerifySession::State::Polling:
        return "POLLING";
    case VerifySession::State::Evaluating:
        return "EVALUATING";
    case VerifySession::State::Done:
        return "DONE";
    default:
        return "UNKNOWN";
    }
}

VerifySession::VerifySession(github::IActionsClient& client, IClock& clock, VerifyRequest request,
                             PollObserver observer)
    : client_(client)
    , request_(std::move(request))
    , resolver_(client)
    , poller_(client, clock, std::move(observer))
{
}

void VerifySession::step()
{
    const State before = state_;
    try
    {
        switch (state_)
        {
        case State::Resolving:
            resolve();
            break;
        case State::Polling:
            poll();
            break;
        case State::Evaluating:
            evaluate();
            break;
        case State::Done:
            return;
        }
    }
    catch (const NotFoundError& e)
    {
        outcome_.kind = Outcome::Kind::NotFound;
        outcome_.errorMessage = e.what();
        state_ = State::Done;
    }
    catch (const github::TransportError& e)
    {
        outcome_.kind = Outcome::Kind::TransportFailure;
        outcome_.errorMessage = e.what();
        state_ = State::Done;
    }

    PLOG_DEBUG << "Session " << toString(before) << " -> " << toString(state_);
}

const Outcome& VerifySession::run()
{
    while (state_ != State::Done)
    {
        step();
    }
    return outcome_;
}

void VerifySession::resolve()
{
    ResolvedRun resolved = resolver_.resolve(request_.repo, request_.selector);
    outcome_.runId = resolved.id;
    outcome_.urlHint = std::move(resolved.urlHint);
    state_ = State::Polling;
}

void VerifySession::poll()
{
    PollResult result = poller_.awaitCompletion(request_.repo, outcome_.runId, request_.poll);
    outcome_.elapsed = result.elapsed;

    if (result.status == PollResult::Status::TimedOut)
    {
        outcome_.kind = Outcome::Kind::Verdict;
        outcome_.verdict = Verdict{ VerdictKind::TimedOut, {}, {} };
        state_ = State::Done;
        return;
    }

    outcome_.run = std::move(result.run);
    state_ = State::Evaluating;
}

void VerifySession::evaluate()
{
    outcome_.jobs = client_.listJobs(request_.repo, outcome_.runId);
    outcome_.kind = Outcome::Kind::Verdict;
    outcome_.verdict = evaluator_.evaluate(outcome_.jobs, request_.requiredJobs, outcome_.run->conclusion,
                                           request_.requireRunSuccess);

    PLOG_INFO << "Run " << outcome_.runId << " verdict: " << toString(outcome_.verdict.kind);
    state_ = State::Done;
}

} // namespace civerify::verify
