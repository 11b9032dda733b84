#pragma once

#include "Clock.hpp"
#include "JobEvaluator.hpp"
#include "RunPoller.hpp"
#include "RunResolver.hpp"
#include "VerifyTypes.hpp"

#include <string>
#include <vector>

namespace civerify::verify
{

struct VerifyRequest
{
    RepoRef repo;
    RunSelector selector;
    std::vector<std::string> requiredJobs;
    PollSettings poll;
    bool requireRunSuccess = true;
};

// One invocation of the gate, driven as an explicit state machine:
//
//   Resolving --(run id)--> Polling --(completed)--> Evaluating --> Done
//       |                      |
//       +--(NotFound)--> Done  +--(deadline)--> Done (TimedOut)
//
// A TransportError in any state moves straight to Done. The resolved run id
// is fixed once Resolving has finished.
class VerifySession
{
public:
    enum class State
    {
        Resolving,
        Polling,
        Evaluating,
        Done
    };

    VerifySession(github::IActionsClient& client, IClock& clock, VerifyRequest request,
                  PollObserver observer = nullptr);

    // Performs exactly one transition; no-op once Done
    void step();

    // Steps until Done and returns the final outcome
    const Outcome& run();

    State state() const { return state_; }

    const Outcome& outcome() const { return outcome_; }

private:
    void resolve();
    void poll();
    void evaluate();

    github::IActionsClient& client_;
    VerifyRequest request_;
    RunResolver resolver_;
    RunPoller poller_;
    JobEvaluator evaluator_;

    State state_ = State::Resolving;
    Outcome outcome_;
};

const char* toString(VerifySession::State state);

} // namespace civerify::verify
