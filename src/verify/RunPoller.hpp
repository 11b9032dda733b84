#pragma once

#include "Clock.hpp"
#include "VerifyTypes.hpp"
#include "../github/IActionsClient.hpp"

#include <functional>

namespace civerify::verify
{

using PollObserver = std::function<void(const PollProgress&)>;

// Fixed-interval poll of a run's top-level state until it completes or the
// deadline expires. The deadline is checked only at the top of an iteration,
// so an in-flight fetch or sleep is never cut short.
class RunPoller
{
public:
    RunPoller(github::IActionsClient& client, IClock& clock, PollObserver observer = nullptr);

    // TransportError from the client propagates unchanged
    PollResult awaitCompletion(const RepoRef& repo, RunId runId, const PollSettings& settings) const;

private:
    github::IActionsClient& client_;
    IClock& clock_;
    PollObserver observer_;
};

} // namespace civerify::verify
