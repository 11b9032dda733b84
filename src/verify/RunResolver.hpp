#pragma once

#include "VerifyTypes.hpp"
#include "../github/IActionsClient.hpp"

namespace civerify::verify
{

// Picks the run to monitor: explicit ids pass through untouched, branches
// resolve to their most recent run.
class RunResolver
{
public:
    explicit RunResolver(github::IActionsClient& client);

    // Throws NotFoundError when the branch has no runs, TransportError on API failure
    ResolvedRun resolve(const RepoRef& repo, const RunSelector& selector) const;

private:
    github::IActionsClient& client_;
};

} // namespace civerify::verify
