#include "RunResolver.hpp"

#include <plog/Log.h>

namespace civerify::verify
{

RunResolver::RunResolver(github::IActionsClient& client)
    : client_(client)
{
}

ResolvedRun RunResolver::resolve(const RepoRef& repo, const RunSelector& selector) const
{
    if (selector.isExplicit())
    {
        PLOG_DEBUG << "Using explicit run id " << *selector.runId;
        return ResolvedRun{ *selector.runId, {} };
    }

    PLOG_INFO << "Resolving latest run of " << repo.slug() << " on branch '" << selector.branch << "'";
    auto latest = client_.latestRunForBranch(repo, selector.branch);
    if (!latest)
    {
        throw NotFoundError(selector.branch);
    }

    PLOG_INFO << "Branch '" << selector.branch << "' resolved to run " << latest->id;
    return ResolvedRun{ latest->id, latest->htmlUrl };
}

} // namespace civerify::verify
