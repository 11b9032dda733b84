#include <catch2/catch_test_macros.hpp>

#include "verify/VerifySession.hpp"
#include "verify/ResultReporter.hpp"
#include "../utils/fake_actions.hpp"

#include <string>
#include <vector>

using namespace civerify::verify;
using namespace std::chrono_literals;
using test_utils::FakeActionsClient;
using test_utils::FakeClock;

namespace {

VerifyRequest branchRequest(std::vector<std::string> required) {
    VerifyRequest request;
    request.repo = RepoRef{"acme", "widget"};
    request.selector = RunSelector::fromBranch("main");
    request.requiredJobs = std::move(required);
    request.poll = PollSettings{60s, 20s};
    return request;
}

}  // namespace

TEST_CASE("VerifySession - state transitions", "[verify][session]") {
    FakeActionsClient client;
    FakeClock clock;
    client.latestRun = civerify::github::RunSummary{42, "https://github.com/acme/widget/actions/runs/42"};
    client.snapshots = {
        FakeActionsClient::snapshot("in_progress"),
        FakeActionsClient::snapshot("completed", "success"),
    };
    client.jobs = {FakeActionsClient::job("build")};

    VerifySession session(client, clock, branchRequest({"build"}));
    REQUIRE(session.state() == VerifySession::State::Resolving);

    SECTION("Each step performs a single transition") {
        session.step();
        REQUIRE(session.state() == VerifySession::State::Polling);
        REQUIRE(session.outcome().runId == 42);
        REQUIRE(client.runFetches == 0);

        session.step();
        REQUIRE(session.state() == VerifySession::State::Evaluating);
        REQUIRE(client.runFetches == 2);
        REQUIRE(client.jobFetches == 0);

        session.step();
        REQUIRE(session.state() == VerifySession::State::Done);
        REQUIRE(client.jobFetches == 1);
        REQUIRE(session.outcome().verdict.kind == VerdictKind::Success);

        // Done is absorbing
        session.step();
        REQUIRE(session.state() == VerifySession::State::Done);
        REQUIRE(client.jobFetches == 1);
    }

    SECTION("Resolved id stays fixed for every poll") {
        session.run();
        REQUIRE(client.fetchedIds == std::vector<civerify::github::RunId>{42, 42});
    }

    SECTION("State names") {
        REQUIRE(std::string(toString(VerifySession::State::Resolving)) == "RESOLVING");
        REQUIRE(std::string(toString(VerifySession::State::Done)) == "DONE");
    }
}

TEST_CASE("VerifySession - end to end outcomes", "[verify][session]") {
    FakeActionsClient client;
    FakeClock clock;
    ResultReporter reporter;
    client.latestRun = civerify::github::RunSummary{42, "https://github.com/acme/widget/actions/runs/42"};

    SECTION("Green run with all required jobs exits 0") {
        client.snapshots = {FakeActionsClient::snapshot("completed", "success")};
        client.jobs = {FakeActionsClient::job("build"), FakeActionsClient::job("lint")};

        VerifySession session(client, clock, branchRequest({"build", "lint"}));
        const Outcome& outcome = session.run();
        REQUIRE(outcome.kind == Outcome::Kind::Verdict);
        REQUIRE(reporter.report(outcome).exitCode == 0);
    }

    SECTION("Missing required job exits 2") {
        client.snapshots = {FakeActionsClient::snapshot("completed", "success")};
        client.jobs = {FakeActionsClient::job("build")};

        VerifySession session(client, clock, branchRequest({"build", "lint"}));
        const Outcome& outcome = session.run();
        REQUIRE(outcome.verdict.missingJobs == std::vector<std::string>{"lint"});
        REQUIRE(reporter.report(outcome).exitCode == 2);
    }

    SECTION("Failed required job exits 1") {
        client.snapshots = {FakeActionsClient::snapshot("completed", "failure")};
        client.jobs = {FakeActionsClient::job("build", "failure")};

        VerifySession session(client, clock, branchRequest({"build"}));
        REQUIRE(reporter.report(session.run()).exitCode == 1);
    }

    SECTION("Never completing run times out with exit 3 and no job fetch") {
        client.snapshots = {FakeActionsClient::snapshot("in_progress")};

        VerifySession session(client, clock, branchRequest({"build"}));
        const Outcome& outcome = session.run();
        REQUIRE(outcome.verdict.kind == VerdictKind::TimedOut);
        REQUIRE(outcome.elapsed == 60s);
        REQUIRE(client.runFetches == 3);
        REQUIRE(client.jobFetches == 0);

        auto report = reporter.report(outcome);
        REQUIRE(report.exitCode == 3);
        REQUIRE(report.text == "ERROR: timed out waiting for run 42 to complete (waited 60s).\n");
    }

    SECTION("Branch without runs stops before polling") {
        client.latestRun.reset();

        VerifySession session(client, clock, branchRequest({"build"}));
        const Outcome& outcome = session.run();
        REQUIRE(outcome.kind == Outcome::Kind::NotFound);
        REQUIRE(client.runFetches == 0);
        REQUIRE(clock.sleeps.empty());

        auto report = reporter.report(outcome);
        REQUIRE(report.exitCode == exit_code::kNotFound);
        REQUIRE(report.text == "ERROR: No workflow runs found for branch 'main'.\n");
    }

    SECTION("Transport failure while listing jobs ends the session") {
        client.snapshots = {FakeActionsClient::snapshot("completed", "success")};
        client.failJobFetch = true;

        VerifySession session(client, clock, branchRequest({"build"}));
        const Outcome& outcome = session.run();
        REQUIRE(session.state() == VerifySession::State::Done);
        REQUIRE(outcome.kind == Outcome::Kind::TransportFailure);
        REQUIRE(outcome.errorMessage == "HTTP 502 for jobs listing");
        REQUIRE(reporter.report(outcome).exitCode == exit_code::kTransport);
    }

    SECTION("Explicit run id skips the branch lookup") {
        client.snapshots = {FakeActionsClient::snapshot("completed", "success")};
        client.jobs = {FakeActionsClient::job("build")};

        auto request = branchRequest({"build"});
        request.selector = RunSelector::fromRunId(777);
        VerifySession session(client, clock, request);
        const Outcome& outcome = session.run();
        REQUIRE(client.branchQueries == 0);
        REQUIRE(outcome.runId == 777);
        REQUIRE(outcome.run->id == 777);
        REQUIRE(reporter.report(outcome).exitCode == 0);
    }

    SECTION("Progress observer is invoked while waiting") {
        client.snapshots = {
            FakeActionsClient::snapshot("queued"),
            FakeActionsClient::snapshot("completed", "success"),
        };
        client.jobs = {FakeActionsClient::job("build")};

        std::vector<std::string> lines;
        VerifySession session(client, clock, branchRequest({"build"}),
                              [&](const PollProgress& progress) { lines.push_back(reporter.progressLine(progress)); });
        session.run();
        REQUIRE(lines == std::vector<std::string>{"waiting: run_id=42 status=queued conclusion=null elapsed=0s"});
    }
}
