#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "verify/ResultReporter.hpp"
#include "../utils/fake_actions.hpp"

using namespace civerify::verify;
using namespace std::chrono_literals;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::StartsWith;
using test_utils::FakeActionsClient;

namespace {

Outcome completedOutcome(VerdictKind kind, const std::string& conclusion) {
    Outcome outcome;
    outcome.kind = Outcome::Kind::Verdict;
    outcome.runId = 42;
    outcome.run = FakeActionsClient::snapshot("completed", conclusion);
    outcome.run->id = 42;
    outcome.verdict.kind = kind;
    return outcome;
}

}  // namespace

TEST_CASE("ResultReporter - exit codes", "[verify][reporter]") {
    SECTION("Verdicts map to distinct codes") {
        REQUIRE(ResultReporter::exitCodeFor(completedOutcome(VerdictKind::Success, "success")) == 0);
        REQUIRE(ResultReporter::exitCodeFor(completedOutcome(VerdictKind::FailedJobs, "failure")) == 1);
        REQUIRE(ResultReporter::exitCodeFor(completedOutcome(VerdictKind::RunNotSuccessful, "failure")) == 1);
        REQUIRE(ResultReporter::exitCodeFor(completedOutcome(VerdictKind::MissingJobs, "success")) == 2);

        Outcome timedOut;
        timedOut.verdict.kind = VerdictKind::TimedOut;
        REQUIRE(ResultReporter::exitCodeFor(timedOut) == 3);
    }

    SECTION("Non-verdict outcomes") {
        Outcome notFound;
        notFound.kind = Outcome::Kind::NotFound;
        REQUIRE(ResultReporter::exitCodeFor(notFound) == exit_code::kNotFound);

        Outcome transport;
        transport.kind = Outcome::Kind::TransportFailure;
        REQUIRE(ResultReporter::exitCodeFor(transport) == exit_code::kTransport);
    }
}

TEST_CASE("ResultReporter - report text", "[verify][reporter]") {
    ResultReporter reporter;

    SECTION("Success prints summary and OK line") {
        auto outcome = completedOutcome(VerdictKind::Success, "success");
        outcome.jobs = {FakeActionsClient::job("build")};

        auto report = reporter.report(outcome);
        REQUIRE(report.exitCode == 0);
        REQUIRE(report.text ==
                "run_id=42 sha=abc1234 status=completed conclusion=success\n"
                "url=https://github.com/acme/widget/actions/runs/42\n"
                "OK: CI is green and all required jobs succeeded.\n");
    }

    SECTION("Missing jobs are listed with the jobs that were seen") {
        auto outcome = completedOutcome(VerdictKind::MissingJobs, "success");
        outcome.verdict.missingJobs = {"lint"};
        outcome.jobs = {FakeActionsClient::job("build")};

        auto report = reporter.report(outcome);
        REQUIRE(report.exitCode == 2);
        REQUIRE_THAT(report.text, ContainsSubstring("ERROR: missing required jobs:\n  - lint\n"));
        REQUIRE_THAT(report.text, ContainsSubstring("\nJobs seen:\n- build | completed | success\n"));
        REQUIRE_THAT(report.text, !ContainsSubstring("Required jobs not successful"));
    }

    SECTION("Failed jobs list name and conclusion") {
        auto outcome = completedOutcome(VerdictKind::FailedJobs, "failure");
        outcome.verdict.failedJobs = {{"build", "failure"}, {"lint", "null"}};
        outcome.jobs = {
            FakeActionsClient::job("build", "failure"),
            FakeActionsClient::job("lint", std::nullopt, "in_progress"),
        };

        auto report = reporter.report(outcome);
        REQUIRE(report.exitCode == 1);
        REQUIRE_THAT(report.text, ContainsSubstring("ERROR: CI not green.\n"
                                                    "Required jobs not successful:\n"
                                                    "  - build: failure\n"
                                                    "  - lint: null\n"));
        REQUIRE_THAT(report.text, ContainsSubstring("- lint | in_progress | null\n"));
    }

    SECTION("Run not successful without failed required jobs") {
        auto outcome = completedOutcome(VerdictKind::RunNotSuccessful, "cancelled");
        auto report = reporter.report(outcome);
        REQUIRE(report.exitCode == 1);
        REQUIRE_THAT(report.text, ContainsSubstring("conclusion=cancelled"));
        REQUIRE_THAT(report.text, ContainsSubstring("ERROR: CI not green.\n"));
    }

    SECTION("Timeout reports run id and waited seconds") {
        Outcome outcome;
        outcome.runId = 42;
        outcome.elapsed = 60s;
        outcome.verdict.kind = VerdictKind::TimedOut;

        auto report = reporter.report(outcome);
        REQUIRE(report.exitCode == 3);
        REQUIRE(report.text == "ERROR: timed out waiting for run 42 to complete (waited 60s).\n");
    }

    SECTION("Not found and transport failures") {
        Outcome notFound;
        notFound.kind = Outcome::Kind::NotFound;
        notFound.errorMessage = NotFoundError("ghost").what();
        REQUIRE(reporter.report(notFound).text == "ERROR: No workflow runs found for branch 'ghost'.\n");

        Outcome transport;
        transport.kind = Outcome::Kind::TransportFailure;
        transport.errorMessage = "HTTP 502";
        REQUIRE_THAT(reporter.report(transport).text, StartsWith("ERROR: GitHub request failed: HTTP 502"));
    }

    SECTION("Listing URL is used when the snapshot has none") {
        auto outcome = completedOutcome(VerdictKind::Success, "success");
        outcome.run->reportUrl.clear();
        outcome.urlHint = "https://example.test/runs/42";
        REQUIRE_THAT(reporter.report(outcome).text, ContainsSubstring("url=https://example.test/runs/42\n"));
    }
}

TEST_CASE("ResultReporter - progress line", "[verify][reporter]") {
    ResultReporter reporter;
    PollProgress progress{42, "in_progress", std::nullopt, 40s};
    REQUIRE(reporter.progressLine(progress) == "waiting: run_id=42 status=in_progress conclusion=null elapsed=40s");
}
