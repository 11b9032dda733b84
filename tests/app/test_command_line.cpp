#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "app/CommandLine.hpp"

#include <vector>

using namespace civerify::app;
using Catch::Matchers::ContainsSubstring;

namespace {

bool parseArgs(std::vector<const char*> args, CommandLineOptions& out, std::string& error) {
    args.insert(args.begin(), "ci-verify");
    return CommandLine::parse(static_cast<int>(args.size()), args.data(), out, error);
}

}  // namespace

TEST_CASE("CommandLine - parsing", "[app][cli]") {
    CommandLineOptions options;
    std::string error;

    SECTION("Branch selector with repository and jobs") {
        REQUIRE(parseArgs({"--owner", "acme", "--repo", "widget", "--branch", "main", "--required-job", "build",
                           "--required-job", "Gates (ubuntu-latest)"},
                          options, error));
        REQUIRE(options.owner == "acme");
        REQUIRE(options.repo == "widget");
        REQUIRE(options.branch == "main");
        REQUIRE_FALSE(options.runId.has_value());
        REQUIRE(options.requiredJobs == std::vector<std::string>{"build", "Gates (ubuntu-latest)"});
    }

    SECTION("Equals form and numeric options") {
        REQUIRE(parseArgs({"--run-id=123456789012", "--timeout-secs=90", "--poll-secs", "5"}, options, error));
        REQUIRE(options.runId == 123456789012LL);
        REQUIRE(options.timeoutSecs == 90);
        REQUIRE(options.pollSecs == 5);
    }

    SECTION("Flags") {
        REQUIRE(parseArgs({"--branch", "main", "--ignore-run-conclusion"}, options, error));
        REQUIRE(options.ignoreRunConclusion);
    }

    SECTION("Help and version skip the selector check") {
        REQUIRE(parseArgs({"--help"}, options, error));
        REQUIRE(options.showHelp);

        CommandLineOptions versionOptions;
        REQUIRE(parseArgs({"--version"}, versionOptions, error));
        REQUIRE(versionOptions.showVersion);
    }
}

TEST_CASE("CommandLine - usage errors", "[app][cli][error]") {
    CommandLineOptions options;
    std::string error;

    SECTION("Selector is required") {
        REQUIRE_FALSE(parseArgs({"--owner", "acme"}, options, error));
        REQUIRE(error == "one of --branch or --run-id is required");
    }

    SECTION("Branch and run id are mutually exclusive") {
        REQUIRE_FALSE(parseArgs({"--branch", "main", "--run-id", "7"}, options, error));
        REQUIRE(error == "--branch and --run-id are mutually exclusive");
    }

    SECTION("Missing value") {
        REQUIRE_FALSE(parseArgs({"--branch"}, options, error));
        REQUIRE(error == "--branch requires a value");
    }

    SECTION("Empty value") {
        REQUIRE_FALSE(parseArgs({"--branch="}, options, error));
        REQUIRE(error == "--branch must not be empty");
    }

    SECTION("Malformed numbers") {
        REQUIRE_FALSE(parseArgs({"--run-id", "abc"}, options, error));
        REQUIRE(error == "--run-id expects a positive integer, got 'abc'");

        REQUIRE_FALSE(parseArgs({"--branch", "main", "--timeout-secs", "0"}, options, error));
        REQUIRE(error == "--timeout-secs expects a positive integer, got '0'");

        REQUIRE_FALSE(parseArgs({"--branch", "main", "--poll-secs", "10s"}, options, error));
        REQUIRE_THAT(error, ContainsSubstring("--poll-secs"));
    }

    SECTION("Unknown argument") {
        REQUIRE_FALSE(parseArgs({"--branch", "main", "--verbose"}, options, error));
        REQUIRE(error == "unknown argument '--verbose'");
    }

    SECTION("Flags reject inline values") {
        REQUIRE_FALSE(parseArgs({"--branch", "main", "--ignore-run-conclusion=yes"}, options, error));
        REQUIRE(error == "--ignore-run-conclusion does not take a value");
    }
}

TEST_CASE("CommandLine - overrides", "[app][cli][config]") {
    civerify::config::VerifyConfig config;
    config.github.owner = "from-file";
    config.github.repo = "widget";
    config.verify.poll_secs = 30;
    config.verify.required_jobs = {"from-file-job"};

    CommandLineOptions options;
    std::string error;

    SECTION("Command line wins over file values") {
        options.owner = "acme";
        options.pollSecs = 5;
        options.requiredJobs = {"build"};
        options.ignoreRunConclusion = true;
        options.logLevel = "info";

        REQUIRE(CommandLine::applyOverrides(options, config, error));
        REQUIRE(config.github.owner == "acme");
        REQUIRE(config.github.repo == "widget");
        REQUIRE(config.verify.poll_secs == 5);
        REQUIRE(config.verify.timeout_secs == 1800);
        REQUIRE(config.verify.required_jobs == std::vector<std::string>{"build"});
        REQUIRE_FALSE(config.verify.require_run_success);
        REQUIRE(config.logging.level == plog::info);
    }

    SECTION("Absent options leave file values alone") {
        REQUIRE(CommandLine::applyOverrides(options, config, error));
        REQUIRE(config.github.owner == "from-file");
        REQUIRE(config.verify.required_jobs == std::vector<std::string>{"from-file-job"});
        REQUIRE(config.verify.require_run_success);
    }

    SECTION("Invalid log level") {
        options.logLevel = "loud";
        REQUIRE_FALSE(CommandLine::applyOverrides(options, config, error));
        REQUIRE(error == "unknown log level 'loud'");
    }

    SECTION("Validation runs after overrides") {
        config.github.repo.clear();
        REQUIRE_FALSE(CommandLine::applyOverrides(options, config, error));
        REQUIRE_THAT(error, ContainsSubstring("--repo"));
    }
}

TEST_CASE("CommandLine - usage text", "[app][cli]") {
    const std::string text = CommandLine::usage("ci-verify");
    REQUIRE_THAT(text, ContainsSubstring("Usage: ci-verify"));
    REQUIRE_THAT(text, ContainsSubstring("--required-job"));
    REQUIRE_THAT(text, ContainsSubstring("GITHUB_TOKEN"));
}
