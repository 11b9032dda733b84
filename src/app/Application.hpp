#pragma once

#include "CommandLine.hpp"
#include "../config/VerifyConfig.hpp"

#include <string>

namespace civerify::app
{

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    Application(const Application&) = delete;
    Application& operator=(const Application&) = delete;

    // Returns the process exit code
    int run();

    // GITHUB_TOKEN, then GH_TOKEN; empty when neither is set
    static std::string readTokenFromEnvironment();

private:
    bool parseCommandLineArgs();
    bool initializeConfig();
    bool initializeLogging();
    int runVerification(const std::string& token);
    int usageError(const std::string& message);

    int argc_;
    char** argv_;
    CommandLineOptions options_;
    config::VerifyConfig config_;
};

} // namespace civerify::app
