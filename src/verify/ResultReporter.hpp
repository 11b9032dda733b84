#pragma once

#include "VerifyTypes.hpp"

#include <string>

namespace civerify::verify
{

// Maps an outcome to the report printed on stdout and the process exit code.
// Pure formatting: nothing here writes to a stream.
class ResultReporter
{
public:
    Report report(const Outcome& outcome) const;

    // Line emitted for every poll that found the run still running
    std::string progressLine(const PollProgress& progress) const;

    static int exitCodeFor(const Outcome& outcome);

private:
    static std::string summaryLines(const Outcome& outcome);
    static std::string jobListing(const Outcome& outcome);
};

} // namespace civerify::verify
