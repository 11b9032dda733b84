#pragma once

#include <stdexcept>
#include <string>

namespace civerify::github
{

// Failure to reach the provider or to decode its response.
// Never retried: the invocation aborts with a transport failure report.
class TransportError : public std::runtime_error
{
public:
    explicit TransportError(const std::string& message, int statusCode = 0)
        : std::runtime_error(message)
        , status_code_(statusCode)
    {
    }

    // HTTP status of the failing response, 0 when the request never completed
    int statusCode() const { return status_code_; }

private:
    int status_code_;
};

} // namespace civerify::github
