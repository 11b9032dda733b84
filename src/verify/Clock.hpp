#pragma once

#include <chrono>

namespace civerify::verify
{

// Time source for the poll loop; tests substitute a manual clock
class IClock
{
public:
    using time_point = std::chrono::steady_clock::time_point;

    virtual ~IClock() = default;

    virtual time_point now() const = 0;
    virtual void sleepFor(std::chrono::seconds duration) = 0;
};

class SteadyClock : public IClock
{
public:
    time_point now() const override;
    void sleepFor(std::chrono::seconds duration) override;
};

} // namespace civerify::verify
