#include "Clock.hpp"

#include <thread>

namespace civerify::verify
{

IClock::time_point SteadyClock::now() const { return std::chrono::steady_clock::now(); }

void SteadyClock::sleepFor(std::chrono::seconds duration) { std::this_thread::sleep_for(duration); }

} // namespace civerify::verify
