#pragma once

#include <chrono>

namespace nodeagent::util {

/*
  Time utilities.
*/

// Elapsed wall time on the steady clock, in fractional milliseconds.
double MillisSince(std::chrono::steady_clock::time_point started_at);

} // namespace nodeagent::util
