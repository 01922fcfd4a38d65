#include "time.hpp"

namespace nodeagent::util {

double MillisSince(std::chrono::steady_clock::time_point started_at) {
  return std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started_at).count();
}

} // namespace nodeagent::util
