#include "model/Snapshot.hpp"
#include <cstdio>
#include <ctime>

namespace hostscope::model {

std::string iso8601(std::chrono::system_clock::time_point tp) {
  using namespace std::chrono;
  auto secs = time_point_cast<seconds>(tp);
  if (secs > tp) secs -= seconds(1); // floor for pre-epoch instants
  auto micros = duration_cast<microseconds>(tp - secs).count();
  std::time_t t = system_clock::to_time_t(secs);
  std::tm lt{};
  ::localtime_r(&t, &lt);
  char date[32];
  if (std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &lt) == 0) return {};
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%s.%06lld", date, static_cast<long long>(micros));
  return buf;
}

} // namespace hostscope::model
