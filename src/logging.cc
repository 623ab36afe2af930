#include "skim/logging.h"

#include <ctime>

namespace skim {

log_lvl s_verbosity = log_lvl::info;

std::string now() {
  using clock = std::chrono::system_clock;
  auto const t = clock::to_time_t(clock::now());
  auto tm = std::tm{};
  gmtime_r(&t, &tm);
  char buf[sizeof("2000-01-01T00:00:00Z")];
  std::strftime(buf, sizeof(buf), "%FT%TZ", &tm);
  return buf;
}

scoped_timer::scoped_timer(std::string name)
    : name_{std::move(name)}, start_{std::chrono::steady_clock::now()} {
  log(log_lvl::info, "skim.timer", "[{}] starting", name_);
}

scoped_timer::~scoped_timer() {
  using namespace std::chrono;
  auto const stop = steady_clock::now();
  auto const t =
      static_cast<double>(duration_cast<microseconds>(stop - start_).count()) /
      1000.0;
  log(log_lvl::info, "skim.timer", "[{}] finished [{:.2f}ms]", name_, t);
}

}  // namespace skim
