#include "skim/types.h"

#include "fmt/core.h"

namespace skim {

std::string format_time(double const t) {
  auto const s = static_cast<long long>(std::floor(t));
  auto const sign = s < 0 ? "-" : "";
  auto const abs = s < 0 ? -s : s;
  return fmt::format("{}{:02}:{:02}:{:02}", sign, abs / 3600, (abs / 60) % 60,
                     abs % 60);
}

}  // namespace skim
