#pragma once

#include <chrono>
#include <iostream>
#include <string>

#include "fmt/core.h"
#include "fmt/ostream.h"

namespace skim {

enum class log_lvl { debug, info, error };

constexpr char const* to_str(log_lvl const lvl) {
  switch (lvl) {
    case log_lvl::debug: return "debug";
    case log_lvl::info: return "info";
    case log_lvl::error: return "error";
  }
  return "";
}

extern log_lvl s_verbosity;

std::string now();

template <typename... Args>
void log(log_lvl const lvl,
         char const* ctx,
         fmt::format_string<Args...> fmt_str,
         Args&&... args) {
  if (lvl >= s_verbosity) {
    fmt::print(std::clog, "{} [{}] [{}] {}\n", now(), to_str(lvl), ctx,
               fmt::format(fmt_str, std::forward<Args>(args)...));
  }
}

struct scoped_timer final {
  explicit scoped_timer(std::string name);
  scoped_timer(scoped_timer const&) = delete;
  scoped_timer(scoped_timer&&) = delete;
  scoped_timer& operator=(scoped_timer const&) = delete;
  scoped_timer& operator=(scoped_timer&&) = delete;
  ~scoped_timer();

  std::string name_;
  std::chrono::time_point<std::chrono::steady_clock> start_;
};

}  // namespace skim
