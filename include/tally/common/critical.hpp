#pragma once

#include <cstdlib>
#include <string_view>

#include <spdlog/spdlog.h>

namespace tally::common {

/// Log an unrecoverable error, flush every sink, and exit with status 1.
[[noreturn]] inline void critical(const std::string_view message) {
  spdlog::critical("{}", message);
  spdlog::shutdown();
  std::exit(EXIT_FAILURE);
}

}  // namespace tally::common
