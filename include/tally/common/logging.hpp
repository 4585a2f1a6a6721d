#pragma once

#include <optional>
#include <string>

namespace tally::common {

/// Install the process-wide asynchronous logger.
///
/// Diagnostics go to stderr so stdout carries only the account table; a file
/// sink is added when `log_file` is set.
void configure_logging(bool verbose, const std::optional<std::string>& log_file);

}  // namespace tally::common
