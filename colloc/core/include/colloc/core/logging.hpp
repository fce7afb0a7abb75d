#pragma once

#include <absl/log/log.h>

#include <optional>

namespace colloc {

/// @brief Initialize Abseil logging once per process.
/// @param min_level Minimum severity to emit (0 = INFO ... 3 = FATAL), if set.
/// @param verbosity Global VLOG level, if set.
void init_logging(std::optional<int> min_level, std::optional<int> verbosity = std::nullopt);

} // namespace colloc
