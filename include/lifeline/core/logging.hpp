#pragma once

#include "config.hpp"

namespace lifeline::core {

// Configure spdlog's default logger from the observability section.
// Falls back to console-only logging if the file sink cannot be opened.
void configure_logging(const ObservabilityConfig& config);

}  // namespace lifeline::core
