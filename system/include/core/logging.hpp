// ============= include/core/logging.hpp =============
#pragma once
#include "core/config.hpp"

namespace faceattend {

// Console (color) + optional file sink, installed as spdlog default logger
void init_logging(const LoggingConfig& config);

} // namespace faceattend
