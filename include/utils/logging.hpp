#pragma once

#include "config/config.hpp"

namespace lumen {

/**
 * Install the "lumen" logger as spdlog's default: colored console output
 * plus a rotating file at <log_dir>/lumen.log (JSON lines when configured).
 */
void setup_logging(const LoggingConfig& config);

} // namespace lumen
