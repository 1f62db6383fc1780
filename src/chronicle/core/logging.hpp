#ifndef CHRONICLE_CORE_LOGGING_HPP
#define CHRONICLE_CORE_LOGGING_HPP

#include <memory>

#include <spdlog/spdlog.h>

#include <chronicle/core/utilities.hpp>

namespace chronicle {

// Get the "chronicle" logger, creating it (with a console sink) if it hasn't
// been registered yet. Applications that want the output to go elsewhere can
// register their own logger with that name before calling into Chronicle.
std::shared_ptr<spdlog::logger>
get_logger();

// Create the logger (if necessary) and set its level.
// If :level is omitted, the level is taken from the CHRONICLE_LOG_LEVEL
// environment variable ("trace", "debug", "info", "warn", "error", "off").
// Without either, the level is left at "warn".
void
initialize_logging(optional<spdlog::level::level_enum> level = none);

} // namespace chronicle

#endif
