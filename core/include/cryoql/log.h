#pragma once

#include <ostream>
#include <string>

namespace cryoql::log {

/// Redirects diagnostics away from std::cerr (tests pass a null stream).
/// MUST outlive every later log call; stdout is never a valid target in stdio mode.
void set_sink(std::ostream* sink);
/// Drops informational lines while keeping warnings.
void set_quiet(bool quiet);

void info(const std::string& message);
void warn(const std::string& message);

}  // namespace cryoql::log
