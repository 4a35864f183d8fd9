#pragma once

#include <string>

namespace cryoql {

constexpr const char* kServerName = "Cryo Data Server";

/// Semantic version baked in by the build (CRYOQL_VERSION).
std::string version();
/// Version plus commit provenance, e.g. "0.3.0 (abc123-dirty)".
/// The stdio transport reports `version()` during initialize; the CLI prints this.
std::string version_string();

}  // namespace cryoql
