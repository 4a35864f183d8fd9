#pragma once

#include <ostream>
#include <string>

#include "cryoql/config.h"

namespace cryoql::cli {

constexpr const char* kDefaultHost = "127.0.0.1";
constexpr int kDefaultPort = 7338;

struct CliOptions {
  enum class Command { None, Serve, Call };

  Command command = Command::None;
  bool serve_stdio = false;
  bool serve_http = false;
  std::string host = kDefaultHost;
  int port = kDefaultPort;
  std::string tool_name;
  std::string tool_args = "{}";
  ConfigOverrides overrides;
  bool quiet = false;
  bool show_help = false;
  bool show_version = false;
};

void print_startup_help(std::ostream& os);
void print_help(std::ostream& os);

/// Parses argv into typed options so main can dispatch consistently.
/// MUST return false for invalid flags; `error` then holds the message for stderr.
bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error);

}  // namespace cryoql::cli
