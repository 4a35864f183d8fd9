#include "cli_args.h"

#include <exception>
#include <stdexcept>
#include <string>

namespace cryoql::cli {

namespace {

bool take_value(int argc, char** argv, int& i, const std::string& flag,
                std::string& out, std::string& error) {
  if (i + 1 >= argc) {
    error = "Missing value for " + flag;
    return false;
  }
  out = argv[++i];
  return true;
}

}  // namespace

/// Prints the startup help so users see baseline usage without flags.
void print_startup_help(std::ostream& os) {
  os << "cryoql - blockchain extraction and SQL tools for agents\n\n";
  os << "Usage:\n";
  os << "  cryoql serve --stdio\n";
  os << "  cryoql serve --http [--host <host>] [--port <n>]\n";
  os << "  cryoql call <tool> ['<json-args>']\n";
  os << "  cryoql --help\n";
  os << "  cryoql --version\n\n";
  os << "Common flags: --rpc-url <url> --data-dir <path> --cryo-bin <path> --quiet\n\n";
  os << "Examples:\n";
  os << "  cryoql call list_datasets\n";
  os << "  cryoql call query_dataset '{\"dataset\":\"blocks\",\"start_block\":1000,\"end_block\":1009}'\n";
  os << "  cryoql call query_sql '{\"query\":\"SELECT COUNT(*) FROM blocks\"}'\n";
}

/// Prints the explicit help requested by --help.
/// MUST stay synchronized with supported flags.
void print_help(std::ostream& os) {
  os << "Usage: cryoql serve --stdio\n";
  os << "       cryoql serve --http [--host <host>] [--port <n>]\n";
  os << "       cryoql call <tool> ['<json-args>']\n";
  os << "       cryoql --version\n";
  os << "Flags:\n";
  os << "  --rpc-url <url>    Ethereum JSON-RPC endpoint (env ETH_RPC_URL, default http://localhost:8545)\n";
  os << "  --data-dir <path>  Data root (env CRYO_DATA_DIR, default ~/.cryo-mcp/data)\n";
  os << "  --cryo-bin <path>  cryo executable (env CRYO_BIN, default cryo on PATH)\n";
  os << "  --host <host>      HTTP bind address (default 127.0.0.1)\n";
  os << "  --port <n>         HTTP port (default 7338)\n";
  os << "  --quiet            Only print warnings on stderr\n";
  os << "stdio mode speaks line-delimited JSON-RPC 2.0 (initialize, tools/list, tools/call, ping).\n";
  os << "HTTP mode serves GET /health, GET /v1/tools and POST /v1/tools/<name>.\n";
  os << "Exit codes: 0=success, 1=tool failure, 2=usage error.\n";
}

bool parse_cli_args(int argc, char** argv, CliOptions& options, std::string& error) {
  CliOptions parsed;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    std::string value;
    if (arg == "serve" && parsed.command == CliOptions::Command::None) {
      parsed.command = CliOptions::Command::Serve;
    } else if (arg == "call" && parsed.command == CliOptions::Command::None) {
      parsed.command = CliOptions::Command::Call;
      if (i + 1 >= argc || argv[i + 1][0] == '-') {
        error = "Missing tool name for call";
        return false;
      }
      parsed.tool_name = argv[++i];
      if (i + 1 < argc && argv[i + 1][0] != '-') {
        parsed.tool_args = argv[++i];
      }
    } else if (arg == "--stdio") {
      parsed.serve_stdio = true;
    } else if (arg == "--http") {
      parsed.serve_http = true;
    } else if (arg == "--host") {
      if (!take_value(argc, argv, i, arg, parsed.host, error)) return false;
    } else if (arg == "--port") {
      if (!take_value(argc, argv, i, arg, value, error)) return false;
      try {
        size_t consumed = 0;
        parsed.port = std::stoi(value, &consumed);
        if (consumed != value.size()) throw std::invalid_argument(value);
      } catch (const std::exception&) {
        error = "Invalid --port value: " + value;
        return false;
      }
      if (parsed.port <= 0 || parsed.port > 65535) {
        error = "Invalid --port value: " + value;
        return false;
      }
    } else if (arg == "--rpc-url") {
      if (!take_value(argc, argv, i, arg, value, error)) return false;
      parsed.overrides.rpc_url = value;
    } else if (arg == "--data-dir") {
      if (!take_value(argc, argv, i, arg, value, error)) return false;
      parsed.overrides.data_dir = value;
    } else if (arg == "--cryo-bin") {
      if (!take_value(argc, argv, i, arg, value, error)) return false;
      parsed.overrides.cryo_bin = value;
    } else if (arg == "--quiet") {
      parsed.quiet = true;
    } else if (arg == "--help") {
      parsed.show_help = true;
    } else if (arg == "--version") {
      parsed.show_version = true;
    } else {
      error = "Unknown argument: " + arg;
      return false;
    }
  }
  if (parsed.show_help || parsed.show_version) {
    options = parsed;
    return true;
  }
  if (parsed.command == CliOptions::Command::Serve) {
    if (parsed.serve_stdio == parsed.serve_http) {
      error = "serve requires exactly one of --stdio or --http";
      return false;
    }
  } else if (parsed.serve_stdio || parsed.serve_http) {
    error = "--stdio and --http are only valid with serve";
    return false;
  }
  options = parsed;
  return true;
}

}  // namespace cryoql::cli
