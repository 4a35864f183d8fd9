#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

#include "cli_args.h"
#include "cryoql/chain_rpc.h"
#include "cryoql/config.h"
#include "cryoql/json.h"
#include "cryoql/log.h"
#include "cryoql/process.h"
#include "cryoql/tool_service.h"
#include "cryoql/version.h"
#include "tool_server.h"

using namespace cryoql::cli;

namespace {

int run_call(cryoql::ToolService& service, const CliOptions& options) {
  const cryoql::json args = cryoql::json::parse(options.tool_args, nullptr, false);
  if (args.is_discarded() || !args.is_object()) {
    std::cerr << "Tool arguments must be a JSON object\n";
    return 2;
  }
  cryoql::ToolCallOutcome outcome = service.call(options.tool_name, args);
  if (!outcome.ok) {
    std::cerr << outcome.error << "\n";
    return 2;
  }
  std::cout << cryoql::dump_text(outcome.document, 2) << std::endl;
  return cryoql::is_failure_document(outcome.document) ? 1 : 0;
}

}  // namespace

/// Entry point that parses CLI options and dispatches to a transport or a one-shot call.
/// MUST preserve exit codes for script usage.
int main(int argc, char** argv) {
  if (argc == 1) {
    print_startup_help(std::cout);
    return 0;
  }

  CliOptions options;
  std::string arg_error;
  if (!parse_cli_args(argc, argv, options, arg_error)) {
    std::cerr << arg_error << "\n";
    return 2;
  }
  if (options.show_help) {
    print_help(std::cout);
    return 0;
  }
  if (options.show_version) {
    std::cout << "cryoql " << cryoql::version_string() << std::endl;
    return 0;
  }
  if (options.command == CliOptions::Command::None) {
    print_startup_help(std::cerr);
    return 2;
  }

  cryoql::log::set_quiet(options.quiet);
  const cryoql::ConfigOverrides process_wide = cryoql::process_overrides(options.overrides);
  const cryoql::Config startup = cryoql::resolve_config({}, process_wide);
  cryoql::log::info("Using RPC URL: " + startup.rpc_url);
  cryoql::log::info("Using data directory: " + startup.data_dir.string());
  std::error_code ec;
  std::filesystem::create_directories(startup.data_dir, ec);
  if (ec) {
    cryoql::log::warn("Could not create data directory " + startup.data_dir.string() + ": " +
                      ec.message());
  }

  cryoql::PosixProcessRunner runner;
  cryoql::CurlRpcTransport transport;
  cryoql::ToolService service(process_wide, runner, transport);

  if (options.command == CliOptions::Command::Call) {
    return run_call(service, options);
  }
  if (options.serve_stdio) {
    return run_stdio_server(service, std::cin, std::cout);
  }
  return run_http_server(service, options.host, options.port);
}
