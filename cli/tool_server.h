#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <string>

#include "cryoql/json.h"
#include "cryoql/tool_service.h"

namespace cryoql::cli {

constexpr const char* kProtocolVersion = "2024-11-05";

constexpr int kParseError = -32700;
constexpr int kInvalidRequest = -32600;
constexpr int kMethodNotFound = -32601;
constexpr int kInvalidParams = -32602;

/// Answers one JSON-RPC message. Notifications (no id) yield nullopt.
std::optional<json> handle_rpc_message(ToolService& service, const json& message);
/// Parses one input line and answers it; malformed JSON yields a -32700 error.
std::optional<std::string> handle_rpc_line(ToolService& service, const std::string& line);

/// Line-delimited JSON-RPC loop until EOF. Only protocol frames go to `out`.
int run_stdio_server(ToolService& service, std::istream& in, std::ostream& out);
/// Blocks serving the HTTP tool routes; returns 1 when the bind fails.
int run_http_server(ToolService& service, const std::string& host, int port);

}  // namespace cryoql::cli
