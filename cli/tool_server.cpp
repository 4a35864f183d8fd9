#include "tool_server.h"

#include <mutex>
#include <utility>

#include <httplib.h>

#include "cryoql/log.h"
#include "cryoql/version.h"

namespace cryoql::cli {

namespace {

json rpc_result(const json& id, json result) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

json rpc_error(const json& id, int code, const std::string& message) {
  return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

json tool_call_result(const json& document) {
  return {{"content", json::array({{{"type", "text"}, {"text", dump_text(document, 2)}}})},
          {"isError", is_failure_document(document)}};
}

void write_json(httplib::Response& res, int status, const json& payload) {
  res.status = status;
  res.set_content(dump_text(payload), "application/json");
}

}  // namespace

std::optional<json> handle_rpc_message(ToolService& service, const json& message) {
  if (!message.is_object() || !message.contains("method") || !message["method"].is_string()) {
    const json id = message.is_object() && message.contains("id") ? message["id"] : json(nullptr);
    return rpc_error(id, kInvalidRequest, "Invalid request");
  }
  const std::string method = message["method"].get<std::string>();
  if (!message.contains("id")) {
    // Notifications such as notifications/initialized get no reply.
    return std::nullopt;
  }
  const json id = message["id"];
  const json params = message.value("params", json::object());

  if (method == "initialize") {
    return rpc_result(id, {{"protocolVersion", kProtocolVersion},
                           {"capabilities", {{"tools", json::object()}}},
                           {"serverInfo", {{"name", kServerName}, {"version", version()}}}});
  }
  if (method == "ping") {
    return rpc_result(id, json::object());
  }
  if (method == "tools/list") {
    return rpc_result(id, {{"tools", tool_descriptors_json()}});
  }
  if (method == "tools/call") {
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string()) {
      return rpc_error(id, kInvalidParams, "tools/call requires a tool name");
    }
    const json args = params.value("arguments", json::object());
    ToolCallOutcome outcome = service.call(params["name"].get<std::string>(), args);
    if (!outcome.ok) {
      return rpc_error(id, kInvalidParams, outcome.error);
    }
    return rpc_result(id, tool_call_result(outcome.document));
  }
  return rpc_error(id, kMethodNotFound, "Method not found: " + method);
}

std::optional<std::string> handle_rpc_line(ToolService& service, const std::string& line) {
  const json message = json::parse(line, nullptr, false);
  if (message.is_discarded()) {
    return dump_text(rpc_error(nullptr, kParseError, "Parse error"));
  }
  std::optional<json> response = handle_rpc_message(service, message);
  if (!response.has_value()) return std::nullopt;
  return dump_text(*response);
}

int run_stdio_server(ToolService& service, std::istream& in, std::ostream& out) {
  log::info("Serving tools over stdio");
  std::string line;
  while (std::getline(in, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.find_first_not_of(" \t") == std::string::npos) continue;
    std::optional<std::string> response = handle_rpc_line(service, line);
    if (response.has_value()) {
      out << *response << "\n";
      out.flush();
    }
  }
  return 0;
}

int run_http_server(ToolService& service, const std::string& host, int port) {
  httplib::Server server;
  // The server accepts on several threads; tool calls run one at a time.
  std::mutex call_mutex;

  server.Get("/health", [](const httplib::Request&, httplib::Response& res) {
    write_json(res, 200, {{"ok", true}, {"name", kServerName}, {"version", version()}});
  });

  server.Get("/v1/tools", [](const httplib::Request&, httplib::Response& res) {
    write_json(res, 200, {{"tools", tool_descriptors_json()}});
  });

  server.Post(R"(/v1/tools/([A-Za-z_]+))", [&](const httplib::Request& req, httplib::Response& res) {
    const std::string name = req.matches[1];
    json args = json::object();
    if (!req.body.empty()) {
      args = json::parse(req.body, nullptr, false);
      if (args.is_discarded() || !args.is_object()) {
        write_json(res, 400, {{"error", "Request body must be a JSON object"}});
        return;
      }
    }
    ToolCallOutcome outcome;
    {
      std::lock_guard<std::mutex> lock(call_mutex);
      outcome = service.call(name, args);
    }
    if (!outcome.ok) {
      write_json(res, 400, {{"error", outcome.error}});
      return;
    }
    write_json(res, 200, outcome.document);
  });

  log::info("Listening on http://" + host + ":" + std::to_string(port));
  if (!server.listen(host, port)) {
    log::warn("Failed to bind to " + host + ":" + std::to_string(port));
    return 1;
  }
  return 0;
}

}  // namespace cryoql::cli
