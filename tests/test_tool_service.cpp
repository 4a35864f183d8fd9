#include "test_harness.h"

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include "cryoql/block_range.h"
#include "cryoql/extraction.h"
#include "cryoql/tool_service.h"
#include "test_utils.h"
#include "util/string_util.h"

namespace {

namespace fs = std::filesystem;
using cryoql::json;

std::string arg_after(const std::vector<std::string>& argv, const std::string& flag) {
  auto it = std::find(argv.begin(), argv.end(), flag);
  if (it == argv.end() || it + 1 == argv.end()) return "";
  return *(it + 1);
}

bool has_arg(const std::vector<std::string>& argv, const std::string& value) {
  return std::find(argv.begin(), argv.end(), value) != argv.end();
}

/// Stands in for cryo: writes one file per extraction into the -o directory.
cryoql::ProcessResult fake_cryo(const std::vector<std::string>& argv) {
  if (argv.size() > 1 && argv[1] == "help") {
    if (argv.size() > 2 && argv[2] == "datasets") {
      return process_ok("- blocks\n- transactions (alias = txs)\n- blocks_and_transactions: x\n");
    }
    return process_ok("help for " + (argv.size() > 2 ? argv[2] : std::string()));
  }
  if (has_arg(argv, "--dry-run")) return process_ok("schema for " + argv[1]);
  const fs::path out = arg_after(argv, "-o");
  const std::string range = arg_after(argv, "-b");
  const std::string stem = "ethereum__" + argv[1] + "__" + range.substr(0, range.find(':'));
  if (has_arg(argv, "--json")) {
    write_text_file(out / (stem + ".json"), "[]");
  } else {
    write_block_parquet(out / (stem + ".parquet"), 1000, 10);
  }
  return process_ok("done");
}

struct Fixture {
  explicit Fixture(const std::string& label)
      : dir(label), service(overrides(dir.path()), runner, transport) {
    runner.handler = fake_cryo;
  }

  static cryoql::ConfigOverrides overrides(const fs::path& root) {
    cryoql::ConfigOverrides out;
    out.rpc_url = "http://node:8545";
    out.data_dir = root.string();
    out.cryo_bin = "cryo";
    return out;
  }

  json call(const std::string& name, const json& args) {
    cryoql::ToolCallOutcome outcome = service.call(name, args);
    expect_true(outcome.ok, "tool call dispatched: " + outcome.error);
    return outcome.document;
  }

  TempDir dir;
  FakeProcessRunner runner;
  FakeRpcTransport transport;
  cryoql::ToolService service;
};

void test_query_dataset_latest_uses_head_and_latest_dir() {
  Fixture fx("tool_latest");
  fx.transport.set_head(2000);
  write_text_file(fx.dir.path() / "latest" / "ethereum__blocks__1.json", "[]");
  json doc = fx.call("query_dataset", {{"dataset", "blocks"}, {"blocks_from_latest", 10}});
  expect_true(!doc.contains("error"), "latest query succeeds");
  expect_eq(doc.value("block_range", ""), "1990:2001", "latest-N through latest");
  expect_eq(doc["count"].get<size_t>(), 1, "only the new file is returned");
  expect_true(!fs::exists(fx.dir.path() / "latest" / "ethereum__blocks__1.json"), "stale file purged");
  expect_eq(arg_after(fx.runner.calls.back(), "-o"), (fx.dir.path() / "latest").string(),
            "writes into the latest area");
}

void test_query_dataset_head_unavailable_skips_extraction() {
  Fixture fx("tool_nohead");
  json doc = fx.call("query_dataset", {{"dataset", "blocks"}, {"use_latest", true}});
  expect_eq(doc.value("error", ""), cryoql::kHeadUnavailableError, "head failure surfaced");
  expect_eq(fx.runner.calls.size(), 0, "cryo never invoked");
}

void test_query_dataset_failure_reports_command() {
  Fixture fx("tool_fail");
  fx.runner.handler = [](const std::vector<std::string>&) {
    return process_failed(2, "bad rpc", "some output");
  };
  json doc = fx.call("query_dataset",
                     {{"dataset", "logs"}, {"start_block", 5}, {"rpc_url", "http://other:1"}});
  expect_eq(doc.value("error", ""), "bad rpc", "stderr is the error");
  expect_eq(doc.value("stdout", ""), "some output", "stdout kept");
  expect_contains(doc.value("command", ""), "-b 5:15 -r http://other:1", "per-call rpc url in command");
  expect_true(cryoql::is_failure_document(doc), "flagged as failure");
}

void test_query_blockchain_sql_runs_over_fetched_parquet() {
  Fixture fx("tool_chain_sql");
  json doc = fx.call("query_blockchain_sql",
                     {{"sql_query", "SELECT COUNT(*) AS n FROM blocks"}, {"start_block", 1000},
                      {"end_block", 1009}});
  expect_true(doc.value("success", false), "convenience query succeeds");
  expect_true(doc["result"][0]["n"] == 10, "rows from the fetched file");
  expect_eq(doc["data_source"]["dataset"].get<std::string>(), "blocks", "dataset inferred from SQL");
  expect_eq(doc["data_source"]["block_range"].get<std::string>(), "1000:1010", "half-open range");
  expect_true(!has_arg(fx.runner.calls.back(), "--json"), "parquet requested");
}

void test_query_blockchain_sql_zero_files_fails_before_sql() {
  Fixture fx("tool_chain_empty");
  write_block_parquet(fx.dir.path() / "archive" / "ethereum__blocks__1_to_10.parquet", 1, 10);
  fx.runner.handler = [](const std::vector<std::string>&) { return process_ok(); };
  json doc = fx.call("query_blockchain_sql", {{"sql_query", "SELECT COUNT(*) FROM blocks"}});
  expect_true(!doc.value("success", true), "empty fetch fails");
  expect_contains(doc.value("error", ""), cryoql::kNoOutputError, "fetch error surfaced");
  expect_true(!doc.contains("result"), "no SQL result produced");
  expect_true(!doc.contains("files_available"), "executor never consulted");
}

void test_query_blockchain_sql_needs_a_dataset() {
  Fixture fx("tool_chain_nodataset");
  json doc = fx.call("query_blockchain_sql", {{"sql_query", "SELECT 1"}});
  expect_true(!doc.value("success", true), "undeterminable dataset fails");
  expect_eq(doc.value("error_kind", ""), "precondition", "precondition failure");
  expect_eq(fx.runner.calls.size(), 0, "no extraction attempted");
}

void test_lookup_dataset_sample_uses_timeout_and_json() {
  Fixture fx("tool_lookup");
  json doc = fx.call("lookup_dataset", {{"name", "blocks"}, {"sample_start_block", 100}});
  expect_eq(doc.value("schema", ""), "schema for blocks", "dry-run schema");
  expect_eq(doc.value("sample_block_range", ""), "100:105", "five-block sample window");
  expect_eq(doc["sample_files"].size(), 1, "sample file reported");
  const auto& sample_call = fx.runner.calls.back();
  expect_true(has_arg(sample_call, "--json"), "sample is json");
  expect_true(fx.runner.timeouts.back() == cryoql::kSampleTimeoutMs, "sample bounded by 30s");
  expect_true(!fx.runner.timeouts.front().has_value(), "help call unbounded");
}

void test_lookup_dataset_sample_failure_keeps_info() {
  Fixture fx("tool_lookup_fail");
  fx.runner.handler = [](const std::vector<std::string>& argv) {
    if (has_arg(argv, "--json")) return process_failed(1, "sample broke", "sample out");
    return fake_cryo(argv);
  };
  json doc = fx.call("lookup_dataset", {{"name", "logs"}});
  expect_eq(doc.value("name", ""), "logs", "info still returned");
  expect_eq(doc.value("sample_error", ""), "sample broke", "sample error recorded");
  expect_eq(doc.value("sample_stdout", ""), "sample out", "sample stdout recorded");
  expect_eq(doc.value("sample_block_range", ""), "1000:1005", "default sample range");
}

void test_dataset_info_latest_example_needs_head() {
  Fixture without("tool_info_nohead");
  json plain = without.call("get_dataset_info", {{"name", "blocks"}});
  expect_eq(plain["example_queries"].size(), 3, "no latest example without head");

  Fixture with("tool_info_head");
  with.transport.set_head(5);
  json rich = with.call("get_dataset_info", {{"name", "blocks"}});
  expect_eq(rich["example_queries"].size(), 4, "latest example with head");
  expect_eq(rich.value("description", ""), "help for blocks", "help text as description");
}

void test_list_datasets_parses_help() {
  Fixture fx("tool_list");
  json doc = fx.call("list_datasets", json::object());
  expect_eq(doc["count"].get<size_t>(), 2, "two datasets");
  expect_eq(doc["datasets"][1].get<std::string>(), "transactions", "alias stripped");
  expect_eq(cryoql::util::join(fx.runner.calls.front()), "cryo help datasets -r http://node:8545",
            "help command");
}

void test_get_latest_ethereum_block() {
  Fixture fx("tool_latest_block");
  fx.transport.set_head(77);
  json doc = fx.call("get_latest_ethereum_block", json::object());
  expect_true(doc["block_number"] == 77, "head reported");
  expect_eq(doc["count"].get<size_t>(), 1, "block file fetched");
  expect_eq(arg_after(fx.runner.calls.back(), "-b"), "77:78", "single head block");
}

void test_sql_tools_over_data_root() {
  Fixture fx("tool_sql");
  const fs::path file = fx.dir.path() / "ethereum__blocks__00001000_to_00001009.parquet";
  write_block_parquet(file, 1000, 10);
  json tables = fx.call("list_available_sql_tables", json::object());
  expect_eq(tables["count"].get<size_t>(), 1, "one table file");
  expect_eq(tables["tables"][0]["block_range"].get<std::string>(), "1000:1009", "range tag");

  json rows = fx.call("query_sql", {{"query", "SELECT MAX(block_number) AS top FROM blocks"}});
  expect_true(rows.value("success", false), "query_sql succeeds");
  expect_true(rows["result"][0]["top"] == 1009, "max block");

  json schema = fx.call("get_sql_table_schema", {{"file_path", file.string()}});
  expect_true(schema["row_count"] == 10, "schema row count");

  json examples = fx.call("get_sql_examples", json::object());
  expect_true(examples.contains("basic") && !examples["basic"].empty(), "examples provided");
}

void test_call_rejects_unknown_tools_and_bad_arguments() {
  Fixture fx("tool_errors");
  cryoql::ToolCallOutcome unknown = fx.service.call("drop_everything", json::object());
  expect_true(!unknown.ok, "unknown tool rejected");
  expect_contains(unknown.error, "Unknown tool", "unknown tool message");

  cryoql::ToolCallOutcome missing = fx.service.call("query_dataset", json::object());
  expect_true(!missing.ok, "missing dataset rejected");
  expect_contains(missing.error, "dataset", "names the argument");

  cryoql::ToolCallOutcome wrong_type =
      fx.service.call("query_dataset", {{"dataset", "blocks"}, {"start_block", "ten"}});
  expect_true(!wrong_type.ok, "wrong type rejected");

  cryoql::ToolCallOutcome not_object = fx.service.call("list_datasets", json::array());
  expect_true(!not_object.ok, "non-object arguments rejected");
}

void test_tool_descriptors_cover_every_tool() {
  json tools = cryoql::tool_descriptors_json();
  expect_eq(tools.size(), 11, "eleven tools");
  for (const auto& tool : tools) {
    expect_true(tool["inputSchema"].value("type", "") == "object",
                "object schema for " + tool["name"].get<std::string>());
  }
}

}  // namespace

void register_tool_service_tests(std::vector<TestCase>& tests) {
  tests.push_back({"query_dataset_latest_uses_head_and_latest_dir",
                   test_query_dataset_latest_uses_head_and_latest_dir});
  tests.push_back({"query_dataset_head_unavailable_skips_extraction",
                   test_query_dataset_head_unavailable_skips_extraction});
  tests.push_back({"query_dataset_failure_reports_command", test_query_dataset_failure_reports_command});
  tests.push_back({"query_blockchain_sql_runs_over_fetched_parquet",
                   test_query_blockchain_sql_runs_over_fetched_parquet});
  tests.push_back({"query_blockchain_sql_zero_files_fails_before_sql",
                   test_query_blockchain_sql_zero_files_fails_before_sql});
  tests.push_back({"query_blockchain_sql_needs_a_dataset", test_query_blockchain_sql_needs_a_dataset});
  tests.push_back({"lookup_dataset_sample_uses_timeout_and_json",
                   test_lookup_dataset_sample_uses_timeout_and_json});
  tests.push_back({"lookup_dataset_sample_failure_keeps_info", test_lookup_dataset_sample_failure_keeps_info});
  tests.push_back({"dataset_info_latest_example_needs_head", test_dataset_info_latest_example_needs_head});
  tests.push_back({"list_datasets_parses_help", test_list_datasets_parses_help});
  tests.push_back({"get_latest_ethereum_block", test_get_latest_ethereum_block});
  tests.push_back({"sql_tools_over_data_root", test_sql_tools_over_data_root});
  tests.push_back({"call_rejects_unknown_tools_and_bad_arguments",
                   test_call_rejects_unknown_tools_and_bad_arguments});
  tests.push_back({"tool_descriptors_cover_every_tool", test_tool_descriptors_cover_every_tool});
}
