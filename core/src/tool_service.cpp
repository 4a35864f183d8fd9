#include "cryoql/tool_service.h"

#include <exception>
#include <optional>
#include <utility>

#include "cryoql/catalog.h"
#include "cryoql/extraction.h"
#include "cryoql/log.h"
#include "cryoql/query_executor.h"
#include "cryoql/schema_inspector.h"
#include "cryoql/table_resolver.h"
#include "util/string_util.h"

namespace cryoql {

namespace {

json string_prop(const std::string& description) {
  return {{"type", "string"}, {"description", description}};
}

json int_prop(const std::string& description) {
  return {{"type", "integer"}, {"description", description}};
}

json bool_prop(const std::string& description) {
  return {{"type", "boolean"}, {"description", description}};
}

json list_prop(const std::string& description) {
  return {{"type", "array"}, {"items", {{"type", "string"}}}, {"description", description}};
}

json object_schema(json properties, std::vector<std::string> required = {}) {
  json schema = {{"type", "object"}, {"properties", std::move(properties)}};
  if (!required.empty()) schema["required"] = std::move(required);
  return schema;
}

void add_config_props(json& properties) {
  properties["rpc_url"] = string_prop("Ethereum JSON-RPC endpoint for this call");
  properties["data_dir"] = string_prop("Data root for this call");
}

json range_props() {
  json props = json::object();
  props["blocks"] = string_prop("Block range in cryo syntax, e.g. '1000:1010'");
  props["start_block"] = int_prop("First block (inclusive)");
  props["end_block"] = int_prop("Last block (inclusive)");
  props["use_latest"] = bool_prop("Use the latest block");
  props["blocks_from_latest"] = int_prop("Cover latest-N through latest");
  props["contract"] = string_prop("Address filter");
  return props;
}

std::vector<ToolDescriptor> build_descriptors() {
  std::vector<ToolDescriptor> tools;

  json none = json::object();
  add_config_props(none);
  tools.push_back({"list_datasets", "Return a list of all available cryo datasets",
                   object_schema(none)});

  json query = range_props();
  query["dataset"] = string_prop("Dataset to extract, e.g. 'logs' or 'transactions'");
  query["output_format"] = {{"type", "string"},
                            {"enum", {"json", "csv", "parquet"}},
                            {"description", "Output format (default json)"}};
  query["include_columns"] = list_prop("Columns to include alongside the defaults");
  query["exclude_columns"] = list_prop("Columns to exclude from the defaults");
  add_config_props(query);
  tools.push_back({"query_dataset", "Extract a cryo dataset for a block range and return the files",
                   object_schema(query, {"dataset"})});

  json info = {{"name", string_prop("Dataset name")}};
  add_config_props(info);
  tools.push_back({"get_dataset_info", "Describe a dataset with example calls",
                   object_schema(info, {"name"})});

  json lookup = {{"name", string_prop("Dataset name")},
                 {"sample_start_block", int_prop("First sample block (inclusive)")},
                 {"sample_end_block", int_prop("Last sample block (inclusive)")},
                 {"use_latest_sample", bool_prop("Sample the latest five blocks")},
                 {"sample_blocks_from_latest", int_prop("Sample latest-N through latest")}};
  add_config_props(lookup);
  tools.push_back({"lookup_dataset", "Describe a dataset with its schema and a small sample",
                   object_schema(lookup, {"name"})});

  json sql = {{"query", string_prop("SQL to run; tables are bound by dataset name")},
              {"files", list_prop("Parquet files to query (default: every file under the data root)")},
              {"include_schema", bool_prop("Include column names and types (default true)")}};
  add_config_props(sql);
  tools.push_back({"query_sql", "Run SQL over downloaded parquet files",
                   object_schema(sql, {"query"})});

  json tables = json::object();
  add_config_props(tables);
  tools.push_back({"list_available_sql_tables", "List parquet files available for SQL",
                   object_schema(tables)});

  json schema = {{"file_path", string_prop("Path of a parquet file")}};
  tools.push_back({"get_sql_table_schema", "Show columns, sample rows and row count of a parquet file",
                   object_schema(schema, {"file_path"})});

  json chain_sql = range_props();
  chain_sql["sql_query"] = string_prop("SQL to run after the fetch");
  chain_sql["dataset"] = string_prop("Dataset to fetch (default: first table in the query)");
  chain_sql["include_schema"] = bool_prop("Include column names and types (default true)");
  add_config_props(chain_sql);
  tools.push_back({"query_blockchain_sql", "Fetch a dataset as parquet and run SQL over it",
                   object_schema(chain_sql, {"sql_query"})});

  tools.push_back({"get_sql_examples", "Example SQL queries for cryo datasets",
                   object_schema(json::object())});

  json latest = json::object();
  add_config_props(latest);
  tools.push_back({"get_latest_ethereum_block", "Fetch the latest block into the latest area",
                   object_schema(latest)});

  json tx = {{"tx_hash", string_prop("Transaction hash")}};
  add_config_props(tx);
  tools.push_back({"get_transaction_by_hash", "Look up a transaction and its receipt",
                   object_schema(tx, {"tx_hash"})});
  return tools;
}

std::optional<std::string> optional_string(const json& args, const char* key) {
  if (!args.contains(key) || args[key].is_null()) return std::nullopt;
  if (!args[key].is_string()) {
    throw ToolArgumentError(std::string("Argument '") + key + "' must be a string");
  }
  return args[key].get<std::string>();
}

std::string required_string(const json& args, const char* key) {
  std::optional<std::string> value = optional_string(args, key);
  if (!value.has_value() || value->empty()) {
    throw ToolArgumentError(std::string("Missing required argument '") + key + "'");
  }
  return *value;
}

std::optional<int64_t> optional_int(const json& args, const char* key) {
  if (!args.contains(key) || args[key].is_null()) return std::nullopt;
  if (!args[key].is_number_integer()) {
    throw ToolArgumentError(std::string("Argument '") + key + "' must be an integer");
  }
  return args[key].get<int64_t>();
}

bool optional_bool(const json& args, const char* key, bool fallback) {
  if (!args.contains(key) || args[key].is_null()) return fallback;
  if (!args[key].is_boolean()) {
    throw ToolArgumentError(std::string("Argument '") + key + "' must be a boolean");
  }
  return args[key].get<bool>();
}

std::vector<std::string> string_list(const json& args, const char* key) {
  std::vector<std::string> out;
  if (!args.contains(key) || args[key].is_null()) return out;
  const json& value = args[key];
  if (value.is_string()) {
    out.push_back(value.get<std::string>());
    return out;
  }
  if (!value.is_array()) {
    throw ToolArgumentError(std::string("Argument '") + key + "' must be a list of strings");
  }
  for (const auto& item : value) {
    if (!item.is_string()) {
      throw ToolArgumentError(std::string("Argument '") + key + "' must be a list of strings");
    }
    out.push_back(item.get<std::string>());
  }
  return out;
}

BlockRangeRequest range_request(const json& args) {
  BlockRangeRequest request;
  request.blocks = optional_string(args, "blocks");
  request.start_block = optional_int(args, "start_block");
  request.end_block = optional_int(args, "end_block");
  request.use_latest = optional_bool(args, "use_latest", false);
  request.blocks_from_latest = optional_int(args, "blocks_from_latest");
  return request;
}

HeadLookup head_lookup_for(ChainClient& chain) {
  return [&chain]() { return chain.latest_block_number(); };
}

/// Normalizes the range, prepares the output area and runs one extraction.
/// `files` is filled on success; the returned document is the query_dataset result.
json fetch_dataset(ProcessRunner& runner,
                   ChainClient& chain,
                   const Config& config,
                   ExtractionRequest request,
                   const BlockRangeRequest& range_req,
                   std::vector<std::string>& files) {
  NormalizedRange range;
  std::string error;
  if (!normalize_block_range(range_req, kQueryRangeDefaults, head_lookup_for(chain), range, error)) {
    return {{"error", error}};
  }
  if (!prepare_output_directory(config.data_dir, range, request.dataset, request.output_dir, error)) {
    return {{"error", error}};
  }
  request.block_range = range.range;
  request.rpc_url = config.rpc_url;

  ExtractionResult result = run_extraction(runner, config.cryo_bin, request);
  if (!result.ok) {
    json doc = {{"error", result.error}};
    if (!result.stdout_text.empty()) doc["stdout"] = result.stdout_text;
    doc["command"] = result.command;
    return doc;
  }
  files = result.files;
  return {{"files", result.files},
          {"count", result.files.size()},
          {"format", format_extension(request.format)},
          {"block_range", range.range}};
}

json sql_examples() {
  json examples = json::object();
  examples["basic"] = {
      "SELECT * FROM blocks LIMIT 10",
      "SELECT COUNT(*) AS block_count FROM blocks",
      "SELECT block_number, gas_used, base_fee_per_gas FROM blocks ORDER BY block_number DESC LIMIT 5"};
  examples["transactions"] = {
      "SELECT from_address, COUNT(*) AS tx_count FROM transactions GROUP BY from_address "
      "ORDER BY tx_count DESC LIMIT 10",
      "SELECT block_number, COUNT(*) AS tx_count, SUM(gas_used) AS total_gas FROM transactions "
      "GROUP BY block_number ORDER BY block_number",
      "SELECT transaction_hash, value FROM transactions WHERE value > 0 ORDER BY value DESC LIMIT 10"};
  examples["joins"] = {
      "SELECT b.block_number, b.timestamp, COUNT(t.transaction_hash) AS tx_count FROM blocks b "
      "JOIN transactions t ON b.block_number = t.block_number GROUP BY b.block_number, b.timestamp "
      "ORDER BY b.block_number"};
  examples["logs"] = {
      "SELECT address, COUNT(*) AS events FROM logs GROUP BY address ORDER BY events DESC LIMIT 10",
      "SELECT topic0, COUNT(*) AS occurrences FROM logs GROUP BY topic0 ORDER BY occurrences DESC"};
  examples["direct_files"] = {
      "SELECT COUNT(*) FROM read_parquet('/path/to/ethereum__blocks__00001000_to_00001010.parquet')"};
  return examples;
}

}  // namespace

const std::vector<ToolDescriptor>& tool_descriptors() {
  static const std::vector<ToolDescriptor> tools = build_descriptors();
  return tools;
}

json tool_descriptors_json() {
  json out = json::array();
  for (const auto& tool : tool_descriptors()) {
    out.push_back({{"name", tool.name},
                   {"description", tool.description},
                   {"inputSchema", tool.input_schema}});
  }
  return out;
}

bool is_failure_document(const json& document) {
  if (!document.is_object()) return false;
  if (document.contains("success") && document["success"].is_boolean()) {
    return !document["success"].get<bool>();
  }
  return document.contains("error");
}

ToolService::ToolService(ConfigOverrides process_wide, ProcessRunner& runner, RpcTransport& transport)
    : process_wide_(std::move(process_wide)), runner_(runner), transport_(transport) {}

Config ToolService::config_for(const json& args) const {
  ConfigOverrides per_call;
  per_call.rpc_url = optional_string(args, "rpc_url");
  per_call.data_dir = optional_string(args, "data_dir");
  return resolve_config(per_call, process_wide_);
}

ToolCallOutcome ToolService::call(const std::string& name, const json& raw_args) {
  using Handler = json (ToolService::*)(const json&);
  static const std::vector<std::pair<std::string, Handler>> handlers = {
      {"list_datasets", &ToolService::list_datasets},
      {"query_dataset", &ToolService::query_dataset},
      {"get_dataset_info", &ToolService::get_dataset_info},
      {"lookup_dataset", &ToolService::lookup_dataset},
      {"query_sql", &ToolService::query_sql},
      {"list_available_sql_tables", &ToolService::list_available_sql_tables},
      {"get_sql_table_schema", &ToolService::get_sql_table_schema},
      {"query_blockchain_sql", &ToolService::query_blockchain_sql},
      {"get_sql_examples", &ToolService::get_sql_examples},
      {"get_latest_ethereum_block", &ToolService::get_latest_ethereum_block},
      {"get_transaction_by_hash", &ToolService::get_transaction_by_hash},
  };

  ToolCallOutcome outcome;
  const json args = raw_args.is_null() ? json::object() : raw_args;
  if (!args.is_object()) {
    outcome.error = "Tool arguments must be a JSON object";
    return outcome;
  }
  for (const auto& entry : handlers) {
    if (entry.first != name) continue;
    try {
      outcome.document = (this->*entry.second)(args);
      outcome.ok = true;
    } catch (const ToolArgumentError& ex) {
      outcome.error = ex.what();
    } catch (const std::exception& ex) {
      log::warn("Tool '" + name + "' failed: " + ex.what());
      outcome.ok = true;
      outcome.document = {{"error", ex.what()}};
    }
    return outcome;
  }
  outcome.error = "Unknown tool: " + name;
  return outcome;
}

json ToolService::list_datasets(const json& args) {
  Config config = config_for(args);
  std::vector<std::string> cmd = {config.cryo_bin, "help", "datasets", "-r", config.rpc_url};
  ProcessResult proc = runner_.run(cmd, std::nullopt);
  if (!proc.launched || proc.timed_out) {
    return {{"error", proc.error}, {"command", util::join(cmd)}};
  }
  if (proc.exit_code != 0) {
    return {{"error", proc.stderr_text}, {"command", util::join(cmd)}};
  }
  std::vector<std::string> datasets = parse_dataset_listing(proc.stdout_text);
  return {{"datasets", datasets}, {"count", datasets.size()}};
}

json ToolService::query_dataset(const json& args) {
  Config config = config_for(args);
  ExtractionRequest request;
  request.dataset = required_string(args, "dataset");
  request.contract = optional_string(args, "contract");
  std::string error;
  if (auto format = optional_string(args, "output_format")) {
    if (!parse_output_format(*format, request.format, error)) throw ToolArgumentError(error);
  }
  request.include_columns = string_list(args, "include_columns");
  request.exclude_columns = string_list(args, "exclude_columns");

  ChainClient chain(config.rpc_url, transport_);
  std::vector<std::string> files;
  return fetch_dataset(runner_, chain, config, std::move(request), range_request(args), files);
}

json ToolService::dataset_info(const Config& config, const std::string& name) {
  ProcessResult help = runner_.run({config.cryo_bin, "help", name, "-r", config.rpc_url}, std::nullopt);
  ChainClient chain(config.rpc_url, transport_);
  std::optional<int64_t> head = chain.latest_block_number();

  json examples = json::array();
  examples.push_back("query_dataset('" + name + "', blocks='1000:1010')");
  examples.push_back("query_dataset('" + name + "', start_block=1000, end_block=1009)");
  examples.push_back("query_dataset('" + name + "', use_latest=True)  # Gets just the latest block");
  if (head.has_value()) {
    examples.push_back("query_dataset('" + name +
                       "', blocks_from_latest=10)  # Gets latest-10 to latest blocks");
  }

  json info = json::object();
  info["name"] = name;
  info["description"] = help.stdout_text;
  if (!help.launched) info["description_error"] = help.error;
  info["example_queries"] = std::move(examples);
  info["notes"] = {
      "Block ranges are inclusive for start_block and end_block when using integer parameters.",
      "Use 'use_latest=True' to query only the latest block.",
      "Use 'blocks_from_latest=N' to query the latest N blocks."};
  return info;
}

json ToolService::get_dataset_info(const json& args) {
  return dataset_info(config_for(args), required_string(args, "name"));
}

json ToolService::lookup_dataset(const json& args) {
  Config config = config_for(args);
  const std::string name = required_string(args, "name");
  BlockRangeRequest sample;
  sample.start_block = optional_int(args, "sample_start_block");
  sample.end_block = optional_int(args, "sample_end_block");
  sample.use_latest = optional_bool(args, "use_latest_sample", false);
  sample.blocks_from_latest = optional_int(args, "sample_blocks_from_latest");

  json info = dataset_info(config, name);

  ProcessResult dry_run = runner_.run({config.cryo_bin, name, "--dry-run", "-r", config.rpc_url},
                                      std::nullopt);
  if (dry_run.launched && dry_run.exit_code == 0) {
    info["schema"] = dry_run.stdout_text;
  } else {
    info["schema_error"] = dry_run.launched ? dry_run.stderr_text : dry_run.error;
  }

  ChainClient chain(config.rpc_url, transport_);
  NormalizedRange range;
  std::string error;
  if (!normalize_block_range(sample, kSampleRangeDefaults, head_lookup_for(chain), range, error)) {
    info["sample_error"] = error;
    return info;
  }
  info["sample_block_range"] = range.range;

  ExtractionRequest request;
  request.dataset = name;
  request.block_range = range.range;
  request.rpc_url = config.rpc_url;
  request.format = OutputFormat::Json;
  request.timeout_ms = kSampleTimeoutMs;
  if (!prepare_output_directory(config.data_dir, range, name, request.output_dir, error)) {
    info["sample_error"] = error;
    return info;
  }

  ExtractionResult result = run_extraction(runner_, config.cryo_bin, request);
  if (result.ok) {
    info["sample_files"] = result.files;
  } else {
    info["sample_error"] = result.error;
    if (!result.stdout_text.empty()) info["sample_stdout"] = result.stdout_text;
  }
  return info;
}

json ToolService::query_sql(const json& args) {
  Config config = config_for(args);
  const std::string sql = required_string(args, "query");
  std::vector<std::string> files = string_list(args, "files");
  bool include_schema = optional_bool(args, "include_schema", true);
  return to_json(execute_sql_query(sql, files, include_schema, config.data_dir));
}

json ToolService::list_available_sql_tables(const json& args) {
  Config config = config_for(args);
  json tables = json::array();
  for (const auto& file : list_available_tables(config.data_dir)) {
    tables.push_back({{"name", file.name},
                      {"path", file.path.string()},
                      {"size_bytes", file.size_bytes},
                      {"modified", file.modified},
                      {"block_range", file.block_range},
                      {"is_latest", file.is_latest}});
  }
  return {{"tables", tables}, {"count", tables.size()}};
}

json ToolService::get_sql_table_schema(const json& args) {
  return to_json(get_table_schema(required_string(args, "file_path")));
}

json ToolService::query_blockchain_sql(const json& args) {
  Config config = config_for(args);
  const std::string sql = required_string(args, "sql_query");
  bool include_schema = optional_bool(args, "include_schema", true);

  std::optional<std::string> dataset = optional_string(args, "dataset");
  if (!dataset.has_value() || dataset->empty()) dataset = extract_dataset_from_sql(sql);
  if (!dataset.has_value()) {
    return {{"success", false},
            {"error_kind", "precondition"},
            {"error", "Could not determine dataset from SQL query. Please specify dataset parameter."}};
  }

  ExtractionRequest request;
  request.dataset = *dataset;
  request.contract = optional_string(args, "contract");
  request.format = OutputFormat::Parquet;

  ChainClient chain(config.rpc_url, transport_);
  std::vector<std::string> files;
  json download = fetch_dataset(runner_, chain, config, std::move(request), range_request(args), files);
  if (download.contains("error")) {
    return {{"success", false},
            {"error_kind", "collaborator"},
            {"error", "Failed to download data: " + download["error"].get<std::string>()},
            {"download_details", download}};
  }
  if (files.empty()) {
    return {{"success", false},
            {"error_kind", "no_files"},
            {"error", "No data files were generated for the requested range"},
            {"download_details", download}};
  }

  json result = to_json(execute_sql_query(sql, files, include_schema, config.data_dir));
  result["data_source"] = {{"dataset", *dataset},
                           {"block_range", download.value("block_range", "")},
                           {"files", files}};
  return result;
}

json ToolService::get_sql_examples(const json&) {
  return sql_examples();
}

json ToolService::get_latest_ethereum_block(const json& args) {
  Config config = config_for(args);
  ChainClient chain(config.rpc_url, transport_);
  std::optional<int64_t> head = chain.latest_block_number();
  if (!head.has_value()) return {{"error", kHeadUnavailableError}};

  NormalizedRange range;
  range.range = format_range(*head, *head + 1);
  range.latest = true;
  range.head = head;

  ExtractionRequest request;
  request.dataset = "blocks";
  request.block_range = range.range;
  request.rpc_url = config.rpc_url;
  request.format = OutputFormat::Json;
  std::string error;
  if (!prepare_output_directory(config.data_dir, range, request.dataset, request.output_dir, error)) {
    return {{"block_number", *head}, {"error", error}};
  }

  ExtractionResult result = run_extraction(runner_, config.cryo_bin, request);
  if (result.ok) {
    return {{"block_number", *head}, {"files", result.files}, {"count", result.files.size()}};
  }
  if (result.error == kNoOutputError) {
    return {{"block_number", *head}, {"error", kNoOutputError}};
  }
  return {{"block_number", *head},
          {"error", "Failed to get detailed block data"},
          {"stderr", result.error}};
}

json ToolService::get_transaction_by_hash(const json& args) {
  Config config = config_for(args);
  ChainClient chain(config.rpc_url, transport_);
  return chain.transaction_by_hash(required_string(args, "tx_hash"));
}

}  // namespace cryoql
