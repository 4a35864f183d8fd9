#include "cryoql/query_executor.h"

#include <exception>
#include <system_error>
#include <utility>

#include "cryoql/catalog.h"
#include "cryoql/log.h"
#include "engine/query_session.h"

namespace cryoql {

namespace fs = std::filesystem;

const char* error_kind_name(QueryOutcome::ErrorKind kind) {
  switch (kind) {
    case QueryOutcome::ErrorKind::NoFiles: return "no_files";
    case QueryOutcome::ErrorKind::Engine: return "engine";
    case QueryOutcome::ErrorKind::None: break;
  }
  return "none";
}

std::vector<fs::path> resolve_file_pool(const std::vector<std::string>& files,
                                        const fs::path& data_root) {
  if (files.empty()) return list_parquet_files(data_root);
  std::vector<fs::path> pool;
  for (const auto& file : files) {
    fs::path path(file);
    std::error_code ec;
    if (fs::exists(path, ec) && path.extension() == ".parquet") {
      pool.push_back(path);
    } else {
      log::warn("File not found or not a parquet file: " + file);
    }
  }
  return pool;
}

QueryOutcome execute_sql_query(const std::string& sql,
                               const std::vector<std::string>& files,
                               bool include_schema,
                               const fs::path& data_root) {
  QueryOutcome outcome;
  std::vector<fs::path> pool = resolve_file_pool(files, data_root);
  for (const auto& path : pool) outcome.files_used.push_back(path.string());
  if (pool.empty()) {
    outcome.error_kind = QueryOutcome::ErrorKind::NoFiles;
    outcome.error = kNoFilesError;
    return outcome;
  }

  try {
    engine::QuerySession session;
    if (!session.timeout_applied()) {
      log::info("Engine has no query_timeout_ms setting; query runs without a time limit");
    }
    std::vector<TableBinding> bindings = plan_bindings(sql, pool);
    for (const auto& binding : bindings) {
      session.create_view(binding.name, binding_select_sql(binding));
      if (binding.combined()) {
        log::info("Registered view '" + binding.name + "' for " +
                  std::to_string(binding.files.size()) + " files using UNION ALL");
      } else {
        log::info("Registered view '" + binding.name + "' for file: " +
                  binding.files.front().string());
      }
    }

    log::info("Executing SQL query: " + sql);
    auto result = session.query(sql);
    outcome.rows = engine::rows_to_json(*result);
    outcome.row_count = outcome.rows.size();
    if (include_schema && outcome.row_count > 0) {
      outcome.schema = engine::schema_to_json(*result);
    }
    outcome.bindings = std::move(bindings);
    outcome.success = true;
  } catch (const std::exception& ex) {
    log::warn(std::string("SQL query error: ") + ex.what());
    outcome = QueryOutcome{};
    outcome.error_kind = QueryOutcome::ErrorKind::Engine;
    outcome.error = ex.what();
    for (const auto& path : pool) outcome.files_used.push_back(path.string());
  }
  return outcome;
}

json to_json(const QueryOutcome& outcome) {
  json doc = json::object();
  doc["success"] = outcome.success;
  if (!outcome.success) {
    doc["error"] = outcome.error;
    doc["error_kind"] = error_kind_name(outcome.error_kind);
    if (outcome.error_kind == QueryOutcome::ErrorKind::Engine) {
      doc["files_available"] = outcome.files_used;
    }
    return doc;
  }
  doc["result"] = outcome.rows;
  doc["row_count"] = outcome.row_count;
  doc["schema"] = outcome.schema.has_value() ? *outcome.schema : json(nullptr);
  doc["files_used"] = outcome.files_used;
  doc["used_direct_references"] = outcome.used_direct_references();
  if (outcome.bindings.empty()) {
    doc["table_mappings"] = nullptr;
  } else {
    json mappings = json::object();
    for (const auto& binding : outcome.bindings) {
      json files = json::array();
      for (const auto& path : binding.files) files.push_back(path.string());
      mappings[binding.name] = {{"files", std::move(files)},
                                {"combined", binding.combined()},
                                {"tier", match_tier_name(binding.tier)}};
    }
    doc["table_mappings"] = std::move(mappings);
  }
  return doc;
}

}  // namespace cryoql
