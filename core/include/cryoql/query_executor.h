#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "cryoql/json.h"
#include "cryoql/table_resolver.h"

namespace cryoql {

constexpr const char* kNoFilesError =
    "No parquet files available. Download data first with query_dataset.";

/// Outcome of one SQL execution; converted to the caller document by to_json.
/// MUST distinguish a missing file pool (no engine call) from an engine failure.
struct QueryOutcome {
  enum class ErrorKind { None, NoFiles, Engine };

  bool success = false;
  ErrorKind error_kind = ErrorKind::None;
  std::string error;
  json rows = json::array();
  size_t row_count = 0;
  std::optional<json> schema;
  std::vector<std::string> files_used;
  std::vector<TableBinding> bindings;

  bool used_direct_references() const { return !bindings.empty(); }
};

const char* error_kind_name(QueryOutcome::ErrorKind kind);

/// Explicit files filtered to existing `.parquet` paths (others are logged and
/// dropped), or every parquet file under data_root when none were given.
std::vector<std::filesystem::path> resolve_file_pool(const std::vector<std::string>& files,
                                                     const std::filesystem::path& data_root);

/// Binds the query's logical tables over the pool in a fresh session, runs it,
/// and materializes every row. Never throws; all failures land in the outcome.
QueryOutcome execute_sql_query(const std::string& sql,
                               const std::vector<std::string>& files,
                               bool include_schema,
                               const std::filesystem::path& data_root);

json to_json(const QueryOutcome& outcome);

}  // namespace cryoql
