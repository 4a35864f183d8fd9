#pragma once

#include <memory>
#include <string>
#include <vector>

#include "duckdb.hpp"

#include "cryoql/json.h"

namespace cryoql::engine {

/// Connection to an in-memory DuckDB database scoped to one operation.
/// MUST drop every view it created before the connection closes, on every exit path.
/// Construction applies the working-memory and expression-depth limits and throws
/// std::runtime_error when either is rejected.
class QuerySession {
 public:
  /// Owns a fresh in-memory database.
  QuerySession();
  /// Connects to a database owned elsewhere; the views still die with the session.
  explicit QuerySession(duckdb::DuckDB& database);
  ~QuerySession();

  QuerySession(const QuerySession&) = delete;
  QuerySession& operator=(const QuerySession&) = delete;

  /// Replaces any existing view of the same name. Throws std::runtime_error on engine error.
  void create_view(const std::string& name, const std::string& select_sql);
  /// Runs one statement to completion. Throws std::runtime_error with the engine's text.
  std::unique_ptr<duckdb::MaterializedQueryResult> query(const std::string& sql);

  /// Drops every view created so far; the destructor calls this too.
  void release_views();

  const std::vector<std::string>& views() const { return views_; }
  /// Whether the advisory execution-time ceiling was accepted by this engine build.
  bool timeout_applied() const { return timeout_applied_; }

 private:
  void apply_safety_limits();

  std::unique_ptr<duckdb::DuckDB> owned_db_;
  duckdb::Connection con_;
  std::vector<std::string> views_;
  bool timeout_applied_ = false;
};

json value_to_json(const duckdb::Value& value);
/// Materializes every row as an object keyed by column name.
json rows_to_json(duckdb::MaterializedQueryResult& result);
/// {"columns": [...], "dtypes": {column: type}} for a result.
json schema_to_json(const duckdb::MaterializedQueryResult& result);

}  // namespace cryoql::engine
