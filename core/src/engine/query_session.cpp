#include "engine/query_session.h"

#include <stdexcept>
#include <utility>

#include "cryoql/log.h"
#include "util/string_util.h"

namespace cryoql::engine {

namespace {

constexpr const char* kMemoryLimit = "SET memory_limit='4GB'";
constexpr const char* kExpressionDepth = "SET max_expression_depth=10000";
constexpr const char* kQueryTimeout = "SET query_timeout_ms=30000";

std::string hex_encode(const std::string& bytes) {
  static const char kDigits[] = "0123456789abcdef";
  std::string out = "0x";
  out.reserve(2 + bytes.size() * 2);
  for (unsigned char c : bytes) {
    out.push_back(kDigits[c >> 4]);
    out.push_back(kDigits[c & 0x0f]);
  }
  return out;
}

}  // namespace

QuerySession::QuerySession()
    : owned_db_(std::make_unique<duckdb::DuckDB>(nullptr)), con_(*owned_db_) {
  apply_safety_limits();
}

QuerySession::QuerySession(duckdb::DuckDB& database) : con_(database) {
  apply_safety_limits();
}

QuerySession::~QuerySession() {
  try {
    release_views();
  } catch (const std::exception& ex) {
    log::warn(std::string("Failed to release query views: ") + ex.what());
  }
}

void QuerySession::apply_safety_limits() {
  for (const char* statement : {kMemoryLimit, kExpressionDepth}) {
    auto result = con_.Query(statement);
    if (result->HasError()) {
      throw std::runtime_error(result->GetError());
    }
  }
  // Not every engine build knows this setting; a rejection leaves the query unbounded.
  auto timeout_setting = con_.Query(kQueryTimeout);
  timeout_applied_ = !timeout_setting->HasError();
}

void QuerySession::create_view(const std::string& name, const std::string& select_sql) {
  const std::string ident = util::sql_quote_identifier(name);
  query("DROP VIEW IF EXISTS " + ident);
  query("CREATE VIEW " + ident + " AS " + select_sql);
  views_.push_back(name);
}

std::unique_ptr<duckdb::MaterializedQueryResult> QuerySession::query(const std::string& sql) {
  auto result = con_.Query(sql);
  if (result->HasError()) {
    throw std::runtime_error(result->GetError());
  }
  return result;
}

void QuerySession::release_views() {
  for (auto it = views_.rbegin(); it != views_.rend(); ++it) {
    auto result = con_.Query("DROP VIEW IF EXISTS " + util::sql_quote_identifier(*it));
    if (result->HasError()) {
      log::warn("Failed to drop view '" + *it + "': " + result->GetError());
    }
  }
  views_.clear();
}

json value_to_json(const duckdb::Value& value) {
  if (value.IsNull()) return nullptr;
  switch (value.type().id()) {
    case duckdb::LogicalTypeId::BOOLEAN:
      return value.GetValue<bool>();
    case duckdb::LogicalTypeId::TINYINT:
    case duckdb::LogicalTypeId::SMALLINT:
    case duckdb::LogicalTypeId::INTEGER:
    case duckdb::LogicalTypeId::BIGINT:
    case duckdb::LogicalTypeId::UTINYINT:
    case duckdb::LogicalTypeId::USMALLINT:
    case duckdb::LogicalTypeId::UINTEGER:
      return value.GetValue<int64_t>();
    case duckdb::LogicalTypeId::UBIGINT:
      return value.GetValue<uint64_t>();
    case duckdb::LogicalTypeId::FLOAT:
    case duckdb::LogicalTypeId::DOUBLE:
    case duckdb::LogicalTypeId::DECIMAL:
      return value.GetValue<double>();
    case duckdb::LogicalTypeId::VARCHAR:
      return value.GetValue<std::string>();
    case duckdb::LogicalTypeId::BLOB:
      return hex_encode(duckdb::StringValue::Get(value));
    default:
      // HUGEINT amounts, temporal and nested types keep the engine's text form.
      return value.ToString();
  }
}

json rows_to_json(duckdb::MaterializedQueryResult& result) {
  json rows = json::array();
  const duckdb::idx_t columns = result.ColumnCount();
  for (duckdb::idx_t row = 0; row < result.RowCount(); ++row) {
    json record = json::object();
    for (duckdb::idx_t col = 0; col < columns; ++col) {
      record[result.names[col]] = value_to_json(result.GetValue(col, row));
    }
    rows.push_back(std::move(record));
  }
  return rows;
}

json schema_to_json(const duckdb::MaterializedQueryResult& result) {
  json schema = json::object();
  schema["columns"] = result.names;
  json dtypes = json::object();
  for (size_t i = 0; i < result.names.size() && i < result.types.size(); ++i) {
    dtypes[result.names[i]] = result.types[i].ToString();
  }
  schema["dtypes"] = std::move(dtypes);
  return schema;
}

}  // namespace cryoql::engine
