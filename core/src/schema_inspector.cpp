#include "cryoql/schema_inspector.h"

#include <exception>
#include <filesystem>
#include <system_error>

#include "engine/query_session.h"
#include "util/string_util.h"

namespace cryoql {

namespace {

constexpr const char* kInspectView = "temp_view";

}  // namespace

TableSchema get_table_schema(const std::string& file_path) {
  TableSchema schema;
  schema.file_path = file_path;
  std::filesystem::path path(file_path);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec) || path.extension() != ".parquet") {
    schema.precondition_failed = true;
    schema.error = "File not found or not a parquet file: " + file_path;
    return schema;
  }

  try {
    engine::QuerySession session;
    session.create_view(kInspectView, "SELECT * FROM read_parquet(" +
                                          util::sql_quote_literal(file_path) + ")");
    auto columns = session.query(
        "SELECT column_name, data_type FROM information_schema.columns "
        "WHERE table_name = '" + std::string(kInspectView) + "' ORDER BY ordinal_position");
    schema.columns = engine::rows_to_json(*columns);

    auto sample = session.query("SELECT * FROM " + std::string(kInspectView) +
                                " LIMIT " + std::to_string(kSchemaSampleRows));
    schema.sample_data = engine::rows_to_json(*sample);

    auto count = session.query("SELECT COUNT(*) AS count FROM " + std::string(kInspectView));
    schema.row_count = count->GetValue(0, 0).GetValue<int64_t>();
    schema.success = true;
  } catch (const std::exception& ex) {
    schema.error = ex.what();
  }
  return schema;
}

json to_json(const TableSchema& schema) {
  json doc = json::object();
  doc["success"] = schema.success;
  if (!schema.success) {
    doc["error"] = schema.error;
    doc["error_kind"] = schema.precondition_failed ? "precondition" : "engine";
    return doc;
  }
  doc["file_path"] = schema.file_path;
  doc["columns"] = schema.columns;
  doc["sample_data"] = schema.sample_data;
  doc["row_count"] = schema.row_count;
  return doc;
}

}  // namespace cryoql
