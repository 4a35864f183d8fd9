#pragma once

#include <cstdint>
#include <string>

#include "cryoql/json.h"

namespace cryoql {

constexpr int kSchemaSampleRows = 5;

struct TableSchema {
  bool success = false;
  bool precondition_failed = false;
  std::string error;
  std::string file_path;
  json columns = json::array();      // [{"column_name", "data_type"}]
  json sample_data = json::array();
  int64_t row_count = 0;
};

/// Column list, first rows and full row count of one parquet file.
/// A missing path or non-parquet extension fails before the engine is opened.
TableSchema get_table_schema(const std::string& file_path);

json to_json(const TableSchema& schema);

}  // namespace cryoql
