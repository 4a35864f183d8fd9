#include "test_harness.h"

#include <filesystem>
#include <string>
#include <vector>

#include "cryoql/catalog.h"
#include "test_utils.h"

namespace {

void test_infer_dataset_name_from_segments() {
  expect_eq(cryoql::infer_dataset_name("ethereum__blocks__00001000_to_00001010"), "blocks",
            "network__dataset__range");
  expect_eq(cryoql::infer_dataset_name("transactions__00001000_to_00001010"), "transactions",
            "dataset__range");
  expect_eq(cryoql::infer_dataset_name("logs_sample"), "logs", "leading word before underscore");
  expect_eq(cryoql::infer_dataset_name("blocks"), "blocks", "bare stem");
}

void test_infer_block_range_drops_leading_zeros() {
  expect_eq(cryoql::infer_block_range("ethereum__blocks__00001000_to_00001010"), "1000:1010",
            "padded range");
  expect_eq(cryoql::infer_block_range("ethereum__blocks__00000000_to_00000009"), "0:9", "genesis range");
  expect_eq(cryoql::infer_block_range("blocks_sample"), "", "no range tag");
}

void test_list_available_tables_recurses_and_flags_latest() {
  TempDir dir("catalog");
  write_text_file(dir.path() / "ethereum__blocks__00001000_to_00001010.parquet", "x");
  write_text_file(dir.path() / "latest" / "ethereum__blocks__00002000_to_00002000.parquet", "yy");
  write_text_file(dir.path() / "ethereum__blocks__00001000_to_00001010.json", "[]");
  write_text_file(dir.path() / ".cryo" / "reports" / "run.json", "{}");

  auto tables = cryoql::list_available_tables(dir.path());
  expect_eq(tables.size(), 2, "only parquet files listed");
  if (tables.size() != 2) return;
  expect_true(tables[0].path < tables[1].path, "sorted by path");
  const auto& historical = tables[0].is_latest ? tables[1] : tables[0];
  const auto& latest = tables[0].is_latest ? tables[0] : tables[1];
  expect_true(latest.is_latest && !historical.is_latest, "latest flag from parent directory");
  expect_eq(historical.name, "blocks", "dataset inferred");
  expect_eq(historical.block_range, "1000:1010", "range inferred");
  expect_eq(static_cast<size_t>(latest.size_bytes), 2, "size reported");
  expect_true(historical.modified > 0.0, "mtime reported");
}

void test_missing_root_lists_nothing() {
  expect_eq(cryoql::list_parquet_files("/nonexistent/cryoql/root").size(), 0, "missing root is empty");
}

}  // namespace

void register_catalog_tests(std::vector<TestCase>& tests) {
  tests.push_back({"infer_dataset_name_from_segments", test_infer_dataset_name_from_segments});
  tests.push_back({"infer_block_range_drops_leading_zeros", test_infer_block_range_drops_leading_zeros});
  tests.push_back({"list_available_tables_recurses_and_flags_latest",
                   test_list_available_tables_recurses_and_flags_latest});
  tests.push_back({"missing_root_lists_nothing", test_missing_root_lists_nothing});
}
