#include "test_harness.h"

#include <filesystem>
#include <string>
#include <vector>

#include "cryoql/table_resolver.h"

namespace {

namespace fs = std::filesystem;

std::vector<fs::path> pool_of(const std::vector<std::string>& names) {
  std::vector<fs::path> pool;
  for (const auto& name : names) pool.push_back(fs::path("/data") / name);
  return pool;
}

void test_extract_table_names_skips_keywords() {
  auto names = cryoql::extract_table_names(
      "select count(*) from blocks b join Transactions t on b.block_number = t.block_number "
      "where b.block_number in (select block_number FROM\n  logs)");
  expect_eq(names.size(), 3, "three table names");
  if (names.size() == 3) {
    expect_eq(names[0], "blocks", "first table");
    expect_eq(names[1], "Transactions", "case preserved");
    expect_eq(names[2], "logs", "newline after FROM tolerated");
  }
  expect_eq(cryoql::extract_table_names("SELECT * FROM (SELECT 1) WHERE 1=1").size(), 0,
            "subquery yields no names");
  expect_eq(cryoql::extract_table_names("DELETE FROM where_clause").size(), 1,
            "keyword prefix is still a name");
}

void test_extract_dataset_from_sql() {
  expect_true(cryoql::extract_dataset_from_sql("SELECT * FROM logs LIMIT 5") == std::string("logs"),
              "dataset inferred from first table");
  expect_true(!cryoql::extract_dataset_from_sql("SELECT 1").has_value(), "no table, no dataset");
}

void test_exact_marker_tier_is_authoritative() {
  auto pool = pool_of({"ethereum__blocks__00001000_to_00001010.parquet",
                       "blocks_sample.parquet",
                       "my_blocks_extra.parquet"});
  cryoql::MatchTier tier = cryoql::MatchTier::None;
  auto files = cryoql::match_files("blocks", pool, &tier);
  expect_eq(files.size(), 1, "exact marker hides looser tiers");
  expect_true(tier == cryoql::MatchTier::ExactMarker, "exact tier reported");
  expect_true(!files.empty() && files[0].filename() == "ethereum__blocks__00001000_to_00001010.parquet",
              "bound to the marker file");
}

void test_delimited_then_prefix_tiers() {
  cryoql::MatchTier tier = cryoql::MatchTier::None;
  auto delimited = cryoql::match_files("logs", pool_of({"logs.parquet", "chain_logs_1.parquet"}), &tier);
  expect_eq(delimited.size(), 1, "delimited tier wins over prefix");
  expect_true(tier == cryoql::MatchTier::Delimited, "delimited tier reported");

  auto prefix = cryoql::match_files("logs", pool_of({"logs.parquet", "logs_1.parquet", "catalogs.parquet"}),
                                    &tier);
  expect_eq(prefix.size(), 2, "prefix tier includes every tie");
  expect_true(tier == cryoql::MatchTier::Prefix, "prefix tier reported");

  auto none = cryoql::match_files("traces", pool_of({"logs.parquet"}), &tier);
  expect_eq(none.size(), 0, "no match");
  expect_true(tier == cryoql::MatchTier::None, "none tier reported");
}

void test_match_is_case_insensitive_on_file_names_only() {
  auto pool = std::vector<fs::path>{"/srv/_blocks_/ETHEREUM__BLOCKS__1_to_2.parquet",
                                    "/srv/_blocks_/ethereum__logs__1_to_2.parquet"};
  auto files = cryoql::match_files("Blocks", pool);
  expect_eq(files.size(), 1, "directory names never match");
}

void test_plan_bindings_union_and_exemptions() {
  auto pool = pool_of({"ethereum__blocks__00001000_to_00001009.parquet",
                       "ethereum__blocks__00001010_to_00001019.parquet",
                       "ethereum__transactions__00001000_to_00001009.parquet"});
  auto bindings = cryoql::plan_bindings(
      "SELECT * FROM blocks JOIN transactions USING (block_number) JOIN blocks b2 USING (block_number) "
      "JOIN traces USING (block_number)",
      pool);
  expect_eq(bindings.size(), 2, "duplicates collapsed and unmatched names skipped");
  if (bindings.size() == 2) {
    expect_eq(bindings[0].name, "blocks", "query order kept");
    expect_true(bindings[0].combined(), "two block files combine");
    expect_true(!bindings[1].combined(), "single transactions file");
  }

  auto direct = cryoql::plan_bindings(
      "SELECT COUNT(*) FROM read_parquet('/data/ethereum__blocks__00001000_to_00001009.parquet') "
      "JOIN blocks USING (block_number)",
      pool);
  expect_eq(direct.size(), 0, "names already read natively are left alone");
}

void test_plan_bindings_is_deterministic() {
  auto pool = pool_of({"ethereum__blocks__2.parquet", "ethereum__blocks__1.parquet"});
  const std::string sql = "SELECT * FROM blocks";
  auto first = cryoql::plan_bindings(sql, pool);
  auto second = cryoql::plan_bindings(sql, pool);
  expect_true(first.size() == 1 && second.size() == 1 && first[0].files == second[0].files,
              "same pool, same bindings");
  expect_eq(cryoql::binding_select_sql(first[0]), cryoql::binding_select_sql(second[0]),
            "same view body");
}

void test_binding_select_sql_unions_files() {
  cryoql::TableBinding binding;
  binding.name = "blocks";
  binding.files = {"/d/a.parquet", "/d/o'b.parquet"};
  expect_eq(cryoql::binding_select_sql(binding),
            "SELECT * FROM read_parquet('/d/a.parquet') UNION ALL SELECT * FROM read_parquet('/d/o''b.parquet')",
            "union of quoted reads");
}

}  // namespace

void register_table_resolver_tests(std::vector<TestCase>& tests) {
  tests.push_back({"extract_table_names_skips_keywords", test_extract_table_names_skips_keywords});
  tests.push_back({"extract_dataset_from_sql", test_extract_dataset_from_sql});
  tests.push_back({"exact_marker_tier_is_authoritative", test_exact_marker_tier_is_authoritative});
  tests.push_back({"delimited_then_prefix_tiers", test_delimited_then_prefix_tiers});
  tests.push_back({"match_is_case_insensitive_on_file_names_only",
                   test_match_is_case_insensitive_on_file_names_only});
  tests.push_back({"plan_bindings_union_and_exemptions", test_plan_bindings_union_and_exemptions});
  tests.push_back({"plan_bindings_is_deterministic", test_plan_bindings_is_deterministic});
  tests.push_back({"binding_select_sql_unions_files", test_binding_select_sql_unions_files});
}
