#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cryoql {

/// Ordered matching tiers for binding a logical table name to files.
/// Earlier tiers are authoritative: a non-empty tier hides every later one.
enum class MatchTier {
  None,
  ExactMarker,   // filename contains `__<name>__`
  Delimited,     // filename contains `_<name>_`
  Prefix,        // filename starts with `<name>_` or `<name>.`
};

const char* match_tier_name(MatchTier tier);

/// Files backing one logical table in a query, in pool order.
struct TableBinding {
  std::string name;
  std::vector<std::filesystem::path> files;
  MatchTier tier = MatchTier::None;
  bool combined() const { return files.size() > 1; }
};

/// Identifiers following FROM/JOIN (case-insensitive) minus clause keywords,
/// in query order with duplicates kept.
std::vector<std::string> extract_table_names(const std::string& sql);
/// First candidate table name, used to infer the dataset a query targets.
std::optional<std::string> extract_dataset_from_sql(const std::string& sql);
/// True when the query already reads files natively and mentions `name`;
/// such names are left to the engine and never bound to a view.
bool is_direct_file_reference(const std::string& sql, const std::string& name);

/// Evaluates the tiers in order against each file name and returns the first
/// non-empty tier's hits. Deterministic for a fixed pool.
std::vector<std::filesystem::path> match_files(const std::string& name,
                                               const std::vector<std::filesystem::path>& pool,
                                               MatchTier* tier_out = nullptr);

/// Resolves every candidate name in the query into a binding.
/// Names with no matching files are skipped silently; the engine reports them.
/// Inputs are the raw SQL and the candidate pool; no side effects.
std::vector<TableBinding> plan_bindings(const std::string& sql,
                                        const std::vector<std::filesystem::path>& pool);

/// SELECT body for a binding: one read_parquet for a single file,
/// a UNION ALL of reads for several.
std::string binding_select_sql(const TableBinding& binding);

}  // namespace cryoql
