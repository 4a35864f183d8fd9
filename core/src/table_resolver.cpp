#include "cryoql/table_resolver.h"

#include <regex>
#include <unordered_set>
#include <utility>

#include "util/string_util.h"

namespace cryoql {

namespace fs = std::filesystem;

namespace {

const std::unordered_set<std::string>& clause_keywords() {
  static const std::unordered_set<std::string> keywords = {
      "where", "select", "group", "order", "having", "limit", "offset"};
  return keywords;
}

bool tier_matches(MatchTier tier, const std::string& file_lower, const std::string& name_lower) {
  switch (tier) {
    case MatchTier::ExactMarker:
      return file_lower.find("__" + name_lower + "__") != std::string::npos;
    case MatchTier::Delimited:
      return file_lower.find("_" + name_lower + "_") != std::string::npos;
    case MatchTier::Prefix:
      return util::starts_with(file_lower, name_lower + "_") ||
             util::starts_with(file_lower, name_lower + ".");
    case MatchTier::None:
      break;
  }
  return false;
}

}  // namespace

const char* match_tier_name(MatchTier tier) {
  switch (tier) {
    case MatchTier::ExactMarker: return "exact_marker";
    case MatchTier::Delimited: return "delimited";
    case MatchTier::Prefix: return "prefix";
    case MatchTier::None: break;
  }
  return "none";
}

std::vector<std::string> extract_table_names(const std::string& sql) {
  static const std::regex table_ref("(?:FROM|JOIN)\\s+([a-zA-Z_][a-zA-Z0-9_]*)",
                                    std::regex::ECMAScript | std::regex::icase);
  std::vector<std::string> names;
  for (auto it = std::sregex_iterator(sql.begin(), sql.end(), table_ref);
       it != std::sregex_iterator(); ++it) {
    std::string name = (*it)[1].str();
    if (clause_keywords().count(util::to_lower(name)) != 0) continue;
    names.push_back(name);
  }
  return names;
}

std::optional<std::string> extract_dataset_from_sql(const std::string& sql) {
  std::vector<std::string> names = extract_table_names(sql);
  if (names.empty()) return std::nullopt;
  return names.front();
}

bool is_direct_file_reference(const std::string& sql, const std::string& name) {
  const std::string lowered = util::to_lower(sql);
  return lowered.find("read_parquet") != std::string::npos &&
         lowered.find(util::to_lower(name)) != std::string::npos;
}

std::vector<fs::path> match_files(const std::string& name,
                                  const std::vector<fs::path>& pool,
                                  MatchTier* tier_out) {
  const std::string name_lower = util::to_lower(name);
  for (MatchTier tier : {MatchTier::ExactMarker, MatchTier::Delimited, MatchTier::Prefix}) {
    std::vector<fs::path> hits;
    for (const auto& path : pool) {
      if (tier_matches(tier, util::to_lower(path.filename().string()), name_lower)) {
        hits.push_back(path);
      }
    }
    if (!hits.empty()) {
      if (tier_out) *tier_out = tier;
      return hits;
    }
  }
  if (tier_out) *tier_out = MatchTier::None;
  return {};
}

std::vector<TableBinding> plan_bindings(const std::string& sql, const std::vector<fs::path>& pool) {
  std::vector<TableBinding> bindings;
  std::unordered_set<std::string> seen;
  for (const auto& name : extract_table_names(sql)) {
    // Engine identifiers are case-insensitive; bind each name once.
    if (!seen.insert(util::to_lower(name)).second) continue;
    if (is_direct_file_reference(sql, name)) continue;
    TableBinding binding;
    binding.name = name;
    binding.files = match_files(name, pool, &binding.tier);
    if (binding.files.empty()) continue;
    bindings.push_back(std::move(binding));
  }
  return bindings;
}

std::string binding_select_sql(const TableBinding& binding) {
  std::string out;
  for (size_t i = 0; i < binding.files.size(); ++i) {
    if (i > 0) out += " UNION ALL ";
    out += "SELECT * FROM read_parquet(" + util::sql_quote_literal(binding.files[i].string()) + ")";
  }
  return out;
}

}  // namespace cryoql
