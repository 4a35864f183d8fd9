#include "cryoql/extraction.h"

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>

#include "cryoql/json.h"
#include "cryoql/log.h"
#include "util/string_util.h"

namespace cryoql {

namespace fs = std::filesystem;

namespace {

std::optional<fs::path> newest_report(const fs::path& report_dir) {
  std::error_code ec;
  if (!fs::is_directory(report_dir, ec)) return std::nullopt;
  std::optional<fs::path> newest;
  fs::file_time_type newest_time{};
  fs::directory_iterator it(report_dir, ec);
  if (ec) return std::nullopt;
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) break;
    const fs::path& path = it->path();
    if (path.extension() != ".json") continue;
    std::error_code time_ec;
    auto modified = fs::last_write_time(path, time_ec);
    if (time_ec) continue;
    if (!newest.has_value() || modified > newest_time) {
      newest = path;
      newest_time = modified;
    }
  }
  return newest;
}

}  // namespace

bool parse_output_format(const std::string& text, OutputFormat& out, std::string& error) {
  const std::string value = util::to_lower(util::trim_ws(text));
  if (value == "json") {
    out = OutputFormat::Json;
  } else if (value == "csv") {
    out = OutputFormat::Csv;
  } else if (value == "parquet") {
    out = OutputFormat::Parquet;
  } else {
    error = "Invalid output_format '" + text + "' (use json|csv|parquet)";
    return false;
  }
  return true;
}

const char* format_extension(OutputFormat format) {
  switch (format) {
    case OutputFormat::Json: return "json";
    case OutputFormat::Csv: return "csv";
    case OutputFormat::Parquet: return "parquet";
  }
  return "json";
}

std::string contract_flag_for(const std::string& dataset) {
  if (dataset == "transactions" || dataset == "txs") return "--to-address";
  return "--contract";
}

std::vector<std::string> build_extraction_command(const std::string& cryo_bin,
                                                  const ExtractionRequest& request) {
  std::vector<std::string> cmd = {cryo_bin, request.dataset, "-b", request.block_range,
                                  "-r", request.rpc_url};
  if (request.contract.has_value() && !request.contract->empty()) {
    cmd.push_back(contract_flag_for(request.dataset));
    cmd.push_back(*request.contract);
  }
  // Parquet is cryo's default and has no flag.
  if (request.format == OutputFormat::Json) {
    cmd.push_back("--json");
  } else if (request.format == OutputFormat::Csv) {
    cmd.push_back("--csv");
  }
  if (!request.include_columns.empty()) {
    cmd.push_back("--include-columns");
    cmd.insert(cmd.end(), request.include_columns.begin(), request.include_columns.end());
  }
  if (!request.exclude_columns.empty()) {
    cmd.push_back("--exclude-columns");
    cmd.insert(cmd.end(), request.exclude_columns.begin(), request.exclude_columns.end());
  }
  cmd.push_back("-o");
  cmd.push_back(request.output_dir.string());
  return cmd;
}

std::optional<std::vector<std::string>> read_manifest_paths(const fs::path& output_dir) {
  auto report = newest_report(output_dir / kManifestSubdir);
  if (!report.has_value()) return std::nullopt;
  std::ifstream in(*report);
  if (!in) return std::nullopt;
  std::stringstream buffer;
  buffer << in.rdbuf();
  const json doc = json::parse(buffer.str(), nullptr, false);
  if (doc.is_discarded() || !doc.is_object()) {
    log::warn("Ignoring unreadable cryo report: " + report->string());
    return std::nullopt;
  }
  if (!doc.contains("results") || !doc["results"].is_object() ||
      !doc["results"].contains("completed_paths") || !doc["results"]["completed_paths"].is_array()) {
    return std::nullopt;
  }
  std::vector<std::string> paths;
  for (const auto& item : doc["results"]["completed_paths"]) {
    if (item.is_string()) paths.push_back(item.get<std::string>());
  }
  return paths;
}

std::vector<std::string> find_dataset_files(const fs::path& dir,
                                            const std::string& dataset,
                                            const std::string& extension) {
  std::vector<std::string> out;
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) return out;
  const std::string suffix = "." + extension;
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) break;
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec)) continue;
    const std::string name = it->path().filename().string();
    if (name.find(dataset) == std::string::npos) continue;
    if (!util::ends_with(name, suffix)) continue;
    // The dataset marker must sit before the extension, as in `*<dataset>*.<ext>`.
    if (name.find(dataset) + dataset.size() > name.size() - suffix.size()) continue;
    out.push_back(it->path().string());
  }
  std::sort(out.begin(), out.end());
  return out;
}

ExtractionResult run_extraction(ProcessRunner& runner,
                                const std::string& cryo_bin,
                                const ExtractionRequest& request) {
  ExtractionResult result;
  const std::vector<std::string> cmd = build_extraction_command(cryo_bin, request);
  result.command = util::join(cmd);
  log::info("Running query command: " + result.command);

  ProcessResult proc = runner.run(cmd, request.timeout_ms);
  result.stdout_text = proc.stdout_text;
  if (!proc.launched || proc.timed_out) {
    result.error = proc.error;
    return result;
  }
  if (proc.exit_code != 0) {
    result.error = proc.stderr_text.empty()
                       ? "cryo exited with status " + std::to_string(proc.exit_code)
                       : proc.stderr_text;
    return result;
  }

  if (auto manifest = read_manifest_paths(request.output_dir)) {
    if (!manifest->empty()) {
      log::info("Found " + std::to_string(manifest->size()) + " files in cryo report");
      result.ok = true;
      result.files = std::move(*manifest);
      result.from_manifest = true;
      return result;
    }
  }

  result.files = find_dataset_files(request.output_dir, request.dataset, format_extension(request.format));
  log::info("Output files found via glob: " + std::to_string(result.files.size()));
  if (result.files.empty()) {
    result.error = kNoOutputError;
    return result;
  }
  result.ok = true;
  return result;
}

std::vector<std::string> parse_dataset_listing(const std::string& help_output) {
  std::vector<std::string> datasets;
  std::istringstream lines(help_output);
  std::string line;
  while (std::getline(lines, line)) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line == "dataset group names") break;
    if (!util::starts_with(line, "- ") || util::starts_with(line, "- blocks_and_transactions:")) {
      continue;
    }
    std::string name = line.substr(2);
    size_t alias = name.find(" (alias");
    if (alias != std::string::npos) name = name.substr(0, alias);
    name = util::trim_ws(name);
    if (!name.empty()) datasets.push_back(name);
  }
  return datasets;
}

}  // namespace cryoql
