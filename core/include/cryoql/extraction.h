#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "cryoql/process.h"

namespace cryoql {

enum class OutputFormat { Json, Csv, Parquet };

bool parse_output_format(const std::string& text, OutputFormat& out, std::string& error);
/// File extension cryo uses for the format ("json", "csv", "parquet").
const char* format_extension(OutputFormat format);

constexpr const char* kNoOutputError = "No output files generated";

/// Subpath of an output directory where cryo writes per-run reports.
constexpr const char* kManifestSubdir = ".cryo/reports";

/// One cryo invocation. block_range is already normalized to "start:end".
struct ExtractionRequest {
  std::string dataset;
  std::string block_range;
  std::string rpc_url;
  std::filesystem::path output_dir;
  std::optional<std::string> contract;
  OutputFormat format = OutputFormat::Json;
  std::vector<std::string> include_columns;
  std::vector<std::string> exclude_columns;
  std::optional<int> timeout_ms;
};

/// Files produced by a run, or the failure with enough context to reproduce it.
struct ExtractionResult {
  bool ok = false;
  std::vector<std::string> files;
  bool from_manifest = false;
  std::string error;
  std::string stdout_text;
  std::string command;
};

/// Address filter flag for a dataset; `transactions` filters on the recipient
/// (`--to-address`), every other dataset takes `--contract`.
std::string contract_flag_for(const std::string& dataset);
std::vector<std::string> build_extraction_command(const std::string& cryo_bin,
                                                  const ExtractionRequest& request);
/// `results.completed_paths` of the newest report under <output_dir>/.cryo/reports.
/// Returns nullopt when there is no report, it does not parse, or the field is absent.
std::optional<std::vector<std::string>> read_manifest_paths(const std::filesystem::path& output_dir);
/// Non-recursive `*<dataset>*.<ext>` match, sorted by path.
std::vector<std::string> find_dataset_files(const std::filesystem::path& dir,
                                            const std::string& dataset,
                                            const std::string& extension);
/// Runs cryo once and resolves its output files (manifest first, then glob).
/// MUST NOT retry; a non-zero exit carries stderr as the error plus stdout and the command.
ExtractionResult run_extraction(ProcessRunner& runner,
                                const std::string& cryo_bin,
                                const ExtractionRequest& request);

/// Parses `cryo help datasets` output into dataset names, skipping the
/// blocks_and_transactions group and stopping at the group-name section.
std::vector<std::string> parse_dataset_listing(const std::string& help_output);

}  // namespace cryoql
