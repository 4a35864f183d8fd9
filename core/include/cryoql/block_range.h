#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>

namespace cryoql {

/// Caller-facing range expression. Precedence: blocks > latest flag/offset >
/// start/end > fallback. start/end are inclusive on both ends.
struct BlockRangeRequest {
  std::optional<std::string> blocks;
  std::optional<int64_t> start_block;
  std::optional<int64_t> end_block;
  bool use_latest = false;
  std::optional<int64_t> blocks_from_latest;
};

/// Per-path policy for the synthesized parts of a range.
struct RangeDefaults {
  int64_t window;              // width used when only start_block is given
  const char* fallback;        // used when nothing is supplied
  int64_t latest_flag_offset;  // blocks before head covered by the bare latest flag
};

constexpr RangeDefaults kQueryRangeDefaults{10, "1000:1010", 0};
constexpr RangeDefaults kSampleRangeDefaults{5, "1000:1005", 4};

/// Half-open "start:end" in cryo's native format plus the bucket it belongs to.
struct NormalizedRange {
  std::string range;
  bool latest = false;
  std::optional<int64_t> head;
};

using HeadLookup = std::function<std::optional<int64_t>()>;

constexpr const char* kHeadUnavailableError =
    "Failed to get the latest block number from the RPC endpoint";
constexpr const char* kLatestDirName = "latest";

std::string format_range(int64_t start, int64_t end_exclusive);

/// Converts any supported range expression into cryo's [start, end) form.
/// head_lookup is consulted only on the latest path; a nullopt answer fails the call.
/// MUST NOT retry the lookup.
bool normalize_block_range(const BlockRangeRequest& request,
                           const RangeDefaults& defaults,
                           const HeadLookup& head_lookup,
                           NormalizedRange& out,
                           std::string& error);

/// `<root>/latest` for head-relative ranges, `<root>` otherwise.
std::filesystem::path output_directory_for(const std::filesystem::path& data_root, bool latest);

/// Removes `*<dataset>*.*` from dir; individual failures are logged and skipped.
/// Returns the number of files removed.
size_t purge_dataset_files(const std::filesystem::path& dir, const std::string& dataset);

/// Creates the output directory for a run and, for latest ranges, purges stale
/// same-dataset files first. Concurrent latest runs race by design (last writer wins).
bool prepare_output_directory(const std::filesystem::path& data_root,
                              const NormalizedRange& range,
                              const std::string& dataset,
                              std::filesystem::path& out_dir,
                              std::string& error);

}  // namespace cryoql
