#include "cryoql/block_range.h"

#include <limits>
#include <system_error>
#include <utility>

#include "cryoql/log.h"

namespace cryoql {

namespace fs = std::filesystem;

namespace {

constexpr int64_t kMaxBlock = std::numeric_limits<int64_t>::max();

}  // namespace

std::string format_range(int64_t start, int64_t end_exclusive) {
  return std::to_string(start) + ":" + std::to_string(end_exclusive);
}

bool normalize_block_range(const BlockRangeRequest& request,
                           const RangeDefaults& defaults,
                           const HeadLookup& head_lookup,
                           NormalizedRange& out,
                           std::string& error) {
  NormalizedRange result;
  if (request.blocks.has_value() && !request.blocks->empty()) {
    // Already in cryo's native syntax.
    result.range = *request.blocks;
  } else if (request.use_latest || request.blocks_from_latest.has_value()) {
    int64_t offset = request.blocks_from_latest.value_or(defaults.latest_flag_offset);
    if (offset < 0) {
      error = "blocks_from_latest must be non-negative";
      return false;
    }
    std::optional<int64_t> head = head_lookup ? head_lookup() : std::nullopt;
    if (!head.has_value()) {
      error = kHeadUnavailableError;
      return false;
    }
    if (*head < 0 || *head == kMaxBlock) {
      error = "Latest block number out of range: " + std::to_string(*head);
      return false;
    }
    int64_t start = *head - offset;
    if (start < 0) start = 0;
    result.range = format_range(start, *head + 1);
    result.latest = true;
    result.head = head;
    log::info("Using latest block range: " + result.range);
  } else if (request.start_block.has_value()) {
    int64_t start = *request.start_block;
    if (start < 0) {
      error = "start_block must be non-negative";
      return false;
    }
    if (request.end_block.has_value()) {
      if (*request.end_block < start) {
        error = "end_block must not be smaller than start_block";
        return false;
      }
      if (*request.end_block == kMaxBlock) {
        error = "end_block is too large";
        return false;
      }
      // Inclusive end on the caller side, exclusive in cryo.
      result.range = format_range(start, *request.end_block + 1);
    } else {
      if (start > kMaxBlock - defaults.window) {
        error = "start_block is too large";
        return false;
      }
      result.range = format_range(start, start + defaults.window);
    }
    log::info("Using block range: " + result.range);
  } else {
    result.range = defaults.fallback;
  }
  out = std::move(result);
  return true;
}

fs::path output_directory_for(const fs::path& data_root, bool latest) {
  return latest ? data_root / kLatestDirName : data_root;
}

size_t purge_dataset_files(const fs::path& dir, const std::string& dataset) {
  size_t removed = 0;
  std::error_code ec;
  fs::directory_iterator it(dir, ec);
  if (ec) return 0;
  for (; it != fs::directory_iterator(); it.increment(ec)) {
    if (ec) break;
    const fs::directory_entry& entry = *it;
    std::error_code type_ec;
    if (!entry.is_regular_file(type_ec)) continue;
    const std::string name = entry.path().filename().string();
    if (name.find(dataset) == std::string::npos || name.find('.') == std::string::npos) {
      continue;
    }
    std::error_code remove_ec;
    if (fs::remove(entry.path(), remove_ec)) {
      ++removed;
      log::info("Removed existing file: " + entry.path().string());
    } else if (remove_ec) {
      log::warn("Could not remove file " + entry.path().string() + ": " + remove_ec.message());
    }
  }
  return removed;
}

bool prepare_output_directory(const fs::path& data_root,
                              const NormalizedRange& range,
                              const std::string& dataset,
                              fs::path& out_dir,
                              std::string& error) {
  fs::path dir = output_directory_for(data_root, range.latest);
  std::error_code ec;
  fs::create_directories(dir, ec);
  if (ec) {
    error = "Could not create output directory " + dir.string() + ": " + ec.message();
    return false;
  }
  if (range.latest) {
    log::info("Cleaning latest directory for " + dataset);
    purge_dataset_files(dir, dataset);
  }
  out_dir = dir;
  return true;
}

}  // namespace cryoql
