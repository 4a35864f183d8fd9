#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace cryoql {

/// One columnar file under the data root, with the metadata inferred from its name.
struct PhysicalFile {
  std::filesystem::path path;
  std::uintmax_t size_bytes = 0;
  double modified = 0.0;  // seconds since the Unix epoch
  std::string name;
  std::string block_range;
  bool is_latest = false;
};

/// Every `*.parquet` below data_root (recursive), sorted by path.
/// A missing root yields an empty list.
std::vector<std::filesystem::path> list_parquet_files(const std::filesystem::path& data_root);
std::vector<PhysicalFile> list_available_tables(const std::filesystem::path& data_root);
PhysicalFile describe_file(const std::filesystem::path& path);

std::string infer_dataset_name(const std::string& stem);
/// "start:end" from a trailing `<start>_to_<end>`, or empty.
std::string infer_block_range(const std::string& stem);

}  // namespace cryoql
