#include "cryoql/catalog.h"

#include <algorithm>
#include <chrono>
#include <regex>
#include <system_error>

#include "cryoql/block_range.h"

namespace cryoql {

namespace fs = std::filesystem;

namespace {

std::vector<std::string> split_double_underscore(const std::string& stem) {
  std::vector<std::string> parts;
  size_t start = 0;
  while (true) {
    size_t pos = stem.find("__", start);
    if (pos == std::string::npos) {
      parts.push_back(stem.substr(start));
      break;
    }
    parts.push_back(stem.substr(start, pos - start));
    start = pos + 2;
  }
  return parts;
}

std::string strip_leading_zeros(const std::string& digits) {
  size_t first = digits.find_first_not_of('0');
  if (first == std::string::npos) return "0";
  return digits.substr(first);
}

double to_epoch_seconds(fs::file_time_type stamp) {
  using namespace std::chrono;
  auto system_stamp = time_point_cast<system_clock::duration>(
      stamp - fs::file_time_type::clock::now() + system_clock::now());
  return duration<double>(system_stamp.time_since_epoch()).count();
}

}  // namespace

std::string infer_dataset_name(const std::string& stem) {
  std::vector<std::string> parts = split_double_underscore(stem);
  if (parts.size() >= 3 && !parts[1].empty()) return parts[1];
  if (parts.size() == 2 && !parts[0].empty()) return parts[0];
  static const std::regex leading_name("^([a-z_]+)_");
  std::smatch match;
  if (std::regex_search(stem, match, leading_name)) return match[1].str();
  return stem;
}

std::string infer_block_range(const std::string& stem) {
  static const std::regex range_tag("(\\d+)_to_(\\d+)$");
  std::smatch match;
  if (!std::regex_search(stem, match, range_tag)) return "";
  return strip_leading_zeros(match[1].str()) + ":" + strip_leading_zeros(match[2].str());
}

std::vector<fs::path> list_parquet_files(const fs::path& data_root) {
  std::vector<fs::path> out;
  std::error_code ec;
  if (!fs::is_directory(data_root, ec)) return out;
  fs::recursive_directory_iterator it(data_root, fs::directory_options::skip_permission_denied, ec);
  if (ec) return out;
  for (; it != fs::recursive_directory_iterator(); it.increment(ec)) {
    if (ec) break;
    std::error_code type_ec;
    if (!it->is_regular_file(type_ec)) continue;
    if (it->path().extension() != ".parquet") continue;
    out.push_back(it->path());
  }
  std::sort(out.begin(), out.end());
  return out;
}

PhysicalFile describe_file(const fs::path& path) {
  PhysicalFile file;
  file.path = path;
  std::error_code ec;
  file.size_bytes = fs::file_size(path, ec);
  if (ec) file.size_bytes = 0;
  auto stamp = fs::last_write_time(path, ec);
  if (!ec) file.modified = to_epoch_seconds(stamp);
  const std::string stem = path.stem().string();
  file.name = infer_dataset_name(stem);
  file.block_range = infer_block_range(stem);
  file.is_latest = path.parent_path().filename() == kLatestDirName;
  return file;
}

std::vector<PhysicalFile> list_available_tables(const fs::path& data_root) {
  std::vector<PhysicalFile> tables;
  for (const auto& path : list_parquet_files(data_root)) {
    tables.push_back(describe_file(path));
  }
  return tables;
}

}  // namespace cryoql
