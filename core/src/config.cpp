#include "cryoql/config.h"

#include <cstdlib>

#include "util/string_util.h"

namespace cryoql {

namespace {

std::optional<std::string> read_env(const char* name) {
  const char* raw = std::getenv(name);
  if (raw == nullptr) return std::nullopt;
  std::string trimmed = util::trim_ws(raw);
  if (trimmed.empty()) return std::nullopt;
  return trimmed;
}

std::string pick(const std::optional<std::string>& first,
                 const std::optional<std::string>& second,
                 const std::string& fallback) {
  if (first.has_value() && !first->empty()) return *first;
  if (second.has_value() && !second->empty()) return *second;
  return fallback;
}

}  // namespace

std::filesystem::path default_data_dir() {
  std::filesystem::path home;
  if (auto env_home = read_env("HOME")) {
    home = *env_home;
  }
  return home / ".cryo-mcp" / "data";
}

ConfigOverrides overrides_from_environment() {
  ConfigOverrides out;
  out.rpc_url = read_env(kRpcUrlEnv);
  out.data_dir = read_env(kDataDirEnv);
  out.cryo_bin = read_env(kCryoBinEnv);
  return out;
}

ConfigOverrides process_overrides(const ConfigOverrides& cli_flags) {
  ConfigOverrides env = overrides_from_environment();
  ConfigOverrides out;
  out.rpc_url = cli_flags.rpc_url ? cli_flags.rpc_url : env.rpc_url;
  out.data_dir = cli_flags.data_dir ? cli_flags.data_dir : env.data_dir;
  out.cryo_bin = cli_flags.cryo_bin ? cli_flags.cryo_bin : env.cryo_bin;
  return out;
}

Config resolve_config(const ConfigOverrides& per_call, const ConfigOverrides& process_wide) {
  Config config;
  config.rpc_url = pick(per_call.rpc_url, process_wide.rpc_url, kDefaultRpcUrl);
  config.data_dir = pick(per_call.data_dir, process_wide.data_dir, default_data_dir().string());
  config.cryo_bin = pick(per_call.cryo_bin, process_wide.cryo_bin, kDefaultCryoBin);
  return config;
}

}  // namespace cryoql
