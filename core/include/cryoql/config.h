#pragma once

#include <filesystem>
#include <optional>
#include <string>

namespace cryoql {

constexpr const char* kDefaultRpcUrl = "http://localhost:8545";
constexpr const char* kDefaultCryoBin = "cryo";
constexpr const char* kRpcUrlEnv = "ETH_RPC_URL";
constexpr const char* kDataDirEnv = "CRYO_DATA_DIR";
constexpr const char* kCryoBinEnv = "CRYO_BIN";

/// Resolved settings for one operation.
/// MUST be fully populated; callers never consult the environment afterwards.
struct Config {
  std::string rpc_url;
  std::filesystem::path data_dir;
  std::string cryo_bin;
};

/// One precedence layer; unset fields defer to the next layer down.
struct ConfigOverrides {
  std::optional<std::string> rpc_url;
  std::optional<std::string> data_dir;
  std::optional<std::string> cryo_bin;
};

/// Reads ETH_RPC_URL / CRYO_DATA_DIR / CRYO_BIN; blank values count as unset.
ConfigOverrides overrides_from_environment();
/// Layers CLI flags over the environment into the process-wide setting.
/// MUST be computed once at startup and treated as immutable afterwards.
ConfigOverrides process_overrides(const ConfigOverrides& cli_flags);
/// Resolves per-call > process-wide > default.
Config resolve_config(const ConfigOverrides& per_call, const ConfigOverrides& process_wide);
/// `$HOME/.cryo-mcp/data`, or a relative `.cryo-mcp/data` when HOME is unset.
std::filesystem::path default_data_dir();

}  // namespace cryoql
