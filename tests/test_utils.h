#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "cryoql/chain_rpc.h"
#include "cryoql/json.h"
#include "cryoql/process.h"

/// Unique directory under the system temp dir, removed on destruction.
class TempDir {
 public:
  explicit TempDir(const std::string& label);
  ~TempDir();

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const { return path_; }

 private:
  std::filesystem::path path_;
};

/// Writes `rows` block-shaped rows (block_number, gas_used, miner, block_hash)
/// starting at first_block to a parquet file through DuckDB COPY.
void write_block_parquet(const std::filesystem::path& path, int64_t first_block, int rows);
void write_text_file(const std::filesystem::path& path, const std::string& content);
std::string read_file_to_string(const std::filesystem::path& path);
/// Writes an executable `#!/bin/sh` script with the given body.
std::filesystem::path write_script(const std::filesystem::path& path, const std::string& body);

/// Records every command and answers through `handler` (default: exit 0, no output).
class FakeProcessRunner final : public cryoql::ProcessRunner {
 public:
  using Handler = std::function<cryoql::ProcessResult(const std::vector<std::string>&)>;

  cryoql::ProcessResult run(const std::vector<std::string>& argv,
                            std::optional<int> timeout_ms) override;

  Handler handler;
  std::vector<std::vector<std::string>> calls;
  std::vector<std::optional<int>> timeouts;
};

cryoql::ProcessResult process_ok(const std::string& stdout_text = "");
cryoql::ProcessResult process_failed(int exit_code, const std::string& stderr_text,
                                     const std::string& stdout_text = "");

/// Answers JSON-RPC calls by method name; unknown methods fail at the transport level.
class FakeRpcTransport final : public cryoql::RpcTransport {
 public:
  cryoql::RpcResponse post(const std::string& url, const cryoql::json& payload) override;

  void set_head(int64_t block);
  std::map<std::string, cryoql::json> bodies;
  std::vector<std::string> methods;
  std::vector<std::string> urls;
};
