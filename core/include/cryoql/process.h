#pragma once

#include <optional>
#include <string>
#include <vector>

namespace cryoql {

/// Captured outcome of one external command.
/// `launched` is false when fork/exec itself failed; `error` then explains why.
struct ProcessResult {
  bool launched = false;
  int exit_code = -1;
  bool timed_out = false;
  std::string stdout_text;
  std::string stderr_text;
  std::string error;
};

/// Seam for running external programs so extraction can be exercised without cryo.
class ProcessRunner {
 public:
  virtual ~ProcessRunner() = default;
  /// Runs argv[0] (PATH lookup) with stdin on /dev/null and both output streams captured.
  /// MUST reap the child on every path; a timeout kills it and sets timed_out.
  virtual ProcessResult run(const std::vector<std::string>& argv,
                            std::optional<int> timeout_ms) = 0;
};

/// fork/execvp implementation with poll-driven pipe draining.
class PosixProcessRunner final : public ProcessRunner {
 public:
  ProcessResult run(const std::vector<std::string>& argv,
                    std::optional<int> timeout_ms) override;
};

}  // namespace cryoql
