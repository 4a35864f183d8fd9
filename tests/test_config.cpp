#include "test_harness.h"

#include <cstdlib>
#include <optional>
#include <string>
#include <vector>

#include "cryoql/config.h"

namespace {

/// Sets or clears an environment variable for the lifetime of the guard.
class EnvGuard {
 public:
  EnvGuard(const char* name, const char* value) : name_(name) {
    const char* old = std::getenv(name);
    if (old) previous_ = std::string(old);
    if (value) {
      ::setenv(name, value, 1);
    } else {
      ::unsetenv(name);
    }
  }
  ~EnvGuard() {
    if (previous_) {
      ::setenv(name_, previous_->c_str(), 1);
    } else {
      ::unsetenv(name_);
    }
  }

 private:
  const char* name_;
  std::optional<std::string> previous_;
};

void test_resolve_config_uses_defaults() {
  cryoql::Config config = cryoql::resolve_config({}, {});
  expect_eq(config.rpc_url, "http://localhost:8545", "default rpc url");
  expect_eq(config.cryo_bin, "cryo", "default cryo binary");
  expect_eq(config.data_dir.string(), cryoql::default_data_dir().string(), "default data dir");
}

void test_resolve_config_precedence() {
  cryoql::ConfigOverrides process_wide;
  process_wide.rpc_url = "http://process:8545";
  process_wide.data_dir = "/srv/process";
  cryoql::ConfigOverrides per_call;
  per_call.rpc_url = "http://call:8545";
  cryoql::Config config = cryoql::resolve_config(per_call, process_wide);
  expect_eq(config.rpc_url, "http://call:8545", "per-call beats process-wide");
  expect_eq(config.data_dir.string(), "/srv/process", "process-wide beats default");
}

void test_process_overrides_prefers_flags_over_environment() {
  EnvGuard rpc("ETH_RPC_URL", "http://env:8545");
  EnvGuard dir("CRYO_DATA_DIR", "   ");
  EnvGuard bin("CRYO_BIN", "/opt/cryo");
  cryoql::ConfigOverrides flags;
  flags.rpc_url = "http://flag:8545";
  cryoql::ConfigOverrides merged = cryoql::process_overrides(flags);
  expect_true(merged.rpc_url == std::string("http://flag:8545"), "flag wins over env");
  expect_true(!merged.data_dir.has_value(), "blank env counts as unset");
  expect_true(merged.cryo_bin == std::string("/opt/cryo"), "env used when no flag");
}

void test_default_data_dir_under_home() {
  EnvGuard home("HOME", "/home/tester");
  expect_eq(cryoql::default_data_dir().string(), "/home/tester/.cryo-mcp/data", "home-relative data dir");
}

}  // namespace

void register_config_tests(std::vector<TestCase>& tests) {
  tests.push_back({"resolve_config_uses_defaults", test_resolve_config_uses_defaults});
  tests.push_back({"resolve_config_precedence", test_resolve_config_precedence});
  tests.push_back({"process_overrides_prefers_flags_over_environment",
                   test_process_overrides_prefers_flags_over_environment});
  tests.push_back({"default_data_dir_under_home", test_default_data_dir_under_home});
}
