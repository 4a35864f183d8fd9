#include "cryoql/log.h"

#include <iostream>
#include <mutex>

namespace cryoql::log {

namespace {

std::mutex g_mu;
std::ostream* g_sink = nullptr;
bool g_quiet = false;

std::ostream& sink() {
  return g_sink ? *g_sink : std::cerr;
}

}  // namespace

void set_sink(std::ostream* sink) {
  std::lock_guard<std::mutex> lock(g_mu);
  g_sink = sink;
}

void set_quiet(bool quiet) {
  std::lock_guard<std::mutex> lock(g_mu);
  g_quiet = quiet;
}

void info(const std::string& message) {
  std::lock_guard<std::mutex> lock(g_mu);
  if (g_quiet) return;
  sink() << "[cryoql] " << message << "\n";
}

void warn(const std::string& message) {
  std::lock_guard<std::mutex> lock(g_mu);
  sink() << "[cryoql] warning: " << message << "\n";
}

}  // namespace cryoql::log
