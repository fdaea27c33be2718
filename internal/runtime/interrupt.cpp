#include "interrupt.hpp"

#include <csignal>

namespace rnaflow::runtime {

namespace {

std::atomic<bool> g_interrupted{false};

void HandleSignal(int) {
  g_interrupted.store(true);
}

} // namespace

std::atomic<bool>& InterruptFlag() {
  return g_interrupted;
}

void InstallSignalHandlers() {
  std::signal(SIGINT, HandleSignal);
  std::signal(SIGTERM, HandleSignal);
}

} // namespace rnaflow::runtime
