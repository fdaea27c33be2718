#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace rnaflow::process {

/*
  External process invocation.

  The child runs in its own process group with stdout/stderr redirected to
  files, so that a timeout or an interrupt can terminate the whole tree
  (SIGTERM, then SIGKILL after the grace period).
*/
struct ProcessOptions {
  std::vector<std::string>                         argv;
  std::vector<std::pair<std::string, std::string>> env;
  std::filesystem::path                            working_dir;
  std::filesystem::path                            stdout_path;
  std::filesystem::path                            stderr_path;
  // Zero disables the timeout.
  std::chrono::milliseconds                        timeout{0};
  std::chrono::milliseconds                        kill_grace{std::chrono::seconds(5)};
  const std::atomic<bool>*                         cancel = nullptr;
};

struct ProcessResult {
  int         exit_code       = -1;
  int         term_signal     = 0;
  bool        timed_out       = false;
  bool        cancelled       = false;
  bool        launch_failed   = false;
  double      runtime_seconds = 0.0;
  // Tail of stderr followed by the tail of stdout.
  std::string output_tail;

  bool        Succeeded() const;
  std::string Describe() const;
};

ProcessResult RunProcess(const ProcessOptions& options);

// True if `name` is an executable path or resolves through PATH.
bool IsExecutableAvailable(const std::string& name);

std::string ReadTail(const std::filesystem::path& path, std::size_t max_bytes);

std::string JoinCommand(const std::vector<std::string>& argv);

} // namespace rnaflow::process
