#include "subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fstream>
#include <sstream>
#include <thread>

#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include "internal/observability/logging.hpp"
#include "internal/util/time.hpp"

extern char** environ;

namespace rnaflow::process {

namespace {

using rnaflow::observability::IntField;
using rnaflow::observability::StringField;

constexpr std::size_t kTailBytes    = 2048;
constexpr auto        kPollInterval = std::chrono::milliseconds(50);

int OpenOutput(const std::filesystem::path& path) {
  if (path.empty()) {
    return ::open("/dev/null", O_WRONLY | O_CLOEXEC);
  }
  std::error_code ec;
  std::filesystem::create_directories(path.parent_path(), ec);
  return ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
}

std::vector<std::string> BuildEnvironment(const std::vector<std::pair<std::string, std::string>>& overrides) {
  std::vector<std::string> env;
  for (char** entry = environ; entry && *entry; ++entry) {
    std::string value(*entry);
    bool        overridden = false;
    for (const auto& [key, _] : overrides) {
      if (value.compare(0, key.size() + 1, key + "=") == 0) {
        overridden = true;
        break;
      }
    }
    if (!overridden) {
      env.push_back(std::move(value));
    }
  }
  for (const auto& [key, value] : overrides) {
    env.push_back(key + "=" + value);
  }
  return env;
}

std::vector<char*> ToCStrings(std::vector<std::string>& values) {
  std::vector<char*> out;
  out.reserve(values.size() + 1);
  for (auto& value : values) {
    out.push_back(value.data());
  }
  out.push_back(nullptr);
  return out;
}

bool Reap(pid_t pid, int* status, bool block) {
  while (true) {
    pid_t rc = ::waitpid(pid, status, block ? 0 : WNOHANG);
    if (rc == pid) {
      return true;
    }
    if (rc == 0) {
      return false;
    }
    if (errno != EINTR) {
      return true;
    }
  }
}

void Terminate(pid_t pid, std::chrono::milliseconds grace, int* status) {
  ::kill(-pid, SIGTERM);

  auto deadline = std::chrono::steady_clock::now() + grace;
  while (std::chrono::steady_clock::now() < deadline) {
    if (Reap(pid, status, false)) {
      return;
    }
    std::this_thread::sleep_for(kPollInterval);
  }

  ::kill(-pid, SIGKILL);
  Reap(pid, status, true);
}

} // namespace

bool ProcessResult::Succeeded() const {
  return !launch_failed && !timed_out && !cancelled && term_signal == 0 && exit_code == 0;
}

std::string ProcessResult::Describe() const {
  std::ostringstream out;
  if (launch_failed) {
    out << "launch failed";
  } else if (timed_out) {
    out << "timed out after " << runtime_seconds << "s";
  } else if (cancelled) {
    out << "cancelled";
  } else if (term_signal != 0) {
    out << "killed by signal " << term_signal;
  } else {
    out << "exit code " << exit_code;
  }
  if (!output_tail.empty()) {
    out << ": " << output_tail;
  }
  return out.str();
}

ProcessResult RunProcess(const ProcessOptions& options) {
  ProcessResult result;
  if (options.argv.empty()) {
    result.launch_failed = true;
    result.output_tail   = "empty command line";
    return result;
  }

  RNAFLOW_LOG_DEBUG("Running", {StringField("cmd", JoinCommand(options.argv))});

  int out_fd = OpenOutput(options.stdout_path);
  int err_fd = OpenOutput(options.stderr_path);
  if (out_fd < 0 || err_fd < 0) {
    if (out_fd >= 0) ::close(out_fd);
    if (err_fd >= 0) ::close(err_fd);
    result.launch_failed = true;
    result.output_tail   = "cannot open output capture files: " + std::string(std::strerror(errno));
    return result;
  }

  // exec failures are reported back through a close-on-exec pipe
  int exec_pipe[2];
  if (::pipe2(exec_pipe, O_CLOEXEC) != 0) {
    ::close(out_fd);
    ::close(err_fd);
    result.launch_failed = true;
    result.output_tail   = "pipe2 failed: " + std::string(std::strerror(errno));
    return result;
  }

  auto args     = options.argv;
  auto env      = BuildEnvironment(options.env);
  auto c_args   = ToCStrings(args);
  auto c_env    = ToCStrings(env);
  auto work_dir = options.working_dir.string();

  const auto start = std::chrono::steady_clock::now();
  pid_t      pid   = ::fork();
  if (pid < 0) {
    ::close(out_fd);
    ::close(err_fd);
    ::close(exec_pipe[0]);
    ::close(exec_pipe[1]);
    result.launch_failed = true;
    result.output_tail   = "fork failed: " + std::string(std::strerror(errno));
    return result;
  }

  if (pid == 0) {
    ::setpgid(0, 0);
    ::dup2(out_fd, STDOUT_FILENO);
    ::dup2(err_fd, STDERR_FILENO);
    if (!work_dir.empty() && ::chdir(work_dir.c_str()) != 0) {
      int err = errno;
      (void)!::write(exec_pipe[1], &err, sizeof(err));
      ::_exit(127);
    }
    ::execvpe(c_args[0], c_args.data(), c_env.data());
    int err = errno;
    (void)!::write(exec_pipe[1], &err, sizeof(err));
    ::_exit(127);
  }

  ::setpgid(pid, pid);
  ::close(out_fd);
  ::close(err_fd);
  ::close(exec_pipe[1]);

  int     exec_errno = 0;
  ssize_t n          = 0;
  do {
    n = ::read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  ::close(exec_pipe[0]);

  int status = 0;
  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    Reap(pid, &status, true);
    result.launch_failed   = true;
    result.runtime_seconds = util::SecondsSince(start);
    result.output_tail     = "cannot execute " + options.argv.front() + ": " + std::strerror(exec_errno);
    return result;
  }

  while (!Reap(pid, &status, false)) {
    if (options.cancel && options.cancel->load()) {
      result.cancelled = true;
      Terminate(pid, options.kill_grace, &status);
      break;
    }
    if (options.timeout.count() > 0 && std::chrono::steady_clock::now() - start >= options.timeout) {
      result.timed_out = true;
      Terminate(pid, options.kill_grace, &status);
      break;
    }
    std::this_thread::sleep_for(kPollInterval);
  }

  result.runtime_seconds = util::SecondsSince(start);
  if (WIFEXITED(status)) {
    result.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result.term_signal = WTERMSIG(status);
  }

  if (!result.Succeeded()) {
    auto tail = ReadTail(options.stderr_path, kTailBytes);
    auto out  = ReadTail(options.stdout_path, kTailBytes);
    if (!tail.empty() && !out.empty()) {
      tail += "\n";
    }
    result.output_tail = tail + out;
    RNAFLOW_LOG_WARN("Command failed", {StringField("cmd", options.argv.front()), IntField("exit_code", result.exit_code),
                                        IntField("signal", result.term_signal)});
  }
  return result;
}

bool IsExecutableAvailable(const std::string& name) {
  if (name.empty()) {
    return false;
  }
  if (name.find('/') != std::string::npos) {
    return ::access(name.c_str(), X_OK) == 0;
  }

  const char* path_env = std::getenv("PATH");
  if (!path_env) {
    return false;
  }
  std::stringstream paths(path_env);
  std::string       dir;
  while (std::getline(paths, dir, ':')) {
    if (dir.empty()) {
      continue;
    }
    auto candidate = std::filesystem::path(dir) / name;
    if (::access(candidate.c_str(), X_OK) == 0) {
      return true;
    }
  }
  return false;
}

std::string ReadTail(const std::filesystem::path& path, std::size_t max_bytes) {
  if (path.empty()) {
    return {};
  }
  std::ifstream in(path, std::ios::binary | std::ios::ate);
  if (!in) {
    return {};
  }
  const auto size   = static_cast<std::size_t>(in.tellg());
  const auto offset = size > max_bytes ? size - max_bytes : 0;
  in.seekg(static_cast<std::streamoff>(offset));

  std::string tail(size - offset, '\0');
  in.read(tail.data(), static_cast<std::streamsize>(tail.size()));
  while (!tail.empty() && (tail.back() == '\n' || tail.back() == '\r')) {
    tail.pop_back();
  }
  return tail;
}

std::string JoinCommand(const std::vector<std::string>& argv) {
  std::string out;
  for (const auto& arg : argv) {
    if (!out.empty()) {
      out += ' ';
    }
    out += arg;
  }
  return out;
}

} // namespace rnaflow::process
