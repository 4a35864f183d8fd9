#include "cryoql/process.h"

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

namespace cryoql {

namespace {

constexpr int kPipeReadEnd = 0;
constexpr int kPipeWriteEnd = 1;

/// Owns a file descriptor and closes it on scope exit.
struct UniqueFd {
  int fd = -1;

  UniqueFd() = default;
  explicit UniqueFd(int value) : fd(value) {}
  UniqueFd(const UniqueFd&) = delete;
  UniqueFd& operator=(const UniqueFd&) = delete;
  ~UniqueFd() { reset(); }

  void reset(int value = -1) {
    if (fd >= 0) close(fd);
    fd = value;
  }
};

struct Pipe {
  UniqueFd read_end;
  UniqueFd write_end;
};

bool make_pipe(Pipe& out, std::string& error) {
  int fds[2];
  if (pipe2(fds, O_CLOEXEC) != 0) {
    error = std::string("Couldn't create pipe: ") + std::strerror(errno);
    return false;
  }
  out.read_end.reset(fds[kPipeReadEnd]);
  out.write_end.reset(fds[kPipeWriteEnd]);
  return true;
}

std::string errno_message(const std::string& what, int err) {
  return what + ": " + std::strerror(err) + " (" + std::to_string(err) + ")";
}

/// Runs between fork and exec: only async-signal-safe calls, no allocation.
[[noreturn]] void exec_child(char* const* args, int stdout_fd, int stderr_fd, int status_fd) {
  int devnull = open("/dev/null", O_RDONLY | O_CLOEXEC);
  if (devnull >= 0) dup2(devnull, STDIN_FILENO);
  dup2(stdout_fd, STDOUT_FILENO);
  dup2(stderr_fd, STDERR_FILENO);
  execvp(args[0], args);

  // Only reached when exec failed; the parent reads errno from the status pipe.
  int err = errno;
  ssize_t ignored = write(status_fd, &err, sizeof(err));
  (void)ignored;
  _exit(127);
}

int decode_wait_status(int status) {
  if (WIFEXITED(status)) return WEXITSTATUS(status);
  if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
  return -1;
}

}  // namespace

ProcessResult PosixProcessRunner::run(const std::vector<std::string>& argv,
                                      std::optional<int> timeout_ms) {
  ProcessResult result;
  if (argv.empty()) {
    result.error = "Empty command";
    return result;
  }

  Pipe out_pipe;
  Pipe err_pipe;
  Pipe status_pipe;
  if (!make_pipe(out_pipe, result.error) || !make_pipe(err_pipe, result.error) ||
      !make_pipe(status_pipe, result.error)) {
    return result;
  }

  std::vector<char*> args;
  args.reserve(argv.size() + 1);
  for (const auto& arg : argv) {
    args.push_back(const_cast<char*>(arg.c_str()));
  }
  args.push_back(nullptr);

  pid_t pid = fork();
  if (pid == -1) {
    result.error = errno_message("Couldn't fork for " + argv[0], errno);
    return result;
  }
  if (pid == 0) {
    exec_child(args.data(), out_pipe.write_end.fd, err_pipe.write_end.fd, status_pipe.write_end.fd);
  }

  out_pipe.write_end.reset();
  err_pipe.write_end.reset();
  status_pipe.write_end.reset();

  // The status pipe closes on a successful exec (O_CLOEXEC) or carries errno.
  int exec_errno = 0;
  ssize_t got = 0;
  do {
    got = read(status_pipe.read_end.fd, &exec_errno, sizeof(exec_errno));
  } while (got == -1 && errno == EINTR);
  if (got == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    waitpid(pid, &status, 0);
    result.error = errno_message("Couldn't start " + argv[0], exec_errno);
    return result;
  }
  result.launched = true;

  const auto deadline = timeout_ms.has_value()
                            ? std::chrono::steady_clock::now() + std::chrono::milliseconds(*timeout_ms)
                            : std::chrono::steady_clock::time_point::max();

  struct pollfd fds[2];
  fds[0].fd = out_pipe.read_end.fd;
  fds[0].events = POLLIN;
  fds[1].fd = err_pipe.read_end.fd;
  fds[1].events = POLLIN;
  std::string* sinks[2] = {&result.stdout_text, &result.stderr_text};
  int open_streams = 2;
  char buffer[4096];

  while (open_streams > 0) {
    int wait_ms = -1;
    if (timeout_ms.has_value()) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - std::chrono::steady_clock::now());
      if (remaining.count() <= 0) {
        result.timed_out = true;
        break;
      }
      wait_ms = static_cast<int>(remaining.count());
    }
    fds[0].revents = 0;
    fds[1].revents = 0;
    int ready = poll(fds, 2, wait_ms);
    if (ready == -1) {
      if (errno == EINTR) continue;
      result.error = errno_message("poll failed while reading " + argv[0], errno);
      break;
    }
    if (ready == 0) continue;
    for (int i = 0; i < 2; ++i) {
      if (fds[i].fd < 0 || fds[i].revents == 0) continue;
      ssize_t n = read(fds[i].fd, buffer, sizeof(buffer));
      if (n > 0) {
        sinks[i]->append(buffer, static_cast<size_t>(n));
      } else if (n == 0 || errno != EINTR) {
        // Negative fd makes poll skip the stream from now on.
        fds[i].fd = -1;
        --open_streams;
      }
    }
  }

  int status = 0;
  if (result.timed_out || !result.error.empty()) {
    kill(pid, SIGKILL);
  }
  while (waitpid(pid, &status, 0) == -1 && errno == EINTR) {
  }
  result.exit_code = decode_wait_status(status);
  if (result.timed_out) {
    result.error = "Command timed out after " + std::to_string(*timeout_ms) + " ms";
  }
  return result;
}

}  // namespace cryoql
