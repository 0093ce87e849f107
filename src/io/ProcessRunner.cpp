/* @file ProcessRunner.cpp
 * @brief fork/exec with stdout pipe, poll-bounded wait and SIGKILL on deadline
 *
 * © 2025 Hearo — MIT-licensed.
 */

// STL headers
#include <cstring>

// Linux headers
#include <errno.h>
#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

// Hearo headers
#include "io/ProcessRunner.hpp"

using namespace hearo::io;

namespace {
  int decodeStatus(int status) {
    if (WIFEXITED(status))
      return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
      return 128 + WTERMSIG(status);
    return -1;
  }

  pid_t waitChild(pid_t pid, int& status) {
    pid_t rc;
    do {
      rc = ::waitpid(pid, &status, 0);
    } while (rc < 0 && errno == EINTR);
    return rc;
  }
} // namespace

std::optional<ProcessResult> ProcessRunner::run(const std::vector<std::string>& argv,
                                                std::chrono::milliseconds timeout) {
  if (argv.empty()) {
    lastError_ = "empty command line";
    return std::nullopt;
  }

  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) {
    lastError_ = std::string("pipe: ") + std::strerror(errno);
    return std::nullopt;
  }

  // argv must be built before fork(); the child only calls async-signal-safe functions
  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv)
    cargv.push_back(const_cast<char*>(a.c_str()));
  cargv.push_back(nullptr);

  pid_t pid = ::fork();
  if (pid < 0) {
    lastError_ = std::string("fork: ") + std::strerror(errno);
    ::close(fds[0]);
    ::close(fds[1]);
    return std::nullopt;
  }

  if (pid == 0) {
    ::dup2(fds[1], STDOUT_FILENO);
    int devnull = ::open("/dev/null", O_RDWR);
    if (devnull >= 0) {
      ::dup2(devnull, STDIN_FILENO);
      ::dup2(devnull, STDERR_FILENO);
    }
    ::execvp(cargv[0], cargv.data());
    ::_exit(127);
  }

  ::close(fds[1]);

  ProcessResult result;
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  pollfd pfd{ fds[0], POLLIN, 0 };
  char buf[1024];

  while (true) {
    auto msLeft = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (msLeft.count() <= 0) {
      result.timedOut = true;
      break;
    }
    int rc = ::poll(&pfd, 1, static_cast<int>(msLeft.count()));
    if (rc < 0) {
      if (errno == EINTR)
        continue;
      lastError_ = std::string("poll: ") + std::strerror(errno);
      result.timedOut = true; // cannot observe the child any more, treat as hung
      break;
    }
    if (rc == 0) {
      result.timedOut = true;
      break;
    }
    ssize_t n = ::read(fds[0], buf, sizeof(buf));
    if (n > 0) {
      if (result.output.size() < kMaxOutput)
        result.output.append(buf, static_cast<std::size_t>(n));
      continue;
    }
    if (n < 0 && errno == EINTR)
      continue;
    break; // EOF: child closed stdout
  }
  ::close(fds[0]);

  if (result.timedOut)
    ::kill(pid, SIGKILL);

  int status = 0;
  if (waitChild(pid, status) < 0) {
    lastError_ = std::string("waitpid: ") + std::strerror(errno);
    return result;
  }
  result.exitCode = decodeStatus(status);
  return result;
}
