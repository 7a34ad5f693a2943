#include <cq/subprocess.h>

#include <poll.h>
#include <signal.h>
#include <sys/types.h>
#include <sys/wait.h>
#include <unistd.h>

#include <array>
#include <cerrno>
#include <cstring>

namespace cq {
namespace {

void CloseFd(int &fd) {
  if (fd >= 0) {
    close(fd);
    fd = -1;
  }
}

int DecodeStatus(int status) {
  if (WIFEXITED(status)) {
    return WEXITSTATUS(status);
  }
  if (WIFSIGNALED(status)) {
    return 128 + WTERMSIG(status);
  }
  return -1;
}

} // namespace

std::string ShellQuote(const std::string &value) {
  std::string quoted = "'";
  for (const auto ch : value) {
    if (ch == '\'') {
      quoted += "'\\''";
    } else {
      quoted += ch;
    }
  }
  quoted += "'";
  return quoted;
}

ProcessResult RunShellCommand(const std::string &command,
                              const std::filesystem::path &working_directory,
                              std::chrono::seconds timeout) {
  ProcessResult result;
  int pipe_fds[2] = {-1, -1};
  if (pipe(pipe_fds) != 0) {
    result.error = std::string("pipe failed: ") + std::strerror(errno);
    return result;
  }

  const pid_t pid = fork();
  if (pid == -1) {
    result.error = std::string("fork failed: ") + std::strerror(errno);
    CloseFd(pipe_fds[0]);
    CloseFd(pipe_fds[1]);
    return result;
  }

  if (pid == 0) {
    setpgid(0, 0);
    dup2(pipe_fds[1], STDOUT_FILENO);
    dup2(pipe_fds[1], STDERR_FILENO);
    close(pipe_fds[0]);
    close(pipe_fds[1]);
    if (!working_directory.empty() && chdir(working_directory.c_str()) != 0) {
      _exit(127);
    }
    execl("/bin/sh", "sh", "-c", command.c_str(), static_cast<char *>(nullptr));
    _exit(127);
  }

  setpgid(pid, pid);
  result.started = true;
  CloseFd(pipe_fds[1]);

  const auto deadline = std::chrono::steady_clock::now() + timeout;
  std::array<char, 4096> buffer{};
  for (;;) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      result.timed_out = true;
      break;
    }
    pollfd descriptor{pipe_fds[0], POLLIN, 0};
    const int ready = poll(&descriptor, 1, static_cast<int>(remaining.count()));
    if (ready < 0) {
      if (errno == EINTR) {
        continue;
      }
      result.error = std::string("poll failed: ") + std::strerror(errno);
      break;
    }
    if (ready == 0) {
      continue;
    }
    const auto count = read(pipe_fds[0], buffer.data(), buffer.size());
    if (count < 0 && errno == EINTR) {
      continue;
    }
    if (count <= 0) {
      break;
    }
    result.output.append(buffer.data(), static_cast<std::size_t>(count));
  }
  CloseFd(pipe_fds[0]);

  if (result.timed_out || !result.error.empty()) {
    kill(-pid, SIGKILL);
  }
  int status = 0;
  while (waitpid(pid, &status, 0) < 0) {
    if (errno != EINTR) {
      result.error = std::string("waitpid failed: ") + std::strerror(errno);
      return result;
    }
  }
  result.exit_code = DecodeStatus(status);
  if (result.exit_code == 127 && !result.timed_out && result.error.empty() &&
      result.output.empty()) {
    result.error = "command could not be started";
  }
  return result;
}

} // namespace cq
