#pragma once

#include <chrono>
#include <filesystem>
#include <string>

namespace cq {

struct ProcessResult {
  bool started = false;
  bool timed_out = false;
  int exit_code = -1;
  // stdout and stderr, interleaved.
  std::string output;
  std::string error;
};

// Runs `command` through /bin/sh -c in its own process group. On timeout the
// whole group is killed.
ProcessResult RunShellCommand(const std::string &command,
                              const std::filesystem::path &working_directory,
                              std::chrono::seconds timeout);

std::string ShellQuote(const std::string &value);

} // namespace cq
