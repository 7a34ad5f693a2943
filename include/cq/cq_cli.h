#pragma once

#include <cq/config.h>
#include <cq/logging.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace cq {

struct AnalyzeOptions {
  std::optional<std::filesystem::path> root;
  std::optional<std::filesystem::path> build_directory;
  std::optional<std::filesystem::path> output_directory;
  std::optional<std::filesystem::path> config_file;
  std::vector<std::string> formats;
  std::optional<std::size_t> jobs;
  std::optional<std::uint64_t> seed;
  std::optional<LogLevel> log_level;
  bool show_help = false;
};

AnalyzeOptions ParseAnalyzeArguments(const std::vector<std::string> &arguments);

// Starts from the config file (or the defaults) and applies the command-line
// overrides on top. Throws std::invalid_argument when no root is known.
AnalysisConfig ResolveAnalysisConfig(const AnalyzeOptions &options);

// Reports go to report.out when set, else to the analyzed root.
std::filesystem::path ResolveOutputDirectory(const AnalysisConfig &config);

void PrintAnalyzeUsage();

int RunAnalyze(const std::vector<std::string> &arguments);
int RunExampleConfig(const std::vector<std::string> &arguments);

} // namespace cq
