#pragma once

#include <cq/logging.h>
#include <cq/models.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace cq {

// Raised for malformed configuration, always before any file is analyzed.
class ConfigError : public std::invalid_argument {
public:
  using std::invalid_argument::invalid_argument;
};

// Raised when the snapshot holds no files at all.
class EmptyRepositoryError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

constexpr double kWeightSumTolerance = 1e-6;

struct DuplicationOptions {
  int k = 5;
  int window = 4;
  int min_clone_tokens = 10;
};

enum class ComplexityAggregation { kSum, kPercentile };

struct ComplexityOptions {
  ComplexityAggregation aggregation = ComplexityAggregation::kSum;
  double percentile = 90.0;
  double target_per_loc = 0.25;
  int function_threshold = 25;
};

struct BootstrapOptions {
  int resamples = 1000;
  double confidence_level = 0.95;
  std::uint64_t seed = 1337;
};

struct ArchitectureOptions {
  std::vector<LayerRule> layers;
};

struct ToolCommand {
  // Shell command template. `{files}` and `{root}` are substituted. Empty
  // means the tool is not configured.
  std::string command;
  int timeout_seconds = 120;
  std::vector<int> accepted_exit_codes = {0};
};

struct ToolOptions {
  ToolCommand lint{"clang-tidy --quiet {files} -- -std=c++17 -I{root} "
                   "-I{root}/include -I{root}/src",
                   120,
                   {0}};
  ToolCommand typing{"clang++ -fsyntax-only -std=c++17 -Wconversion "
                     "-Wsign-conversion -Wold-style-cast -I{root} "
                     "-I{root}/include -I{root}/src {files}",
                     120,
                     {0}};
  double lint_error_weight = 1.0;
  double lint_warning_weight = 0.5;
  // Diagnostics per 1000 lines at which the typing score reaches zero.
  double typing_zero_score_density = 20.0;
};

struct PathOptions {
  // Relative to the root. Empty include means the whole root.
  std::vector<std::string> include;
  std::vector<std::string> exclude;
  std::string build_directory = "build";
};

struct LoaderOptions {
  std::vector<std::string> extra_args;
};

struct ReportOptions {
  std::vector<std::string> formats = {"markdown", "json"};
  std::string output_directory;
};

struct AnalysisConfig {
  std::string root_path;
  PillarWeights weights;
  DuplicationOptions duplication;
  ComplexityOptions complexity;
  BootstrapOptions bootstrap;
  ArchitectureOptions architecture;
  ToolOptions tools;
  PathOptions paths;
  LoaderOptions loader;
  ReportOptions report;
  // Zero selects the hardware concurrency.
  std::size_t workers = 0;
  LoggingConfig logging;
  std::shared_ptr<Logger> logger;
  std::string config_file;
};

// Throws ConfigError describing the first problem found.
void ValidateConfig(const AnalysisConfig &config);

// Parses YAML on top of the defaults. Throws ConfigError on unknown keys or
// malformed values; does not run ValidateConfig.
AnalysisConfig ParseConfigText(const std::string &yaml_text);
AnalysisConfig LoadConfigFile(const std::filesystem::path &path);

std::string DefaultConfigYaml();

std::vector<std::string> SupportedConfigKeys();

} // namespace cq
