#include <cq/cq_cli.h>

#include <cq/analyzer_pipeline_builder.h>
#include <cq/cli_exit_codes.h>
#include <cq/default_analyzer_pipeline.h>
#include <cq/markdown_reporter.h>

#include <algorithm>
#include <cctype>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

namespace {

using cq::AnalyzeOptions;

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(value.begin(), value.end(), value.begin(),
                 [](unsigned char ch) { return std::tolower(ch); });
  return value;
}

void AppendFormats(const std::string &raw_formats,
                   std::vector<std::string> &formats) {
  std::size_t start = 0;
  while (start <= raw_formats.size()) {
    const auto comma = raw_formats.find(',', start);
    const auto end = comma == std::string::npos ? raw_formats.size() : comma;
    auto format = ToLower(Trim(raw_formats.substr(start, end - start)));
    if (format == "md") {
      format = "markdown";
    }
    if (!format.empty() &&
        std::find(formats.begin(), formats.end(), format) == formats.end()) {
      formats.push_back(format);
    }
    if (comma == std::string::npos) {
      break;
    }
    start = comma + 1;
  }
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

std::uint64_t ParseUnsigned(const std::string &value, const std::string &flag) {
  const auto trimmed = Trim(value);
  if (trimmed.empty() ||
      !std::all_of(trimmed.begin(), trimmed.end(),
                   [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
    throw std::invalid_argument(flag + " expects a non-negative integer, got '" +
                                value + "'");
  }
  try {
    return std::stoull(trimmed);
  } catch (const std::out_of_range &) {
    throw std::invalid_argument(flag + " is out of range: " + value);
  }
}

void HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level =
        cq::ParseLogLevel(RequireValue(arguments, index, argument));
    return;
  }
  if (argument == "--verbose") {
    options.log_level = cq::LogLevel::kInfo;
    return;
  }
  if (argument == "--debug") {
    options.log_level = cq::LogLevel::kDebug;
    return;
  }
}

bool DispatchAnalyzeOption(const std::vector<std::string> &arguments,
                           std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--root") {
    options.root = RequireValue(arguments, index, "--root");
    return true;
  }
  if (argument == "--build") {
    options.build_directory = RequireValue(arguments, index, "--build");
    return true;
  }
  if (argument == "--out") {
    options.output_directory = RequireValue(arguments, index, "--out");
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, "--config");
    return true;
  }
  if (argument == "--format") {
    AppendFormats(RequireValue(arguments, index, "--format"), options.formats);
    return true;
  }
  if (argument == "--jobs" || argument == "-j") {
    options.jobs = static_cast<std::size_t>(
        ParseUnsigned(RequireValue(arguments, index, argument), argument));
    return true;
  }
  if (argument == "--seed") {
    options.seed = ParseUnsigned(RequireValue(arguments, index, "--seed"),
                                 "--seed");
    return true;
  }

  HandleLoggingOption(arguments, index, options);
  if (argument == "--log-level" || argument == "--verbose" ||
      argument == "--debug") {
    return true;
  }

  return false;
}

} // namespace

namespace cq {

void PrintAnalyzeUsage() {
  std::cout
      << "Usage: cq analyze --root <path> [options]\n"
      << "Options:\n"
      << "  --root <path>         Repository to analyze\n"
      << "  --config <file>       YAML config file (see 'cq example-config')\n"
      << "  --format <list>       Comma-separated list of output formats\n"
      << "                        (supported: markdown,json)\n"
      << "  --out <path>          Directory for report outputs (default: "
         "analysis root)\n"
      << "  --build <path>        Build directory holding "
         "compile_commands.json,\n"
      << "                        relative to the root (default: build)\n"
      << "  --jobs <n>            Worker threads (0: hardware concurrency)\n"
      << "  --seed <n>            Bootstrap random seed\n"
      << "  --log-level <level>   Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose             Shortcut for --log-level info\n"
      << "  --debug               Shortcut for --log-level debug\n"
      << "  --help                Show this message\n"
      << "Exit codes: 0 complete report, 2 partial report, 1 error.\n";
}

AnalyzeOptions
ParseAnalyzeArguments(const std::vector<std::string> &arguments) {
  AnalyzeOptions options;

  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchAnalyzeOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }

  return options;
}

AnalysisConfig ResolveAnalysisConfig(const AnalyzeOptions &options) {
  AnalysisConfig config;
  if (options.config_file) {
    config = LoadConfigFile(*options.config_file);
  }

  if (options.root) {
    config.root_path = options.root->string();
  }
  if (config.root_path.empty()) {
    throw std::invalid_argument("--root is required");
  }
  config.root_path =
      std::filesystem::weakly_canonical(config.root_path).string();

  if (options.build_directory) {
    config.paths.build_directory = options.build_directory->generic_string();
  }
  if (options.output_directory) {
    config.report.output_directory = options.output_directory->string();
  }
  if (!options.formats.empty()) {
    config.report.formats = options.formats;
  }
  if (options.jobs) {
    config.workers = *options.jobs;
  }
  if (options.seed) {
    config.bootstrap.seed = *options.seed;
  }
  if (options.log_level) {
    config.logging.level = *options.log_level;
  }
  return config;
}

std::filesystem::path ResolveOutputDirectory(const AnalysisConfig &config) {
  if (config.report.output_directory.empty()) {
    return config.root_path;
  }
  return config.report.output_directory;
}

int RunAnalyze(const std::vector<std::string> &arguments) {
  const auto options = ParseAnalyzeArguments(arguments);
  if (options.show_help) {
    PrintAnalyzeUsage();
    return kExitComplete;
  }

  auto config = ResolveAnalysisConfig(options);
  auto logger = MakeLogger(config.logging, std::clog);
  config.logger = logger;

  auto pipeline = AnalyzerPipelineBuilder().WithLogger(logger).Build();
  const auto result = pipeline.Run(config);
  WriteReports(ResolveOutputDirectory(config), result.rendered);
  return ReportExitCode(result.report);
}

int RunExampleConfig(const std::vector<std::string> &arguments) {
  if (!arguments.empty() &&
      (arguments.front() == "--help" || arguments.front() == "-h")) {
    std::cout << "Usage: cq example-config\n"
              << "Prints the default configuration as YAML.\n";
    return kExitComplete;
  }
  if (!arguments.empty()) {
    throw std::invalid_argument("Unknown argument: " + arguments.front());
  }
  std::cout << DefaultConfigYaml() << "\n";
  return kExitComplete;
}

} // namespace cq
