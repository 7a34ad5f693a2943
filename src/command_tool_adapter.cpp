#include <cq/command_tool_adapter.h>

#include <cq/subprocess.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <limits>
#include <map>
#include <optional>
#include <regex>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace cq {
namespace {

const std::regex &DiagnosticPattern() {
  static const std::regex pattern(
      R"(^(.+?):(\d+):(\d+):\s+(fatal error|error|warning|note):\s+(.*?)(?:\s+\[([^\]]+)\])?\s*$)");
  return pattern;
}

void ReplaceAll(std::string &text, const std::string &from,
                const std::string &to) {
  std::size_t position = 0;
  while ((position = text.find(from, position)) != std::string::npos) {
    text.replace(position, from.size(), to);
    position += to.size();
  }
}

std::string RelativeToRoot(const std::string &path,
                           const std::filesystem::path &root) {
  std::filesystem::path candidate(path);
  if (candidate.is_absolute()) {
    candidate = candidate.lexically_normal().lexically_relative(root);
  }
  return candidate.lexically_normal().generic_string();
}

// Empty when the digits do not fit an unsigned position.
std::optional<unsigned> ParsePosition(const std::string &digits) {
  try {
    const auto value = std::stoull(digits);
    if (value > std::numeric_limits<unsigned>::max()) {
      return std::nullopt;
    }
    return static_cast<unsigned>(value);
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

} // namespace

std::vector<ToolDiagnostic> ParseDiagnostics(const std::string &output) {
  std::vector<ToolDiagnostic> diagnostics;
  std::istringstream stream(output);
  std::string line;
  while (std::getline(stream, line)) {
    std::smatch match;
    if (!std::regex_match(line, match, DiagnosticPattern())) {
      continue;
    }
    const auto severity = match[4].str();
    if (severity == "note") {
      continue;
    }
    const auto line_number = ParsePosition(match[2].str());
    const auto column = ParsePosition(match[3].str());
    if (!line_number || !column) {
      continue;
    }
    ToolDiagnostic diagnostic;
    diagnostic.file = match[1].str();
    diagnostic.line = *line_number;
    diagnostic.column = *column;
    diagnostic.severity =
        severity == "warning" ? Severity::kWarning : Severity::kError;
    diagnostic.message = match[5].str();
    diagnostic.check = match[6].matched ? match[6].str() : std::string{};
    diagnostics.push_back(std::move(diagnostic));
  }
  return diagnostics;
}

std::string ExpandCommandTemplate(const std::string &command_template,
                                  const std::vector<std::string> &files,
                                  const std::string &root) {
  std::string quoted_files;
  for (const auto &file : files) {
    if (!quoted_files.empty()) {
      quoted_files += ' ';
    }
    quoted_files += ShellQuote(file);
  }
  auto command = command_template;
  ReplaceAll(command, "{files}", quoted_files);
  ReplaceAll(command, "{root}", ShellQuote(root));
  return command;
}

CommandToolAdapter::CommandToolAdapter(ToolKind kind,
                                       std::shared_ptr<Logger> logger)
    : kind_(kind), logger_(EnsureLogger(std::move(logger))) {}

double CommandToolAdapter::FileScore(
    const std::vector<ToolDiagnostic> &diagnostics, std::size_t line_count,
    const ToolOptions &options) const {
  if (kind_ == ToolKind::kLint) {
    double penalty = 0.0;
    for (const auto &diagnostic : diagnostics) {
      penalty += diagnostic.severity == Severity::kError
                     ? options.lint_error_weight
                     : options.lint_warning_weight;
    }
    return std::max(0.0, 1.0 - penalty / 100.0);
  }
  const auto lines = static_cast<double>(std::max<std::size_t>(line_count, 1));
  const auto density = static_cast<double>(diagnostics.size()) * 1000.0 / lines;
  return std::max(0.0, 1.0 - density / options.typing_zero_score_density);
}

ToolOutcome CommandToolAdapter::Measure(const RepositorySnapshot &snapshot,
                                        const AnalysisConfig &config) {
  const auto &command = kind_ == ToolKind::kLint ? config.tools.lint
                                                 : config.tools.typing;
  const auto name = ToolKindName(kind_);
  if (command.command.empty()) {
    return ToolOutcome::Unavailable(name + " tool not configured");
  }
  if (snapshot.files.empty()) {
    return ToolOutcome::Unavailable("no files to check");
  }

  const auto root = std::filesystem::path(snapshot.root_path).lexically_normal();
  std::vector<std::string> absolute_files;
  for (const auto &file : snapshot.files) {
    absolute_files.push_back((root / file.path).generic_string());
  }
  const auto expanded =
      ExpandCommandTemplate(command.command, absolute_files, root.string());

  logger_->Log(LogLevel::kInfo, "tool.start",
               {{"tool", name}, {"files", std::to_string(absolute_files.size())}});
  const auto started = std::chrono::steady_clock::now();
  const auto process = RunShellCommand(
      expanded, root, std::chrono::seconds(command.timeout_seconds));
  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started)
          .count();

  if (!process.started) {
    logger_->Log(LogLevel::kWarn, "tool.unavailable",
                 {{"tool", name}, {"reason", process.error}});
    return ToolOutcome::Unavailable(name + " tool could not be started: " +
                                    process.error);
  }
  if (process.timed_out) {
    logger_->Log(LogLevel::kWarn, "tool.unavailable",
                 {{"tool", name}, {"reason", "timeout"}});
    return ToolOutcome::Unavailable(
        name + " tool timed out after " +
        std::to_string(command.timeout_seconds) + "s");
  }
  if (std::find(command.accepted_exit_codes.begin(),
                command.accepted_exit_codes.end(),
                process.exit_code) == command.accepted_exit_codes.end()) {
    logger_->Log(LogLevel::kWarn, "tool.unavailable",
                 {{"tool", name},
                  {"exit_code", std::to_string(process.exit_code)}});
    return ToolOutcome::Unavailable(name + " tool exited with status " +
                                    std::to_string(process.exit_code));
  }

  std::map<std::string, std::vector<ToolDiagnostic>> by_file;
  for (const auto &file : snapshot.files) {
    by_file[file.path];
  }
  std::vector<ToolDiagnostic> kept;
  for (auto diagnostic : ParseDiagnostics(process.output)) {
    diagnostic.file = RelativeToRoot(diagnostic.file, root);
    const auto found = by_file.find(diagnostic.file);
    if (found == by_file.end()) {
      continue;
    }
    found->second.push_back(diagnostic);
    kept.push_back(std::move(diagnostic));
  }

  std::vector<FileToolMetric> metrics;
  double weighted = 0.0;
  double lines = 0.0;
  for (const auto &file : snapshot.files) {
    const auto &diagnostics = by_file[file.path];
    FileToolMetric metric;
    metric.path = file.path;
    metric.diagnostics = diagnostics.size();
    metric.score = FileScore(diagnostics, file.line_count, config.tools);
    weighted += metric.score * static_cast<double>(file.line_count);
    lines += static_cast<double>(file.line_count);
    metrics.push_back(std::move(metric));
  }
  std::sort(metrics.begin(), metrics.end(),
            [](const FileToolMetric &lhs, const FileToolMetric &rhs) {
              return lhs.path < rhs.path;
            });

  double value = 1.0;
  if (lines > 0.0) {
    value = weighted / lines;
  } else if (!metrics.empty()) {
    value = 0.0;
    for (const auto &metric : metrics) {
      value += metric.score;
    }
    value /= static_cast<double>(metrics.size());
  }

  logger_->Log(LogLevel::kInfo, "tool.complete",
               {{"tool", name},
                {"diagnostics", std::to_string(kept.size())},
                {"duration_ms", std::to_string(duration_ms)}});
  return ToolOutcome::Available(value, std::move(metrics), std::move(kept));
}

} // namespace cq
