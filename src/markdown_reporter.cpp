#include <cq/markdown_reporter.h>

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <fstream>
#include <iomanip>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <unordered_map>

namespace cq {
namespace {

constexpr std::size_t kTopFileCount = 10;

template <typename Collection, typename Formatter>
std::string Join(const Collection &items, const std::string &delimiter,
                 Formatter formatter) {
  std::ostringstream output;
  bool first = true;
  std::for_each(items.begin(), items.end(), [&](const auto &item) {
    if (!first) {
      output << delimiter;
    }
    output << formatter(item);
    first = false;
  });
  return output.str();
}

std::string Fixed(double value, int precision) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(precision) << value;
  return stream.str();
}

std::string JsonNumber(double value) {
  std::ostringstream stream;
  stream << std::setprecision(10) << value;
  return stream.str();
}

std::string JsonString(const std::string &value) {
  return "\"" + EscapeJsonString(value) + "\"";
}

std::string JsonBool(bool value) { return value ? "true" : "false"; }

std::string JsonOptional(const std::optional<double> &value) {
  return value ? JsonNumber(*value) : "null";
}

// Table cells cannot contain pipes or line breaks.
std::string Cell(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    if (character == '|') {
      escaped += "\\|";
    } else if (character == '\n' || character == '\r') {
      escaped += ' ';
    } else {
      escaped.push_back(character);
    }
  }
  return escaped.empty() ? "-" : escaped;
}

bool ShouldRenderFormat(const std::vector<std::string> &formats,
                        const std::string &format) {
  if (formats.empty()) {
    return format == "markdown";
  }
  return std::find(formats.begin(), formats.end(), format) != formats.end();
}

std::string CurrentTimestamp() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t now_time = std::chrono::system_clock::to_time_t(now);
  std::tm tm;
  gmtime_r(&now_time, &tm);
  std::ostringstream stream;
  stream << std::put_time(&tm, "%FT%TZ");
  return stream.str();
}

std::string DescribeInterval(const ConfidenceInterval &interval,
                             double scale, int precision) {
  if (interval.sample_count == 0) {
    return "-";
  }
  return Fixed(interval.low * scale, precision) + " - " +
         Fixed(interval.high * scale, precision) + " (n=" +
         std::to_string(interval.sample_count) + ")";
}

std::string BuildAnalysisHeaderMarkdown(const Report &report,
                                        const AnalysisConfig &config,
                                        const std::string &timestamp) {
  std::ostringstream section;
  section << "## Analysis Header\n\n";
  section << "| Field | Value |\n";
  section << "| --- | --- |\n";
  section << "| Generated On | " << timestamp << " |\n";
  section << "| Source | " << Cell(report.root_path) << " |\n";
  section << "| Config | "
          << (config.config_file.empty() ? "defaults" : Cell(config.config_file))
          << " |\n";
  section << "| Files | " << report.files.size() << " |\n\n";
  return section.str();
}

std::string BuildSummaryMarkdown(const Report &report) {
  std::ostringstream section;
  section << "## Summary\n\n";
  section << "- Overall score: **" << Fixed(report.overall_score, 2)
          << " / 100**\n";
  section << "- Confidence: ";
  if (report.confidence.sample_count == 0) {
    section << "not available\n";
  } else {
    section << Fixed(report.confidence.level * 100.0, 0) << "% interval "
            << DescribeInterval(report.confidence, 1.0, 2) << "\n";
  }
  section << "- Status: "
          << (report.partial ? "partial (some pillars unavailable)"
                             : "complete")
          << "\n\n";
  return section.str();
}

std::string BuildPillarsMarkdown(const Report &report) {
  std::ostringstream section;
  section << "## Pillars\n\n";
  section << "| Pillar | Score | Applied Weight | Interval | Status |\n";
  section << "| --- | --- | --- | --- | --- |\n";
  for (const auto pillar : kAllPillars) {
    const auto &score = report.PillarFor(pillar);
    section << "| " << PillarName(pillar) << " | "
            << (score.available ? Fixed(score.score * 100.0, 2) : "-")
            << " | " << Fixed(report.applied_weights.Get(pillar), 3) << " | "
            << DescribeInterval(score.interval, 100.0, 2) << " | "
            << (score.available ? "available"
                                : "unavailable: " + Cell(score.reason))
            << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildFindingsMarkdown(const Report &report) {
  std::ostringstream section;
  section << "## Findings\n\n";
  section << "| File | Line | Severity | Category | Rule | Message |\n";
  section << "| --- | --- | --- | --- | --- | --- |\n";
  if (report.findings.empty()) {
    section << "| None | - | - | - | - | - |\n\n";
    return section.str();
  }
  for (const auto &finding : report.findings) {
    section << "| " << Cell(finding.file) << " | " << finding.line << " | "
            << SeverityName(finding.severity) << " | " << Cell(finding.category)
            << " | " << Cell(finding.rule) << " | " << Cell(finding.message)
            << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildClonesMarkdown(const Report &report) {
  std::ostringstream section;
  section << "## Clone Pairs\n\n";
  section << "| First | Second | Tokens | Lines |\n";
  section << "| --- | --- | --- | --- |\n";
  if (report.clones.empty()) {
    section << "| None | - | - | - |\n\n";
    return section.str();
  }
  for (const auto &clone : report.clones) {
    section << "| " << Cell(clone.first.file) << ":" << clone.first.start_line
            << "-" << clone.first.end_line << " | " << Cell(clone.second.file)
            << ":" << clone.second.start_line << "-" << clone.second.end_line
            << " | " << clone.TokenCount() << " | " << clone.first.LineCount()
            << " |\n";
  }
  section << "\n";
  return section.str();
}

template <typename Key>
std::vector<const FileMetrics *> TopFiles(const Report &report, Key key) {
  std::vector<const FileMetrics *> files;
  for (const auto &file : report.files) {
    if (!file.parse_failed && key(file) > 0.0) {
      files.push_back(&file);
    }
  }
  std::stable_sort(files.begin(), files.end(),
                   [&](const FileMetrics *lhs, const FileMetrics *rhs) {
                     return key(*lhs) > key(*rhs);
                   });
  if (files.size() > kTopFileCount) {
    files.resize(kTopFileCount);
  }
  return files;
}

std::string BuildTopFilesMarkdown(const Report &report) {
  std::ostringstream section;
  section << "## Top Files by Duplication\n\n";
  const auto duplicated = TopFiles(
      report, [](const FileMetrics &file) { return file.duplication_ratio; });
  if (duplicated.empty()) {
    section << "- None\n\n";
  } else {
    for (const auto *file : duplicated) {
      section << "- " << file->path << ": "
              << Fixed(file->duplication_ratio * 100.0, 1) << "% duplicated\n";
    }
    section << "\n";
  }

  section << "## Top Files by Cognitive Complexity\n\n";
  const auto complex = TopFiles(report, [](const FileMetrics &file) {
    return file.cognitive_complexity;
  });
  if (complex.empty()) {
    section << "- None\n\n";
  } else {
    for (const auto *file : complex) {
      section << "- " << file->path << ": "
              << Fixed(file->cognitive_complexity, 0) << " over "
              << file->line_count << " lines\n";
    }
    section << "\n";
  }
  return section.str();
}

std::string BuildAbsentRelationsMarkdown(const Report &report) {
  std::ostringstream section;
  section << "## Absent Relations\n\n";
  if (report.absent_relations.empty()) {
    section << "- None\n";
    return section.str();
  }
  for (const auto &relation : report.absent_relations) {
    section << "- " << relation.source_layer << " -> "
            << relation.target_layer
            << " is allowed but never used\n";
  }
  return section.str();
}

std::string IntervalJson(const ConfidenceInterval &interval) {
  std::ostringstream json;
  json << "{\"low\": " << JsonNumber(interval.low) << ",";
  json << "\"high\": " << JsonNumber(interval.high) << ",";
  json << "\"level\": " << JsonNumber(interval.level) << ",";
  json << "\"sample_count\": " << interval.sample_count << "}";
  return json.str();
}

std::string BuildAnalysisHeaderJson(const Report &report,
                                    const AnalysisConfig &config,
                                    const std::string &timestamp) {
  std::ostringstream json;
  json << "\"analysis_header\": {";
  json << "\"generated_on\": " << JsonString(timestamp) << ",";
  json << "\"source\": " << JsonString(report.root_path) << ",";
  json << "\"config_file\": " << JsonString(config.config_file) << "}";
  return json.str();
}

std::string BuildScoreJson(const Report &report) {
  std::ostringstream json;
  json << "\"overall_score\": " << JsonNumber(report.overall_score) << ",";
  json << "\"partial\": " << JsonBool(report.partial) << ",";
  json << "\"confidence\": {";
  json << "\"interval_low\": " << JsonNumber(report.confidence.low) << ",";
  json << "\"interval_high\": " << JsonNumber(report.confidence.high) << ",";
  json << "\"level\": " << JsonNumber(report.confidence.level) << ",";
  json << "\"sample_count\": " << report.confidence.sample_count << "},";
  json << "\"weights\": {"
       << Join(kAllPillars, ",",
               [&](Pillar pillar) {
                 return JsonString(PillarName(pillar)) + ": " +
                        JsonNumber(report.applied_weights.Get(pillar));
               })
       << "}";
  return json.str();
}

std::string BuildPillarsJson(const Report &report) {
  std::ostringstream json;
  json << "\"pillars\": {";
  json << Join(kAllPillars, ",", [&](Pillar pillar) {
    const auto &score = report.PillarFor(pillar);
    std::ostringstream entry;
    entry << JsonString(PillarName(pillar)) << ": {";
    entry << "\"score\": " << JsonNumber(score.score) << ",";
    entry << "\"available\": " << JsonBool(score.available) << ",";
    entry << "\"reason\": " << JsonString(score.reason) << ",";
    entry << "\"interval\": " << IntervalJson(score.interval) << "}";
    return entry.str();
  });
  json << "}";
  return json.str();
}

std::string BuildFindingsJson(const Report &report) {
  std::ostringstream json;
  json << "\"findings\": [";
  json << Join(report.findings, ",", [](const Finding &finding) {
    std::ostringstream entry;
    entry << "{\"file\": " << JsonString(finding.file) << ",";
    entry << "\"line\": " << finding.line << ",";
    entry << "\"category\": " << JsonString(finding.category) << ",";
    entry << "\"severity\": " << JsonString(SeverityName(finding.severity))
          << ",";
    entry << "\"rule\": " << JsonString(finding.rule) << ",";
    entry << "\"message\": " << JsonString(finding.message) << "}";
    return entry.str();
  });
  json << "]";
  return json.str();
}

std::string CloneSpanJson(const CloneSpan &span) {
  std::ostringstream json;
  json << "{\"file\": " << JsonString(span.file) << ",";
  json << "\"start_line\": " << span.start_line << ",";
  json << "\"end_line\": " << span.end_line << ",";
  json << "\"start_token\": " << span.start_token << ",";
  json << "\"end_token\": " << span.end_token << "}";
  return json.str();
}

std::string BuildClonesJson(const Report &report) {
  std::ostringstream json;
  json << "\"clones\": [";
  json << Join(report.clones, ",", [](const ClonePair &clone) {
    return "{\"first\": " + CloneSpanJson(clone.first) +
           ",\"second\": " + CloneSpanJson(clone.second) +
           ",\"tokens\": " + std::to_string(clone.TokenCount()) + "}";
  });
  json << "]";
  return json.str();
}

std::string BuildFilesJson(const Report &report) {
  std::ostringstream json;
  json << "\"files\": [";
  json << Join(report.files, ",", [](const FileMetrics &file) {
    std::ostringstream entry;
    entry << "{\"path\": " << JsonString(file.path) << ",";
    entry << "\"line_count\": " << file.line_count << ",";
    entry << "\"parse_failed\": " << JsonBool(file.parse_failed) << ",";
    entry << "\"duplication_ratio\": " << JsonNumber(file.duplication_ratio)
          << ",";
    entry << "\"cognitive_complexity\": "
          << JsonNumber(file.cognitive_complexity) << ",";
    entry << "\"complexity_score\": " << JsonNumber(file.complexity_score)
          << ",";
    entry << "\"architecture_score\": "
          << JsonOptional(file.architecture_score) << ",";
    entry << "\"lint_score\": " << JsonOptional(file.lint_score) << ",";
    entry << "\"typing_score\": " << JsonOptional(file.typing_score) << ",";
    entry << "\"grade\": " << JsonNumber(file.grade) << "}";
    return entry.str();
  });
  json << "]";
  return json.str();
}

std::string BuildAbsentRelationsJson(const Report &report) {
  std::ostringstream json;
  json << "\"absent_relations\": [";
  json << Join(report.absent_relations, ",",
               [](const AbsentRelation &relation) {
                 return "{\"source_layer\": " +
                        JsonString(relation.source_layer) +
                        ",\"target_layer\": " +
                        JsonString(relation.target_layer) + "}";
               });
  json << "]";
  return json.str();
}

// An unrendered format removes the file left by an earlier run.
void WriteOrRemoveReport(const std::filesystem::path &path,
                         const std::string &content) {
  if (content.empty()) {
    std::filesystem::remove(path);
    return;
  }
  std::ofstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " + path.string());
  }
  stream << content;
}

} // namespace

std::string EscapeJsonString(const std::string &value) {
  static const std::unordered_map<char, std::string> replacements{
      {'"', "\\\""},
      {'\\', "\\\\"},
      {'\n', "\\n"},
      {'\r', "\\r"},
      {'\t', "\\t"}};

  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    const auto replacement = replacements.find(character);
    if (replacement != replacements.end()) {
      escaped.append(replacement->second);
    } else if (static_cast<unsigned char>(character) < 0x20) {
      char buffer[8];
      std::snprintf(buffer, sizeof(buffer), "\\u%04x",
                    static_cast<unsigned>(static_cast<unsigned char>(character)));
      escaped.append(buffer);
    } else {
      escaped.push_back(character);
    }
  }
  return escaped;
}

RenderedReport MarkdownReporter::Render(const Report &report,
                                        const AnalysisConfig &config) {
  const auto timestamp = CurrentTimestamp();

  RenderedReport rendered;
  if (ShouldRenderFormat(config.report.formats, "markdown")) {
    std::ostringstream output;
    output << "# Code Quality Report\n\n";
    output << BuildAnalysisHeaderMarkdown(report, config, timestamp);
    output << BuildSummaryMarkdown(report);
    output << BuildPillarsMarkdown(report);
    output << BuildFindingsMarkdown(report);
    output << BuildClonesMarkdown(report);
    output << BuildTopFilesMarkdown(report);
    output << BuildAbsentRelationsMarkdown(report);
    rendered.markdown = output.str();
  }

  if (ShouldRenderFormat(config.report.formats, "json")) {
    std::ostringstream output;
    output << "{";
    output << BuildAnalysisHeaderJson(report, config, timestamp) << ",";
    output << BuildScoreJson(report) << ",";
    output << BuildPillarsJson(report) << ",";
    output << BuildFindingsJson(report) << ",";
    output << BuildClonesJson(report) << ",";
    output << BuildFilesJson(report) << ",";
    output << BuildAbsentRelationsJson(report);
    output << "}";
    rendered.json = output.str();
  }
  return rendered;
}

void WriteReports(const std::filesystem::path &directory,
                  const RenderedReport &rendered) {
  std::filesystem::create_directories(directory);
  WriteOrRemoveReport(directory / "cq_report.md", rendered.markdown);
  WriteOrRemoveReport(directory / "cq_report.json", rendered.json);
}

} // namespace cq
