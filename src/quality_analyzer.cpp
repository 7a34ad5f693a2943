#include <cq/quality_analyzer.h>

#include <cq/aggregator.h>
#include <cq/architecture_checker.h>
#include <cq/ast_normalizer.h>
#include <cq/cognitive_complexity.h>
#include <cq/confidence_estimator.h>
#include <cq/duplication_detector.h>
#include <cq/import_graph.h>
#include <cq/worker_pool.h>

#include <algorithm>
#include <map>
#include <utility>

namespace cq {
namespace {

PillarScore Unavailable(std::string reason) {
  PillarScore score;
  score.available = false;
  score.reason = std::move(reason);
  return score;
}

PillarScore Available(double value, ConfidenceInterval interval) {
  PillarScore score;
  score.available = true;
  score.score = value;
  score.interval = interval;
  return score;
}

std::string DescribeSpan(const CloneSpan &span) {
  return span.file + ":" + std::to_string(span.start_line) + "-" +
         std::to_string(span.end_line);
}

Finding CloneFinding(const ClonePair &pair) {
  Finding finding;
  finding.file = pair.first.file;
  finding.line = pair.first.start_line;
  finding.category = "duplication";
  finding.severity = Severity::kWarning;
  finding.rule = "duplicate-code";
  finding.message = "Duplicated block of " +
                    std::to_string(pair.TokenCount()) + " tokens (" +
                    std::to_string(pair.first.LineCount()) +
                    " lines) also at " + DescribeSpan(pair.second);
  return finding;
}

Finding ToolFinding(const ToolDiagnostic &diagnostic, ToolKind kind) {
  Finding finding;
  finding.file = diagnostic.file;
  finding.line = diagnostic.line;
  finding.category = ToolKindName(kind);
  finding.severity = diagnostic.severity;
  finding.rule = diagnostic.check.empty() ? "diagnostic" : diagnostic.check;
  finding.message = diagnostic.message;
  return finding;
}

PillarScore MeasureTool(ToolAdapter *adapter, ToolKind kind,
                        const RepositorySnapshot &snapshot,
                        const AnalysisConfig &config,
                        const ConfidenceEstimator &estimator,
                        std::map<std::string, double> &file_scores,
                        std::vector<Finding> &findings, Logger &logger) {
  const auto name = ToolKindName(kind);
  if (adapter == nullptr) {
    return Unavailable(name + " tool not configured");
  }
  const auto outcome = adapter->Measure(snapshot, config);
  if (!outcome.available) {
    logger.Log(LogLevel::kWarn, "analysis.pillar.unavailable",
               {{"pillar", name}, {"reason", outcome.reason}});
    return Unavailable(outcome.reason);
  }

  std::vector<MetricSample> samples;
  for (const auto &file : outcome.files) {
    file_scores[file.path] = file.score;
    samples.push_back(MetricSample{file.path, name, file.score});
  }
  for (const auto &diagnostic : outcome.diagnostics) {
    findings.push_back(ToolFinding(diagnostic, kind));
  }
  return Available(std::max(0.0, std::min(1.0, outcome.value)),
                   estimator.Estimate(std::move(samples)));
}

} // namespace

QualityAnalyzer::QualityAnalyzer(std::shared_ptr<ToolAdapter> lint,
                                 std::shared_ptr<ToolAdapter> typing,
                                 std::shared_ptr<Logger> logger)
    : lint_(std::move(lint)), typing_(std::move(typing)),
      logger_(EnsureLogger(std::move(logger))) {}

Report QualityAnalyzer::Analyze(const RepositorySnapshot &snapshot,
                                const AnalysisConfig &config) {
  ValidateConfig(config);
  if (snapshot.files.empty()) {
    throw EmptyRepositoryError("No source files found under " +
                               snapshot.root_path);
  }

  const auto workers = ResolveWorkerCount(config.workers);
  logger_->Log(LogLevel::kInfo, "analysis.start",
               {{"files", std::to_string(snapshot.files.size())},
                {"workers", std::to_string(workers)}});

  std::vector<ParsedFile> files = snapshot.files;
  std::sort(files.begin(), files.end(),
            [](const ParsedFile &lhs, const ParsedFile &rhs) {
              return lhs.path < rhs.path;
            });

  std::vector<Finding> findings;
  for (const auto &file : files) {
    if (!file.ParseFailed()) {
      continue;
    }
    Finding finding;
    finding.file = file.path;
    finding.category = "parse";
    finding.severity = Severity::kWarning;
    finding.rule = "parse-failure";
    finding.message = file.parse_error.empty() ? "File could not be parsed"
                                               : file.parse_error;
    findings.push_back(std::move(finding));
  }

  const AstNormalizer normalizer;
  const auto normalized = normalizer.NormalizeAll(files, workers);
  const ConfidenceEstimator estimator(config.bootstrap, workers);
  std::array<PillarScore, kPillarCount> pillars;

  // Duplication
  const DuplicationDetector detector(config.duplication, workers);
  const auto duplication = detector.Detect(normalized);
  std::map<std::string, double> duplication_ratios;
  {
    std::vector<MetricSample> samples;
    for (const auto &file : duplication.files) {
      duplication_ratios[file.path] = file.ratio;
      samples.push_back(MetricSample{file.path, "duplication", 1.0 - file.ratio});
    }
    for (const auto &clone : duplication.clones) {
      findings.push_back(CloneFinding(clone));
    }
    pillars[static_cast<std::size_t>(Pillar::kDuplication)] =
        duplication.files.empty()
            ? Unavailable("no parsable source files")
            : Available(1.0 - duplication.repository_ratio,
                        estimator.Estimate(std::move(samples)));
  }
  logger_->Log(LogLevel::kDebug, "analysis.pillar.complete",
               {{"pillar", "duplication"},
                {"clones", std::to_string(duplication.clones.size())}});

  // Architecture
  const ImportGraphExtractor extractor;
  const auto graph = extractor.Extract(normalized);
  const ArchitectureChecker checker(config.architecture.layers);
  const auto architecture = checker.Check(graph);
  std::map<std::string, double> module_scores;
  if (architecture.available) {
    for (const auto &sample : architecture.samples) {
      module_scores[sample.subject] = sample.value;
    }
    findings.insert(findings.end(), architecture.findings.begin(),
                    architecture.findings.end());
    pillars[static_cast<std::size_t>(Pillar::kArchitecture)] = Available(
        architecture.score, estimator.Estimate(architecture.samples));
  } else {
    pillars[static_cast<std::size_t>(Pillar::kArchitecture)] =
        Unavailable(architecture.reason);
  }
  logger_->Log(LogLevel::kDebug, "analysis.pillar.complete",
               {{"pillar", "architecture"},
                {"modules", std::to_string(graph.modules.size())},
                {"edges", std::to_string(graph.edges.size())},
                {"divergent", std::to_string(architecture.divergent_edges)}});

  // Complexity
  const CognitiveComplexityScorer scorer(config.complexity);
  const auto complexity = scorer.Score(files, workers);
  if (complexity.available) {
    std::vector<MetricSample> samples;
    for (const auto &file : complexity.files) {
      if (file.scored) {
        samples.push_back(MetricSample{file.path, "complexity", file.score});
      }
    }
    findings.insert(findings.end(), complexity.findings.begin(),
                    complexity.findings.end());
    pillars[static_cast<std::size_t>(Pillar::kComplexity)] =
        Available(complexity.score, estimator.Estimate(std::move(samples)));
  } else {
    pillars[static_cast<std::size_t>(Pillar::kComplexity)] =
        Unavailable(complexity.reason);
  }
  logger_->Log(LogLevel::kDebug, "analysis.pillar.complete",
               {{"pillar", "complexity"},
                {"findings", std::to_string(complexity.findings.size())}});

  // Tools
  RepositorySnapshot sorted_snapshot{snapshot.root_path, files};
  std::map<std::string, double> lint_scores;
  std::map<std::string, double> typing_scores;
  pillars[static_cast<std::size_t>(Pillar::kLint)] =
      MeasureTool(lint_.get(), ToolKind::kLint, sorted_snapshot, config,
                  estimator, lint_scores, findings, *logger_);
  pillars[static_cast<std::size_t>(Pillar::kTyping)] =
      MeasureTool(typing_.get(), ToolKind::kTyping, sorted_snapshot, config,
                  estimator, typing_scores, findings, *logger_);

  AggregationInput input;
  input.root_path = snapshot.root_path;
  input.pillars = pillars;
  input.clones = duplication.clones;
  input.absent_relations = architecture.absent_relations;
  for (std::size_t i = 0; i < files.size(); ++i) {
    const auto &file = files[i];
    FileMetrics metrics;
    metrics.path = file.path;
    metrics.line_count = file.line_count;
    metrics.parse_failed = file.ParseFailed();
    if (const auto found = duplication_ratios.find(file.path);
        found != duplication_ratios.end()) {
      metrics.duplication_ratio = found->second;
    }
    metrics.cognitive_complexity = complexity.files[i].value;
    metrics.complexity_score = complexity.files[i].score;
    if (const auto found = module_scores.find(normalized[i].module_id);
        found != module_scores.end()) {
      metrics.architecture_score = found->second;
    }
    if (const auto found = lint_scores.find(file.path);
        found != lint_scores.end()) {
      metrics.lint_score = found->second;
    }
    if (const auto found = typing_scores.find(file.path);
        found != typing_scores.end()) {
      metrics.typing_score = found->second;
    }
    input.files.push_back(std::move(metrics));
  }
  input.findings = std::move(findings);

  const Aggregator aggregator(config.weights, config.bootstrap, workers);
  auto report = aggregator.Aggregate(std::move(input));
  logger_->Log(LogLevel::kInfo, "analysis.complete",
               {{"overall", std::to_string(report.overall_score)},
                {"partial", report.partial ? "true" : "false"},
                {"findings", std::to_string(report.findings.size())}});
  return report;
}

} // namespace cq
