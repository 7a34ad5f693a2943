#include <cq/aggregator.h>

#include <algorithm>
#include <tuple>
#include <utility>

namespace cq {
namespace {

std::optional<double> FilePillarScore(const FileMetrics &file, Pillar pillar) {
  switch (pillar) {
  case Pillar::kDuplication:
    if (file.parse_failed) {
      return std::nullopt;
    }
    return 1.0 - file.duplication_ratio;
  case Pillar::kArchitecture:
    return file.architecture_score;
  case Pillar::kLint:
    return file.lint_score;
  case Pillar::kTyping:
    return file.typing_score;
  case Pillar::kComplexity:
    if (file.parse_failed) {
      return std::nullopt;
    }
    return file.complexity_score;
  }
  return std::nullopt;
}

bool CloneLess(const ClonePair &lhs, const ClonePair &rhs) {
  return std::tie(lhs.first.file, lhs.first.start_token, lhs.second.file,
                  lhs.second.start_token) <
         std::tie(rhs.first.file, rhs.first.start_token, rhs.second.file,
                  rhs.second.start_token);
}

} // namespace

bool FindingLess(const Finding &lhs, const Finding &rhs) {
  const auto lhs_severity = static_cast<int>(lhs.severity);
  const auto rhs_severity = static_cast<int>(rhs.severity);
  return std::tie(lhs.file, lhs.line, lhs_severity, lhs.category,
                  lhs.message) < std::tie(rhs.file, rhs.line, rhs_severity,
                                          rhs.category, rhs.message);
}

void SortFindings(std::vector<Finding> &findings) {
  std::stable_sort(findings.begin(), findings.end(), FindingLess);
}

PillarWeights
RedistributeWeights(const PillarWeights &weights,
                    const std::array<PillarScore, kPillarCount> &pillars) {
  double available_weight = 0.0;
  for (const auto pillar : kAllPillars) {
    if (pillars[static_cast<std::size_t>(pillar)].available) {
      available_weight += weights.Get(pillar);
    }
  }

  PillarWeights applied;
  for (const auto pillar : kAllPillars) {
    const bool available = pillars[static_cast<std::size_t>(pillar)].available;
    applied.Set(pillar, available && available_weight > 0.0
                            ? weights.Get(pillar) / available_weight
                            : 0.0);
  }
  return applied;
}

std::optional<double>
FileGrade(const FileMetrics &file,
          const std::array<PillarScore, kPillarCount> &pillars,
          const PillarWeights &weights) {
  double weighted = 0.0;
  double weight_total = 0.0;
  for (const auto pillar : kAllPillars) {
    if (!pillars[static_cast<std::size_t>(pillar)].available) {
      continue;
    }
    const auto score = FilePillarScore(file, pillar);
    if (!score) {
      continue;
    }
    weighted += weights.Get(pillar) * *score;
    weight_total += weights.Get(pillar);
  }
  if (weight_total <= 0.0) {
    return std::nullopt;
  }
  return 100.0 * weighted / weight_total;
}

Aggregator::Aggregator(PillarWeights weights, BootstrapOptions bootstrap,
                       std::size_t workers)
    : weights_(weights), estimator_(bootstrap, workers) {}

Report Aggregator::Aggregate(AggregationInput input) const {
  Report report;
  report.root_path = std::move(input.root_path);
  report.pillars = input.pillars;
  report.applied_weights = RedistributeWeights(weights_, input.pillars);

  double overall = 0.0;
  for (const auto pillar : kAllPillars) {
    const auto &score = report.PillarFor(pillar);
    if (!score.available) {
      report.partial = true;
      continue;
    }
    overall += report.applied_weights.Get(pillar) * score.score;
  }
  report.overall_score = 100.0 * overall;

  std::vector<MetricSample> grades;
  for (auto &file : input.files) {
    const auto grade =
        FileGrade(file, report.pillars, report.applied_weights);
    file.grade = grade.value_or(0.0);
    if (grade) {
      grades.push_back(MetricSample{file.path, "grade", *grade});
    }
  }
  report.confidence = estimator_.Estimate(std::move(grades));

  std::sort(input.files.begin(), input.files.end(),
            [](const FileMetrics &lhs, const FileMetrics &rhs) {
              return lhs.path < rhs.path;
            });
  report.files = std::move(input.files);

  std::sort(input.clones.begin(), input.clones.end(), CloneLess);
  report.clones = std::move(input.clones);

  std::sort(input.absent_relations.begin(), input.absent_relations.end(),
            [](const AbsentRelation &lhs, const AbsentRelation &rhs) {
              return std::tie(lhs.source_layer, lhs.target_layer) <
                     std::tie(rhs.source_layer, rhs.target_layer);
            });
  report.absent_relations = std::move(input.absent_relations);

  SortFindings(input.findings);
  report.findings = std::move(input.findings);
  return report;
}

} // namespace cq
