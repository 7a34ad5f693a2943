#include <cq/aggregator.h>

#include <gtest/gtest.h>

namespace cq {
namespace {

PillarScore Score(double value) {
  PillarScore score;
  score.available = true;
  score.score = value;
  return score;
}

PillarScore Missing(const std::string &reason) {
  PillarScore score;
  score.reason = reason;
  return score;
}

std::array<PillarScore, kPillarCount> AllAvailable() {
  return {Score(0.9), Score(0.8), Score(0.7), Score(0.6), Score(0.5)};
}

Finding MakeFinding(const std::string &file, unsigned line, Severity severity,
                    const std::string &message) {
  Finding finding;
  finding.file = file;
  finding.line = line;
  finding.severity = severity;
  finding.category = "test";
  finding.message = message;
  return finding;
}

TEST(AggregatorTest, WeightedOverallScore) {
  const Aggregator aggregator(PillarWeights{}, BootstrapOptions{}, 1);
  AggregationInput input;
  input.pillars = AllAvailable();

  const auto report = aggregator.Aggregate(input);

  EXPECT_FALSE(report.partial);
  EXPECT_NEAR(report.overall_score,
              100.0 * (0.2 * 0.9 + 0.2 * 0.8 + 0.25 * 0.7 + 0.15 * 0.6 +
                       0.2 * 0.5),
              1e-9);
}

TEST(AggregatorTest, RedistributesUnavailableWeightProportionally) {
  auto pillars = AllAvailable();
  pillars[static_cast<std::size_t>(Pillar::kLint)] = Missing("lint tool timed out");
  pillars[static_cast<std::size_t>(Pillar::kTyping)] = Missing("no compiler");

  const auto applied = RedistributeWeights(PillarWeights{}, pillars);

  EXPECT_DOUBLE_EQ(applied.lint, 0.0);
  EXPECT_DOUBLE_EQ(applied.typing, 0.0);
  EXPECT_NEAR(applied.duplication, 0.2 / 0.6, 1e-12);
  EXPECT_NEAR(applied.architecture, 0.2 / 0.6, 1e-12);
  EXPECT_NEAR(applied.complexity, 0.2 / 0.6, 1e-12);
  EXPECT_NEAR(applied.Sum(), 1.0, 1e-12);
}

TEST(AggregatorTest, UnavailablePillarMarksReportPartial) {
  const Aggregator aggregator(PillarWeights{}, BootstrapOptions{}, 1);
  AggregationInput input;
  input.pillars = AllAvailable();
  input.pillars[static_cast<std::size_t>(Pillar::kArchitecture)] =
      Missing("no architecture layers configured");

  const auto report = aggregator.Aggregate(input);

  EXPECT_TRUE(report.partial);
  const double available = 0.2 + 0.25 + 0.15 + 0.2;
  EXPECT_NEAR(report.overall_score,
              100.0 * (0.2 * 0.9 + 0.25 * 0.7 + 0.15 * 0.6 + 0.2 * 0.5) /
                  available,
              1e-9);
  EXPECT_EQ(report.PillarFor(Pillar::kArchitecture).reason,
            "no architecture layers configured");
}

TEST(AggregatorTest, NothingAvailableScoresZero) {
  const Aggregator aggregator(PillarWeights{}, BootstrapOptions{}, 1);
  AggregationInput input;
  for (auto &pillar : input.pillars) {
    pillar = Missing("down");
  }

  const auto report = aggregator.Aggregate(input);

  EXPECT_TRUE(report.partial);
  EXPECT_DOUBLE_EQ(report.overall_score, 0.0);
  EXPECT_DOUBLE_EQ(report.applied_weights.Sum(), 0.0);
}

TEST(AggregatorTest, SortsFindingsByFileLineAndSeverity) {
  const Aggregator aggregator(PillarWeights{}, BootstrapOptions{}, 1);
  AggregationInput input;
  input.pillars = AllAvailable();
  input.findings = {MakeFinding("b.cpp", 1, Severity::kWarning, "w"),
                    MakeFinding("a.cpp", 9, Severity::kWarning, "late"),
                    MakeFinding("a.cpp", 2, Severity::kWarning, "warn"),
                    MakeFinding("a.cpp", 2, Severity::kError, "err")};

  const auto report = aggregator.Aggregate(input);

  ASSERT_EQ(report.findings.size(), 4u);
  EXPECT_EQ(report.findings[0].message, "err");
  EXPECT_EQ(report.findings[1].message, "warn");
  EXPECT_EQ(report.findings[2].message, "late");
  EXPECT_EQ(report.findings[3].message, "w");
}

TEST(AggregatorTest, FileGradeUsesOnlyPillarsThatMeasuredTheFile) {
  const auto pillars = AllAvailable();
  FileMetrics file;
  file.path = "a.cpp";
  file.duplication_ratio = 0.5;
  file.complexity_score = 1.0;
  file.lint_score = 0.0;

  const auto grade = FileGrade(file, pillars, PillarWeights{});

  // duplication 0.5 (w 0.2), lint 0.0 (w 0.25), complexity 1.0 (w 0.2)
  ASSERT_TRUE(grade);
  EXPECT_NEAR(*grade, 100.0 * (0.2 * 0.5 + 0.2 * 1.0) / 0.65, 1e-9);
}

TEST(AggregatorTest, ParseFailedFileWithoutToolScoresHasNoGrade) {
  FileMetrics file;
  file.path = "broken.cpp";
  file.parse_failed = true;

  EXPECT_FALSE(FileGrade(file, AllAvailable(), PillarWeights{}));
}

TEST(AggregatorTest, ConfidenceComesFromFileGrades) {
  const Aggregator aggregator(PillarWeights{}, BootstrapOptions{}, 2);
  AggregationInput input;
  input.pillars = AllAvailable();
  for (int i = 0; i < 5; ++i) {
    FileMetrics file;
    file.path = "f" + std::to_string(i) + ".cpp";
    file.duplication_ratio = 0.1 * i;
    input.files.push_back(file);
  }
  FileMetrics broken;
  broken.path = "broken.cpp";
  broken.parse_failed = true;
  input.files.push_back(broken);

  const auto report = aggregator.Aggregate(input);

  EXPECT_EQ(report.confidence.sample_count, 5u);
  EXPECT_DOUBLE_EQ(report.confidence.level, 0.95);
  EXPECT_LE(report.confidence.low, report.confidence.high);
  ASSERT_EQ(report.files.size(), 6u);
  EXPECT_EQ(report.files.front().path, "broken.cpp");
  EXPECT_DOUBLE_EQ(report.files.front().grade, 0.0);
}

TEST(AggregatorTest, SameInputsGiveIdenticalReports) {
  AggregationInput input;
  input.pillars = AllAvailable();
  for (int i = 0; i < 20; ++i) {
    FileMetrics file;
    file.path = "f" + std::to_string(i) + ".cpp";
    file.duplication_ratio = (i % 3) * 0.2;
    file.complexity_score = 1.0 - (i % 5) * 0.1;
    input.files.push_back(file);
  }

  const auto serial =
      Aggregator(PillarWeights{}, BootstrapOptions{}, 1).Aggregate(input);
  const auto parallel =
      Aggregator(PillarWeights{}, BootstrapOptions{}, 8).Aggregate(input);

  EXPECT_EQ(serial.overall_score, parallel.overall_score);
  EXPECT_EQ(serial.confidence.low, parallel.confidence.low);
  EXPECT_EQ(serial.confidence.high, parallel.confidence.high);
}

} // namespace
} // namespace cq
