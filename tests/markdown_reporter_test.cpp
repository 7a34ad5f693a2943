#include <cq/markdown_reporter.h>
#include <cq/models.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace cq {
namespace {

using ::testing::HasSubstr;
using ::testing::Not;

PillarScore Available(double value) {
  PillarScore score;
  score.available = true;
  score.score = value;
  score.interval = ConfidenceInterval{value - 0.05, value + 0.05, 0.95, 4};
  return score;
}

Report SampleReport() {
  Report report;
  report.root_path = "/work/repo";
  report.overall_score = 72.5;
  report.partial = true;
  report.pillars = {Available(0.8), Available(0.75), Available(0.9),
                    PillarScore{}, Available(0.5)};
  report.pillars[static_cast<std::size_t>(Pillar::kTyping)].reason =
      "typing tool timed out after 120s";
  report.applied_weights = PillarWeights{0.25, 0.25, 0.3, 0.0, 0.2};
  report.confidence = ConfidenceInterval{68.0, 77.0, 0.95, 2};

  Finding finding;
  finding.file = "src/ui/view.cpp";
  finding.line = 4;
  finding.category = "architecture";
  finding.severity = Severity::kError;
  finding.rule = "layer-violation";
  finding.message = "ui -> infra | forbidden\n(2 occurrences)";
  report.findings = {finding};

  ClonePair clone;
  clone.first = CloneSpan{"src/a.cpp", 0, 41, 1, 12};
  clone.second = CloneSpan{"src/b.cpp", 3, 44, 5, 16};
  report.clones = {clone};

  FileMetrics a;
  a.path = "src/a.cpp";
  a.line_count = 12;
  a.duplication_ratio = 1.0;
  a.cognitive_complexity = 4.0;
  a.lint_score = 0.995;
  a.grade = 61.0;
  FileMetrics broken;
  broken.path = "src/broken.cpp";
  broken.line_count = 3;
  broken.parse_failed = true;
  report.files = {a, broken};

  report.absent_relations = {AbsentRelation{"infra", "domain"}};
  return report;
}

AnalysisConfig ConfigWithFormats(std::vector<std::string> formats) {
  AnalysisConfig config;
  config.root_path = "/work/repo";
  config.report.formats = std::move(formats);
  return config;
}

TEST(MarkdownReporterTest, RendersSections) {
  MarkdownReporter reporter;
  const auto rendered =
      reporter.Render(SampleReport(), ConfigWithFormats({"markdown", "json"}));

  EXPECT_THAT(rendered.markdown, HasSubstr("# Code Quality Report"));
  EXPECT_THAT(rendered.markdown, HasSubstr("## Analysis Header"));
  EXPECT_THAT(rendered.markdown, HasSubstr("| Source | /work/repo |"));
  EXPECT_THAT(rendered.markdown, HasSubstr("| Config | defaults |"));
  EXPECT_THAT(rendered.markdown, HasSubstr("| Files | 2 |"));
  EXPECT_THAT(rendered.markdown, HasSubstr("Overall score: **72.50 / 100**"));
  EXPECT_THAT(rendered.markdown,
              HasSubstr("95% interval 68.00 - 77.00 (n=2)"));
  EXPECT_THAT(rendered.markdown, HasSubstr("partial (some pillars unavailable)"));
  EXPECT_THAT(rendered.markdown,
              HasSubstr("| duplication | 80.00 | 0.250 | 75.00 - 85.00 (n=4) "
                        "| available |"));
  EXPECT_THAT(rendered.markdown,
              HasSubstr("| typing | - | 0.000 | - | unavailable: typing tool "
                        "timed out after 120s |"));
  EXPECT_THAT(rendered.markdown, HasSubstr("## Clone Pairs"));
  EXPECT_THAT(rendered.markdown,
              HasSubstr("| src/a.cpp:1-12 | src/b.cpp:5-16 | 41 | 12 |"));
  EXPECT_THAT(rendered.markdown,
              HasSubstr("- src/a.cpp: 100.0% duplicated"));
  EXPECT_THAT(rendered.markdown, HasSubstr("- src/a.cpp: 4 over 12 lines"));
  EXPECT_THAT(rendered.markdown, Not(HasSubstr("- src/broken.cpp")));
  EXPECT_THAT(rendered.markdown,
              HasSubstr("- infra -> domain is allowed but never used"));
}

TEST(MarkdownReporterTest, EscapesTableCells) {
  MarkdownReporter reporter;
  const auto rendered =
      reporter.Render(SampleReport(), ConfigWithFormats({"markdown"}));

  EXPECT_THAT(rendered.markdown,
              HasSubstr("| src/ui/view.cpp | 4 | error | architecture | "
                        "layer-violation | ui -> infra \\| forbidden (2 "
                        "occurrences) |"));
}

TEST(MarkdownReporterTest, RendersEmptyCollections) {
  Report report;
  report.root_path = "/empty";

  MarkdownReporter reporter;
  const auto rendered = reporter.Render(report, ConfigWithFormats({"markdown"}));

  EXPECT_THAT(rendered.markdown, HasSubstr("| None | - | - | - | - | - |"));
  EXPECT_THAT(rendered.markdown, HasSubstr("| None | - | - | - |"));
  EXPECT_THAT(rendered.markdown, HasSubstr("Confidence: not available"));
  EXPECT_THAT(rendered.markdown, HasSubstr("- Status: complete"));
}

TEST(MarkdownReporterTest, RendersJsonDocument) {
  auto config = ConfigWithFormats({"json"});
  config.config_file = "/work/repo/cq.yaml";

  MarkdownReporter reporter;
  const auto rendered = reporter.Render(SampleReport(), config);

  EXPECT_TRUE(rendered.markdown.empty());
  ASSERT_FALSE(rendered.json.empty());
  EXPECT_EQ(rendered.json.front(), '{');
  EXPECT_EQ(rendered.json.back(), '}');
  EXPECT_THAT(rendered.json, HasSubstr("\"config_file\": \"/work/repo/cq.yaml\""));
  EXPECT_THAT(rendered.json, HasSubstr("\"overall_score\": 72.5,"));
  EXPECT_THAT(rendered.json, HasSubstr("\"partial\": true,"));
  EXPECT_THAT(rendered.json, HasSubstr("\"interval_low\": 68,"));
  EXPECT_THAT(rendered.json, HasSubstr("\"lint\": 0.3"));
  EXPECT_THAT(rendered.json,
              HasSubstr("\"typing\": {\"score\": 0,\"available\": false,"
                        "\"reason\": \"typing tool timed out after 120s\""));
  EXPECT_THAT(rendered.json,
              HasSubstr("\"message\": \"ui -> infra | forbidden\\n(2 "
                        "occurrences)\""));
  EXPECT_THAT(rendered.json, HasSubstr("\"tokens\": 41"));
  EXPECT_THAT(rendered.json, HasSubstr("\"lint_score\": 0.995,"));
  EXPECT_THAT(rendered.json, HasSubstr("\"typing_score\": null,"));
  EXPECT_THAT(rendered.json,
              HasSubstr("\"absent_relations\": [{\"source_layer\": "
                        "\"infra\",\"target_layer\": \"domain\"}]"));
}

TEST(MarkdownReporterTest, EmptyFormatListMeansMarkdownOnly) {
  MarkdownReporter reporter;
  const auto rendered = reporter.Render(SampleReport(), ConfigWithFormats({}));

  EXPECT_FALSE(rendered.markdown.empty());
  EXPECT_TRUE(rendered.json.empty());
}

TEST(MarkdownReporterTest, EscapesJsonStrings) {
  EXPECT_EQ(EscapeJsonString("say \"hi\"\\\n\t"), "say \\\"hi\\\"\\\\\\n\\t");
  EXPECT_EQ(EscapeJsonString(std::string("bell\x07")), "bell\\u0007");
  EXPECT_EQ(EscapeJsonString("plain"), "plain");
}

TEST(MarkdownReporterTest, WritesOnlyRenderedFormats) {
  test::TemporaryProject project;
  const auto directory = project.root() / "out" / "nested";

  WriteReports(directory, RenderedReport{"# Code Quality Report\n", ""});

  EXPECT_EQ(test::ReadFile(directory / "cq_report.md"),
            "# Code Quality Report\n");
  EXPECT_FALSE(std::filesystem::exists(directory / "cq_report.json"));
}

TEST(MarkdownReporterTest, RemovesReportsOfUnrequestedFormats) {
  test::TemporaryProject project;
  const auto stale = project.AddFile("out/cq_report.json", "{\"old\": true}");

  WriteReports(project.root() / "out",
               RenderedReport{"# Code Quality Report\n", ""});

  EXPECT_FALSE(std::filesystem::exists(stale));
  EXPECT_EQ(test::ReadFile(project.root() / "out" / "cq_report.md"),
            "# Code Quality Report\n");
}

} // namespace
} // namespace cq
