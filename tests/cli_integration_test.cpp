#include <cstdlib>
#include <filesystem>
#include <string>
#include <sys/wait.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace cq {
namespace {

using ::testing::HasSubstr;

std::filesystem::path ExecutableUnderTest() {
  return std::filesystem::path(CQ_EXECUTABLE_PATH);
}

int ExitCode(const std::string &command) {
  return WEXITSTATUS(std::system(command.c_str()));
}

std::string Quoted(const std::filesystem::path &path) {
  return "'" + path.string() + "'";
}

void AddSampleProject(const test::TemporaryProject &project) {
  project.AddFile("src/ui/view.cpp", "#include \"infra/db.h\"\n"
                                     "int render(int rows) {\n"
                                     "  int drawn = 0;\n"
                                     "  for (int i = 0; i < rows; ++i) {\n"
                                     "    if (i % 2 == 0) {\n"
                                     "      drawn += query(i);\n"
                                     "    }\n"
                                     "  }\n"
                                     "  return drawn;\n"
                                     "}\n");
  project.AddFile("src/infra/db.h", "#pragma once\nint query(int row);\n");
  project.AddFile("src/infra/db.cpp",
                  "#include \"infra/db.h\"\nint query(int row) { return row; }\n");
  project.AddFile("cq.yaml", "architecture:\n"
                             "  layers:\n"
                             "    - name: ui\n"
                             "      patterns: [src/ui]\n"
                             "      forbid: [infra]\n"
                             "    - name: infra\n"
                             "      patterns: [src/infra]\n"
                             "tools:\n"
                             "  lint: \"true\"\n"
                             "  typing: \"true\"\n"
                             "bootstrap:\n"
                             "  resamples: 100\n");
}

TEST(CliIntegrationTest, GeneratesReportsForSampleProject) {
  test::TemporaryProject project;
  AddSampleProject(project);

  const auto cli = ExecutableUnderTest();
  ASSERT_TRUE(std::filesystem::exists(cli))
      << "Expected CLI executable at " << cli;

  const auto output_directory = project.root() / "artifacts";
  const std::string command =
      Quoted(cli) + " analyze --root " + Quoted(project.root()) +
      " --config " + Quoted(project.root() / "cq.yaml") +
      " --format markdown,json --jobs 2 --out " + Quoted(output_directory);

  ASSERT_EQ(ExitCode(command), 0);

  const auto markdown = test::ReadFile(output_directory / "cq_report.md");
  const auto json = test::ReadFile(output_directory / "cq_report.json");
  EXPECT_THAT(markdown, HasSubstr("# Code Quality Report"));
  EXPECT_THAT(markdown, HasSubstr("layer-violation"));
  EXPECT_THAT(markdown, HasSubstr("- Status: complete"));
  EXPECT_THAT(json, HasSubstr("\"partial\": false"));
  EXPECT_THAT(json, HasSubstr("\"path\": \"src/ui/view.cpp\""));
}

TEST(CliIntegrationTest, MissingToolsGivePartialExitCode) {
  test::TemporaryProject project;
  project.AddFile("src/main.cpp", "int main() { return 0; }\n");
  project.AddFile("cq.yaml", "tools:\n"
                             "  lint: \"exit 7\"\n"
                             "  typing: \"true\"\n");

  const std::string command =
      Quoted(ExecutableUnderTest()) + " --root " + Quoted(project.root()) +
      " --config " + Quoted(project.root() / "cq.yaml") + " --format md";

  ASSERT_EQ(ExitCode(command), 2);
  EXPECT_TRUE(std::filesystem::exists(project.root() / "cq_report.md"));
  EXPECT_FALSE(std::filesystem::exists(project.root() / "cq_report.json"));
  EXPECT_THAT(test::ReadFile(project.root() / "cq_report.md"),
              HasSubstr("unavailable: lint tool exited with status 7"));
}

TEST(CliIntegrationTest, ErrorsExitWithOne) {
  test::TemporaryProject project;
  project.AddFile("cq.yaml", "weights:\n  lint: 0.9\n");
  project.AddFile("src/main.cpp", "int main() { return 0; }\n");
  const auto cli = Quoted(ExecutableUnderTest());

  EXPECT_EQ(ExitCode(cli + " analyze --bogus 2>/dev/null"), 1);
  EXPECT_EQ(ExitCode(cli + " analyze 2>/dev/null"), 1);
  EXPECT_EQ(ExitCode(cli + " frobnicate 2>/dev/null"), 1);
  EXPECT_EQ(ExitCode(cli + " analyze --root " + Quoted(project.root()) +
                     " --config " + Quoted(project.root() / "cq.yaml") +
                     " 2>/dev/null"),
            1);
  EXPECT_FALSE(std::filesystem::exists(project.root() / "cq_report.md"));
}

TEST(CliIntegrationTest, EmptyRepositoryIsAnError) {
  test::TemporaryProject project;
  project.AddFile("README.md", "nothing to see\n");

  EXPECT_EQ(ExitCode(Quoted(ExecutableUnderTest()) + " analyze --root " +
                     Quoted(project.root()) + " 2>/dev/null"),
            1);
}

TEST(CliIntegrationTest, PrintsExampleConfig) {
  test::TemporaryProject project;
  const auto output = project.root() / "example.yaml";

  ASSERT_EQ(ExitCode(Quoted(ExecutableUnderTest()) + " example-config > " +
                     Quoted(output)),
            0);
  const auto text = test::ReadFile(output);
  EXPECT_THAT(text, HasSubstr("weights:"));
  EXPECT_THAT(text, HasSubstr("seed: 1337"));
}

} // namespace
} // namespace cq
