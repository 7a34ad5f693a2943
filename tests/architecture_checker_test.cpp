#include <cq/architecture_checker.h>

#include <gtest/gtest.h>

namespace cq {
namespace {

std::vector<LayerRule> ThreeLayers() {
  return {LayerRule{"ui", {"src/ui"}, {"domain"}, {"infra"}},
          LayerRule{"domain", {"src/domain"}, {}, {}},
          LayerRule{"infra", {"src/infra/*"}, {"domain"}, {}}};
}

ModuleNode Module(const std::string &id) {
  return ModuleNode{id, false, {id + ".cpp"}};
}

ImportEdge Edge(const std::string &source, const std::string &target,
                std::vector<unsigned> lines) {
  ImportEdge edge;
  edge.source = source;
  edge.target = target;
  for (const auto line : lines) {
    edge.locations.push_back(ImportLocation{source + ".cpp", line, target + ".h"});
  }
  return edge;
}

TEST(ArchitectureCheckerTest, PatternsMatchGlobsAndDirectoryPrefixes) {
  EXPECT_TRUE(MatchesModulePattern("src/ui", "src/ui"));
  EXPECT_TRUE(MatchesModulePattern("src/ui", "src/ui/window"));
  EXPECT_TRUE(MatchesModulePattern("src/ui/", "src/ui/window"));
  EXPECT_FALSE(MatchesModulePattern("src/ui", "src/uikit/window"));
  EXPECT_TRUE(MatchesModulePattern("src/*/db", "src/infra/db"));
  EXPECT_FALSE(MatchesModulePattern("src/*.x", "src/a"));
  EXPECT_FALSE(MatchesModulePattern("", "src/a"));
}

TEST(ArchitectureCheckerTest, ClassifiesLayerPairs) {
  const ArchitectureChecker checker(ThreeLayers());

  EXPECT_EQ(checker.Classify("ui", "domain"), EdgeClass::kConvergent);
  EXPECT_EQ(checker.Classify("ui", "ui"), EdgeClass::kConvergent);
  EXPECT_EQ(checker.Classify("ui", "infra"), EdgeClass::kDivergent);
  // Only domain <- ui is declared, so the opposite direction diverges.
  EXPECT_EQ(checker.Classify("domain", "ui"), EdgeClass::kDivergent);
  EXPECT_EQ(checker.Classify("infra", "ui"), EdgeClass::kUnspecified);
}

TEST(ArchitectureCheckerTest, ForbiddenModulePairIsReportedOnce) {
  ImportGraph graph;
  graph.modules = {Module("src/infra/db"), Module("src/ui/window")};
  graph.edges = {Edge("src/ui/window", "src/infra/db", {4, 9, 12})};

  const auto result = ArchitectureChecker(ThreeLayers()).Check(graph);

  ASSERT_TRUE(result.available);
  ASSERT_EQ(result.findings.size(), 1u);
  const auto &finding = result.findings.front();
  EXPECT_EQ(finding.file, "src/ui/window.cpp");
  EXPECT_EQ(finding.line, 4u);
  EXPECT_EQ(finding.severity, Severity::kError);
  EXPECT_EQ(finding.category, "architecture");
  EXPECT_EQ(finding.rule, "layer-violation");
  EXPECT_EQ(finding.message,
            "Module 'src/ui/window' (layer ui) depends on 'src/infra/db' "
            "(layer infra): dependency is forbidden (3 occurrences)");
  EXPECT_EQ(result.divergent_edges, 1u);
  EXPECT_DOUBLE_EQ(result.score, 0.0);
}

TEST(ArchitectureCheckerTest, ReverseOfAllowedRelationDiverges) {
  ImportGraph graph;
  graph.modules = {Module("src/domain/order"), Module("src/ui/window")};
  graph.edges = {Edge("src/domain/order", "src/ui/window", {2})};

  const auto result = ArchitectureChecker(ThreeLayers()).Check(graph);

  ASSERT_EQ(result.findings.size(), 1u);
  EXPECT_NE(result.findings[0].message.find(
                "only the reverse dependency is allowed (1 occurrence)"),
            std::string::npos);
}

TEST(ArchitectureCheckerTest, ScoreCountsNonDivergentEdges) {
  ImportGraph graph;
  graph.modules = {Module("src/domain/order"), Module("src/infra/db"),
                   Module("src/infra/log"), Module("src/ui/window")};
  graph.edges = {Edge("src/infra/db", "src/domain/order", {1}),
                 Edge("src/infra/db", "src/ui/window", {2}),
                 Edge("src/ui/window", "src/domain/order", {1}),
                 Edge("src/ui/window", "src/infra/log", {3})};

  const auto result = ArchitectureChecker(ThreeLayers()).Check(graph);

  ASSERT_EQ(result.edges.size(), 4u);
  EXPECT_EQ(result.edges[1].edge_class, EdgeClass::kUnspecified);
  EXPECT_EQ(result.divergent_edges, 1u);
  EXPECT_DOUBLE_EQ(result.score, 0.75);

  ASSERT_EQ(result.samples.size(), 2u);
  EXPECT_EQ(result.samples[0].subject, "src/infra/db");
  EXPECT_DOUBLE_EQ(result.samples[0].value, 1.0);
  EXPECT_EQ(result.samples[1].subject, "src/ui/window");
  EXPECT_DOUBLE_EQ(result.samples[1].value, 0.5);
}

TEST(ArchitectureCheckerTest, BoundaryAndUnclassifiedEndpointsAreNotClassified) {
  ImportGraph graph;
  graph.modules = {ModuleNode{"<vector>", true, {}}, Module("src/ui/window"),
                   Module("tools/gen")};
  ImportEdge external = Edge("src/ui/window", "<vector>", {1});
  external.boundary_target = true;
  graph.edges = {external, Edge("tools/gen", "src/ui/window", {2})};

  const auto result = ArchitectureChecker(ThreeLayers()).Check(graph);

  EXPECT_TRUE(result.edges.empty());
  EXPECT_DOUBLE_EQ(result.score, 1.0);
  ASSERT_EQ(result.findings.size(), 1u);
  EXPECT_EQ(result.findings[0].rule, "unclassified-module");
  EXPECT_EQ(result.findings[0].file, "tools/gen.cpp");
  EXPECT_EQ(result.findings[0].line, 0u);
  EXPECT_EQ(result.findings[0].severity, Severity::kWarning);
}

TEST(ArchitectureCheckerTest, UnrealizedAllowedRelationsAreAbsent) {
  ImportGraph graph;
  graph.modules = {Module("src/domain/order"), Module("src/ui/window")};
  graph.edges = {Edge("src/ui/window", "src/domain/order", {1})};

  const auto result = ArchitectureChecker(ThreeLayers()).Check(graph);

  ASSERT_EQ(result.absent_relations.size(), 1u);
  EXPECT_EQ(result.absent_relations[0].source_layer, "infra");
  EXPECT_EQ(result.absent_relations[0].target_layer, "domain");
  EXPECT_TRUE(result.findings.empty());
  EXPECT_DOUBLE_EQ(result.score, 1.0);
}

TEST(ArchitectureCheckerTest, NoLayersMeansUnavailable) {
  const auto result = ArchitectureChecker({}).Check(ImportGraph{});

  EXPECT_FALSE(result.available);
  EXPECT_EQ(result.reason, "no architecture layers configured");
}

TEST(ArchitectureCheckerTest, FirstMatchingLayerWins) {
  const ArchitectureChecker checker(
      {LayerRule{"special", {"src/ui/legacy*"}, {}, {}},
       LayerRule{"ui", {"src/ui"}, {}, {}}});

  EXPECT_EQ(checker.LayerOf("src/ui/legacy_view"),
            std::optional<std::string>("special"));
  EXPECT_EQ(checker.LayerOf("src/ui/window"), std::optional<std::string>("ui"));
  EXPECT_FALSE(checker.LayerOf("src/other"));
}

} // namespace
} // namespace cq
