#pragma once

#include <cq/models.h>

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace cq {

enum class EdgeClass { kConvergent, kDivergent, kUnspecified };

std::string EdgeClassName(EdgeClass edge_class);

// fnmatch-style glob. A pattern without wildcards matches the module itself
// and every module below it as a directory prefix.
bool MatchesModulePattern(const std::string &pattern,
                          const std::string &module_id);

struct ClassifiedEdge {
  std::string source;
  std::string target;
  std::string source_layer;
  std::string target_layer;
  EdgeClass edge_class = EdgeClass::kUnspecified;
  std::size_t occurrences = 0;
};

struct ArchitectureResult {
  bool available = false;
  std::string reason;
  double score = 1.0;
  std::vector<ClassifiedEdge> edges;
  std::size_t divergent_edges = 0;
  std::vector<Finding> findings;
  std::vector<AbsentRelation> absent_relations;
  // One sample per module with classifiable outgoing edges.
  std::vector<MetricSample> samples;
};

class ArchitectureChecker {
public:
  explicit ArchitectureChecker(std::vector<LayerRule> layers);

  // First declared layer with a matching pattern.
  std::optional<std::string> LayerOf(const std::string &module_id) const;
  EdgeClass Classify(const std::string &source_layer,
                     const std::string &target_layer) const;

  ArchitectureResult Check(const ImportGraph &graph) const;

private:
  const LayerRule *FindLayer(const std::string &name) const;

  std::vector<LayerRule> layers_;
};

} // namespace cq
