#include <cq/architecture_checker.h>

#include <fnmatch.h>

#include <algorithm>
#include <map>
#include <set>
#include <utility>

namespace cq {
namespace {

bool HasWildcard(const std::string &pattern) {
  return pattern.find_first_of("*?[") != std::string::npos;
}

bool ListContains(const std::vector<std::string> &values,
                  const std::string &value) {
  return std::find(values.begin(), values.end(), value) != values.end();
}

std::string DescribeDivergence(const ClassifiedEdge &edge,
                               bool reverse_of_allowed) {
  std::string message = "Module '" + edge.source + "' (layer " +
                        edge.source_layer + ") depends on '" + edge.target +
                        "' (layer " + edge.target_layer + "): ";
  message += reverse_of_allowed
                 ? "only the reverse dependency is allowed"
                 : "dependency is forbidden";
  message += " (" + std::to_string(edge.occurrences) +
             (edge.occurrences == 1 ? " occurrence)" : " occurrences)");
  return message;
}

} // namespace

std::string EdgeClassName(EdgeClass edge_class) {
  switch (edge_class) {
  case EdgeClass::kConvergent:
    return "convergent";
  case EdgeClass::kDivergent:
    return "divergent";
  case EdgeClass::kUnspecified:
    return "unspecified";
  }
  return "unknown";
}

bool MatchesModulePattern(const std::string &pattern,
                          const std::string &module_id) {
  if (pattern.empty()) {
    return false;
  }
  if (HasWildcard(pattern)) {
    return fnmatch(pattern.c_str(), module_id.c_str(), 0) == 0;
  }
  auto prefix = pattern;
  while (prefix.size() > 1 && prefix.back() == '/') {
    prefix.pop_back();
  }
  return module_id == prefix ||
         (module_id.size() > prefix.size() &&
          module_id.compare(0, prefix.size(), prefix) == 0 &&
          module_id[prefix.size()] == '/');
}

ArchitectureChecker::ArchitectureChecker(std::vector<LayerRule> layers)
    : layers_(std::move(layers)) {}

const LayerRule *ArchitectureChecker::FindLayer(const std::string &name) const {
  for (const auto &layer : layers_) {
    if (layer.name == name) {
      return &layer;
    }
  }
  return nullptr;
}

std::optional<std::string>
ArchitectureChecker::LayerOf(const std::string &module_id) const {
  for (const auto &layer : layers_) {
    for (const auto &pattern : layer.patterns) {
      if (MatchesModulePattern(pattern, module_id)) {
        return layer.name;
      }
    }
  }
  return std::nullopt;
}

EdgeClass ArchitectureChecker::Classify(const std::string &source_layer,
                                        const std::string &target_layer) const {
  if (source_layer == target_layer) {
    return EdgeClass::kConvergent;
  }
  const auto *source = FindLayer(source_layer);
  const auto *target = FindLayer(target_layer);
  if (source != nullptr && ListContains(source->allow, target_layer)) {
    return EdgeClass::kConvergent;
  }
  if (source != nullptr && ListContains(source->forbid, target_layer)) {
    return EdgeClass::kDivergent;
  }
  if (target != nullptr && ListContains(target->allow, source_layer)) {
    return EdgeClass::kDivergent;
  }
  return EdgeClass::kUnspecified;
}

ArchitectureResult ArchitectureChecker::Check(const ImportGraph &graph) const {
  ArchitectureResult result;
  if (layers_.empty()) {
    result.available = false;
    result.reason = "no architecture layers configured";
    return result;
  }
  result.available = true;

  std::map<std::string, std::string> layer_of;
  for (const auto &module : graph.modules) {
    if (module.boundary) {
      continue;
    }
    if (const auto layer = LayerOf(module.id)) {
      layer_of[module.id] = *layer;
    } else {
      Finding finding;
      finding.file = module.files.empty() ? module.id : module.files.front();
      finding.category = "architecture";
      finding.severity = Severity::kWarning;
      finding.rule = "unclassified-module";
      finding.message =
          "Module '" + module.id + "' does not belong to any declared layer";
      result.findings.push_back(std::move(finding));
    }
  }

  std::set<std::pair<std::string, std::string>> realized;
  std::map<std::string, std::pair<std::size_t, std::size_t>> per_module;
  std::size_t non_divergent = 0;

  for (const auto &edge : graph.edges) {
    if (edge.boundary_target) {
      continue;
    }
    const auto source_layer = layer_of.find(edge.source);
    const auto target_layer = layer_of.find(edge.target);
    if (source_layer == layer_of.end() || target_layer == layer_of.end()) {
      continue;
    }

    ClassifiedEdge classified;
    classified.source = edge.source;
    classified.target = edge.target;
    classified.source_layer = source_layer->second;
    classified.target_layer = target_layer->second;
    classified.edge_class =
        Classify(classified.source_layer, classified.target_layer);
    classified.occurrences = edge.locations.size();

    auto &counts = per_module[edge.source];
    ++counts.second;
    if (classified.edge_class == EdgeClass::kDivergent) {
      ++result.divergent_edges;
      const auto *source = FindLayer(classified.source_layer);
      const bool reverse_of_allowed =
          source == nullptr ||
          !ListContains(source->forbid, classified.target_layer);

      Finding finding;
      if (!edge.locations.empty()) {
        finding.file = edge.locations.front().file;
        finding.line = edge.locations.front().line;
      }
      finding.category = "architecture";
      finding.severity = Severity::kError;
      finding.rule = "layer-violation";
      finding.message = DescribeDivergence(classified, reverse_of_allowed);
      result.findings.push_back(std::move(finding));
    } else {
      ++non_divergent;
      ++counts.first;
      if (classified.edge_class == EdgeClass::kConvergent) {
        realized.insert({classified.source_layer, classified.target_layer});
      }
    }
    result.edges.push_back(std::move(classified));
  }

  result.score = result.edges.empty()
                     ? 1.0
                     : static_cast<double>(non_divergent) /
                           static_cast<double>(result.edges.size());

  for (const auto &layer : layers_) {
    for (const auto &allowed : layer.allow) {
      if (realized.count({layer.name, allowed}) == 0) {
        result.absent_relations.push_back(AbsentRelation{layer.name, allowed});
      }
    }
  }

  for (const auto &[module, counts] : per_module) {
    result.samples.push_back(MetricSample{
        module, "architecture",
        static_cast<double>(counts.first) / static_cast<double>(counts.second)});
  }
  return result;
}

} // namespace cq
