#include <cq/import_graph.h>

#include <cq/ast_normalizer.h>

#include <algorithm>
#include <filesystem>
#include <map>
#include <tuple>
#include <utility>

namespace cq {
namespace {

bool EndsWithPathSuffix(const std::string &path, const std::string &suffix) {
  if (path == suffix) {
    return true;
  }
  if (path.size() <= suffix.size()) {
    return false;
  }
  return path.compare(path.size() - suffix.size(), suffix.size(), suffix) ==
             0 &&
         path[path.size() - suffix.size() - 1] == '/';
}

} // namespace

std::string BoundaryModuleId(const std::string &spelling) {
  return "<" + spelling + ">";
}

std::optional<std::string>
ImportGraphExtractor::ResolveImport(const std::string &including_file,
                                    const std::string &spelling,
                                    const std::set<std::string> &repository_files) {
  if (spelling.empty()) {
    return std::nullopt;
  }
  const auto directory = std::filesystem::path(including_file).parent_path();
  const auto relative =
      (directory / spelling).lexically_normal().generic_string();
  if (repository_files.count(relative) > 0) {
    return relative;
  }

  const auto suffix =
      std::filesystem::path(spelling).lexically_normal().generic_string();
  // Lexically smallest match wins; the set is ordered.
  for (const auto &candidate : repository_files) {
    if (EndsWithPathSuffix(candidate, suffix)) {
      return candidate;
    }
  }
  return std::nullopt;
}

ImportGraph
ImportGraphExtractor::Extract(const std::vector<NormalizedFile> &files) const {
  std::set<std::string> repository_files;
  std::map<std::string, ModuleNode> modules;
  for (const auto &file : files) {
    repository_files.insert(file.path);
    auto &module = modules[file.module_id];
    module.id = file.module_id;
    module.files.push_back(file.path);
  }

  std::map<std::pair<std::string, std::string>, ImportEdge> edges;
  for (const auto &file : files) {
    for (const auto &import : file.imports) {
      const auto resolved =
          ResolveImport(file.path, import.spelling, repository_files);
      std::string target;
      bool boundary = false;
      if (resolved) {
        target = ModuleIdForPath(*resolved);
      } else {
        target = BoundaryModuleId(import.spelling);
        boundary = true;
        auto &node = modules[target];
        node.id = target;
        node.boundary = true;
      }
      if (target == file.module_id) {
        continue;
      }

      auto &edge = edges[{file.module_id, target}];
      edge.source = file.module_id;
      edge.target = target;
      edge.boundary_target = boundary;
      edge.locations.push_back(
          ImportLocation{file.path, import.line, import.spelling});
    }
  }

  ImportGraph graph;
  for (auto &[id, module] : modules) {
    std::sort(module.files.begin(), module.files.end());
    graph.modules.push_back(std::move(module));
  }
  for (auto &[key, edge] : edges) {
    std::sort(edge.locations.begin(), edge.locations.end(),
              [](const ImportLocation &lhs, const ImportLocation &rhs) {
                return std::tie(lhs.file, lhs.line, lhs.spelling) <
                       std::tie(rhs.file, rhs.line, rhs.spelling);
              });
    graph.edges.push_back(std::move(edge));
  }
  return graph;
}

} // namespace cq
