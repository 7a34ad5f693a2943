#include <cq/source_discovery.h>

#include <algorithm>
#include <iterator>
#include <set>
#include <stdexcept>

namespace cq {
namespace {

bool IsWithin(const std::filesystem::path &candidate,
              const std::filesystem::path &potential_parent) {
  if (potential_parent.empty()) {
    return false;
  }

  const auto parent = std::filesystem::weakly_canonical(potential_parent);
  const auto normalized_candidate =
      std::filesystem::weakly_canonical(candidate);

  return std::distance(parent.begin(), parent.end()) <=
             std::distance(normalized_candidate.begin(),
                           normalized_candidate.end()) &&
         std::equal(parent.begin(), parent.end(), normalized_candidate.begin());
}

std::vector<std::filesystem::path>
ResolvePrefixes(const std::filesystem::path &root,
                const std::vector<std::string> &prefixes) {
  std::vector<std::filesystem::path> resolved;
  resolved.reserve(prefixes.size());
  for (const auto &prefix : prefixes) {
    if (prefix.empty()) {
      continue;
    }
    std::filesystem::path path(prefix);
    if (!path.is_absolute()) {
      path = root / path;
    }
    resolved.push_back(std::filesystem::weakly_canonical(path));
  }
  return resolved;
}

bool IsWithinAny(const std::filesystem::path &path,
                 const std::vector<std::filesystem::path> &parents) {
  return std::any_of(parents.begin(), parents.end(),
                     [&](const auto &parent) { return IsWithin(path, parent); });
}

} // namespace

bool IsSourceExtension(const std::filesystem::path &path) {
  static const std::set<std::string> kExtensions = {
      ".c", ".cc", ".cpp", ".cxx", ".h", ".hh", ".hpp", ".hxx"};
  return kExtensions.count(path.extension().string()) > 0;
}

bool IsCSourceFile(const std::filesystem::path &path) {
  return path.extension() == ".c";
}

std::filesystem::path ResolveRootPath(const std::string &root_path) {
  if (root_path.empty()) {
    throw std::invalid_argument("AnalysisConfig.root_path must not be empty.");
  }

  const auto normalized_root = std::filesystem::weakly_canonical(root_path);

  if (!std::filesystem::exists(normalized_root) ||
      !std::filesystem::is_directory(normalized_root)) {
    throw std::runtime_error("Analysis root path is not a directory: " +
                             normalized_root.string());
  }

  return normalized_root;
}

std::vector<std::string> DiscoverSourceFiles(const std::filesystem::path &root,
                                             const PathOptions &paths) {
  const auto included = ResolvePrefixes(root, paths.include);
  const auto excluded = ResolvePrefixes(root, paths.exclude);
  std::vector<std::filesystem::path> build;
  if (!paths.build_directory.empty()) {
    build = ResolvePrefixes(root, {paths.build_directory});
  }

  std::vector<std::string> files;
  for (std::filesystem::recursive_directory_iterator it(root), end; it != end;
       ++it) {
    const auto &entry = *it;
    const auto canonical_path = std::filesystem::weakly_canonical(entry.path());
    if (IsWithinAny(canonical_path, excluded) ||
        IsWithinAny(canonical_path, build)) {
      if (entry.is_directory()) {
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!entry.is_regular_file() || !IsSourceExtension(entry.path())) {
      continue;
    }
    if (!included.empty() && !IsWithinAny(canonical_path, included)) {
      continue;
    }

    files.push_back(canonical_path.lexically_relative(root).generic_string());
  }

  std::sort(files.begin(), files.end());
  files.erase(std::unique(files.begin(), files.end()), files.end());
  return files;
}

std::size_t CountLines(const std::string &content) {
  if (content.empty()) {
    return 0;
  }
  auto lines = static_cast<std::size_t>(
      std::count(content.begin(), content.end(), '\n'));
  if (content.back() != '\n') {
    ++lines;
  }
  return lines;
}

} // namespace cq
