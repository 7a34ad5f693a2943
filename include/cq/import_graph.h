#pragma once

#include <cq/models.h>

#include <optional>
#include <set>
#include <string>
#include <vector>

namespace cq {

class ImportGraphExtractor {
public:
  ImportGraph Extract(const std::vector<NormalizedFile> &files) const;

  // Resolves an include spelling seen in `including_file` to a repository
  // file path, or nothing when it points outside the repository.
  static std::optional<std::string>
  ResolveImport(const std::string &including_file, const std::string &spelling,
                const std::set<std::string> &repository_files);
};

// Module id used for targets outside the repository.
std::string BoundaryModuleId(const std::string &spelling);

} // namespace cq
