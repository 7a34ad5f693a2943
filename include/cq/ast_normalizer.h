#pragma once

#include <cq/models.h>

#include <cstddef>
#include <string>
#include <vector>

namespace cq {

// Repository-relative path without its extension; `foo.h` and `foo.cpp` share
// one module.
std::string ModuleIdForPath(const std::string &path);

IdentifierRole RoleForNode(const SyntaxNode &node);

class AstNormalizer {
public:
  NormalizedFile Normalize(const ParsedFile &file) const;

  // Normalizes every file on `workers` threads. The result is in the
  // snapshot's file order.
  std::vector<NormalizedFile> NormalizeAll(const std::vector<ParsedFile> &files,
                                           std::size_t workers) const;
};

} // namespace cq
