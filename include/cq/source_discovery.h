#pragma once

#include <cq/config.h>

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace cq {

bool IsSourceExtension(const std::filesystem::path &path);
bool IsCSourceFile(const std::filesystem::path &path);

// Canonical, existing root directory. Throws std::invalid_argument for an
// empty path and std::runtime_error when it is not a directory.
std::filesystem::path ResolveRootPath(const std::string &root_path);

// Root-relative source paths with generic separators, sorted. Skips the
// build directory and excluded prefixes; when include prefixes are given
// only files below them are kept.
std::vector<std::string> DiscoverSourceFiles(const std::filesystem::path &root,
                                             const PathOptions &paths);

std::size_t CountLines(const std::string &content);

} // namespace cq
