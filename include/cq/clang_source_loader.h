#pragma once

#include <cq/interfaces.h>
#include <cq/logging.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace cq {

// Discovers C and C++ files under the root and parses each one with libclang
// into a SyntaxNode tree. Compile flags come from compile_commands.json in
// the build directory when it lists the file.
class ClangSourceLoader : public SourceLoader {
public:
  explicit ClangSourceLoader(std::shared_ptr<Logger> logger = nullptr);

  RepositorySnapshot Load(const AnalysisConfig &config) override;

  ParsedFile ParseFile(const std::filesystem::path &root,
                       const std::string &relative_path,
                       const std::vector<std::string> &args) const;

  static std::vector<std::string>
  DefaultArguments(const std::filesystem::path &root,
                   const std::string &relative_path,
                   const std::vector<std::string> &extra_args);

private:
  std::shared_ptr<Logger> logger_;
};

} // namespace cq
