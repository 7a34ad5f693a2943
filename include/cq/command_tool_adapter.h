#pragma once

#include <cq/interfaces.h>
#include <cq/logging.h>

#include <memory>
#include <string>
#include <vector>

namespace cq {

// Compiler-style `path:line:col: severity: message [check]` lines. Notes are
// skipped.
std::vector<ToolDiagnostic> ParseDiagnostics(const std::string &output);

std::string ExpandCommandTemplate(const std::string &command_template,
                                  const std::vector<std::string> &files,
                                  const std::string &root);

class CommandToolAdapter : public ToolAdapter {
public:
  CommandToolAdapter(ToolKind kind, std::shared_ptr<Logger> logger = nullptr);

  ToolOutcome Measure(const RepositorySnapshot &snapshot,
                      const AnalysisConfig &config) override;

private:
  double FileScore(const std::vector<ToolDiagnostic> &diagnostics,
                   std::size_t line_count, const ToolOptions &options) const;

  ToolKind kind_;
  std::shared_ptr<Logger> logger_;
};

} // namespace cq
