#pragma once

#include <cq/interfaces.h>
#include <cq/logging.h>

#include <memory>

namespace cq {

// The analysis engine: normalization, duplication, import graph and
// architecture, cognitive complexity, tool pillars and aggregation.
class QualityAnalyzer : public Analyzer {
public:
  QualityAnalyzer(std::shared_ptr<ToolAdapter> lint = nullptr,
                  std::shared_ptr<ToolAdapter> typing = nullptr,
                  std::shared_ptr<Logger> logger = nullptr);

  // Throws ConfigError before touching any file, EmptyRepositoryError for a
  // snapshot without files.
  Report Analyze(const RepositorySnapshot &snapshot,
                 const AnalysisConfig &config) override;

private:
  std::shared_ptr<ToolAdapter> lint_;
  std::shared_ptr<ToolAdapter> typing_;
  std::shared_ptr<Logger> logger_;
};

} // namespace cq
