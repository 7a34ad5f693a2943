#pragma once

#include <cq/config.h>
#include <cq/models.h>

namespace cq {

class SourceLoader {
public:
  virtual ~SourceLoader() = default;
  virtual RepositorySnapshot Load(const AnalysisConfig &config) = 0;
};

// External lint or typing tool. Never throws for tool trouble; reports it as
// ToolOutcome::Unavailable.
class ToolAdapter {
public:
  virtual ~ToolAdapter() = default;
  virtual ToolOutcome Measure(const RepositorySnapshot &snapshot,
                              const AnalysisConfig &config) = 0;
};

class Analyzer {
public:
  virtual ~Analyzer() = default;
  virtual Report Analyze(const RepositorySnapshot &snapshot,
                         const AnalysisConfig &config) = 0;
};

class Reporter {
public:
  virtual ~Reporter() = default;
  virtual RenderedReport Render(const Report &report,
                                const AnalysisConfig &config) = 0;
};

class AnalyzerPipeline {
public:
  virtual ~AnalyzerPipeline() = default;
  virtual PipelineResult Run(const AnalysisConfig &config) = 0;
};

} // namespace cq
