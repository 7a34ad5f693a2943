#pragma once

#include <cq/analyzer_pipeline_builder.h>
#include <cq/interfaces.h>

#include <memory>

namespace cq {

class DefaultAnalyzerPipeline : public AnalyzerPipeline {
public:
  explicit DefaultAnalyzerPipeline(PipelineComponents components);

  PipelineResult Run(const AnalysisConfig &config) override;

private:
  std::unique_ptr<SourceLoader> source_loader_;
  std::unique_ptr<Analyzer> analyzer_;
  std::unique_ptr<Reporter> reporter_;
  std::shared_ptr<Logger> logger_;
};

} // namespace cq
