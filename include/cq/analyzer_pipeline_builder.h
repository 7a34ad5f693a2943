#pragma once

#include <cq/interfaces.h>
#include <cq/logging.h>

#include <memory>

namespace cq {

class DefaultAnalyzerPipeline;

struct PipelineComponents {
  std::unique_ptr<SourceLoader> source_loader;
  std::unique_ptr<Analyzer> analyzer;
  std::unique_ptr<Reporter> reporter;
  std::shared_ptr<Logger> logger;
};

// Missing components fall back to the libclang loader, the quality analyzer
// with command-line lint and typing adapters, and the Markdown reporter.
class AnalyzerPipelineBuilder {
public:
  AnalyzerPipelineBuilder &
  WithSourceLoader(std::unique_ptr<SourceLoader> source_loader);
  AnalyzerPipelineBuilder &WithAnalyzer(std::unique_ptr<Analyzer> analyzer);
  AnalyzerPipelineBuilder &WithReporter(std::unique_ptr<Reporter> reporter);
  AnalyzerPipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);

  DefaultAnalyzerPipeline Build();

  static AnalyzerPipelineBuilder WithDefaults();

private:
  PipelineComponents components_;
};

} // namespace cq
