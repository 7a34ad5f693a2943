#include <cq/analyzer_pipeline_builder.h>

#include <cq/clang_source_loader.h>
#include <cq/command_tool_adapter.h>
#include <cq/default_analyzer_pipeline.h>
#include <cq/markdown_reporter.h>
#include <cq/quality_analyzer.h>

#include <utility>

namespace {

template <typename Interface, typename Implementation, typename... Args>
std::unique_ptr<Interface> EnsureComponent(std::unique_ptr<Interface> component,
                                           Args &&...args) {
  if (component) {
    return component;
  }
  return std::make_unique<Implementation>(std::forward<Args>(args)...);
}

} // namespace

namespace cq {

AnalyzerPipelineBuilder AnalyzerPipelineBuilder::WithDefaults() {
  AnalyzerPipelineBuilder builder;
  builder.WithLogger(std::make_shared<NullLogger>());
  return builder;
}

AnalyzerPipelineBuilder &AnalyzerPipelineBuilder::WithSourceLoader(
    std::unique_ptr<SourceLoader> source_loader) {
  components_.source_loader = std::move(source_loader);
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithAnalyzer(std::unique_ptr<Analyzer> analyzer) {
  components_.analyzer = std::move(analyzer);
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithReporter(std::unique_ptr<Reporter> reporter) {
  components_.reporter = std::move(reporter);
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

DefaultAnalyzerPipeline AnalyzerPipelineBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));
  const auto logger = components_.logger;

  components_.source_loader =
      EnsureComponent<SourceLoader, ClangSourceLoader>(
          std::move(components_.source_loader), logger);
  if (!components_.analyzer) {
    components_.analyzer = std::make_unique<QualityAnalyzer>(
        std::make_shared<CommandToolAdapter>(ToolKind::kLint, logger),
        std::make_shared<CommandToolAdapter>(ToolKind::kTyping, logger),
        logger);
  }
  components_.reporter = EnsureComponent<Reporter, MarkdownReporter>(
      std::move(components_.reporter));
  return DefaultAnalyzerPipeline(std::move(components_));
}

} // namespace cq
