#include <cq/default_analyzer_pipeline.h>

#include <chrono>
#include <utility>

namespace cq {

DefaultAnalyzerPipeline::DefaultAnalyzerPipeline(PipelineComponents components)
    : source_loader_(std::move(components.source_loader)),
      analyzer_(std::move(components.analyzer)),
      reporter_(std::move(components.reporter)),
      logger_(EnsureLogger(std::move(components.logger))) {}

PipelineResult DefaultAnalyzerPipeline::Run(const AnalysisConfig &config) {
  // Fail on bad weights or layers before the loader touches any file.
  ValidateConfig(config);

  logger_->Log(LogLevel::kInfo, "pipeline.start",
               {{"root", config.root_path},
                {"formats", std::to_string(config.report.formats.size())}});

  const auto pipeline_start = std::chrono::steady_clock::now();
  const auto snapshot = source_loader_->Load(config);
  std::size_t parse_failures = 0;
  for (const auto &file : snapshot.files) {
    if (file.ParseFailed()) {
      ++parse_failures;
    }
  }
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "load"},
                {"file_count", std::to_string(snapshot.files.size())},
                {"parse_failures", std::to_string(parse_failures)}});

  const auto report = analyzer_->Analyze(snapshot, config);
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "analyze"},
                {"findings", std::to_string(report.findings.size())},
                {"clones", std::to_string(report.clones.size())}});

  auto rendered = reporter_->Render(report, config);
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "render"},
                {"markdown_bytes", std::to_string(rendered.markdown.size())},
                {"json_bytes", std::to_string(rendered.json.size())}});

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - pipeline_start)
          .count();
  logger_->Log(LogLevel::kInfo, "pipeline.complete",
               {{"duration_ms", std::to_string(duration_ms)},
                {"findings", std::to_string(report.findings.size())},
                {"partial", report.partial ? "true" : "false"}});

  return PipelineResult{report, std::move(rendered)};
}

} // namespace cq
