#pragma once

#include <cq/interfaces.h>

#include <filesystem>

namespace cq {

// Renders the report as Markdown and as hand-written JSON, for the formats
// listed in the config.
class MarkdownReporter : public Reporter {
public:
  RenderedReport Render(const Report &report,
                        const AnalysisConfig &config) override;
};

std::string EscapeJsonString(const std::string &value);

// Writes cq_report.md / cq_report.json for every non-empty rendering.
void WriteReports(const std::filesystem::path &directory,
                  const RenderedReport &rendered);

} // namespace cq
