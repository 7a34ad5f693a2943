#pragma once

#include <cq/config.h>
#include <cq/models.h>

#include <cstddef>
#include <string>
#include <vector>

namespace cq {

struct FunctionComplexity {
  std::string name;
  unsigned line = 0;
  int complexity = 0;
};

struct FileComplexity {
  std::string path;
  std::size_t line_count = 0;
  bool scored = false;
  double value = 0.0;
  double score = 1.0;
  std::vector<FunctionComplexity> functions;
};

struct ComplexityResult {
  bool available = false;
  std::string reason;
  double score = 1.0;
  std::vector<FileComplexity> files; // snapshot order
  std::vector<Finding> findings;
};

class CognitiveComplexityScorer {
public:
  explicit CognitiveComplexityScorer(ComplexityOptions options);

  // `function` must be a kFunction node; lambdas inside it count towards it.
  int ScoreFunction(const SyntaxNode &function) const;
  FileComplexity ScoreFile(const ParsedFile &file) const;
  ComplexityResult Score(const std::vector<ParsedFile> &files,
                         std::size_t workers) const;

private:
  double AggregateFile(std::vector<int> values) const;

  ComplexityOptions options_;
};

} // namespace cq
