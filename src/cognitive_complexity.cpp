#include <cq/cognitive_complexity.h>

#include <cq/worker_pool.h>

#include <algorithm>
#include <cmath>
#include <utility>

namespace cq {
namespace {

bool HasBody(const SyntaxNode &node) {
  return std::any_of(node.children.begin(), node.children.end(),
                     [](const SyntaxNode &child) {
                       return child.kind == NodeKind::kCompound;
                     });
}

class ComplexityWalker {
public:
  explicit ComplexityWalker(std::string function_name)
      : function_name_(std::move(function_name)) {}

  int total() const { return total_; }

  void Visit(const SyntaxNode &node, int nesting) {
    switch (node.kind) {
    case NodeKind::kFunction:
      // Scored on its own.
      return;
    case NodeKind::kIf:
      VisitIf(node, nesting, false);
      return;
    case NodeKind::kConditional:
    case NodeKind::kSwitch:
    case NodeKind::kFor:
    case NodeKind::kWhile:
    case NodeKind::kDo:
    case NodeKind::kCatch:
      total_ += 1 + nesting;
      VisitChildren(node, nesting + 1);
      return;
    case NodeKind::kLambda:
      VisitChildren(node, nesting + 1);
      return;
    case NodeKind::kBinaryOperator:
      if (node.spelling == "&&" || node.spelling == "||") {
        ++total_;
      }
      break;
    case NodeKind::kCall:
      if (!function_name_.empty() && node.spelling == function_name_ &&
          (!node.referent || *node.referent == NodeKind::kFunction)) {
        ++total_;
      }
      break;
    case NodeKind::kGoto:
      ++total_;
      break;
    default:
      break;
    }
    VisitChildren(node, nesting);
  }

private:
  void VisitChildren(const SyntaxNode &node, int nesting) {
    for (const auto &child : node.children) {
      Visit(child, nesting);
    }
  }

  // An `else if` costs one flat increment and keeps the nesting of the
  // leading `if`.
  void VisitIf(const SyntaxNode &node, int nesting, bool is_else_if) {
    total_ += is_else_if ? 1 : 1 + nesting;
    const auto branch_count =
        node.has_else && !node.children.empty() ? node.children.size() - 1
                                                : node.children.size();
    for (std::size_t i = 0; i < branch_count; ++i) {
      Visit(node.children[i], nesting + 1);
    }
    if (branch_count == node.children.size()) {
      return;
    }
    const auto &else_branch = node.children.back();
    if (else_branch.kind == NodeKind::kIf) {
      VisitIf(else_branch, nesting, true);
    } else {
      Visit(else_branch, nesting + 1);
    }
  }

  std::string function_name_;
  int total_ = 0;
};

void CollectFunctions(const SyntaxNode &node,
                      std::vector<const SyntaxNode *> &functions) {
  if (node.kind == NodeKind::kFunction && HasBody(node)) {
    functions.push_back(&node);
  }
  for (const auto &child : node.children) {
    CollectFunctions(child, functions);
  }
}

} // namespace

CognitiveComplexityScorer::CognitiveComplexityScorer(ComplexityOptions options)
    : options_(options) {}

int CognitiveComplexityScorer::ScoreFunction(const SyntaxNode &function) const {
  ComplexityWalker walker(function.spelling);
  for (const auto &child : function.children) {
    walker.Visit(child, 0);
  }
  return walker.total();
}

double CognitiveComplexityScorer::AggregateFile(std::vector<int> values) const {
  if (values.empty()) {
    return 0.0;
  }
  if (options_.aggregation == ComplexityAggregation::kSum) {
    double total = 0.0;
    for (const auto value : values) {
      total += value;
    }
    return total;
  }
  std::sort(values.begin(), values.end());
  const auto rank = static_cast<std::size_t>(std::ceil(
      options_.percentile / 100.0 * static_cast<double>(values.size())));
  const auto index = std::min(values.size(), std::max<std::size_t>(rank, 1)) - 1;
  return values[index];
}

FileComplexity CognitiveComplexityScorer::ScoreFile(const ParsedFile &file) const {
  FileComplexity result;
  result.path = file.path;
  result.line_count = file.line_count;
  if (file.ParseFailed()) {
    return result;
  }
  result.scored = true;

  std::vector<const SyntaxNode *> functions;
  CollectFunctions(*file.root, functions);
  std::vector<int> values;
  for (const auto *function : functions) {
    const auto complexity = ScoreFunction(*function);
    result.functions.push_back(
        FunctionComplexity{function->spelling, function->span.start_line,
                           complexity});
    values.push_back(complexity);
  }

  result.value = AggregateFile(std::move(values));
  if (file.line_count > 0) {
    const auto per_line =
        result.value / static_cast<double>(file.line_count);
    result.score = std::max(0.0, 1.0 - per_line / options_.target_per_loc);
  }
  return result;
}

ComplexityResult
CognitiveComplexityScorer::Score(const std::vector<ParsedFile> &files,
                                 std::size_t workers) const {
  ComplexityResult result;
  result.files.resize(files.size());
  ParallelFor(files.size(), workers, [&](std::size_t index) {
    result.files[index] = ScoreFile(files[index]);
  });

  double weighted = 0.0;
  double lines = 0.0;
  std::size_t scored_files = 0;
  for (const auto &file : result.files) {
    if (!file.scored) {
      continue;
    }
    ++scored_files;
    weighted += file.score * static_cast<double>(file.line_count);
    lines += static_cast<double>(file.line_count);

    for (const auto &function : file.functions) {
      if (function.complexity < options_.function_threshold) {
        continue;
      }
      Finding finding;
      finding.file = file.path;
      finding.line = function.line;
      finding.category = "complexity";
      finding.severity = Severity::kWarning;
      finding.rule = "cognitive-complexity";
      finding.message = "Function '" + function.name +
                        "' has cognitive complexity " +
                        std::to_string(function.complexity) + " (threshold " +
                        std::to_string(options_.function_threshold) + ")";
      result.findings.push_back(std::move(finding));
    }
  }

  if (scored_files == 0) {
    result.available = false;
    result.reason = "no parsable source files";
    return result;
  }
  result.available = true;
  result.score = lines > 0.0 ? weighted / lines : 1.0;
  return result;
}

} // namespace cq
