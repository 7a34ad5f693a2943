#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace cq {

// Closed set of syntax node kinds produced by source loaders. Anything a
// loader cannot map is made transparent (its children are lifted).
enum class NodeKind {
  kTranslationUnit,
  kFunction,
  kParameter,
  kVariable,
  kField,
  kRecord,
  kEnum,
  kEnumConstant,
  kTypeAlias,
  kNamespace,
  kCompound,
  kIf,
  kFor,
  kWhile,
  kDo,
  kSwitch,
  kCase,
  kDefault,
  kTry,
  kCatch,
  kConditional,
  kBinaryOperator,
  kUnaryOperator,
  kCall,
  kMemberRef,
  kDeclRef,
  kTypeRef,
  kIntegerLiteral,
  kFloatingLiteral,
  kStringLiteral,
  kCharacterLiteral,
  kBoolLiteral,
  kNullLiteral,
  kReturn,
  kBreak,
  kContinue,
  kGoto,
  kLabel,
  kLambda,
  kDeclStmt,
  kThrow,
  kSubscript,
  kNew,
  kDelete,
  kCast,
  kThis,
  kInclude,
};

std::string NodeKindName(NodeKind kind);

struct LineRange {
  unsigned start_line = 0;
  unsigned end_line = 0;
};

struct SyntaxNode {
  NodeKind kind = NodeKind::kTranslationUnit;
  // Identifier, operator, literal text or include spelling.
  std::string spelling;
  // Declaration kind a reference (call, member or declaration reference)
  // resolves to.
  std::optional<NodeKind> referent;
  LineRange span;
  // kIf only: the last child is the else branch.
  bool has_else = false;
  std::vector<SyntaxNode> children;
};

struct ParsedFile {
  // Repository-relative, generic separators.
  std::string path;
  std::size_t line_count = 0;
  std::optional<SyntaxNode> root;
  std::string parse_error;

  bool ParseFailed() const { return !root.has_value(); }
};

struct RepositorySnapshot {
  std::string root_path;
  std::vector<ParsedFile> files;
};

enum class IdentifierRole {
  kNone,
  kVariable,
  kFunction,
  kParameter,
  kField,
  kType,
  kLabel,
  kNamespace,
};

std::string IdentifierRoleName(IdentifierRole role);

struct NormalizedToken {
  NodeKind kind = NodeKind::kTranslationUnit;
  IdentifierRole role = IdentifierRole::kNone;
  // Operator text; part of the structural kind.
  std::string structural_text;
  // Original spelling, for display only.
  std::string display;
  LineRange span;
};

struct ImportTarget {
  std::string spelling;
  unsigned line = 0;
};

struct NormalizedFile {
  std::string path;
  std::string module_id;
  std::size_t line_count = 0;
  bool parse_failed = false;
  std::string parse_error;
  std::vector<NormalizedToken> tokens;
  std::vector<ImportTarget> imports;
};

enum class Severity { kError = 0, kWarning = 1, kInfo = 2 };

std::string SeverityName(Severity severity);

struct Finding {
  std::string file;
  unsigned line = 0;
  std::string category;
  Severity severity = Severity::kWarning;
  std::string rule;
  std::string message;
};

struct Fingerprint {
  std::uint64_t hash = 0;
  std::size_t file_id = 0;
  // First token of the k-gram; the range is [start, start + k).
  std::size_t start = 0;
};

struct CloneSpan {
  std::string file;
  std::size_t start_token = 0;
  std::size_t end_token = 0; // exclusive
  unsigned start_line = 0;
  unsigned end_line = 0;

  std::size_t TokenCount() const { return end_token - start_token; }
  unsigned LineCount() const {
    return end_line >= start_line ? end_line - start_line + 1 : 0;
  }
};

// Canonical: `first` precedes `second` by (path, start line, start token).
struct ClonePair {
  CloneSpan first;
  CloneSpan second;

  std::size_t TokenCount() const { return first.TokenCount(); }
};

struct ModuleNode {
  std::string id;
  bool boundary = false;
  // Files realizing the module, sorted. Empty for boundary nodes.
  std::vector<std::string> files;
};

struct ImportLocation {
  std::string file;
  unsigned line = 0;
  std::string spelling;
};

struct ImportEdge {
  std::string source;
  std::string target;
  bool boundary_target = false;
  // Sorted by (file, line).
  std::vector<ImportLocation> locations;
};

struct ImportGraph {
  std::vector<ModuleNode> modules; // sorted by id
  std::vector<ImportEdge> edges;   // sorted by (source, target)

  const ModuleNode *FindModule(const std::string &id) const;
};

struct LayerRule {
  std::string name;
  std::vector<std::string> patterns;
  std::vector<std::string> allow;
  std::vector<std::string> forbid;
};

struct MetricSample {
  std::string subject;
  std::string metric;
  double value = 0.0;
};

struct ConfidenceInterval {
  double low = 0.0;
  double high = 0.0;
  double level = 0.0;
  std::size_t sample_count = 0;
};

enum class Pillar {
  kDuplication = 0,
  kArchitecture = 1,
  kLint = 2,
  kTyping = 3,
  kComplexity = 4,
};

constexpr std::size_t kPillarCount = 5;
constexpr std::array<Pillar, kPillarCount> kAllPillars = {
    Pillar::kDuplication, Pillar::kArchitecture, Pillar::kLint,
    Pillar::kTyping, Pillar::kComplexity};

std::string PillarName(Pillar pillar);

struct PillarWeights {
  double duplication = 0.20;
  double architecture = 0.20;
  double lint = 0.25;
  double typing = 0.15;
  double complexity = 0.20;

  double Get(Pillar pillar) const;
  void Set(Pillar pillar, double value);
  double Sum() const;
};

struct PillarScore {
  double score = 0.0; // [0, 1]
  bool available = false;
  std::string reason;
  ConfidenceInterval interval;
};

enum class ToolKind { kLint, kTyping };

std::string ToolKindName(ToolKind kind);

struct ToolDiagnostic {
  std::string file;
  unsigned line = 0;
  unsigned column = 0;
  Severity severity = Severity::kWarning;
  std::string message;
  std::string check;
};

struct FileToolMetric {
  std::string path;
  std::size_t diagnostics = 0;
  double score = 1.0;
};

// Result of an external tool adapter: either Available(value) with per-file
// metrics, or Unavailable(reason).
struct ToolOutcome {
  bool available = false;
  double value = 0.0;
  std::string reason;
  std::vector<FileToolMetric> files;
  std::vector<ToolDiagnostic> diagnostics;

  static ToolOutcome Available(double value, std::vector<FileToolMetric> files,
                               std::vector<ToolDiagnostic> diagnostics);
  static ToolOutcome Unavailable(std::string reason);
};

struct AbsentRelation {
  std::string source_layer;
  std::string target_layer;
};

struct FileMetrics {
  std::string path;
  std::size_t line_count = 0;
  bool parse_failed = false;
  double duplication_ratio = 0.0;
  double cognitive_complexity = 0.0;
  double complexity_score = 1.0;
  std::optional<double> architecture_score;
  std::optional<double> lint_score;
  std::optional<double> typing_score;
  double grade = 0.0; // 0-100
};

struct Report {
  std::string root_path;
  double overall_score = 0.0; // 0-100
  bool partial = false;
  std::array<PillarScore, kPillarCount> pillars;
  PillarWeights applied_weights;
  ConfidenceInterval confidence;
  std::vector<Finding> findings;
  std::vector<ClonePair> clones;
  std::vector<FileMetrics> files;
  std::vector<AbsentRelation> absent_relations;

  const PillarScore &PillarFor(Pillar pillar) const {
    return pillars[static_cast<std::size_t>(pillar)];
  }
};

struct RenderedReport {
  std::string markdown;
  std::string json;
};

struct PipelineResult {
  Report report;
  RenderedReport rendered;
};

} // namespace cq
