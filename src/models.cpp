#include <cq/models.h>

#include <algorithm>
#include <utility>

namespace cq {

std::string NodeKindName(NodeKind kind) {
  switch (kind) {
  case NodeKind::kTranslationUnit:
    return "translation-unit";
  case NodeKind::kFunction:
    return "function";
  case NodeKind::kParameter:
    return "parameter";
  case NodeKind::kVariable:
    return "variable";
  case NodeKind::kField:
    return "field";
  case NodeKind::kRecord:
    return "record";
  case NodeKind::kEnum:
    return "enum";
  case NodeKind::kEnumConstant:
    return "enum-constant";
  case NodeKind::kTypeAlias:
    return "type-alias";
  case NodeKind::kNamespace:
    return "namespace";
  case NodeKind::kCompound:
    return "compound";
  case NodeKind::kIf:
    return "if";
  case NodeKind::kFor:
    return "for";
  case NodeKind::kWhile:
    return "while";
  case NodeKind::kDo:
    return "do";
  case NodeKind::kSwitch:
    return "switch";
  case NodeKind::kCase:
    return "case";
  case NodeKind::kDefault:
    return "default";
  case NodeKind::kTry:
    return "try";
  case NodeKind::kCatch:
    return "catch";
  case NodeKind::kConditional:
    return "conditional";
  case NodeKind::kBinaryOperator:
    return "binary-operator";
  case NodeKind::kUnaryOperator:
    return "unary-operator";
  case NodeKind::kCall:
    return "call";
  case NodeKind::kMemberRef:
    return "member-ref";
  case NodeKind::kDeclRef:
    return "decl-ref";
  case NodeKind::kTypeRef:
    return "type-ref";
  case NodeKind::kIntegerLiteral:
    return "integer-literal";
  case NodeKind::kFloatingLiteral:
    return "floating-literal";
  case NodeKind::kStringLiteral:
    return "string-literal";
  case NodeKind::kCharacterLiteral:
    return "character-literal";
  case NodeKind::kBoolLiteral:
    return "bool-literal";
  case NodeKind::kNullLiteral:
    return "null-literal";
  case NodeKind::kReturn:
    return "return";
  case NodeKind::kBreak:
    return "break";
  case NodeKind::kContinue:
    return "continue";
  case NodeKind::kGoto:
    return "goto";
  case NodeKind::kLabel:
    return "label";
  case NodeKind::kLambda:
    return "lambda";
  case NodeKind::kDeclStmt:
    return "decl-stmt";
  case NodeKind::kThrow:
    return "throw";
  case NodeKind::kSubscript:
    return "subscript";
  case NodeKind::kNew:
    return "new";
  case NodeKind::kDelete:
    return "delete";
  case NodeKind::kCast:
    return "cast";
  case NodeKind::kThis:
    return "this";
  case NodeKind::kInclude:
    return "include";
  }
  return "unknown";
}

std::string IdentifierRoleName(IdentifierRole role) {
  switch (role) {
  case IdentifierRole::kNone:
    return "";
  case IdentifierRole::kVariable:
    return "VAR";
  case IdentifierRole::kFunction:
    return "FUNC";
  case IdentifierRole::kParameter:
    return "PARAM";
  case IdentifierRole::kField:
    return "FIELD";
  case IdentifierRole::kType:
    return "TYPE";
  case IdentifierRole::kLabel:
    return "LABEL";
  case IdentifierRole::kNamespace:
    return "NS";
  }
  return "";
}

std::string SeverityName(Severity severity) {
  switch (severity) {
  case Severity::kError:
    return "error";
  case Severity::kWarning:
    return "warning";
  case Severity::kInfo:
    return "info";
  }
  return "unknown";
}

std::string PillarName(Pillar pillar) {
  switch (pillar) {
  case Pillar::kDuplication:
    return "duplication";
  case Pillar::kArchitecture:
    return "architecture";
  case Pillar::kLint:
    return "lint";
  case Pillar::kTyping:
    return "typing";
  case Pillar::kComplexity:
    return "complexity";
  }
  return "unknown";
}

std::string ToolKindName(ToolKind kind) {
  return kind == ToolKind::kLint ? "lint" : "typing";
}

double PillarWeights::Get(Pillar pillar) const {
  switch (pillar) {
  case Pillar::kDuplication:
    return duplication;
  case Pillar::kArchitecture:
    return architecture;
  case Pillar::kLint:
    return lint;
  case Pillar::kTyping:
    return typing;
  case Pillar::kComplexity:
    return complexity;
  }
  return 0.0;
}

void PillarWeights::Set(Pillar pillar, double value) {
  switch (pillar) {
  case Pillar::kDuplication:
    duplication = value;
    return;
  case Pillar::kArchitecture:
    architecture = value;
    return;
  case Pillar::kLint:
    lint = value;
    return;
  case Pillar::kTyping:
    typing = value;
    return;
  case Pillar::kComplexity:
    complexity = value;
    return;
  }
}

double PillarWeights::Sum() const {
  double total = 0.0;
  for (const auto pillar : kAllPillars) {
    total += Get(pillar);
  }
  return total;
}

const ModuleNode *ImportGraph::FindModule(const std::string &id) const {
  const auto found = std::lower_bound(
      modules.begin(), modules.end(), id,
      [](const ModuleNode &node, const std::string &key) {
        return node.id < key;
      });
  if (found == modules.end() || found->id != id) {
    return nullptr;
  }
  return &*found;
}

ToolOutcome ToolOutcome::Available(double value,
                                   std::vector<FileToolMetric> files,
                                   std::vector<ToolDiagnostic> diagnostics) {
  ToolOutcome outcome;
  outcome.available = true;
  outcome.value = value;
  outcome.files = std::move(files);
  outcome.diagnostics = std::move(diagnostics);
  return outcome;
}

ToolOutcome ToolOutcome::Unavailable(std::string reason) {
  ToolOutcome outcome;
  outcome.available = false;
  outcome.reason = std::move(reason);
  return outcome;
}

} // namespace cq
