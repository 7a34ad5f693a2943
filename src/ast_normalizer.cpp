#include <cq/ast_normalizer.h>

#include <cq/worker_pool.h>

#include <filesystem>

namespace cq {
namespace {

IdentifierRole RoleForDeclarationKind(NodeKind kind) {
  switch (kind) {
  case NodeKind::kFunction:
    return IdentifierRole::kFunction;
  case NodeKind::kParameter:
    return IdentifierRole::kParameter;
  case NodeKind::kVariable:
  case NodeKind::kEnumConstant:
    return IdentifierRole::kVariable;
  case NodeKind::kField:
    return IdentifierRole::kField;
  case NodeKind::kRecord:
  case NodeKind::kEnum:
  case NodeKind::kTypeAlias:
    return IdentifierRole::kType;
  case NodeKind::kNamespace:
    return IdentifierRole::kNamespace;
  case NodeKind::kLabel:
    return IdentifierRole::kLabel;
  default:
    return IdentifierRole::kNone;
  }
}

bool KeepsStructuralText(NodeKind kind) {
  return kind == NodeKind::kBinaryOperator ||
         kind == NodeKind::kUnaryOperator;
}

class TokenCollector {
public:
  explicit TokenCollector(NormalizedFile &file) : file_(file) {}

  void Visit(const SyntaxNode &node) {
    if (node.kind == NodeKind::kInclude) {
      file_.imports.push_back(ImportTarget{node.spelling, node.span.start_line});
      return;
    }
    if (node.kind != NodeKind::kTranslationUnit) {
      NormalizedToken token;
      token.kind = node.kind;
      token.role = RoleForNode(node);
      if (KeepsStructuralText(node.kind)) {
        token.structural_text = node.spelling;
      }
      token.display = node.spelling;
      token.span = node.span;
      file_.tokens.push_back(std::move(token));
    }
    for (const auto &child : node.children) {
      Visit(child);
    }
  }

private:
  NormalizedFile &file_;
};

} // namespace

std::string ModuleIdForPath(const std::string &path) {
  std::filesystem::path module(path);
  module.replace_extension();
  return module.generic_string();
}

IdentifierRole RoleForNode(const SyntaxNode &node) {
  switch (node.kind) {
  case NodeKind::kCall:
    return node.referent ? RoleForDeclarationKind(*node.referent)
                         : IdentifierRole::kFunction;
  case NodeKind::kMemberRef:
    return node.referent ? RoleForDeclarationKind(*node.referent)
                         : IdentifierRole::kField;
  case NodeKind::kDeclRef:
    return node.referent ? RoleForDeclarationKind(*node.referent)
                         : IdentifierRole::kVariable;
  case NodeKind::kTypeRef:
    return IdentifierRole::kType;
  case NodeKind::kGoto:
    return IdentifierRole::kLabel;
  default:
    return RoleForDeclarationKind(node.kind);
  }
}

NormalizedFile AstNormalizer::Normalize(const ParsedFile &file) const {
  NormalizedFile normalized;
  normalized.path = file.path;
  normalized.module_id = ModuleIdForPath(file.path);
  normalized.line_count = file.line_count;
  if (file.ParseFailed()) {
    normalized.parse_failed = true;
    normalized.parse_error = file.parse_error;
    return normalized;
  }

  TokenCollector collector(normalized);
  collector.Visit(*file.root);
  return normalized;
}

std::vector<NormalizedFile>
AstNormalizer::NormalizeAll(const std::vector<ParsedFile> &files,
                            std::size_t workers) const {
  std::vector<NormalizedFile> normalized(files.size());
  ParallelFor(files.size(), workers, [&](std::size_t index) {
    normalized[index] = Normalize(files[index]);
  });
  return normalized;
}

} // namespace cq
