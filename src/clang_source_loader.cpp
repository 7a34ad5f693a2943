#include <cq/clang_source_loader.h>

#include <cq/source_discovery.h>
#include <cq/worker_pool.h>

#include <clang-c/CXCompilationDatabase.h>
#include <clang-c/Index.h>

#include <algorithm>
#include <chrono>
#include <fstream>
#include <iterator>
#include <map>
#include <optional>
#include <utility>

namespace cq {
namespace {

std::string ToString(CXString value) {
  std::string text;
  if (const auto *cstr = clang_getCString(value); cstr != nullptr) {
    text = cstr;
  }
  clang_disposeString(value);
  return text;
}

unsigned OffsetOf(CXSourceLocation location) {
  unsigned offset = 0;
  clang_getFileLocation(location, nullptr, nullptr, nullptr, &offset);
  return offset;
}

LineRange LinesOf(CXCursor cursor) {
  const auto extent = clang_getCursorExtent(cursor);
  LineRange range;
  clang_getFileLocation(clang_getRangeStart(extent), nullptr, &range.start_line,
                        nullptr, nullptr);
  clang_getFileLocation(clang_getRangeEnd(extent), nullptr, &range.end_line,
                        nullptr, nullptr);
  if (range.end_line < range.start_line) {
    range.end_line = range.start_line;
  }
  return range;
}

std::optional<NodeKind> MapCursorKind(CXCursorKind kind) {
  switch (kind) {
  case CXCursor_FunctionDecl:
  case CXCursor_CXXMethod:
  case CXCursor_Constructor:
  case CXCursor_Destructor:
  case CXCursor_ConversionFunction:
  case CXCursor_FunctionTemplate:
    return NodeKind::kFunction;
  case CXCursor_ParmDecl:
    return NodeKind::kParameter;
  case CXCursor_VarDecl:
    return NodeKind::kVariable;
  case CXCursor_FieldDecl:
    return NodeKind::kField;
  case CXCursor_StructDecl:
  case CXCursor_UnionDecl:
  case CXCursor_ClassDecl:
  case CXCursor_ClassTemplate:
  case CXCursor_ClassTemplatePartialSpecialization:
    return NodeKind::kRecord;
  case CXCursor_EnumDecl:
    return NodeKind::kEnum;
  case CXCursor_EnumConstantDecl:
    return NodeKind::kEnumConstant;
  case CXCursor_TypedefDecl:
  case CXCursor_TypeAliasDecl:
  case CXCursor_TypeAliasTemplateDecl:
    return NodeKind::kTypeAlias;
  case CXCursor_Namespace:
    return NodeKind::kNamespace;
  case CXCursor_CompoundStmt:
    return NodeKind::kCompound;
  case CXCursor_IfStmt:
    return NodeKind::kIf;
  case CXCursor_ForStmt:
  case CXCursor_CXXForRangeStmt:
    return NodeKind::kFor;
  case CXCursor_WhileStmt:
    return NodeKind::kWhile;
  case CXCursor_DoStmt:
    return NodeKind::kDo;
  case CXCursor_SwitchStmt:
    return NodeKind::kSwitch;
  case CXCursor_CaseStmt:
    return NodeKind::kCase;
  case CXCursor_DefaultStmt:
    return NodeKind::kDefault;
  case CXCursor_CXXTryStmt:
    return NodeKind::kTry;
  case CXCursor_CXXCatchStmt:
    return NodeKind::kCatch;
  case CXCursor_ConditionalOperator:
    return NodeKind::kConditional;
  case CXCursor_BinaryOperator:
  case CXCursor_CompoundAssignOperator:
    return NodeKind::kBinaryOperator;
  case CXCursor_UnaryOperator:
    return NodeKind::kUnaryOperator;
  case CXCursor_CallExpr:
    return NodeKind::kCall;
  case CXCursor_MemberRefExpr:
    return NodeKind::kMemberRef;
  case CXCursor_DeclRefExpr:
    return NodeKind::kDeclRef;
  case CXCursor_TypeRef:
  case CXCursor_TemplateRef:
    return NodeKind::kTypeRef;
  case CXCursor_IntegerLiteral:
    return NodeKind::kIntegerLiteral;
  case CXCursor_FloatingLiteral:
    return NodeKind::kFloatingLiteral;
  case CXCursor_StringLiteral:
    return NodeKind::kStringLiteral;
  case CXCursor_CharacterLiteral:
    return NodeKind::kCharacterLiteral;
  case CXCursor_CXXBoolLiteralExpr:
    return NodeKind::kBoolLiteral;
  case CXCursor_CXXNullPtrLiteralExpr:
    return NodeKind::kNullLiteral;
  case CXCursor_ReturnStmt:
    return NodeKind::kReturn;
  case CXCursor_BreakStmt:
    return NodeKind::kBreak;
  case CXCursor_ContinueStmt:
    return NodeKind::kContinue;
  case CXCursor_GotoStmt:
    return NodeKind::kGoto;
  case CXCursor_LabelStmt:
    return NodeKind::kLabel;
  case CXCursor_LambdaExpr:
    return NodeKind::kLambda;
  case CXCursor_DeclStmt:
    return NodeKind::kDeclStmt;
  case CXCursor_CXXThrowExpr:
    return NodeKind::kThrow;
  case CXCursor_ArraySubscriptExpr:
    return NodeKind::kSubscript;
  case CXCursor_CXXNewExpr:
    return NodeKind::kNew;
  case CXCursor_CXXDeleteExpr:
    return NodeKind::kDelete;
  case CXCursor_CStyleCastExpr:
  case CXCursor_CXXStaticCastExpr:
  case CXCursor_CXXDynamicCastExpr:
  case CXCursor_CXXReinterpretCastExpr:
  case CXCursor_CXXConstCastExpr:
  case CXCursor_CXXFunctionalCastExpr:
    return NodeKind::kCast;
  case CXCursor_CXXThisExpr:
    return NodeKind::kThis;
  case CXCursor_InclusionDirective:
    return NodeKind::kInclude;
  default:
    return std::nullopt;
  }
}

bool IsDeclarationKind(NodeKind kind) {
  switch (kind) {
  case NodeKind::kFunction:
  case NodeKind::kParameter:
  case NodeKind::kVariable:
  case NodeKind::kField:
  case NodeKind::kRecord:
  case NodeKind::kEnum:
  case NodeKind::kEnumConstant:
  case NodeKind::kTypeAlias:
  case NodeKind::kNamespace:
  case NodeKind::kLabel:
    return true;
  default:
    return false;
  }
}

std::vector<CXCursor> ChildrenOf(CXCursor cursor) {
  std::vector<CXCursor> children;
  clang_visitChildren(
      cursor,
      [](CXCursor child, CXCursor, CXClientData data) {
        static_cast<std::vector<CXCursor> *>(data)->push_back(child);
        return CXChildVisit_Continue;
      },
      &children);
  return children;
}

struct TokenText {
  std::string spelling;
  CXTokenKind kind = CXToken_Punctuation;
  unsigned offset = 0;
};

class SyntaxTreeBuilder {
public:
  explicit SyntaxTreeBuilder(CXTranslationUnit translation_unit)
      : translation_unit_(translation_unit) {}

  SyntaxNode Build() {
    SyntaxNode root;
    root.kind = NodeKind::kTranslationUnit;
    const auto cursor = clang_getTranslationUnitCursor(translation_unit_);
    for (const auto child : ChildrenOf(cursor)) {
      if (!clang_Location_isFromMainFile(clang_getCursorLocation(child))) {
        continue;
      }
      Append(child, root.children);
    }
    if (!root.children.empty()) {
      root.span.start_line = root.children.front().span.start_line;
      root.span.end_line = root.children.back().span.end_line;
    }
    return root;
  }

private:
  std::vector<TokenText> Tokens(CXCursor cursor) const {
    CXToken *tokens = nullptr;
    unsigned count = 0;
    clang_tokenize(translation_unit_, clang_getCursorExtent(cursor), &tokens,
                   &count);
    std::vector<TokenText> result;
    result.reserve(count);
    for (unsigned i = 0; i < count; ++i) {
      result.push_back(TokenText{
          ToString(clang_getTokenSpelling(translation_unit_, tokens[i])),
          clang_getTokenKind(tokens[i]),
          OffsetOf(clang_getTokenLocation(translation_unit_, tokens[i]))});
    }
    if (tokens != nullptr) {
      clang_disposeTokens(translation_unit_, tokens, count);
    }
    return result;
  }

  std::string BinaryOperatorSpelling(CXCursor cursor,
                                     const std::vector<CXCursor> &children) const {
    if (children.empty()) {
      return {};
    }
    const auto lhs_end =
        OffsetOf(clang_getRangeEnd(clang_getCursorExtent(children.front())));
    for (const auto &token : Tokens(cursor)) {
      if (token.offset >= lhs_end && token.kind == CXToken_Punctuation) {
        return token.spelling;
      }
    }
    return {};
  }

  std::string UnaryOperatorSpelling(CXCursor cursor,
                                    const std::vector<CXCursor> &children) const {
    const auto tokens = Tokens(cursor);
    if (tokens.empty()) {
      return {};
    }
    if (children.empty()) {
      return tokens.front().spelling;
    }
    const auto operand_start =
        OffsetOf(clang_getRangeStart(clang_getCursorExtent(children.front())));
    if (tokens.front().offset < operand_start) {
      return tokens.front().spelling;
    }
    return tokens.back().spelling;
  }

  std::string LiteralSpelling(CXCursor cursor) const {
    const auto tokens = Tokens(cursor);
    return tokens.empty() ? std::string{} : tokens.front().spelling;
  }

  bool HasElseBranch(CXCursor cursor,
                     const std::vector<CXCursor> &children) const {
    if (children.size() < 2) {
      return false;
    }
    const auto then_end = OffsetOf(
        clang_getRangeEnd(clang_getCursorExtent(children[children.size() - 2])));
    const auto else_start = OffsetOf(
        clang_getRangeStart(clang_getCursorExtent(children.back())));
    for (const auto &token : Tokens(cursor)) {
      if (token.kind == CXToken_Keyword && token.spelling == "else" &&
          token.offset >= then_end && token.offset < else_start) {
        return true;
      }
    }
    return false;
  }

  void Append(CXCursor cursor, std::vector<SyntaxNode> &out) const {
    const auto cursor_kind = clang_getCursorKind(cursor);
    const auto children = ChildrenOf(cursor);
    const auto kind = MapCursorKind(cursor_kind);
    if (!kind) {
      for (const auto child : children) {
        Append(child, out);
      }
      return;
    }

    SyntaxNode node;
    node.kind = *kind;
    node.span = LinesOf(cursor);

    switch (*kind) {
    case NodeKind::kBinaryOperator:
      node.spelling = BinaryOperatorSpelling(cursor, children);
      break;
    case NodeKind::kUnaryOperator:
      node.spelling = UnaryOperatorSpelling(cursor, children);
      break;
    case NodeKind::kIntegerLiteral:
    case NodeKind::kFloatingLiteral:
    case NodeKind::kStringLiteral:
    case NodeKind::kCharacterLiteral:
    case NodeKind::kBoolLiteral:
    case NodeKind::kNullLiteral:
      node.spelling = LiteralSpelling(cursor);
      break;
    case NodeKind::kGoto:
      if (!children.empty()) {
        node.spelling = ToString(clang_getCursorSpelling(children.front()));
      }
      break;
    default:
      node.spelling = ToString(clang_getCursorSpelling(cursor));
      break;
    }

    if (*kind == NodeKind::kCall || *kind == NodeKind::kDeclRef ||
        *kind == NodeKind::kMemberRef) {
      const auto referenced = clang_getCursorReferenced(cursor);
      if (!clang_Cursor_isNull(referenced)) {
        const auto referent = MapCursorKind(clang_getCursorKind(referenced));
        if (referent && IsDeclarationKind(*referent)) {
          node.referent = referent;
        }
      }
    }

    if (*kind == NodeKind::kInclude || *kind == NodeKind::kGoto) {
      out.push_back(std::move(node));
      return;
    }

    if (*kind == NodeKind::kIf && HasElseBranch(cursor, children)) {
      for (std::size_t i = 0; i + 1 < children.size(); ++i) {
        Append(children[i], node.children);
      }
      std::vector<SyntaxNode> else_nodes;
      Append(children.back(), else_nodes);
      if (else_nodes.size() == 1) {
        node.children.push_back(std::move(else_nodes.front()));
        node.has_else = true;
      } else if (!else_nodes.empty()) {
        SyntaxNode block;
        block.kind = NodeKind::kCompound;
        block.span = LinesOf(children.back());
        block.children = std::move(else_nodes);
        node.children.push_back(std::move(block));
        node.has_else = true;
      }
      out.push_back(std::move(node));
      return;
    }

    for (const auto child : children) {
      Append(child, node.children);
    }
    out.push_back(std::move(node));
  }

  CXTranslationUnit translation_unit_;
};

std::optional<std::string> MainFileParseError(CXTranslationUnit translation_unit) {
  const auto count = clang_getNumDiagnostics(translation_unit);
  for (unsigned i = 0; i < count; ++i) {
    const auto diagnostic = clang_getDiagnostic(translation_unit, i);
    const auto severity = clang_getDiagnosticSeverity(diagnostic);
    const bool in_main_file = clang_Location_isFromMainFile(
                                  clang_getDiagnosticLocation(diagnostic)) != 0;
    const auto category = ToString(clang_getDiagnosticCategoryText(diagnostic));
    std::optional<std::string> message;
    if (severity >= CXDiagnostic_Error && in_main_file &&
        category == "Parse Issue") {
      message = ToString(clang_formatDiagnostic(
          diagnostic, clang_defaultDiagnosticDisplayOptions()));
    }
    clang_disposeDiagnostic(diagnostic);
    if (message) {
      return message;
    }
  }
  return std::nullopt;
}

std::vector<std::string> NormalizeArgs(const std::vector<std::string> &raw,
                                       const std::filesystem::path &file) {
  std::vector<std::string> args;
  args.reserve(raw.size());
  // raw[0] is the compiler.
  for (std::size_t i = 1; i < raw.size(); ++i) {
    const auto &arg = raw[i];
    if (arg == "-c") {
      continue;
    }
    if (arg == "-o" && i + 1 < raw.size()) {
      ++i;
      continue;
    }
    if (std::filesystem::path(arg).filename() == file.filename()) {
      continue;
    }
    args.push_back(arg);
  }
  return args;
}

// Flags recorded for each file by compile_commands.json, keyed by the
// root-relative path.
std::map<std::string, std::vector<std::string>>
LoadCompileDatabase(const std::filesystem::path &root,
                    const std::filesystem::path &build_directory,
                    const std::vector<std::string> &files) {
  std::map<std::string, std::vector<std::string>> arguments;
  if (!std::filesystem::exists(build_directory / "compile_commands.json")) {
    return arguments;
  }

  CXCompilationDatabase_Error error = CXCompilationDatabase_NoError;
  CXCompilationDatabase database = clang_CompilationDatabase_fromDirectory(
      build_directory.string().c_str(), &error);
  if (error != CXCompilationDatabase_NoError || database == nullptr) {
    return arguments;
  }

  for (const auto &file : files) {
    const auto absolute = (root / file).string();
    CXCompileCommands commands =
        clang_CompilationDatabase_getCompileCommands(database, absolute.c_str());
    if (commands == nullptr) {
      continue;
    }
    if (clang_CompileCommands_getSize(commands) > 0) {
      CXCompileCommand command = clang_CompileCommands_getCommand(commands, 0);
      std::vector<std::string> raw;
      const unsigned count = clang_CompileCommand_getNumArgs(command);
      for (unsigned index = 0; index < count; ++index) {
        raw.push_back(ToString(clang_CompileCommand_getArg(command, index)));
      }
      arguments[file] = NormalizeArgs(raw, std::filesystem::path(file));
    }
    clang_CompileCommands_dispose(commands);
  }
  clang_CompilationDatabase_dispose(database);
  return arguments;
}

} // namespace

ClangSourceLoader::ClangSourceLoader(std::shared_ptr<Logger> logger)
    : logger_(EnsureLogger(std::move(logger))) {}

std::vector<std::string>
ClangSourceLoader::DefaultArguments(const std::filesystem::path &root,
                                    const std::string &relative_path,
                                    const std::vector<std::string> &extra_args) {
  std::vector<std::string> args;
  if (IsCSourceFile(relative_path)) {
    args = {"-x", "c", "-std=c11"};
  } else {
    args = {"-x", "c++", "-std=c++17"};
  }
  args.push_back("-I" + root.string());
  args.push_back("-I" + (root / "include").string());
  args.push_back("-I" + (root / "src").string());
  args.insert(args.end(), extra_args.begin(), extra_args.end());
  return args;
}

ParsedFile ClangSourceLoader::ParseFile(const std::filesystem::path &root,
                                        const std::string &relative_path,
                                        const std::vector<std::string> &args) const {
  ParsedFile parsed;
  parsed.path = relative_path;
  const auto absolute = root / relative_path;

  std::ifstream stream(absolute, std::ios::binary);
  if (!stream) {
    parsed.parse_error = "Failed to read " + absolute.string();
    return parsed;
  }
  const std::string content((std::istreambuf_iterator<char>(stream)),
                            std::istreambuf_iterator<char>());
  parsed.line_count = CountLines(content);

  std::vector<const char *> arg_pointers;
  arg_pointers.reserve(args.size());
  for (const auto &arg : args) {
    arg_pointers.push_back(arg.c_str());
  }

  CXIndex index = clang_createIndex(0, 0);
  CXTranslationUnit translation_unit = nullptr;
  const auto error = clang_parseTranslationUnit2(
      index, absolute.string().c_str(), arg_pointers.data(),
      static_cast<int>(arg_pointers.size()), nullptr, 0,
      CXTranslationUnit_DetailedPreprocessingRecord |
          CXTranslationUnit_KeepGoing,
      &translation_unit);

  if (error != CXError_Success || translation_unit == nullptr) {
    parsed.parse_error = "libclang could not parse " + relative_path +
                         " (error " + std::to_string(error) + ")";
  } else if (const auto parse_error = MainFileParseError(translation_unit)) {
    parsed.parse_error = *parse_error;
  } else {
    SyntaxTreeBuilder builder(translation_unit);
    parsed.root = builder.Build();
  }

  if (translation_unit != nullptr) {
    clang_disposeTranslationUnit(translation_unit);
  }
  clang_disposeIndex(index);
  return parsed;
}

RepositorySnapshot ClangSourceLoader::Load(const AnalysisConfig &config) {
  const auto root = ResolveRootPath(config.root_path);
  const auto started = std::chrono::steady_clock::now();
  const auto files = DiscoverSourceFiles(root, config.paths);

  auto build_directory = std::filesystem::path(config.paths.build_directory);
  if (!build_directory.empty() && build_directory.is_relative()) {
    build_directory = root / build_directory;
  }
  const auto database =
      build_directory.empty()
          ? std::map<std::string, std::vector<std::string>>{}
          : LoadCompileDatabase(root, build_directory, files);

  RepositorySnapshot snapshot;
  snapshot.root_path = root.string();
  snapshot.files.resize(files.size());
  ParallelFor(files.size(), config.workers, [&](std::size_t index) {
    const auto &file = files[index];
    const auto recorded = database.find(file);
    auto args = recorded != database.end()
                    ? recorded->second
                    : DefaultArguments(root, file, config.loader.extra_args);
    if (recorded != database.end()) {
      args.insert(args.end(), config.loader.extra_args.begin(),
                  config.loader.extra_args.end());
    }
    snapshot.files[index] = ParseFile(root, file, args);
    logger_->Log(LogLevel::kDebug, "loader.file.parsed",
                 {{"file", file},
                  {"ok", snapshot.files[index].ParseFailed() ? "false" : "true"},
                  {"compile_commands",
                   recorded != database.end() ? "true" : "false"}});
  });

  const auto failures = std::count_if(
      snapshot.files.begin(), snapshot.files.end(),
      [](const ParsedFile &file) { return file.ParseFailed(); });
  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started)
          .count();
  logger_->Log(LogLevel::kInfo, "loader.complete",
               {{"root", snapshot.root_path},
                {"files", std::to_string(snapshot.files.size())},
                {"parse_failures", std::to_string(failures)},
                {"duration_ms", std::to_string(duration_ms)}});
  return snapshot;
}

} // namespace cq
