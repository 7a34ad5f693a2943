#include <cq/ast_normalizer.h>
#include <cq/duplication_detector.h>

#include <gtest/gtest.h>

#include "test_support/syntax_builder.h"

namespace cq {
namespace {

using test::AccumulateFunction;
using test::AccumulateNames;
using test::MakeFile;

std::vector<std::uint64_t> Codes(const NormalizedFile &file) {
  std::vector<std::uint64_t> codes;
  for (const auto &token : file.tokens) {
    codes.push_back(TokenCode(token));
  }
  return codes;
}

TEST(AstNormalizerTest, ModuleIdDropsExtension) {
  EXPECT_EQ(ModuleIdForPath("src/core/parser.cpp"), "src/core/parser");
  EXPECT_EQ(ModuleIdForPath("include/core/parser.h"), "include/core/parser");
  EXPECT_EQ(ModuleIdForPath("main.c"), "main");
}

TEST(AstNormalizerTest, CanonicalizesIdentifiersByRole) {
  AccumulateNames renamed;
  renamed.name = "sum_evens";
  renamed.limit = "bound";
  renamed.step = "delta";
  renamed.total = "acc";
  renamed.index = "i";

  const AstNormalizer normalizer;
  const auto original = normalizer.Normalize(
      MakeFile("a.cpp", {AccumulateFunction({}, 1)}, 12));
  const auto copy = normalizer.Normalize(
      MakeFile("b.cpp", {AccumulateFunction(renamed, 1)}, 12));

  ASSERT_FALSE(original.tokens.empty());
  EXPECT_EQ(Codes(original), Codes(copy));
  EXPECT_EQ(original.tokens.front().display, "accumulate");
  EXPECT_EQ(copy.tokens.front().display, "sum_evens");
}

TEST(AstNormalizerTest, AssignsRolesFromReferents) {
  const auto file = MakeFile(
      "roles.cpp",
      {test::Function("run", 1, 3, {test::Parameter("count", 1)},
                      {test::Call("helper", 2,
                                  {test::Ref("count", NodeKind::kParameter, 2),
                                   test::Ref("global", NodeKind::kVariable, 2)})})},
      3);
  const auto normalized = AstNormalizer().Normalize(file);

  std::vector<IdentifierRole> roles;
  for (const auto &token : normalized.tokens) {
    roles.push_back(token.role);
  }
  EXPECT_EQ(roles, (std::vector<IdentifierRole>{
                       IdentifierRole::kFunction, IdentifierRole::kParameter,
                       IdentifierRole::kNone, IdentifierRole::kFunction,
                       IdentifierRole::kParameter, IdentifierRole::kVariable}));
}

TEST(AstNormalizerTest, LiteralValuesDoNotAffectHashingButOperatorsDo) {
  const auto with_literal = [](const std::string &value, const std::string &op) {
    return MakeFile("x.cpp",
                    {test::Function("f", 1, 1, {},
                                    {test::Return(1, {test::Binary(
                                                         op, test::Literal(value, 1),
                                                         test::Literal("1", 1))})})},
                    1);
  };
  const AstNormalizer normalizer;
  const auto one = normalizer.Normalize(with_literal("41", "+"));
  const auto two = normalizer.Normalize(with_literal("99", "+"));
  const auto three = normalizer.Normalize(with_literal("41", "-"));

  EXPECT_EQ(Codes(one), Codes(two));
  EXPECT_NE(Codes(one), Codes(three));
}

TEST(AstNormalizerTest, CollectsIncludesAsImportsOnly) {
  const auto file = MakeFile("src/app.cpp",
                             {test::Include("core/model.h", 1),
                              test::Include("vector", 2),
                              test::Function("main", 4, 4, {}, {})},
                             4);
  const auto normalized = AstNormalizer().Normalize(file);

  ASSERT_EQ(normalized.imports.size(), 2u);
  EXPECT_EQ(normalized.imports[0].spelling, "core/model.h");
  EXPECT_EQ(normalized.imports[0].line, 1u);
  EXPECT_EQ(normalized.imports[1].spelling, "vector");
  for (const auto &token : normalized.tokens) {
    EXPECT_NE(token.kind, NodeKind::kInclude);
  }
  EXPECT_EQ(normalized.module_id, "src/app");
}

TEST(AstNormalizerTest, ParseFailureYieldsNoTokens) {
  const auto normalized =
      AstNormalizer().Normalize(test::FailedFile("broken.cpp", "expected ';'"));

  EXPECT_TRUE(normalized.parse_failed);
  EXPECT_EQ(normalized.parse_error, "expected ';'");
  EXPECT_TRUE(normalized.tokens.empty());
}

TEST(AstNormalizerTest, NormalizeAllKeepsInputOrder) {
  std::vector<ParsedFile> files;
  for (int i = 0; i < 12; ++i) {
    files.push_back(MakeFile("file" + std::to_string(i) + ".cpp",
                             {AccumulateFunction({}, 1)}, 12));
  }
  const auto normalized = AstNormalizer().NormalizeAll(files, 4);

  ASSERT_EQ(normalized.size(), files.size());
  for (std::size_t i = 0; i < files.size(); ++i) {
    EXPECT_EQ(normalized[i].path, files[i].path);
  }
}

} // namespace
} // namespace cq
