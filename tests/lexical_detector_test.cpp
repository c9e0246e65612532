#include <sage/lexical_detector.h>

#include <gtest/gtest.h>

#include <algorithm>
#include <iterator>

namespace sage {
namespace {

std::vector<Issue> WithRule(const std::vector<Issue> &issues,
                            const std::string &rule_id) {
  std::vector<Issue> selected;
  std::copy_if(issues.begin(), issues.end(), std::back_inserter(selected),
               [&](const Issue &issue) { return issue.rule_id == rule_id; });
  return selected;
}

TEST(LexicalDetectorTest, MaskLineCommentKeepsColumns) {
  EXPECT_EQ("let a = 1;          ", MaskLineComment("let a = 1; // a == b"));
  EXPECT_EQ("const url = 'http://x';",
            MaskLineComment("const url = 'http://x';"));
  EXPECT_EQ("f(\"a\\\"//b\")", MaskLineComment("f(\"a\\\"//b\")"));
}

TEST(LexicalDetectorTest, FlagsConsoleLogging) {
  const auto detector = MakeJavaScriptDetector(nullptr, nullptr);
  const auto &lexical = dynamic_cast<const LexicalDetector &>(*detector);

  const auto record =
      lexical.AnalyzeSource("app.js", "function f() {\n  console.log(x);\n}\n");

  const auto found = WithRule(record.issues, "console-log");
  ASSERT_EQ(1u, found.size());
  EXPECT_EQ(2, found[0].location.line_start);
  EXPECT_EQ(3, found[0].location.column_start.value_or(0));
  EXPECT_TRUE(found[0].auto_fixable);
  EXPECT_EQ("javascript", record.language);
}

TEST(LexicalDetectorTest, LooseEqualityButNotStrict) {
  const auto detector = MakeJavaScriptDetector(nullptr, nullptr);
  const auto &lexical = dynamic_cast<const LexicalDetector &>(*detector);

  const auto record = lexical.AnalyzeSource("eq.js",
                                            "if (a == b) {}\n"
                                            "if (a === b) {}\n"
                                            "if (a !== b) {}\n"
                                            "if (a != b) {}\n");

  const auto found = WithRule(record.issues, "loose-equality");
  ASSERT_EQ(2u, found.size());
  EXPECT_EQ(1, found[0].location.line_start);
  EXPECT_EQ(4, found[1].location.line_start);
  EXPECT_EQ(Severity::kMedium, found[0].severity);
}

TEST(LexicalDetectorTest, LooseEqualityColumnsCoverTheOperator) {
  const auto detector = MakeJavaScriptDetector(nullptr, nullptr);
  const auto &lexical = dynamic_cast<const LexicalDetector &>(*detector);

  const auto record = lexical.AnalyzeSource("eq.js",
                                            "if (a == b) {}\n"
                                            "x!=y\n");

  const auto found = WithRule(record.issues, "loose-equality");
  ASSERT_EQ(2u, found.size());
  EXPECT_EQ(7, found[0].location.column_start.value_or(0));
  EXPECT_EQ(8, found[0].location.column_end.value_or(0));
  EXPECT_EQ(2, found[1].location.column_start.value_or(0));
  EXPECT_EQ(3, found[1].location.column_end.value_or(0));
}

TEST(LexicalDetectorTest, CommentedOutCodeIsIgnored) {
  const auto detector = MakeJavaScriptDetector(nullptr, nullptr);
  const auto &lexical = dynamic_cast<const LexicalDetector &>(*detector);

  const auto record = lexical.AnalyzeSource(
      "quiet.js", "// console.log(debug)\nlet x = 1; // var y = 2\n");

  EXPECT_TRUE(record.issues.empty());
}

TEST(LexicalDetectorTest, SnippetShowsOriginalLine) {
  const auto detector = MakeJavaScriptDetector(nullptr, nullptr);
  const auto &lexical = dynamic_cast<const LexicalDetector &>(*detector);

  const auto record =
      lexical.AnalyzeSource("v.js", "var count = 0; // legacy counter\n");

  const auto found = WithRule(record.issues, "var-usage");
  ASSERT_EQ(1u, found.size());
  ASSERT_TRUE(found[0].code_snippet.has_value());
  EXPECT_NE(std::string::npos, found[0].code_snippet->find("legacy counter"));
}

TEST(LexicalDetectorTest, EvalIsASecurityIssue) {
  const auto detector = MakeTypeScriptDetector(nullptr, nullptr);
  const auto &lexical = dynamic_cast<const LexicalDetector &>(*detector);

  const auto record =
      lexical.AnalyzeSource("run.ts", "const out = eval(input);\n");

  const auto found = WithRule(record.issues, "eval-usage");
  ASSERT_EQ(1u, found.size());
  EXPECT_EQ(Severity::kHigh, found[0].severity);
  EXPECT_EQ(Category::kSecurity, found[0].category);
  EXPECT_EQ("typescript", record.language);
}

TEST(LexicalDetectorTest, ExtensionsPerLanguage) {
  const auto javascript = MakeJavaScriptDetector(nullptr, nullptr);
  const auto typescript = MakeTypeScriptDetector(nullptr, nullptr);

  EXPECT_TRUE(javascript->CanAnalyze("ui/app.jsx"));
  EXPECT_TRUE(javascript->CanAnalyze("lib.mjs"));
  EXPECT_TRUE(typescript->CanAnalyze("view.tsx"));
  EXPECT_FALSE(typescript->CanAnalyze("app.js"));
}

TEST(LexicalDetectorTest, CatalogHoldsOnlyItsLanguage) {
  LexicalDetector detector("javascript", {".js"},
                           LexicalRuleDefinitions("javascript"));

  EXPECT_EQ(4u, detector.catalog().size());
  EXPECT_TRUE(detector.catalog().frozen());
  EXPECT_TRUE(detector.catalog().RulesFor("typescript").empty());
}

} // namespace
} // namespace sage
