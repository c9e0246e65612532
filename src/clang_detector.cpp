#include <sage/clang_detector.h>

#include <sage/code_metrics.h>
#include <sage/errors.h>
#include <sage/issue_factory.h>
#include <sage/source_reader.h>

#include <clang-c/Index.h>

#include <algorithm>
#include <optional>
#include <utility>

namespace sage {
namespace {

std::string ToString(CXString value) {
  std::string text;
  if (const auto *cstr = clang_getCString(value); cstr != nullptr) {
    text = cstr;
  }
  clang_disposeString(value);
  return text;
}

int LineOf(CXSourceLocation location) {
  unsigned line = 0;
  clang_getSpellingLocation(location, nullptr, &line, nullptr, nullptr);
  return static_cast<int>(line);
}

unsigned OffsetOf(CXSourceLocation location) {
  unsigned offset = 0;
  clang_getSpellingLocation(location, nullptr, nullptr, nullptr, &offset);
  return offset;
}

bool InMainFile(CXCursor cursor) {
  return clang_Location_isFromMainFile(clang_getCursorLocation(cursor)) != 0;
}

bool IsFunctionKind(CXCursorKind kind) {
  return kind == CXCursor_FunctionDecl || kind == CXCursor_CXXMethod ||
         kind == CXCursor_Constructor || kind == CXCursor_Destructor ||
         kind == CXCursor_ConversionFunction ||
         kind == CXCursor_FunctionTemplate;
}

bool IsRecordKind(CXCursorKind kind) {
  return kind == CXCursor_ClassDecl || kind == CXCursor_StructDecl ||
         kind == CXCursor_UnionDecl || kind == CXCursor_ClassTemplate ||
         kind == CXCursor_ClassTemplatePartialSpecialization;
}

std::string FunctionName(CXCursor cursor) {
  const auto name = ToString(clang_getCursorSpelling(cursor));
  const auto parent = clang_getCursorSemanticParent(cursor);
  if (clang_Cursor_isNull(parent) ||
      !IsRecordKind(clang_getCursorKind(parent))) {
    return name;
  }
  return ToString(clang_getCursorSpelling(parent)) + "::" + name;
}

CXCursor FirstChild(CXCursor cursor) {
  CXCursor first = clang_getNullCursor();
  clang_visitChildren(
      cursor,
      [](CXCursor child, CXCursor, CXClientData data) {
        *static_cast<CXCursor *>(data) = child;
        return CXChildVisit_Break;
      },
      &first);
  return first;
}

bool HasChildOfKind(CXCursor cursor, CXCursorKind wanted) {
  struct Search {
    CXCursorKind kind;
    bool found;
  } search{wanted, false};
  clang_visitChildren(
      cursor,
      [](CXCursor child, CXCursor, CXClientData data) {
        auto *state = static_cast<Search *>(data);
        if (clang_getCursorKind(child) == state->kind) {
          state->found = true;
          return CXChildVisit_Break;
        }
        return CXChildVisit_Continue;
      },
      &search);
  return search.found;
}

int CountParameters(CXCursor cursor) {
  const auto count = clang_Cursor_getNumArguments(cursor);
  if (count >= 0) {
    return count;
  }
  int parameters = 0;
  clang_visitChildren(
      cursor,
      [](CXCursor child, CXCursor, CXClientData data) {
        if (clang_getCursorKind(child) == CXCursor_ParmDecl) {
          ++*static_cast<int *>(data);
        }
        return CXChildVisit_Continue;
      },
      &parameters);
  return parameters;
}

// libclang exposes no portable operator query, so the operator is the first
// punctuation token after the left operand.
std::string BinaryOperatorSpelling(CXTranslationUnit unit, CXCursor cursor) {
  const auto lhs = FirstChild(cursor);
  if (clang_Cursor_isNull(lhs)) {
    return {};
  }
  const auto lhs_end = OffsetOf(clang_getRangeEnd(clang_getCursorExtent(lhs)));

  CXToken *tokens = nullptr;
  unsigned count = 0;
  clang_tokenize(unit, clang_getCursorExtent(cursor), &tokens, &count);
  std::string spelling;
  for (unsigned i = 0; i < count; ++i) {
    if (clang_getTokenKind(tokens[i]) != CXToken_Punctuation) {
      continue;
    }
    if (OffsetOf(clang_getTokenLocation(unit, tokens[i])) < lhs_end) {
      continue;
    }
    spelling = ToString(clang_getTokenSpelling(unit, tokens[i]));
    break;
  }
  clang_disposeTokens(unit, tokens, count);
  return spelling;
}

class ComplexityCounter {
public:
  explicit ComplexityCounter(CXTranslationUnit unit) : unit_(unit) {}

  int Count(CXCursor function) {
    complexity_ = 1;
    VisitChildren(function);
    return complexity_;
  }

private:
  void Traverse(CXCursor cursor) {
    const auto kind = clang_getCursorKind(cursor);
    if (IsFunctionKind(kind)) {
      return;
    }
    switch (kind) {
    case CXCursor_IfStmt:
    case CXCursor_ForStmt:
    case CXCursor_CXXForRangeStmt:
    case CXCursor_WhileStmt:
    case CXCursor_DoStmt:
    case CXCursor_CaseStmt:
    case CXCursor_CXXCatchStmt:
    case CXCursor_ConditionalOperator:
      ++complexity_;
      break;
    case CXCursor_BinaryOperator: {
      const auto op = BinaryOperatorSpelling(unit_, cursor);
      if (op == "&&" || op == "||") {
        ++complexity_;
      }
      break;
    }
    default:
      break;
    }
    VisitChildren(cursor);
  }

  void VisitChildren(CXCursor cursor) {
    clang_visitChildren(
        cursor,
        [](CXCursor child, CXCursor, CXClientData data) {
          static_cast<ComplexityCounter *>(data)->Traverse(child);
          return CXChildVisit_Continue;
        },
        this);
  }

  CXTranslationUnit unit_;
  int complexity_ = 1;
};

struct FunctionFacts {
  std::string name;
  int line_start = 0;
  int line_end = 0;
  int parameters = 0;
  int complexity = 1;
};

struct SpanFacts {
  int line_start = 0;
  int line_end = 0;
  std::string name;
};

class DeclarationScanner {
public:
  explicit DeclarationScanner(CXTranslationUnit unit) : unit_(unit) {}

  void Scan() { VisitChildren(clang_getTranslationUnitCursor(unit_)); }

  const std::vector<FunctionFacts> &functions() const { return functions_; }
  const std::vector<SpanFacts> &catch_alls() const { return catch_alls_; }
  const std::vector<SpanFacts> &using_directives() const {
    return using_directives_;
  }

private:
  void Traverse(CXCursor cursor) {
    if (!InMainFile(cursor)) {
      return;
    }
    const auto kind = clang_getCursorKind(cursor);
    if (IsFunctionKind(kind) && clang_isCursorDefinition(cursor) != 0) {
      AddFunction(cursor);
    } else if (kind == CXCursor_CXXCatchStmt &&
               !HasChildOfKind(cursor, CXCursor_VarDecl)) {
      catch_alls_.push_back(Span(cursor, "..."));
    } else if (kind == CXCursor_UsingDirective &&
               clang_getCursorKind(clang_getCursorLexicalParent(cursor)) ==
                   CXCursor_TranslationUnit) {
      const auto nominated = clang_getCursorReferenced(cursor);
      using_directives_.push_back(
          Span(cursor, ToString(clang_getCursorSpelling(nominated))));
    }
    VisitChildren(cursor);
  }

  static SpanFacts Span(CXCursor cursor, std::string name) {
    const auto extent = clang_getCursorExtent(cursor);
    return SpanFacts{LineOf(clang_getRangeStart(extent)),
                     LineOf(clang_getRangeEnd(extent)), std::move(name)};
  }

  void AddFunction(CXCursor cursor) {
    const auto extent = clang_getCursorExtent(cursor);
    FunctionFacts facts;
    facts.name = FunctionName(cursor);
    facts.line_start = LineOf(clang_getCursorLocation(cursor));
    facts.line_end = LineOf(clang_getRangeEnd(extent));
    facts.parameters = CountParameters(cursor);
    facts.complexity = ComplexityCounter(unit_).Count(cursor);
    functions_.push_back(std::move(facts));
  }

  void VisitChildren(CXCursor cursor) {
    clang_visitChildren(
        cursor,
        [](CXCursor child, CXCursor, CXClientData data) {
          static_cast<DeclarationScanner *>(data)->Traverse(child);
          return CXChildVisit_Continue;
        },
        this);
  }

  CXTranslationUnit unit_;
  std::vector<FunctionFacts> functions_;
  std::vector<SpanFacts> catch_alls_;
  std::vector<SpanFacts> using_directives_;
};

struct ParseDiagnostic {
  int line = 1;
  int column = 1;
  std::string message;
};

std::optional<ParseDiagnostic> FirstParseError(CXTranslationUnit unit) {
  const auto count = clang_getNumDiagnostics(unit);
  for (unsigned i = 0; i < count; ++i) {
    const auto diagnostic = clang_getDiagnostic(unit, i);
    const auto severity = clang_getDiagnosticSeverity(diagnostic);
    const auto category = ToString(clang_getDiagnosticCategoryText(diagnostic));
    const auto location = clang_getDiagnosticLocation(diagnostic);
    std::optional<ParseDiagnostic> found;
    if ((severity == CXDiagnostic_Error || severity == CXDiagnostic_Fatal) &&
        category == "Parse Issue" &&
        clang_Location_isFromMainFile(location) != 0) {
      unsigned line = 0;
      unsigned column = 0;
      clang_getSpellingLocation(location, nullptr, &line, &column, nullptr);
      found = ParseDiagnostic{static_cast<int>(line), static_cast<int>(column),
                              ToString(clang_getDiagnosticSpelling(diagnostic))};
    }
    clang_disposeDiagnostic(diagnostic);
    if (found) {
      return found;
    }
  }
  return std::nullopt;
}

struct IndexDeleter {
  void operator()(void *index) const { clang_disposeIndex(index); }
};

struct TranslationUnitDeleter {
  void operator()(CXTranslationUnit unit) const {
    clang_disposeTranslationUnit(unit);
  }
};

using IndexHandle = std::unique_ptr<void, IndexDeleter>;
using TranslationUnitHandle =
    std::unique_ptr<CXTranslationUnitImpl, TranslationUnitDeleter>;

} // namespace

ClangDetector::ClangDetector(std::string language,
                             std::vector<std::string> extensions,
                             AnalysisSettings settings,
                             std::shared_ptr<const SourceReader> reader,
                             std::shared_ptr<Logger> logger)
    : language_(std::move(language)), extensions_(std::move(extensions)),
      settings_(settings), reader_(std::move(reader)),
      logger_(EnsureLogger(std::move(logger))) {
  if (!reader_) {
    reader_ = std::make_shared<FileSourceReader>();
  }
}

bool ClangDetector::CanAnalyze(const std::filesystem::path &path) const {
  const auto extension = path.extension().string();
  return std::find(extensions_.begin(), extensions_.end(), extension) !=
         extensions_.end();
}

FileRecord ClangDetector::Analyze(const std::filesystem::path &path) const {
  std::string content;
  try {
    content = reader_->Read(path);
  } catch (const FileAccessError &error) {
    logger_->Log(LogLevel::kWarn, "detector.read_failed",
                 {{"path", path.string()}, {"error", error.what()}});
    return MakeFailedRecord(path.string(), Language(), error.what());
  }
  return AnalyzeSource(path.string(), content);
}

std::vector<std::string> ClangDetector::CompilerArguments() const {
  if (language_ == "c") {
    return {"-x", "c", "-std=c11", "-fsyntax-only"};
  }
  return {"-x", "c++", "-std=c++17", "-fsyntax-only"};
}

FileRecord ClangDetector::AnalyzeSource(const std::string &file_path,
                                        const std::string &content) const {
  const auto arguments = CompilerArguments();
  std::vector<const char *> argument_pointers;
  argument_pointers.reserve(arguments.size());
  for (const auto &argument : arguments) {
    argument_pointers.push_back(argument.c_str());
  }

  CXUnsavedFile unsaved{file_path.c_str(), content.data(),
                        static_cast<unsigned long>(content.size())};

  IndexHandle index(clang_createIndex(0, 0));
  CXTranslationUnit raw_unit = nullptr;
  const auto error = clang_parseTranslationUnit2(
      index.get(), file_path.c_str(), argument_pointers.data(),
      static_cast<int>(argument_pointers.size()), &unsaved, 1,
      CXTranslationUnit_KeepGoing, &raw_unit);
  TranslationUnitHandle unit(raw_unit);
  if (error != CXError_Success || !unit) {
    logger_->Log(LogLevel::kWarn, "clang.parse_failed",
                 {{"path", file_path}, {"code", std::to_string(static_cast<int>(error))}});
    return MakeFailedRecord(file_path, Language(),
                            "libclang could not parse the file (error " +
                                std::to_string(static_cast<int>(error)) + ")");
  }

  FileRecord record;
  record.file_path = file_path;
  record.language = Language();
  const auto lines = SplitLines(content);

  if (const auto parse_error = FirstParseError(unit.get())) {
    auto issue =
        NewIssue(file_path, "syntax", parse_error->line, parse_error->line);
    issue.title = language_ == "c" ? "C Syntax Error" : "C++ Syntax Error";
    issue.description = parse_error->message;
    issue.severity = Severity::kCritical;
    issue.category = Category::kBug;
    issue.location.column_start = parse_error->column;
    issue.code_snippet =
        FormatSnippet(lines, parse_error->line, parse_error->line);
    record.issues.push_back(std::move(issue));
    logger_->Log(LogLevel::kInfo, "clang.syntax_error",
                 {{"path", file_path},
                  {"line", std::to_string(parse_error->line)},
                  {"message", parse_error->message}});
    record.metrics = CountLines(lines, CommentStyle::kCFamily);
    return record;
  }

  DeclarationScanner scanner(unit.get());
  scanner.Scan();

  std::vector<int> complexities;
  for (const auto &function : scanner.functions()) {
    complexities.push_back(function.complexity);

    const auto length = function.line_end - function.line_start;
    if (length > settings_.max_function_length) {
      auto issue = NewIssue(file_path, "long_func", function.line_start,
                            function.line_end);
      issue.title = "Long Function: " + function.name;
      issue.description = "Function has " + std::to_string(length) +
                          " lines, exceeding the recommended " +
                          std::to_string(settings_.max_function_length) +
                          " lines";
      issue.severity = Severity::kLow;
      issue.category = Category::kCodeSmell;
      issue.code_snippet =
          FormatSnippet(lines, function.line_start, function.line_start);
      issue.suggested_fix = "Split the function into smaller helpers.";
      record.issues.push_back(std::move(issue));
    }

    if (function.parameters > settings_.max_parameters) {
      auto issue = NewIssue(file_path, "many_params", function.line_start,
                            function.line_start);
      issue.title = "Too Many Parameters: " + function.name;
      issue.description = "Function has " +
                          std::to_string(function.parameters) +
                          " parameters. Consider grouping them in a struct.";
      issue.severity = Severity::kLow;
      issue.category = Category::kCodeSmell;
      record.issues.push_back(std::move(issue));
    }

    if (function.complexity > settings_.max_complexity) {
      auto issue = NewIssue(file_path, "complexity", function.line_start,
                            function.line_end);
      issue.title = "High Complexity: " + function.name;
      issue.description = "Cyclomatic complexity of " +
                          std::to_string(function.complexity) +
                          " exceeds threshold of " +
                          std::to_string(settings_.max_complexity);
      issue.severity = Severity::kMedium;
      issue.category = Category::kComplexity;
      issue.suggested_fix = "Split the function into smaller helpers.";
      issue.metadata["complexity"] = std::to_string(function.complexity);
      record.issues.push_back(std::move(issue));
    }
  }

  for (const auto &handler : scanner.catch_alls()) {
    auto issue = NewIssue(file_path, "catch_all", handler.line_start,
                          handler.line_end);
    issue.title = "Catch-All Handler";
    issue.description = "'catch (...)' swallows every exception type. Catch "
                        "the specific exceptions you can handle.";
    issue.severity = Severity::kMedium;
    issue.category = Category::kBestPractice;
    issue.code_snippet =
        FormatSnippet(lines, handler.line_start, handler.line_end);
    issue.suggested_fix = "Catch const std::exception& or a narrower type";
    record.issues.push_back(std::move(issue));
  }

  for (const auto &directive : scanner.using_directives()) {
    auto issue = NewIssue(file_path, "using_namespace", directive.line_start,
                          directive.line_end);
    issue.title = "Using Namespace Directive";
    issue.description = "'using namespace " + directive.name +
                        "' at file scope pulls every name into the global "
                        "namespace.";
    issue.severity = Severity::kLow;
    issue.category = Category::kBestPractice;
    issue.suggested_fix = "Qualify names or add using-declarations for the "
                          "names you need";
    record.issues.push_back(std::move(issue));
  }

  auto metrics = CountLines(lines, CommentStyle::kCFamily);
  ApplyComplexities(metrics, complexities);
  record.metrics = metrics;

  logger_->Log(LogLevel::kDebug, "clang.analyzed",
               {{"path", file_path},
                {"issues", std::to_string(record.issues.size())}});
  return record;
}

std::unique_ptr<Detector>
MakeCDetector(const AnalysisSettings &settings,
              std::shared_ptr<const SourceReader> reader,
              std::shared_ptr<Logger> logger) {
  return std::make_unique<ClangDetector>("c", std::vector<std::string>{".c"},
                                         settings, std::move(reader),
                                         std::move(logger));
}

std::unique_ptr<Detector>
MakeCppDetector(const AnalysisSettings &settings,
                std::shared_ptr<const SourceReader> reader,
                std::shared_ptr<Logger> logger) {
  return std::make_unique<ClangDetector>(
      "cpp",
      std::vector<std::string>{".cc", ".cpp", ".cxx", ".c++", ".h", ".hh",
                               ".hpp", ".hxx"},
      settings, std::move(reader), std::move(logger));
}

} // namespace sage
