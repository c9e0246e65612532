#include <sage/python_detector.h>

#include <sage/code_metrics.h>
#include <sage/errors.h>
#include <sage/issue_factory.h>
#include <sage/python_parser.h>
#include <sage/source_reader.h>

#include <algorithm>
#include <iterator>
#include <utility>

namespace sage {
namespace {

using python::Expr;
using python::ExprKind;
using python::Module;
using python::Stmt;
using python::StmtKind;

template <typename Visitor> void WalkExpr(const Expr &expr, Visitor &visit) {
  visit(expr);
  for (const auto &child : expr.children) {
    WalkExpr(child, visit);
  }
}

template <typename StmtVisitor, typename ExprVisitor>
void WalkBody(const std::vector<Stmt> &body, StmtVisitor &on_stmt,
              ExprVisitor &on_expr);

template <typename StmtVisitor, typename ExprVisitor>
void WalkStmt(const Stmt &stmt, StmtVisitor &on_stmt, ExprVisitor &on_expr) {
  on_stmt(stmt);
  if (stmt.value) {
    WalkExpr(*stmt.value, on_expr);
  }
  for (const auto &target : stmt.targets) {
    WalkExpr(target, on_expr);
  }
  for (const auto &extra : stmt.extras) {
    WalkExpr(extra, on_expr);
  }
  for (const auto &parameter : stmt.parameters) {
    if (parameter.default_value) {
      WalkExpr(*parameter.default_value, on_expr);
    }
    if (parameter.annotation) {
      WalkExpr(*parameter.annotation, on_expr);
    }
  }
  WalkBody(stmt.body, on_stmt, on_expr);
  WalkBody(stmt.orelse, on_stmt, on_expr);
  WalkBody(stmt.finalbody, on_stmt, on_expr);
  for (const auto &handler : stmt.handlers) {
    if (handler.type) {
      WalkExpr(*handler.type, on_expr);
    }
    WalkBody(handler.body, on_stmt, on_expr);
  }
  for (const auto &match_case : stmt.cases) {
    if (match_case.guard) {
      WalkExpr(*match_case.guard, on_expr);
    }
    WalkBody(match_case.body, on_stmt, on_expr);
  }
}

template <typename StmtVisitor, typename ExprVisitor>
void WalkBody(const std::vector<Stmt> &body, StmtVisitor &on_stmt,
              ExprVisitor &on_expr) {
  for (const auto &stmt : body) {
    WalkStmt(stmt, on_stmt, on_expr);
  }
}

void CollectFunctions(const std::vector<Stmt> &body, const std::string &prefix,
                      std::vector<PythonFunction> &out) {
  for (const auto &stmt : body) {
    switch (stmt.kind) {
    case StmtKind::kFunctionDef:
      out.push_back(
          PythonFunction{&stmt, prefix + stmt.name, CyclomaticComplexity(stmt)});
      CollectFunctions(stmt.body, "", out);
      break;
    case StmtKind::kClassDef:
      CollectFunctions(stmt.body, prefix + stmt.name + ".", out);
      break;
    default:
      CollectFunctions(stmt.body, prefix, out);
      CollectFunctions(stmt.orelse, prefix, out);
      CollectFunctions(stmt.finalbody, prefix, out);
      for (const auto &handler : stmt.handlers) {
        CollectFunctions(handler.body, prefix, out);
      }
      for (const auto &match_case : stmt.cases) {
        CollectFunctions(match_case.body, prefix, out);
      }
      break;
    }
  }
}

int ExprComplexity(const Expr &expr) {
  int total = 0;
  switch (expr.kind) {
  case ExprKind::kBoolOp:
    total += static_cast<int>(expr.children.size()) - 1;
    break;
  case ExprKind::kIfExp:
    total += 1;
    break;
  case ExprKind::kComprehension:
    // The `for` clause plus each `if` filter; children are target,
    // iterable, then the filters.
    total += 1 + static_cast<int>(expr.children.size()) - 2;
    break;
  default:
    break;
  }
  for (const auto &child : expr.children) {
    total += ExprComplexity(child);
  }
  return total;
}

int BodyComplexity(const std::vector<Stmt> &body);

int OwnExpressionComplexity(const Stmt &stmt) {
  int total = stmt.value ? ExprComplexity(*stmt.value) : 0;
  for (const auto &target : stmt.targets) {
    total += ExprComplexity(target);
  }
  for (const auto &extra : stmt.extras) {
    total += ExprComplexity(extra);
  }
  return total;
}

int StmtComplexity(const Stmt &stmt) {
  switch (stmt.kind) {
  case StmtKind::kFunctionDef:
  case StmtKind::kClassDef:
    return 0;
  case StmtKind::kIf:
    return 1 + OwnExpressionComplexity(stmt) + BodyComplexity(stmt.body) +
           BodyComplexity(stmt.orelse);
  case StmtKind::kWhile:
  case StmtKind::kFor:
    return 1 + (stmt.orelse.empty() ? 0 : 1) + OwnExpressionComplexity(stmt) +
           BodyComplexity(stmt.body) + BodyComplexity(stmt.orelse);
  case StmtKind::kTry: {
    int total = static_cast<int>(stmt.handlers.size()) +
                BodyComplexity(stmt.body) + BodyComplexity(stmt.orelse) +
                BodyComplexity(stmt.finalbody);
    for (const auto &handler : stmt.handlers) {
      total += BodyComplexity(handler.body);
    }
    return total;
  }
  case StmtKind::kMatch: {
    int total = static_cast<int>(stmt.cases.size()) +
                OwnExpressionComplexity(stmt);
    for (const auto &match_case : stmt.cases) {
      if (match_case.guard) {
        total += ExprComplexity(*match_case.guard);
      }
      total += BodyComplexity(match_case.body);
    }
    return total;
  }
  default:
    return OwnExpressionComplexity(stmt) + BodyComplexity(stmt.body);
  }
}

int BodyComplexity(const std::vector<Stmt> &body) {
  int total = 0;
  for (const auto &stmt : body) {
    total += StmtComplexity(stmt);
  }
  return total;
}

bool IsMutableLiteral(const Expr &expr) {
  switch (expr.kind) {
  case ExprKind::kList:
  case ExprKind::kDict:
  case ExprKind::kSet:
  case ExprKind::kListComp:
  case ExprKind::kDictComp:
  case ExprKind::kSetComp:
    return true;
  default:
    return false;
  }
}

bool IsIdentityLiteral(const Expr &expr) {
  return expr.kind == ExprKind::kNumber || expr.kind == ExprKind::kString ||
         expr.kind == ExprKind::kBytes;
}

int CountPositionalParameters(const Stmt &function) {
  return static_cast<int>(std::count_if(
      function.parameters.begin(), function.parameters.end(),
      [](const python::Parameter &parameter) {
        return parameter.kind == python::ParameterKind::kPositional ||
               parameter.kind == python::ParameterKind::kPositionalOnly;
      }));
}

std::vector<Issue> CheckFunctions(const std::string &file_path,
                                  const std::vector<PythonFunction> &functions,
                                  const std::vector<std::string> &lines,
                                  const AnalysisSettings &settings) {
  std::vector<Issue> issues;
  for (const auto &function : functions) {
    const auto &node = *function.node;

    const auto length = node.end_line - node.line;
    if (length > settings.max_function_length) {
      auto issue = NewIssue(file_path, "long_func", node.line, node.end_line);
      issue.title = "Long Function: " + node.name;
      issue.description = "Function has " + std::to_string(length) +
                          " lines, exceeding the recommended " +
                          std::to_string(settings.max_function_length) +
                          " lines";
      issue.severity = Severity::kLow;
      issue.category = Category::kCodeSmell;
      issue.code_snippet = FormatSnippet(lines, node.line, node.end_line);
      issue.suggested_fix = "Consider breaking this function into smaller, "
                            "more focused functions.";
      issues.push_back(std::move(issue));
    }

    const auto parameters = CountPositionalParameters(node);
    if (parameters > settings.max_parameters) {
      auto issue = NewIssue(file_path, "many_params", node.line, node.line);
      issue.title = "Too Many Parameters: " + node.name;
      issue.description = "Function has " + std::to_string(parameters) +
                          " parameters. Consider using a configuration "
                          "object.";
      issue.severity = Severity::kLow;
      issue.category = Category::kCodeSmell;
      issues.push_back(std::move(issue));
    }

    const auto mutable_default = std::find_if(
        node.parameters.begin(), node.parameters.end(),
        [](const python::Parameter &parameter) {
          return parameter.default_value &&
                 IsMutableLiteral(*parameter.default_value);
        });
    if (mutable_default != node.parameters.end()) {
      auto issue = NewIssue(file_path, "mutable_default", node.line, node.line);
      issue.title = "Mutable Default Argument: " + node.name;
      issue.description = "Using mutable objects as default arguments can "
                          "lead to unexpected behavior";
      issue.severity = Severity::kHigh;
      issue.category = Category::kBug;
      issue.code_snippet = FormatSnippet(lines, node.line, node.line);
      issue.suggested_fix = "Use None as default and create the mutable "
                            "object inside the function";
      issue.auto_fixable = true;
      issue.metadata["parameter"] = mutable_default->name;
      issues.push_back(std::move(issue));
    }

    if (function.complexity > settings.max_complexity) {
      auto issue = NewIssue(file_path, "complexity", node.line, node.end_line);
      issue.title = "High Complexity: " + function.qualified_name;
      issue.description = "Cyclomatic complexity of " +
                          std::to_string(function.complexity) +
                          " exceeds threshold of " +
                          std::to_string(settings.max_complexity);
      issue.severity = Severity::kMedium;
      issue.category = Category::kComplexity;
      issue.code_snippet = FormatSnippet(lines, node.line, node.end_line);
      issue.suggested_fix = "Consider breaking this function into smaller, "
                            "more focused functions.";
      issue.metadata["complexity"] = std::to_string(function.complexity);
      issues.push_back(std::move(issue));
    }
  }
  return issues;
}

std::vector<Issue> CheckStatements(const std::string &file_path,
                                   const Module &module,
                                   const std::vector<std::string> &lines) {
  std::vector<Issue> issues;
  auto on_stmt = [&](const Stmt &stmt) {
    if (stmt.kind == StmtKind::kImportFrom) {
      const auto wildcard = std::any_of(
          stmt.aliases.begin(), stmt.aliases.end(),
          [](const python::ImportAlias &alias) { return alias.name == "*"; });
      if (wildcard) {
        auto issue =
            NewIssue(file_path, "wildcard_import", stmt.line, stmt.end_line);
        issue.title = "Wildcard Import";
        issue.description = "Avoid wildcard imports from " + stmt.name +
                            ". Import specific names instead.";
        issue.severity = Severity::kLow;
        issue.category = Category::kBestPractice;
        issues.push_back(std::move(issue));
      }
      return;
    }
    if (stmt.kind != StmtKind::kTry) {
      return;
    }
    for (const auto &handler : stmt.handlers) {
      if (!handler.type) {
        auto issue =
            NewIssue(file_path, "bare_except", handler.line, handler.end_line);
        issue.title = "Bare Except Clause";
        issue.description = "Using bare 'except:' is discouraged. Catch "
                            "specific exceptions instead.";
        issue.severity = Severity::kMedium;
        issue.category = Category::kBestPractice;
        issue.code_snippet =
            FormatSnippet(lines, handler.line, handler.end_line);
        issue.suggested_fix =
            "Replace with 'except Exception:' or catch specific exceptions";
        issue.auto_fixable = true;
        issues.push_back(std::move(issue));
        continue;
      }
      const auto &type = *handler.type;
      if (type.kind == ExprKind::kName &&
          (type.text == "Exception" || type.text == "BaseException")) {
        auto issue =
            NewIssue(file_path, "broad_except", handler.line, handler.end_line);
        issue.title = "Broad Exception Handler";
        issue.description = "Catching '" + type.text +
                            "' hides unrelated errors. Catch the specific "
                            "exceptions you expect.";
        issue.severity = Severity::kLow;
        issue.category = Category::kBestPractice;
        issue.code_snippet =
            FormatSnippet(lines, handler.line, handler.end_line);
        issues.push_back(std::move(issue));
      }
    }
  };

  auto on_expr = [&](const Expr &expr) {
    if (expr.kind != ExprKind::kCompare) {
      return;
    }
    for (std::size_t i = 0; i < expr.operators.size(); ++i) {
      const auto &op = expr.operators[i];
      if (op != "is" && op != "is not") {
        continue;
      }
      if (!IsIdentityLiteral(expr.children[i]) &&
          !IsIdentityLiteral(expr.children[i + 1])) {
        continue;
      }
      auto issue = NewIssue(file_path, "is_literal", expr.line, expr.end_line);
      issue.title = "Identity Check with Literal";
      issue.description = "Use '==' for value comparison, not 'is'";
      issue.severity = Severity::kMedium;
      issue.category = Category::kBug;
      issue.location.column_start = expr.column;
      issue.code_snippet = FormatSnippet(lines, expr.line, expr.end_line);
      issue.suggested_fix =
          op == "is" ? "Replace 'is' with '=='" : "Replace 'is not' with '!='";
      issue.auto_fixable = true;
      issues.push_back(std::move(issue));
      break;
    }
  };

  WalkBody(module.body, on_stmt, on_expr);
  return issues;
}

} // namespace

int CyclomaticComplexity(const python::Stmt &function) {
  return 1 + BodyComplexity(function.body);
}

std::vector<PythonFunction>
CollectPythonFunctions(const python::Module &module) {
  std::vector<PythonFunction> functions;
  CollectFunctions(module.body, "", functions);
  return functions;
}

std::vector<Issue> CheckPythonModule(const std::string &file_path,
                                     const python::Module &module,
                                     const std::vector<std::string> &lines,
                                     const AnalysisSettings &settings) {
  auto issues = CheckFunctions(file_path, CollectPythonFunctions(module),
                               lines, settings);
  auto statement_issues = CheckStatements(file_path, module, lines);
  issues.insert(issues.end(),
                std::make_move_iterator(statement_issues.begin()),
                std::make_move_iterator(statement_issues.end()));
  return issues;
}

Issue MakeSyntaxErrorIssue(const std::string &file_path,
                           const python::SyntaxError &error,
                           const std::vector<std::string> &lines) {
  auto issue = NewIssue(file_path, "syntax", error.line, error.line);
  issue.title = "Python Syntax Error";
  issue.description = error.message;
  issue.severity = Severity::kCritical;
  issue.category = Category::kBug;
  issue.location.column_start = error.column;
  issue.code_snippet = FormatSnippet(lines, error.line, error.line);
  return issue;
}

PythonDetector::PythonDetector(AnalysisSettings settings,
                               std::shared_ptr<const SourceReader> reader,
                               std::shared_ptr<Logger> logger)
    : settings_(settings), reader_(std::move(reader)),
      logger_(EnsureLogger(std::move(logger))) {
  if (!reader_) {
    reader_ = std::make_shared<FileSourceReader>();
  }
}

bool PythonDetector::CanAnalyze(const std::filesystem::path &path) const {
  const auto extension = path.extension().string();
  return extension == ".py" || extension == ".pyw";
}

FileRecord PythonDetector::Analyze(const std::filesystem::path &path) const {
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

FileRecord PythonDetector::AnalyzeSource(const std::string &file_path,
                                         const std::string &content) const {
  FileRecord record;
  record.file_path = file_path;
  record.language = Language();

  const auto lines = SplitLines(content);
  auto metrics = CountLines(lines, CommentStyle::kHash);

  const auto parsed = python::ParsePython(content);
  if (!parsed.ok()) {
    logger_->Log(LogLevel::kInfo, "python.syntax_error",
                 {{"path", file_path},
                  {"line", std::to_string(parsed.error->line)},
                  {"message", parsed.error->message}});
    record.issues.push_back(
        MakeSyntaxErrorIssue(file_path, *parsed.error, lines));
    record.metrics = metrics;
    return record;
  }

  const auto &module = *parsed.module;
  record.issues = CheckPythonModule(file_path, module, lines, settings_);

  std::vector<int> complexities;
  for (const auto &function : CollectPythonFunctions(module)) {
    complexities.push_back(function.complexity);
  }
  ApplyComplexities(metrics, complexities);
  record.metrics = metrics;

  logger_->Log(LogLevel::kDebug, "python.analyzed",
               {{"path", file_path},
                {"issues", std::to_string(record.issues.size())}});
  return record;
}

} // namespace sage
