#pragma once

#include <optional>
#include <string>
#include <vector>

namespace sage {
namespace python {

enum class ExprKind {
  kName,
  kNumber,
  kString,
  kBytes,
  kConstant, // None, True, False
  kEllipsis,
  kTuple,
  kList,
  kSet,
  kDict,
  kListComp,
  kSetComp,
  kDictComp,
  kGeneratorExp,
  kComprehension, // one `for ... in ... if ...` clause
  kBoolOp,
  kBinOp,
  kUnaryOp,
  kCompare,
  kIfExp,
  kLambda,
  kCall,
  kKeyword,
  kAttribute,
  kSubscript,
  kSlice,
  kStarred,
  kNamedExpr,
  kAwait,
  kYield,
  kYieldFrom,
  kMissing // absent slot, e.g. the start of `a[:2]` or a `{**x}` key
};

// Child layout per kind:
//   kDict            key0, value0, key1, value1, ... (kMissing key for **x)
//   k*Comp, kGeneratorExp   element(s) first, then kComprehension clauses
//   kComprehension   target, iterable, conditions...
//   kBoolOp          operands; `text` is "and" or "or"
//   kCompare         operands; `operators` holds one entry per pair
//   kIfExp           body, test, orelse
//   kLambda          parameter defaults..., body (always last)
//   kCall            callee, then arguments / kKeyword / kStarred
//   kAttribute       value; `text` is the attribute name
//   kSubscript       value, index
//   kSlice           lower, upper, step (each possibly kMissing)
struct Expr {
  ExprKind kind = ExprKind::kMissing;
  int line = 0;
  int column = 0;
  int end_line = 0;
  std::string text;
  std::vector<std::string> operators;
  std::vector<Expr> children;
  bool is_async = false;
};

enum class ParameterKind {
  kPositionalOnly,
  kPositional,
  kVarPositional,
  kKeywordOnly,
  kVarKeyword
};

struct Parameter {
  std::string name;
  ParameterKind kind = ParameterKind::kPositional;
  std::optional<Expr> default_value;
  std::optional<Expr> annotation;
  int line = 0;
};

struct ImportAlias {
  std::string name;
  std::string as_name;
};

enum class StmtKind {
  kExpr,
  kAssign,
  kAugAssign,
  kAnnAssign,
  kTypeAlias,
  kPass,
  kBreak,
  kContinue,
  kReturn,
  kRaise,
  kGlobal,
  kNonlocal,
  kDel,
  kAssert,
  kImport,
  kImportFrom,
  kIf,
  kWhile,
  kFor,
  kWith,
  kTry,
  kFunctionDef,
  kClassDef,
  kMatch
};

struct Stmt;

struct ExceptHandler {
  int line = 0;
  int end_line = 0;
  std::optional<Expr> type;
  std::string name;
  bool is_group = false; // except*
  std::vector<Stmt> body;
};

struct MatchCase {
  int line = 0;
  int end_line = 0;
  std::optional<Expr> guard;
  std::vector<Stmt> body;
};

struct Stmt {
  StmtKind kind = StmtKind::kPass;
  int line = 0;
  int column = 0;
  int end_line = 0;
  bool is_async = false;

  // Function or class name, `from` module, or augmented operator.
  std::string name;
  // Value, test, iterable, return value, raised exception or subject.
  std::optional<Expr> value;
  // Assignment / loop / `as` targets, deleted names.
  std::vector<Expr> targets;
  // Secondary expressions: with-item managers, raise cause, assert message,
  // annotations, class bases, decorators.
  std::vector<Expr> extras;

  std::vector<Parameter> parameters;
  std::vector<ImportAlias> aliases;
  std::vector<std::string> names;

  std::vector<Stmt> body;
  std::vector<Stmt> orelse;
  std::vector<Stmt> finalbody;
  std::vector<ExceptHandler> handlers;
  std::vector<MatchCase> cases;
};

struct Module {
  std::vector<Stmt> body;
};

struct SyntaxError {
  int line = 1;
  int column = 1;
  std::string message;
};

} // namespace python
} // namespace sage
