#include <sage/python_parser.h>

#include <sage/python_lexer.h>

#include <algorithm>
#include <array>
#include <initializer_list>
#include <string>
#include <utility>
#include <vector>

namespace sage {
namespace python {
namespace {

constexpr std::array<std::string_view, 13> kAugmentedOperators = {
    "+=", "-=", "*=", "/=", "//=", "%=", "@=",
    "&=", "|=", "^=", ">>=", "<<=", "**="};

// Bracket nesting is already capped by the lexer; this bounds the remaining
// recursion (unary chains, lambdas, conditional chains).
constexpr int kMaxExpressionDepth = 1000;

constexpr std::array<std::string_view, 6> kComparisonOperators = {
    "==", "!=", "<", "<=", ">", ">="};

bool IsAssignable(const Expr &target) {
  switch (target.kind) {
  case ExprKind::kName:
  case ExprKind::kAttribute:
  case ExprKind::kSubscript:
    return true;
  case ExprKind::kStarred:
    return target.text == "*" && !target.children.empty() &&
           IsAssignable(target.children.front());
  case ExprKind::kTuple:
  case ExprKind::kList:
    return std::all_of(target.children.begin(), target.children.end(),
                       [](const Expr &child) { return IsAssignable(child); });
  default:
    return false;
  }
}

std::string DescribeTarget(const Expr &target) {
  switch (target.kind) {
  case ExprKind::kNumber:
  case ExprKind::kString:
  case ExprKind::kBytes:
  case ExprKind::kConstant:
  case ExprKind::kEllipsis:
    return "literal";
  case ExprKind::kCall:
    return "function call";
  case ExprKind::kCompare:
    return "comparison";
  case ExprKind::kLambda:
    return "lambda";
  default:
    return "expression";
  }
}

class Parser {
public:
  explicit Parser(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

  Module ParseModule() {
    Module module;
    while (Peek().kind != TokenKind::kEndMarker) {
      if (Peek().kind == TokenKind::kNewline) {
        Advance();
        continue;
      }
      ParseStatementInto(module.body);
    }
    return module;
  }

private:
  class NestingGuard {
  public:
    NestingGuard(Parser &parser, const Token &token) : parser_(parser) {
      if (++parser_.depth_ > kMaxExpressionDepth) {
        parser_.Fail(token, "expression is too deeply nested");
      }
    }
    ~NestingGuard() { --parser_.depth_; }

    NestingGuard(const NestingGuard &) = delete;
    NestingGuard &operator=(const NestingGuard &) = delete;

  private:
    Parser &parser_;
  };

  // ---- token helpers -----------------------------------------------------

  const Token &Peek(std::size_t ahead = 0) const {
    const auto index = std::min(index_ + ahead, tokens_.size() - 1);
    return tokens_[index];
  }

  const Token &Advance() {
    const auto &token = tokens_[std::min(index_, tokens_.size() - 1)];
    if (token.kind != TokenKind::kNewline &&
        token.kind != TokenKind::kIndent &&
        token.kind != TokenKind::kDedent &&
        token.kind != TokenKind::kEndMarker) {
      last_end_line_ = token.end_line;
    }
    if (index_ < tokens_.size() - 1) {
      ++index_;
    }
    return token;
  }

  bool AtOperator(std::string_view op, std::size_t ahead = 0) const {
    const auto &token = Peek(ahead);
    return token.kind == TokenKind::kOperator && token.text == op;
  }

  bool AtKeyword(std::string_view word, std::size_t ahead = 0) const {
    const auto &token = Peek(ahead);
    return token.kind == TokenKind::kName && token.text == word;
  }

  bool AtKind(TokenKind kind) const { return Peek().kind == kind; }

  bool AtStatementEnd() const {
    return AtKind(TokenKind::kNewline) || AtKind(TokenKind::kEndMarker) ||
           AtOperator(";");
  }

  bool StartsExpression() const {
    const auto &token = Peek();
    switch (token.kind) {
    case TokenKind::kNumber:
    case TokenKind::kString:
      return true;
    case TokenKind::kName:
      return !IsHardKeyword(token.text) || token.text == "None" ||
             token.text == "True" || token.text == "False" ||
             token.text == "not" || token.text == "lambda" ||
             token.text == "await";
    case TokenKind::kOperator:
      return token.text == "(" || token.text == "[" || token.text == "{" ||
             token.text == "-" || token.text == "+" || token.text == "~" ||
             token.text == "*" || token.text == "...";
    default:
      return false;
    }
  }

  [[noreturn]] void Fail(const Token &token, std::string message) const {
    if (token.kind == TokenKind::kIndent) {
      message = "unexpected indent";
    }
    throw SyntaxErrorException(
        SyntaxError{token.line, token.column, std::move(message)});
  }

  void Expect(std::string_view op) {
    if (!AtOperator(op)) {
      Fail(Peek(), "expected '" + std::string(op) + "'");
    }
    Advance();
  }

  void ExpectKeyword(std::string_view word) {
    if (!AtKeyword(word)) {
      Fail(Peek(), "expected '" + std::string(word) + "'");
    }
    Advance();
  }

  std::string ExpectName() {
    const auto &token = Peek();
    if (token.kind != TokenKind::kName || IsHardKeyword(token.text)) {
      Fail(token, "invalid syntax");
    }
    return Advance().text;
  }

  void ExpectNewline() {
    if (AtKind(TokenKind::kEndMarker)) {
      return;
    }
    if (!AtKind(TokenKind::kNewline)) {
      Fail(Peek(), "invalid syntax");
    }
    Advance();
  }

  Expr MakeExpr(ExprKind kind, const Token &at) const {
    Expr expr;
    expr.kind = kind;
    expr.line = at.line;
    expr.column = at.column;
    expr.end_line = at.end_line;
    return expr;
  }

  Expr Finish(Expr expr) const {
    expr.end_line = std::max(expr.line, last_end_line_);
    return expr;
  }

  Stmt MakeStmt(StmtKind kind, const Token &at) const {
    Stmt stmt;
    stmt.kind = kind;
    stmt.line = at.line;
    stmt.column = at.column;
    return stmt;
  }

  Stmt Close(Stmt stmt) const {
    stmt.end_line = std::max(stmt.line, last_end_line_);
    return stmt;
  }

  // ---- statements --------------------------------------------------------

  void ParseStatementInto(std::vector<Stmt> &out) {
    const auto &token = Peek();
    if (token.kind == TokenKind::kIndent) {
      Fail(token, "unexpected indent");
    }
    if (token.kind == TokenKind::kOperator && token.text == "@") {
      out.push_back(ParseDecorated());
      return;
    }
    if (token.kind == TokenKind::kName) {
      if (token.text == "if") {
        out.push_back(ParseIf());
        return;
      }
      if (token.text == "while") {
        out.push_back(ParseWhile());
        return;
      }
      if (token.text == "for") {
        out.push_back(ParseFor(Peek(), false));
        return;
      }
      if (token.text == "try") {
        out.push_back(ParseTry());
        return;
      }
      if (token.text == "with") {
        out.push_back(ParseWith(Peek(), false));
        return;
      }
      if (token.text == "def") {
        out.push_back(ParseFunctionDef({}, Peek(), false));
        return;
      }
      if (token.text == "class") {
        out.push_back(ParseClassDef({}));
        return;
      }
      if (token.text == "async") {
        out.push_back(ParseAsync({}));
        return;
      }
      if (token.text == "match" && IsMatchStatement()) {
        out.push_back(ParseMatch());
        return;
      }
    }
    ParseSimpleStatements(out);
  }

  std::vector<Stmt> ParseBlock() {
    Expect(":");
    std::vector<Stmt> body;
    if (!AtKind(TokenKind::kNewline)) {
      ParseSimpleStatements(body);
      return body;
    }
    Advance();
    if (!AtKind(TokenKind::kIndent)) {
      Fail(Peek(), "expected an indented block");
    }
    Advance();
    while (!AtKind(TokenKind::kDedent) && !AtKind(TokenKind::kEndMarker)) {
      ParseStatementInto(body);
    }
    if (AtKind(TokenKind::kDedent)) {
      Advance();
    }
    return body;
  }

  Stmt ParseIf() {
    auto stmt = MakeStmt(StmtKind::kIf, Advance());
    stmt.value = ParseNamedExpression();
    stmt.body = ParseBlock();
    if (AtKeyword("elif")) {
      stmt.orelse.push_back(ParseIf());
    } else if (AtKeyword("else")) {
      Advance();
      stmt.orelse = ParseBlock();
    }
    return Close(std::move(stmt));
  }

  Stmt ParseWhile() {
    auto stmt = MakeStmt(StmtKind::kWhile, Advance());
    stmt.value = ParseNamedExpression();
    stmt.body = ParseBlock();
    if (AtKeyword("else")) {
      Advance();
      stmt.orelse = ParseBlock();
    }
    return Close(std::move(stmt));
  }

  Stmt ParseFor(const Token &start, bool is_async) {
    auto stmt = MakeStmt(StmtKind::kFor, start);
    stmt.is_async = is_async;
    ExpectKeyword("for");
    stmt.targets.push_back(ParseTargetList());
    ExpectKeyword("in");
    stmt.value = ParseStarExpressions();
    stmt.body = ParseBlock();
    if (AtKeyword("else")) {
      Advance();
      stmt.orelse = ParseBlock();
    }
    return Close(std::move(stmt));
  }

  bool IsParenthesizedWithItems() const {
    int depth = 0;
    bool saw_as = false;
    for (std::size_t ahead = 0;; ++ahead) {
      const auto &token = Peek(ahead);
      if (token.kind == TokenKind::kEndMarker ||
          token.kind == TokenKind::kNewline) {
        return false;
      }
      if (token.kind == TokenKind::kOperator) {
        if (token.text == "(" || token.text == "[" || token.text == "{") {
          ++depth;
        } else if (token.text == ")" || token.text == "]" ||
                   token.text == "}") {
          --depth;
          if (depth == 0) {
            return saw_as && AtOperator(":", ahead + 1);
          }
        }
      } else if (depth == 1 && token.kind == TokenKind::kName &&
                 token.text == "as") {
        saw_as = true;
      }
    }
  }

  void ParseWithItem(Stmt &stmt) {
    stmt.extras.push_back(ParseExpression());
    if (AtKeyword("as")) {
      Advance();
      auto target = ParseTarget();
      if (!IsAssignable(target)) {
        Fail(Peek(), "cannot assign to " + DescribeTarget(target));
      }
      stmt.targets.push_back(std::move(target));
    }
  }

  Stmt ParseWith(const Token &start, bool is_async) {
    auto stmt = MakeStmt(StmtKind::kWith, start);
    stmt.is_async = is_async;
    ExpectKeyword("with");
    if (AtOperator("(") && IsParenthesizedWithItems()) {
      Advance();
      while (!AtOperator(")")) {
        ParseWithItem(stmt);
        if (!AtOperator(",")) {
          break;
        }
        Advance();
      }
      Expect(")");
    } else {
      ParseWithItem(stmt);
      while (AtOperator(",")) {
        Advance();
        ParseWithItem(stmt);
      }
    }
    stmt.body = ParseBlock();
    return Close(std::move(stmt));
  }

  Stmt ParseTry() {
    auto stmt = MakeStmt(StmtKind::kTry, Advance());
    stmt.body = ParseBlock();
    while (AtKeyword("except")) {
      ExceptHandler handler;
      handler.line = Advance().line;
      if (AtOperator("*")) {
        Advance();
        handler.is_group = true;
      }
      if (!AtOperator(":")) {
        auto type = ParseExpression();
        if (AtOperator(",")) {
          auto group = MakeExpr(ExprKind::kTuple, Peek());
          group.line = type.line;
          group.column = type.column;
          group.children.push_back(std::move(type));
          while (AtOperator(",")) {
            Advance();
            group.children.push_back(ParseExpression());
          }
          type = Finish(std::move(group));
        }
        handler.type = std::move(type);
        if (AtKeyword("as")) {
          Advance();
          handler.name = ExpectName();
        }
      }
      handler.body = ParseBlock();
      handler.end_line = std::max(handler.line, last_end_line_);
      stmt.handlers.push_back(std::move(handler));
    }
    if (AtKeyword("else")) {
      if (stmt.handlers.empty()) {
        Fail(Peek(), "expected 'except' or 'finally' block");
      }
      Advance();
      stmt.orelse = ParseBlock();
    }
    if (AtKeyword("finally")) {
      Advance();
      stmt.finalbody = ParseBlock();
    }
    if (stmt.handlers.empty() && stmt.finalbody.empty()) {
      Fail(Peek(), "expected 'except' or 'finally' block");
    }
    return Close(std::move(stmt));
  }

  void SkipTypeParameters() {
    if (!AtOperator("[")) {
      return;
    }
    int depth = 0;
    do {
      if (AtOperator("[") || AtOperator("(")) {
        ++depth;
      } else if (AtOperator("]") || AtOperator(")")) {
        --depth;
      }
      Advance();
    } while (depth > 0 && !AtKind(TokenKind::kEndMarker));
  }

  std::vector<Parameter> ParseParameters(std::string_view closing,
                                         bool annotations) {
    std::vector<Parameter> parameters;
    bool keyword_only = false;
    bool seen_default = false;
    while (!AtOperator(closing)) {
      Parameter parameter;
      parameter.line = Peek().line;
      if (AtOperator("/")) {
        Advance();
        for (auto &previous : parameters) {
          previous.kind = ParameterKind::kPositionalOnly;
        }
      } else if (AtOperator("**")) {
        Advance();
        parameter.name = ExpectName();
        parameter.kind = ParameterKind::kVarKeyword;
        if (annotations && AtOperator(":")) {
          Advance();
          parameter.annotation = ParseExpression();
        }
      } else if (AtOperator("*")) {
        Advance();
        keyword_only = true;
        if (Peek().kind == TokenKind::kName) {
          parameter.name = ExpectName();
          parameter.kind = ParameterKind::kVarPositional;
          if (annotations && AtOperator(":")) {
            Advance();
            parameter.annotation = ParseStarExpression();
          }
        }
      } else {
        const auto &start = Peek();
        parameter.name = ExpectName();
        parameter.kind = keyword_only ? ParameterKind::kKeywordOnly
                                      : ParameterKind::kPositional;
        if (annotations && AtOperator(":")) {
          Advance();
          parameter.annotation = ParseExpression();
        }
        if (AtOperator("=")) {
          Advance();
          parameter.default_value = ParseExpression();
          if (!keyword_only) {
            seen_default = true;
          }
        } else if (!keyword_only && seen_default) {
          Fail(start, "parameter without a default follows parameter with "
                      "a default");
        }
      }
      if (!parameter.name.empty()) {
        parameters.push_back(std::move(parameter));
      }
      if (!AtOperator(",")) {
        break;
      }
      Advance();
    }
    return parameters;
  }

  Stmt ParseFunctionDef(std::vector<Expr> decorators, const Token &start,
                        bool is_async) {
    auto stmt = MakeStmt(StmtKind::kFunctionDef, start);
    stmt.is_async = is_async;
    ExpectKeyword("def");
    stmt.name = ExpectName();
    SkipTypeParameters();
    Expect("(");
    stmt.parameters = ParseParameters(")", true);
    Expect(")");
    stmt.extras = std::move(decorators);
    if (AtOperator("->")) {
      Advance();
      stmt.extras.push_back(ParseExpression());
    }
    stmt.body = ParseBlock();
    return Close(std::move(stmt));
  }

  Stmt ParseClassDef(std::vector<Expr> decorators) {
    auto stmt = MakeStmt(StmtKind::kClassDef, Peek());
    ExpectKeyword("class");
    stmt.name = ExpectName();
    SkipTypeParameters();
    stmt.extras = std::move(decorators);
    if (AtOperator("(")) {
      auto call = MakeExpr(ExprKind::kCall, Peek());
      ParseCallArguments(call);
      for (auto &argument : call.children) {
        stmt.extras.push_back(std::move(argument));
      }
    }
    stmt.body = ParseBlock();
    return Close(std::move(stmt));
  }

  Stmt ParseAsync(std::vector<Expr> decorators) {
    const auto start = Advance();
    if (AtKeyword("def")) {
      return ParseFunctionDef(std::move(decorators), start, true);
    }
    if (decorators.empty() && AtKeyword("for")) {
      return ParseFor(start, true);
    }
    if (decorators.empty() && AtKeyword("with")) {
      return ParseWith(start, true);
    }
    Fail(Peek(), "invalid syntax");
  }

  Stmt ParseDecorated() {
    std::vector<Expr> decorators;
    while (AtOperator("@")) {
      Advance();
      decorators.push_back(ParseNamedExpression());
      ExpectNewline();
    }
    if (AtKeyword("def")) {
      return ParseFunctionDef(std::move(decorators), Peek(), false);
    }
    if (AtKeyword("class")) {
      return ParseClassDef(std::move(decorators));
    }
    if (AtKeyword("async")) {
      return ParseAsync(std::move(decorators));
    }
    Fail(Peek(), "invalid syntax");
  }

  // `match` is a soft keyword: it opens a statement only when the logical
  // line ends with ':' and a block of `case` clauses follows.
  bool IsMatchStatement() const {
    const auto &next = Peek(1);
    if (next.kind == TokenKind::kNewline ||
        next.kind == TokenKind::kEndMarker) {
      return false;
    }
    if (next.kind == TokenKind::kOperator &&
        (next.text == "=" || next.text == "." || next.text == "," ||
         next.text == ":" || next.text == ";" || next.text == ")" ||
         std::find(kAugmentedOperators.begin(), kAugmentedOperators.end(),
                   next.text) != kAugmentedOperators.end())) {
      return false;
    }
    int depth = 0;
    for (std::size_t ahead = 1;; ++ahead) {
      const auto &token = Peek(ahead);
      if (token.kind == TokenKind::kEndMarker) {
        return false;
      }
      if (token.kind == TokenKind::kNewline) {
        return depth == 0 && AtOperator(":", ahead - 1) &&
               Peek(ahead + 1).kind == TokenKind::kIndent &&
               AtKeyword("case", ahead + 2);
      }
      if (token.kind == TokenKind::kOperator) {
        if (token.text == "(" || token.text == "[" || token.text == "{") {
          ++depth;
        } else if (token.text == ")" || token.text == "]" ||
                   token.text == "}") {
          --depth;
        }
      }
    }
  }

  void SkipPattern() {
    int depth = 0;
    bool consumed = false;
    while (true) {
      const auto &token = Peek();
      if (token.kind == TokenKind::kNewline ||
          token.kind == TokenKind::kEndMarker) {
        Fail(token, "expected ':'");
      }
      if (depth == 0 && (AtOperator(":") || AtKeyword("if"))) {
        break;
      }
      if (AtOperator("(") || AtOperator("[") || AtOperator("{")) {
        ++depth;
      } else if (AtOperator(")") || AtOperator("]") || AtOperator("}")) {
        --depth;
      }
      Advance();
      consumed = true;
    }
    if (!consumed) {
      Fail(Peek(), "invalid syntax");
    }
  }

  Stmt ParseMatch() {
    auto stmt = MakeStmt(StmtKind::kMatch, Advance());
    stmt.value = ParseStarExpressions();
    Expect(":");
    ExpectNewline();
    if (!AtKind(TokenKind::kIndent)) {
      Fail(Peek(), "expected an indented block");
    }
    Advance();
    while (!AtKind(TokenKind::kDedent) && !AtKind(TokenKind::kEndMarker)) {
      if (!AtKeyword("case")) {
        Fail(Peek(), "expected 'case' block");
      }
      MatchCase match_case;
      match_case.line = Advance().line;
      SkipPattern();
      if (AtKeyword("if")) {
        Advance();
        match_case.guard = ParseNamedExpression();
      }
      match_case.body = ParseBlock();
      match_case.end_line = std::max(match_case.line, last_end_line_);
      stmt.cases.push_back(std::move(match_case));
    }
    if (AtKind(TokenKind::kDedent)) {
      Advance();
    }
    return Close(std::move(stmt));
  }

  void ParseSimpleStatements(std::vector<Stmt> &out) {
    while (true) {
      out.push_back(ParseSimpleStatement());
      if (!AtOperator(";")) {
        break;
      }
      Advance();
      if (AtKind(TokenKind::kNewline) || AtKind(TokenKind::kEndMarker)) {
        break;
      }
    }
    ExpectNewline();
  }

  std::string ParseDottedName() {
    auto name = ExpectName();
    while (AtOperator(".")) {
      Advance();
      name += "." + ExpectName();
    }
    return name;
  }

  Stmt ParseImport() {
    auto stmt = MakeStmt(StmtKind::kImport, Advance());
    do {
      if (!stmt.aliases.empty()) {
        Advance();
      }
      ImportAlias alias;
      alias.name = ParseDottedName();
      if (AtKeyword("as")) {
        Advance();
        alias.as_name = ExpectName();
      }
      stmt.aliases.push_back(std::move(alias));
    } while (AtOperator(","));
    return Close(std::move(stmt));
  }

  Stmt ParseImportFrom() {
    auto stmt = MakeStmt(StmtKind::kImportFrom, Advance());
    while (AtOperator(".") || AtOperator("...")) {
      stmt.name += Advance().text;
    }
    if (!AtKeyword("import")) {
      stmt.name += ParseDottedName();
    }
    ExpectKeyword("import");
    if (AtOperator("*")) {
      Advance();
      stmt.aliases.push_back(ImportAlias{"*", ""});
      return Close(std::move(stmt));
    }
    const bool parenthesized = AtOperator("(");
    if (parenthesized) {
      Advance();
    }
    while (true) {
      ImportAlias alias;
      alias.name = ExpectName();
      if (AtKeyword("as")) {
        Advance();
        alias.as_name = ExpectName();
      }
      stmt.aliases.push_back(std::move(alias));
      if (!AtOperator(",")) {
        break;
      }
      Advance();
      if (parenthesized && AtOperator(")")) {
        break;
      }
    }
    if (parenthesized) {
      Expect(")");
    }
    return Close(std::move(stmt));
  }

  Expr ParseAssignedValue() {
    if (AtKeyword("yield")) {
      return ParseYield();
    }
    return ParseStarExpressions();
  }

  void RequireAssignable(const Expr &target) const {
    if (!IsAssignable(target)) {
      throw SyntaxErrorException(SyntaxError{
          target.line, target.column,
          "cannot assign to " + DescribeTarget(target)});
    }
  }

  Stmt ParseSimpleStatement() {
    const auto &start = Peek();
    if (start.kind == TokenKind::kName) {
      if (start.text == "pass") {
        return Close(MakeStmt(StmtKind::kPass, Advance()));
      }
      if (start.text == "break") {
        return Close(MakeStmt(StmtKind::kBreak, Advance()));
      }
      if (start.text == "continue") {
        return Close(MakeStmt(StmtKind::kContinue, Advance()));
      }
      if (start.text == "return") {
        auto stmt = MakeStmt(StmtKind::kReturn, Advance());
        if (!AtStatementEnd()) {
          stmt.value = ParseStarExpressions();
        }
        return Close(std::move(stmt));
      }
      if (start.text == "raise") {
        auto stmt = MakeStmt(StmtKind::kRaise, Advance());
        if (!AtStatementEnd()) {
          stmt.value = ParseExpression();
          if (AtKeyword("from")) {
            Advance();
            stmt.extras.push_back(ParseExpression());
          }
        }
        return Close(std::move(stmt));
      }
      if (start.text == "global" || start.text == "nonlocal") {
        auto stmt = MakeStmt(start.text == "global" ? StmtKind::kGlobal
                                                    : StmtKind::kNonlocal,
                             Advance());
        stmt.names.push_back(ExpectName());
        while (AtOperator(",")) {
          Advance();
          stmt.names.push_back(ExpectName());
        }
        return Close(std::move(stmt));
      }
      if (start.text == "del") {
        auto stmt = MakeStmt(StmtKind::kDel, Advance());
        stmt.targets.push_back(ParseTargetList());
        return Close(std::move(stmt));
      }
      if (start.text == "assert") {
        auto stmt = MakeStmt(StmtKind::kAssert, Advance());
        stmt.value = ParseExpression();
        if (AtOperator(",")) {
          Advance();
          stmt.extras.push_back(ParseExpression());
        }
        return Close(std::move(stmt));
      }
      if (start.text == "import") {
        return ParseImport();
      }
      if (start.text == "from") {
        return ParseImportFrom();
      }
      if (start.text == "type" && Peek(1).kind == TokenKind::kName &&
          (AtOperator("=", 2) || AtOperator("[", 2))) {
        auto stmt = MakeStmt(StmtKind::kTypeAlias, Advance());
        const auto &name = Peek();
        auto target = MakeExpr(ExprKind::kName, name);
        target.text = ExpectName();
        stmt.targets.push_back(std::move(target));
        SkipTypeParameters();
        Expect("=");
        stmt.value = ParseExpression();
        return Close(std::move(stmt));
      }
    }

    auto first = ParseAssignedValue();
    if (AtOperator(":")) {
      auto stmt = MakeStmt(StmtKind::kAnnAssign, start);
      Advance();
      RequireAssignable(first);
      stmt.targets.push_back(std::move(first));
      stmt.extras.push_back(ParseExpression());
      if (AtOperator("=")) {
        Advance();
        stmt.value = ParseAssignedValue();
      }
      return Close(std::move(stmt));
    }
    if (Peek().kind == TokenKind::kOperator &&
        std::find(kAugmentedOperators.begin(), kAugmentedOperators.end(),
                  Peek().text) != kAugmentedOperators.end()) {
      auto stmt = MakeStmt(StmtKind::kAugAssign, start);
      stmt.name = Advance().text;
      if (first.kind != ExprKind::kName && first.kind != ExprKind::kAttribute &&
          first.kind != ExprKind::kSubscript) {
        throw SyntaxErrorException(SyntaxError{
            first.line, first.column,
            "'" + DescribeTarget(first) +
                "' is an illegal expression for augmented assignment"});
      }
      stmt.targets.push_back(std::move(first));
      stmt.value = ParseAssignedValue();
      return Close(std::move(stmt));
    }
    if (AtOperator("=")) {
      auto stmt = MakeStmt(StmtKind::kAssign, start);
      RequireAssignable(first);
      stmt.targets.push_back(std::move(first));
      while (AtOperator("=")) {
        Advance();
        auto next = ParseAssignedValue();
        if (AtOperator("=")) {
          RequireAssignable(next);
          stmt.targets.push_back(std::move(next));
        } else {
          stmt.value = std::move(next);
        }
      }
      return Close(std::move(stmt));
    }
    auto stmt = MakeStmt(StmtKind::kExpr, start);
    stmt.value = std::move(first);
    return Close(std::move(stmt));
  }

  // ---- expressions -------------------------------------------------------

  Expr ParseTarget() {
    if (AtOperator("*")) {
      auto starred = MakeExpr(ExprKind::kStarred, Advance());
      starred.text = "*";
      starred.children.push_back(ParseBitOr());
      return Finish(std::move(starred));
    }
    return ParseBitOr();
  }

  // Comma separated targets; stops before `in` and `=`.
  Expr ParseTargetList() {
    auto first = ParseTarget();
    if (!AtOperator(",")) {
      return first;
    }
    auto tuple = MakeExpr(ExprKind::kTuple, Peek());
    tuple.line = first.line;
    tuple.column = first.column;
    tuple.children.push_back(std::move(first));
    while (AtOperator(",")) {
      Advance();
      if (!StartsExpression()) {
        break;
      }
      tuple.children.push_back(ParseTarget());
    }
    return Finish(std::move(tuple));
  }

  Expr ParseStarExpressions() {
    auto first = ParseStarExpression();
    if (!AtOperator(",")) {
      return first;
    }
    auto tuple = MakeExpr(ExprKind::kTuple, Peek());
    tuple.line = first.line;
    tuple.column = first.column;
    tuple.children.push_back(std::move(first));
    while (AtOperator(",")) {
      Advance();
      if (!StartsExpression()) {
        break;
      }
      tuple.children.push_back(ParseStarExpression());
    }
    return Finish(std::move(tuple));
  }

  Expr ParseStarExpression() {
    if (AtOperator("*")) {
      auto starred = MakeExpr(ExprKind::kStarred, Advance());
      starred.text = "*";
      starred.children.push_back(ParseBitOr());
      return Finish(std::move(starred));
    }
    return ParseNamedExpression();
  }

  Expr ParseNamedExpression() {
    if (Peek().kind == TokenKind::kName && AtOperator(":=", 1)) {
      auto named = MakeExpr(ExprKind::kNamedExpr, Peek());
      auto target = MakeExpr(ExprKind::kName, Peek());
      target.text = ExpectName();
      Advance();
      named.children.push_back(std::move(target));
      named.children.push_back(ParseExpression());
      return Finish(std::move(named));
    }
    return ParseExpression();
  }

  Expr ParseExpression() {
    const NestingGuard guard(*this, Peek());
    if (AtKeyword("lambda")) {
      return ParseLambda();
    }
    auto body = ParseDisjunction();
    if (!AtKeyword("if")) {
      return body;
    }
    Advance();
    auto conditional = MakeExpr(ExprKind::kIfExp, Peek());
    conditional.line = body.line;
    conditional.column = body.column;
    conditional.children.push_back(std::move(body));
    conditional.children.push_back(ParseDisjunction());
    ExpectKeyword("else");
    conditional.children.push_back(ParseExpression());
    return Finish(std::move(conditional));
  }

  Expr ParseLambda() {
    auto lambda = MakeExpr(ExprKind::kLambda, Advance());
    for (auto &parameter : ParseParameters(":", false)) {
      if (parameter.default_value) {
        lambda.children.push_back(std::move(*parameter.default_value));
      }
    }
    Expect(":");
    lambda.children.push_back(ParseExpression());
    return Finish(std::move(lambda));
  }

  Expr ParseBoolean(std::string_view word, Expr (Parser::*operand)()) {
    auto first = (this->*operand)();
    if (!AtKeyword(word)) {
      return first;
    }
    auto boolean = MakeExpr(ExprKind::kBoolOp, Peek());
    boolean.line = first.line;
    boolean.column = first.column;
    boolean.text = std::string(word);
    boolean.children.push_back(std::move(first));
    while (AtKeyword(word)) {
      Advance();
      boolean.children.push_back((this->*operand)());
    }
    return Finish(std::move(boolean));
  }

  Expr ParseDisjunction() { return ParseBoolean("or", &Parser::ParseConjunction); }

  Expr ParseConjunction() { return ParseBoolean("and", &Parser::ParseInversion); }

  Expr ParseInversion() {
    if (AtKeyword("not")) {
      const NestingGuard guard(*this, Peek());
      auto negation = MakeExpr(ExprKind::kUnaryOp, Advance());
      negation.text = "not";
      negation.children.push_back(ParseInversion());
      return Finish(std::move(negation));
    }
    return ParseComparison();
  }

  std::string ComparisonOperator() const {
    const auto &token = Peek();
    if (token.kind == TokenKind::kOperator &&
        std::find(kComparisonOperators.begin(), kComparisonOperators.end(),
                  token.text) != kComparisonOperators.end()) {
      return token.text;
    }
    if (AtKeyword("in")) {
      return "in";
    }
    if (AtKeyword("not") && AtKeyword("in", 1)) {
      return "not in";
    }
    if (AtKeyword("is")) {
      return AtKeyword("not", 1) ? "is not" : "is";
    }
    return {};
  }

  Expr ParseComparison() {
    auto first = ParseBitOr();
    auto op = ComparisonOperator();
    if (op.empty()) {
      return first;
    }
    auto comparison = MakeExpr(ExprKind::kCompare, Peek());
    comparison.line = first.line;
    comparison.column = first.column;
    comparison.children.push_back(std::move(first));
    while (!op.empty()) {
      Advance();
      if (op == "not in" || op == "is not") {
        Advance();
      }
      comparison.operators.push_back(op);
      comparison.children.push_back(ParseBitOr());
      op = ComparisonOperator();
    }
    return Finish(std::move(comparison));
  }

  Expr ParseBinary(std::initializer_list<std::string_view> ops,
                   Expr (Parser::*operand)()) {
    auto left = (this->*operand)();
    while (Peek().kind == TokenKind::kOperator &&
           std::find(ops.begin(), ops.end(), Peek().text) != ops.end()) {
      auto binary = MakeExpr(ExprKind::kBinOp, Peek());
      binary.line = left.line;
      binary.column = left.column;
      binary.text = Advance().text;
      binary.children.push_back(std::move(left));
      binary.children.push_back((this->*operand)());
      left = Finish(std::move(binary));
    }
    return left;
  }

  Expr ParseBitOr() { return ParseBinary({"|"}, &Parser::ParseBitXor); }
  Expr ParseBitXor() { return ParseBinary({"^"}, &Parser::ParseBitAnd); }
  Expr ParseBitAnd() { return ParseBinary({"&"}, &Parser::ParseShift); }
  Expr ParseShift() { return ParseBinary({"<<", ">>"}, &Parser::ParseSum); }
  Expr ParseSum() { return ParseBinary({"+", "-"}, &Parser::ParseTerm); }
  Expr ParseTerm() {
    return ParseBinary({"*", "/", "//", "%", "@"}, &Parser::ParseFactor);
  }

  Expr ParseFactor() {
    const NestingGuard guard(*this, Peek());
    if (AtOperator("+") || AtOperator("-") || AtOperator("~")) {
      auto unary = MakeExpr(ExprKind::kUnaryOp, Peek());
      unary.text = Advance().text;
      unary.children.push_back(ParseFactor());
      return Finish(std::move(unary));
    }
    return ParsePower();
  }

  Expr ParsePower() {
    auto base = ParseAwaitPrimary();
    if (!AtOperator("**")) {
      return base;
    }
    auto power = MakeExpr(ExprKind::kBinOp, Peek());
    power.line = base.line;
    power.column = base.column;
    power.text = Advance().text;
    power.children.push_back(std::move(base));
    power.children.push_back(ParseFactor());
    return Finish(std::move(power));
  }

  Expr ParseAwaitPrimary() {
    if (AtKeyword("await")) {
      auto awaited = MakeExpr(ExprKind::kAwait, Advance());
      awaited.children.push_back(ParsePrimary());
      return Finish(std::move(awaited));
    }
    return ParsePrimary();
  }

  Expr ParsePrimary() {
    auto expr = ParseAtom();
    while (true) {
      if (AtOperator(".")) {
        Advance();
        auto attribute = MakeExpr(ExprKind::kAttribute, Peek());
        attribute.line = expr.line;
        attribute.column = expr.column;
        attribute.text = ExpectName();
        attribute.children.push_back(std::move(expr));
        expr = Finish(std::move(attribute));
        continue;
      }
      if (AtOperator("(")) {
        auto call = MakeExpr(ExprKind::kCall, Peek());
        call.line = expr.line;
        call.column = expr.column;
        call.children.push_back(std::move(expr));
        ParseCallArguments(call);
        expr = Finish(std::move(call));
        continue;
      }
      if (AtOperator("[")) {
        Advance();
        auto subscript = MakeExpr(ExprKind::kSubscript, Peek());
        subscript.line = expr.line;
        subscript.column = expr.column;
        subscript.children.push_back(std::move(expr));
        subscript.children.push_back(ParseSlices());
        Expect("]");
        expr = Finish(std::move(subscript));
        continue;
      }
      return expr;
    }
  }

  bool AtComprehension() const {
    return AtKeyword("for") || (AtKeyword("async") && AtKeyword("for", 1));
  }

  void ParseComprehensionClauses(Expr &owner) {
    while (AtComprehension()) {
      auto clause = MakeExpr(ExprKind::kComprehension, Peek());
      if (AtKeyword("async")) {
        Advance();
        clause.is_async = true;
      }
      ExpectKeyword("for");
      clause.children.push_back(ParseTargetList());
      ExpectKeyword("in");
      clause.children.push_back(ParseDisjunction());
      while (AtKeyword("if")) {
        Advance();
        clause.children.push_back(ParseDisjunction());
      }
      owner.children.push_back(Finish(std::move(clause)));
    }
  }

  // Consumes `( ... )` and appends the arguments to `call`.
  void ParseCallArguments(Expr &call) {
    Expect("(");
    while (!AtOperator(")")) {
      if (AtOperator("*") || AtOperator("**")) {
        auto starred = MakeExpr(ExprKind::kStarred, Peek());
        starred.text = Advance().text;
        starred.children.push_back(ParseExpression());
        call.children.push_back(Finish(std::move(starred)));
      } else if (Peek().kind == TokenKind::kName && AtOperator("=", 1)) {
        auto keyword = MakeExpr(ExprKind::kKeyword, Peek());
        keyword.text = ExpectName();
        Advance();
        keyword.children.push_back(ParseExpression());
        call.children.push_back(Finish(std::move(keyword)));
      } else {
        auto argument = ParseNamedExpression();
        if (AtComprehension()) {
          auto generator = MakeExpr(ExprKind::kGeneratorExp, Peek());
          generator.line = argument.line;
          generator.column = argument.column;
          generator.children.push_back(std::move(argument));
          ParseComprehensionClauses(generator);
          argument = Finish(std::move(generator));
        }
        call.children.push_back(std::move(argument));
      }
      if (!AtOperator(",")) {
        break;
      }
      Advance();
    }
    Expect(")");
  }

  Expr Missing() const { return MakeExpr(ExprKind::kMissing, Peek()); }

  Expr ParseSlice() {
    Expr lower = Missing();
    if (!AtOperator(":")) {
      lower = ParseStarExpression();
      if (!AtOperator(":")) {
        return lower;
      }
    }
    auto slice = MakeExpr(ExprKind::kSlice, Peek());
    Advance();
    slice.children.push_back(std::move(lower));
    slice.children.push_back(StartsExpression() ? ParseExpression()
                                                : Missing());
    Expr step = Missing();
    if (AtOperator(":")) {
      Advance();
      if (StartsExpression()) {
        step = ParseExpression();
      }
    }
    slice.children.push_back(std::move(step));
    return Finish(std::move(slice));
  }

  Expr ParseSlices() {
    auto first = ParseSlice();
    if (!AtOperator(",")) {
      return first;
    }
    auto tuple = MakeExpr(ExprKind::kTuple, Peek());
    tuple.line = first.line;
    tuple.column = first.column;
    tuple.children.push_back(std::move(first));
    while (AtOperator(",")) {
      Advance();
      if (AtOperator("]")) {
        break;
      }
      tuple.children.push_back(ParseSlice());
    }
    return Finish(std::move(tuple));
  }

  Expr ParseYield() {
    auto yield = MakeExpr(ExprKind::kYield, Advance());
    if (AtKeyword("from")) {
      Advance();
      yield.kind = ExprKind::kYieldFrom;
      yield.children.push_back(ParseExpression());
    } else if (StartsExpression()) {
      yield.children.push_back(ParseStarExpressions());
    }
    return Finish(std::move(yield));
  }

  Expr ParseStrings() {
    auto literal = MakeExpr(ExprKind::kString, Peek());
    while (AtKind(TokenKind::kString)) {
      const auto &token = Advance();
      const auto quote = token.text.find_first_of("\"'");
      const auto prefix = token.text.substr(0, quote);
      if (prefix.find_first_of("bB") != std::string::npos) {
        literal.kind = ExprKind::kBytes;
      }
      literal.text += token.text;
    }
    return Finish(std::move(literal));
  }

  Expr ParseParenthesized() {
    const auto &open = Advance();
    if (AtOperator(")")) {
      Advance();
      return Finish(MakeExpr(ExprKind::kTuple, open));
    }
    if (AtKeyword("yield")) {
      auto yield = ParseYield();
      Expect(")");
      return yield;
    }
    auto first = ParseStarExpression();
    if (AtComprehension()) {
      auto generator = MakeExpr(ExprKind::kGeneratorExp, open);
      generator.children.push_back(std::move(first));
      ParseComprehensionClauses(generator);
      Expect(")");
      return Finish(std::move(generator));
    }
    if (!AtOperator(",")) {
      Expect(")");
      return first;
    }
    auto tuple = MakeExpr(ExprKind::kTuple, open);
    tuple.children.push_back(std::move(first));
    while (AtOperator(",")) {
      Advance();
      if (AtOperator(")")) {
        break;
      }
      tuple.children.push_back(ParseStarExpression());
    }
    Expect(")");
    return Finish(std::move(tuple));
  }

  Expr ParseBracketed() {
    auto list = MakeExpr(ExprKind::kList, Advance());
    if (AtOperator("]")) {
      Advance();
      return Finish(std::move(list));
    }
    list.children.push_back(ParseStarExpression());
    if (AtComprehension()) {
      list.kind = ExprKind::kListComp;
      ParseComprehensionClauses(list);
      Expect("]");
      return Finish(std::move(list));
    }
    while (AtOperator(",")) {
      Advance();
      if (AtOperator("]")) {
        break;
      }
      list.children.push_back(ParseStarExpression());
    }
    Expect("]");
    return Finish(std::move(list));
  }

  void ParseDictEntry(Expr &dict) {
    if (AtOperator("**")) {
      dict.children.push_back(MakeExpr(ExprKind::kMissing, Advance()));
      dict.children.push_back(ParseBitOr());
      return;
    }
    dict.children.push_back(ParseExpression());
    Expect(":");
    dict.children.push_back(ParseExpression());
  }

  Expr ParseBraced() {
    auto braced = MakeExpr(ExprKind::kDict, Advance());
    if (AtOperator("}")) {
      Advance();
      return Finish(std::move(braced));
    }
    if (AtOperator("**")) {
      ParseDictEntry(braced);
    } else {
      auto first = ParseStarExpression();
      if (AtOperator(":") && first.kind != ExprKind::kStarred) {
        Advance();
        braced.children.push_back(std::move(first));
        braced.children.push_back(ParseExpression());
        if (AtComprehension()) {
          braced.kind = ExprKind::kDictComp;
          ParseComprehensionClauses(braced);
          Expect("}");
          return Finish(std::move(braced));
        }
      } else {
        braced.kind = ExprKind::kSet;
        braced.children.push_back(std::move(first));
        if (AtComprehension()) {
          braced.kind = ExprKind::kSetComp;
          ParseComprehensionClauses(braced);
          Expect("}");
          return Finish(std::move(braced));
        }
      }
    }
    while (AtOperator(",")) {
      Advance();
      if (AtOperator("}")) {
        break;
      }
      if (braced.kind == ExprKind::kDict) {
        ParseDictEntry(braced);
      } else {
        braced.children.push_back(ParseStarExpression());
      }
    }
    Expect("}");
    return Finish(std::move(braced));
  }

  Expr ParseAtom() {
    const auto &token = Peek();
    switch (token.kind) {
    case TokenKind::kName: {
      if (token.text == "None" || token.text == "True" ||
          token.text == "False") {
        auto constant = MakeExpr(ExprKind::kConstant, token);
        constant.text = Advance().text;
        return constant;
      }
      if (IsHardKeyword(token.text)) {
        Fail(token, "invalid syntax");
      }
      auto name = MakeExpr(ExprKind::kName, token);
      name.text = Advance().text;
      return name;
    }
    case TokenKind::kNumber: {
      auto number = MakeExpr(ExprKind::kNumber, token);
      number.text = Advance().text;
      return number;
    }
    case TokenKind::kString:
      return ParseStrings();
    case TokenKind::kOperator:
      if (token.text == "(") {
        return ParseParenthesized();
      }
      if (token.text == "[") {
        return ParseBracketed();
      }
      if (token.text == "{") {
        return ParseBraced();
      }
      if (token.text == "...") {
        auto ellipsis = MakeExpr(ExprKind::kEllipsis, token);
        ellipsis.text = Advance().text;
        return ellipsis;
      }
      break;
    default:
      break;
    }
    Fail(token, "invalid syntax");
  }

  std::vector<Token> tokens_;
  std::size_t index_ = 0;
  int last_end_line_ = 1;
  int depth_ = 0;
};

} // namespace

ParseResult ParsePython(std::string_view source) {
  ParseResult result;
  try {
    Parser parser(Tokenize(source));
    result.module = parser.ParseModule();
  } catch (const SyntaxErrorException &error) {
    result.error = error.error();
  }
  return result;
}

} // namespace python
} // namespace sage
