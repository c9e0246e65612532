#include <sage/python_lexer.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace sage {
namespace python {
namespace {

constexpr int kTabSize = 8;
constexpr std::size_t kMaxIndentLevels = 100;
constexpr std::size_t kMaxBracketDepth = 200;

// Longest operators first so that matching can stop at the first hit.
constexpr std::array<std::string_view, 49> kOperators = {
    "**=", "//=", ">>=", "<<=", "...", "->", ":=", "**", "//", "<<",
    ">>",  "<=",  ">=",  "==",  "!=",  "+=", "-=", "*=", "/=", "%=",
    "&=",  "|=",  "^=",  "@=",  "+",   "-",  "*",  "/",  "%",  "@",
    "&",   "|",   "^",   "~",   "<",   ">",  "(",  ")",  "[",  "]",
    "{",   "}",   ",",   ":",   ";",   ".",  "=",  "!",  "`"};

bool IsIdentifierStart(char character) {
  const auto code = static_cast<unsigned char>(character);
  return std::isalpha(code) != 0 || character == '_' || code >= 0x80;
}

bool IsIdentifierChar(char character) {
  return IsIdentifierStart(character) ||
         std::isdigit(static_cast<unsigned char>(character)) != 0;
}

bool IsStringPrefix(std::string_view prefix) {
  std::string lowered;
  for (const auto character : prefix) {
    lowered.push_back(
        static_cast<char>(std::tolower(static_cast<unsigned char>(character))));
  }
  static const std::array<std::string_view, 11> kPrefixes = {
      "r", "u", "b", "f", "t", "br", "rb", "fr", "rf", "tr", "rt"};
  return std::find(kPrefixes.begin(), kPrefixes.end(), lowered) !=
         kPrefixes.end();
}

char ClosingFor(char opening) {
  switch (opening) {
  case '(':
    return ')';
  case '[':
    return ']';
  default:
    return '}';
  }
}

struct OpenBracket {
  char character;
  int line;
  int column;
};

class Lexer {
public:
  explicit Lexer(std::string_view source) : source_(source) {}

  std::vector<Token> Run() {
    while (pos_ < source_.size()) {
      if (at_line_start_ && brackets_.empty()) {
        if (!LexIndentation()) {
          continue;
        }
      }
      if (pos_ >= source_.size()) {
        break;
      }
      LexToken();
    }
    Finish();
    return std::move(tokens_);
  }

private:
  [[noreturn]] void Fail(int line, int column, std::string message) const {
    throw SyntaxErrorException(SyntaxError{line, column, std::move(message)});
  }

  int Column() const { return static_cast<int>(pos_ - line_start_) + 1; }

  char At(std::size_t offset = 0) const {
    const auto index = pos_ + offset;
    return index < source_.size() ? source_[index] : '\0';
  }

  void Emit(TokenKind kind, std::string text, int line, int column) {
    tokens_.push_back(Token{kind, std::move(text), line, column, line_});
  }

  void ConsumeNewline() {
    if (At() == '\r' && At(1) == '\n') {
      pos_ += 2;
    } else {
      ++pos_;
    }
    ++line_;
    line_start_ = pos_;
  }

  // Returns false when the physical line was blank or comment-only.
  bool LexIndentation() {
    int width = 0;
    while (pos_ < source_.size()) {
      const auto character = At();
      if (character == ' ') {
        ++width;
      } else if (character == '\t') {
        width = (width / kTabSize + 1) * kTabSize;
      } else if (character == '\f') {
        width = 0;
      } else {
        break;
      }
      ++pos_;
    }

    const auto character = At();
    if (pos_ >= source_.size()) {
      return false;
    }
    if (character == '#') {
      while (pos_ < source_.size() && At() != '\n' && At() != '\r') {
        ++pos_;
      }
    }
    if (At() == '\n' || At() == '\r') {
      ConsumeNewline();
      return false;
    }
    if (pos_ >= source_.size()) {
      return false;
    }

    at_line_start_ = false;
    if (width > indents_.back()) {
      if (indents_.size() >= kMaxIndentLevels) {
        Fail(line_, Column(), "too many levels of indentation");
      }
      indents_.push_back(width);
      Emit(TokenKind::kIndent, "", line_, Column());
      return true;
    }
    while (width < indents_.back()) {
      indents_.pop_back();
      Emit(TokenKind::kDedent, "", line_, Column());
    }
    if (width != indents_.back()) {
      Fail(line_, Column(),
           "unindent does not match any outer indentation level");
    }
    return true;
  }

  void LexToken() {
    const auto character = At();
    if (character == ' ' || character == '\t' || character == '\f') {
      ++pos_;
      return;
    }
    if (character == '#') {
      while (pos_ < source_.size() && At() != '\n' && At() != '\r') {
        ++pos_;
      }
      return;
    }
    if (character == '\n' || character == '\r') {
      if (brackets_.empty()) {
        Emit(TokenKind::kNewline, "", line_, Column());
        at_line_start_ = true;
      }
      ConsumeNewline();
      return;
    }
    if (character == '\\') {
      if (At(1) == '\n' || At(1) == '\r') {
        ++pos_;
        ConsumeNewline();
        return;
      }
      Fail(line_, Column(),
           "unexpected character after line continuation character");
    }
    if (character == '"' || character == '\'') {
      LexString(0);
      return;
    }
    if (std::isdigit(static_cast<unsigned char>(character)) != 0 ||
        (character == '.' &&
         std::isdigit(static_cast<unsigned char>(At(1))) != 0)) {
      LexNumber();
      return;
    }
    if (IsIdentifierStart(character)) {
      LexName();
      return;
    }
    LexOperator();
  }

  void LexName() {
    const auto start = pos_;
    const auto column = Column();
    while (pos_ < source_.size() && IsIdentifierChar(At())) {
      ++pos_;
    }
    const auto word = source_.substr(start, pos_ - start);
    if ((At() == '"' || At() == '\'') && word.size() <= 2 &&
        IsStringPrefix(word)) {
      pos_ = start;
      LexString(word.size());
      return;
    }
    Emit(TokenKind::kName, std::string(word), line_, column);
  }

  void LexNumber() {
    const auto start = pos_;
    const auto column = Column();
    const auto is_digit = [](char c) {
      return std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '_';
    };
    const auto lowered = static_cast<char>(
        std::tolower(static_cast<unsigned char>(At(1))));
    if (At() == '0' && (lowered == 'x' || lowered == 'o' || lowered == 'b')) {
      pos_ += 2;
      while (pos_ < source_.size() &&
             (std::isxdigit(static_cast<unsigned char>(At())) != 0 ||
              At() == '_')) {
        ++pos_;
      }
    } else {
      while (pos_ < source_.size() && is_digit(At())) {
        ++pos_;
      }
      if (At() == '.') {
        ++pos_;
        while (pos_ < source_.size() && is_digit(At())) {
          ++pos_;
        }
      }
      if (At() == 'e' || At() == 'E') {
        const auto sign = (At(1) == '+' || At(1) == '-') ? 1U : 0U;
        if (std::isdigit(static_cast<unsigned char>(At(1 + sign))) != 0) {
          pos_ += 1 + sign;
          while (pos_ < source_.size() && is_digit(At())) {
            ++pos_;
          }
        }
      }
      if (At() == 'j' || At() == 'J') {
        ++pos_;
      }
    }
    Emit(TokenKind::kNumber, std::string(source_.substr(start, pos_ - start)),
         line_, column);
  }

  void LexString(std::size_t prefix_length) {
    const auto start = pos_;
    const auto start_line = line_;
    const auto column = Column();
    pos_ += prefix_length;
    const auto quote = At();
    const bool triple = At(1) == quote && At(2) == quote;
    pos_ += triple ? 3 : 1;

    while (true) {
      if (pos_ >= source_.size()) {
        Fail(start_line, column,
             triple ? "unterminated triple-quoted string literal"
                    : "unterminated string literal");
      }
      const auto character = At();
      if (character == '\\') {
        ++pos_;
        if (At() == '\n' || At() == '\r') {
          ConsumeNewline();
        } else if (pos_ < source_.size()) {
          ++pos_;
        }
        continue;
      }
      if (character == '\n' || character == '\r') {
        if (!triple) {
          Fail(start_line, column, "unterminated string literal");
        }
        ConsumeNewline();
        continue;
      }
      if (character == quote) {
        if (!triple) {
          ++pos_;
          break;
        }
        if (At(1) == quote && At(2) == quote) {
          pos_ += 3;
          break;
        }
      }
      ++pos_;
    }

    tokens_.push_back(Token{TokenKind::kString,
                            std::string(source_.substr(start, pos_ - start)),
                            start_line, column, line_});
  }

  void LexOperator() {
    const auto column = Column();
    for (const auto op : kOperators) {
      if (source_.compare(pos_, op.size(), op) != 0) {
        continue;
      }
      if (op == "!" || op == "`") {
        break;
      }
      TrackBracket(op.front(), op.size() == 1, column);
      pos_ += op.size();
      Emit(TokenKind::kOperator, std::string(op), line_, column);
      return;
    }
    Fail(line_, column,
         std::string("invalid character '") + At() + "' in source");
  }

  void TrackBracket(char character, bool single, int column) {
    if (!single) {
      return;
    }
    if (character == '(' || character == '[' || character == '{') {
      if (brackets_.size() >= kMaxBracketDepth) {
        Fail(line_, column, "too many nested parentheses");
      }
      brackets_.push_back(OpenBracket{character, line_, column});
      return;
    }
    if (character != ')' && character != ']' && character != '}') {
      return;
    }
    if (brackets_.empty()) {
      Fail(line_, column, std::string("unmatched '") + character + "'");
    }
    const auto open = brackets_.back();
    if (ClosingFor(open.character) != character) {
      Fail(line_, column,
           std::string("closing parenthesis '") + character +
               "' does not match opening parenthesis '" + open.character +
               "'");
    }
    brackets_.pop_back();
  }

  void Finish() {
    if (!brackets_.empty()) {
      const auto &open = brackets_.back();
      Fail(open.line, open.column,
           std::string("'") + open.character + "' was never closed");
    }
    if (!tokens_.empty() && tokens_.back().kind != TokenKind::kNewline &&
        tokens_.back().kind != TokenKind::kDedent) {
      Emit(TokenKind::kNewline, "", line_, Column());
    }
    while (indents_.size() > 1) {
      indents_.pop_back();
      Emit(TokenKind::kDedent, "", line_, 1);
    }
    Emit(TokenKind::kEndMarker, "", line_, 1);
  }

  std::string_view source_;
  std::size_t pos_ = 0;
  std::size_t line_start_ = 0;
  int line_ = 1;
  bool at_line_start_ = true;
  std::vector<int> indents_ = {0};
  std::vector<OpenBracket> brackets_;
  std::vector<Token> tokens_;
};

} // namespace

bool IsHardKeyword(std::string_view word) {
  static const std::array<std::string_view, 35> kKeywords = {
      "False",  "None",   "True",    "and",      "as",       "assert",
      "async",  "await",  "break",   "class",    "continue", "def",
      "del",    "elif",   "else",    "except",   "finally",  "for",
      "from",   "global", "if",      "import",   "in",       "is",
      "lambda", "nonlocal", "not",   "or",       "pass",     "raise",
      "return", "try",    "while",   "with",     "yield"};
  return std::find(kKeywords.begin(), kKeywords.end(), word) !=
         kKeywords.end();
}

std::vector<Token> Tokenize(std::string_view source) {
  // A UTF-8 byte order mark is not part of the program text.
  if (source.size() >= 3 && source.compare(0, 3, "\xEF\xBB\xBF") == 0) {
    source.remove_prefix(3);
  }
  return Lexer(source).Run();
}

} // namespace python
} // namespace sage
