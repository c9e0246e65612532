#pragma once

#include <sage/python_ast.h>

#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace sage {
namespace python {

enum class TokenKind {
  kName,
  kNumber,
  kString,
  kOperator,
  kNewline,
  kIndent,
  kDedent,
  kEndMarker
};

struct Token {
  TokenKind kind = TokenKind::kEndMarker;
  std::string text;
  int line = 1;
  int column = 1;
  int end_line = 1;
};

class SyntaxErrorException : public std::runtime_error {
public:
  explicit SyntaxErrorException(SyntaxError error)
      : std::runtime_error(error.message), error_(std::move(error)) {}

  const SyntaxError &error() const { return error_; }

private:
  SyntaxError error_;
};

// Logical-line tokenizer. Comments and blank lines produce no tokens,
// newlines inside brackets are joined, and the stream always ends with
// NEWLINE (when non-empty), the pending DEDENTs and one END_MARKER.
// Throws SyntaxErrorException.
std::vector<Token> Tokenize(std::string_view source);

bool IsHardKeyword(std::string_view word);

} // namespace python
} // namespace sage
