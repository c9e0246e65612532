#pragma once

#include <sage/python_ast.h>

#include <optional>
#include <string_view>

namespace sage {
namespace python {

struct ParseResult {
  std::optional<Module> module;
  std::optional<SyntaxError> error;

  bool ok() const { return module.has_value(); }
};

// Parses Python 3 source into a syntax tree. Syntax errors are reported
// through the result, never thrown.
ParseResult ParsePython(std::string_view source);

} // namespace python
} // namespace sage
