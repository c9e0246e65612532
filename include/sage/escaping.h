#pragma once

#include <string>
#include <vector>

namespace sage {

// Body of a JSON string literal, without the surrounding quotes.
std::string EscapeJson(const std::string &value);

// `"value"` with escaping applied.
std::string JsonString(const std::string &value);

std::string JoinJsonArray(const std::vector<std::string> &values);

std::string FormatDouble(double value, int precision);

} // namespace sage
