#include <sage/escaping.h>

#include <iomanip>
#include <sstream>
#include <unordered_map>

namespace sage {

std::string EscapeJson(const std::string &value) {
  static const std::unordered_map<char, std::string> replacements{
      {'"', "\\\""}, {'\\', "\\\\"}, {'\n', "\\n"}, {'\r', "\\r"},
      {'\t', "\\t"}, {'\b', "\\b"},  {'\f', "\\f"}};

  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    const auto replacement = replacements.find(character);
    if (replacement != replacements.end()) {
      escaped.append(replacement->second);
    } else if (static_cast<unsigned char>(character) < 0x20) {
      std::ostringstream code;
      code << "\\u" << std::hex << std::setw(4) << std::setfill('0')
           << static_cast<int>(static_cast<unsigned char>(character));
      escaped.append(code.str());
    } else {
      escaped.push_back(character);
    }
  }
  return escaped;
}

std::string JsonString(const std::string &value) {
  return "\"" + EscapeJson(value) + "\"";
}

std::string JoinJsonArray(const std::vector<std::string> &values) {
  std::string joined = "[";
  for (std::size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      joined += ", ";
    }
    joined += JsonString(values[i]);
  }
  joined += "]";
  return joined;
}

std::string FormatDouble(double value, int precision) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(precision) << value;
  return stream.str();
}

} // namespace sage
