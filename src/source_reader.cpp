#include <sage/source_reader.h>

#include <sage/errors.h>

#include <fstream>
#include <iterator>
#include <system_error>

namespace sage {

bool IsValidUtf8(std::string_view bytes) {
  std::size_t i = 0;
  while (i < bytes.size()) {
    const auto lead = static_cast<unsigned char>(bytes[i]);
    std::size_t length = 0;
    if (lead < 0x80) {
      length = 1;
    } else if (lead >= 0xC2 && lead <= 0xDF) {
      length = 2;
    } else if (lead >= 0xE0 && lead <= 0xEF) {
      length = 3;
    } else if (lead >= 0xF0 && lead <= 0xF4) {
      length = 4;
    } else {
      return false;
    }
    if (i + length > bytes.size()) {
      return false;
    }
    for (std::size_t k = 1; k < length; ++k) {
      const auto continuation = static_cast<unsigned char>(bytes[i + k]);
      if ((continuation & 0xC0) != 0x80) {
        return false;
      }
    }
    if (length == 3) {
      const auto second = static_cast<unsigned char>(bytes[i + 1]);
      if ((lead == 0xE0 && second < 0xA0) || (lead == 0xED && second > 0x9F)) {
        return false;
      }
    }
    if (length == 4) {
      const auto second = static_cast<unsigned char>(bytes[i + 1]);
      if ((lead == 0xF0 && second < 0x90) || (lead == 0xF4 && second > 0x8F)) {
        return false;
      }
    }
    i += length;
  }
  return true;
}

std::string Latin1ToUtf8(std::string_view bytes) {
  std::string converted;
  converted.reserve(bytes.size());
  for (const auto character : bytes) {
    const auto code = static_cast<unsigned char>(character);
    if (code < 0x80) {
      converted.push_back(character);
      continue;
    }
    converted.push_back(static_cast<char>(0xC0 | (code >> 6)));
    converted.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  }
  return converted;
}

std::string FileSourceReader::Read(const std::filesystem::path &path) const {
  std::error_code error;
  if (!std::filesystem::is_regular_file(path, error)) {
    throw FileAccessError("not a readable file", path.string());
  }
  std::ifstream stream(path, std::ios::binary);
  if (!stream) {
    throw FileAccessError("cannot open file", path.string());
  }
  std::string bytes((std::istreambuf_iterator<char>(stream)),
                    std::istreambuf_iterator<char>());
  if (stream.bad()) {
    throw FileAccessError("read failed", path.string());
  }
  if (IsValidUtf8(bytes)) {
    return bytes;
  }
  return Latin1ToUtf8(bytes);
}

} // namespace sage
