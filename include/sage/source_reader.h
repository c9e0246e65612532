#pragma once

#include <sage/interfaces.h>

#include <filesystem>
#include <string>
#include <string_view>

namespace sage {

class FileSourceReader : public SourceReader {
public:
  std::string Read(const std::filesystem::path &path) const override;
};

bool IsValidUtf8(std::string_view bytes);
std::string Latin1ToUtf8(std::string_view bytes);

} // namespace sage
