#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace matchwire::file {

std::optional<std::string> ReadFileText(const std::filesystem::path &path);

// Writes to a sibling temporary file and renames it over the destination so
// readers never observe a partially written file. Throws Error(Filesystem).
void WriteFileAtomically(const std::filesystem::path &path, std::string_view contents);

} // namespace matchwire::file
