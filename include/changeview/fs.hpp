#pragma once
#include <filesystem>
#include <string>

namespace changeview::fs {

bool exists(const std::filesystem::path& p);
bool is_regular_file(const std::filesystem::path& p);

// Whole file as bytes in a string. Throws std::runtime_error if it cannot be opened.
std::string read_file(const std::filesystem::path& p);

} // namespace changeview::fs
