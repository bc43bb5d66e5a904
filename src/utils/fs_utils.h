/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <filesystem>
#include <istream>
#include <string>

namespace tagnorm::fs_utils {
std::string read_text_file(const std::filesystem::path& path);
std::string read_stream(std::istream& in);
void write_text_file(const std::filesystem::path& path, const std::string& text);
void ensure_dir(const std::filesystem::path& dir);
}  // namespace tagnorm::fs_utils
