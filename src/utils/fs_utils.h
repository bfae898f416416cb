/**
 * Copyright (c) 2026 Cr4nkSt4r - https://github.com/Cr4nkSt4r/Borderlands-4.NcsParser
 */
#pragma once

#include <cstdint>
#include <filesystem>
#include <span>
#include <string>
#include <vector>

namespace j2m::fs_utils {
std::filesystem::path executable_dir();
bool is_hints_json(const std::filesystem::path& path);
std::filesystem::path hints_path_for(const std::filesystem::path& input);
std::vector<std::filesystem::path> collect_inputs(const std::filesystem::path& root);
std::string read_text_file(const std::filesystem::path& path);
void write_file(const std::filesystem::path& path, std::span<const std::uint8_t> bytes);
void ensure_dir(const std::filesystem::path& dir);
}  // namespace j2m::fs_utils
