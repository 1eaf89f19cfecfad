#pragma once

#include <cstdint>
#include <string>
#include <filesystem>
#include <vector>

// String utility functions
std::string truncate_with_ellipsis(const std::string& text, size_t max_length);
std::string to_lowercase(const std::string& str);

// Path utility functions
std::string normalize_path_separators(const std::string& path);
std::string get_relative_path(const std::string& full_path, const std::string& root_directory);
std::string format_file_size(uint64_t size_bytes);
void ensure_executable_working_directory();

// Extensions stb_image can decode, lowercase with the leading dot
const std::vector<std::string>& supported_image_extensions();
bool is_supported_image(const std::filesystem::path& path);

// Opens a file with the platform's default application. Returns false when the command could not run.
bool open_with_system_viewer(const std::string& file_path);
