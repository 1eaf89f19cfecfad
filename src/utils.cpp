#include "utils.h"
#include "logger.h"

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <filesystem>

#ifdef _WIN32
#ifndef NOMINMAX
#define NOMINMAX
#endif
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#include <windows.h>
#endif

namespace fs = std::filesystem;

std::string truncate_with_ellipsis(const std::string& text, size_t max_length) {
  if (text.length() <= max_length || max_length <= 3) {
    return text;
  }
  return text.substr(0, max_length - 3) + "...";
}

std::string to_lowercase(const std::string& str) {
  std::string result = str;
  std::transform(result.begin(), result.end(), result.begin(),
    [](unsigned char c) { return std::tolower(c); });
  return result;
}

std::string normalize_path_separators(const std::string& path) {
  std::string normalized = path;
  std::replace(normalized.begin(), normalized.end(), '\\', '/');
  return normalized;
}

// Path below root_directory with forward slashes; used as the stable photo id
std::string get_relative_path(const std::string& full_path, const std::string& root_directory) {
  std::string normalized_full_path = normalize_path_separators(full_path);
  std::string root_path = normalize_path_separators(root_directory);

  if (!root_path.empty() && root_path.back() != '/') {
    root_path += '/';
  }

  if (normalized_full_path.length() >= root_path.length() &&
    normalized_full_path.compare(0, root_path.length(), root_path) == 0) {
    return normalized_full_path.substr(root_path.length());
  }

  LOG_WARN("Photo path is outside the library root {}: {}", root_directory, full_path);
  return normalized_full_path;
}

std::string format_file_size(uint64_t size_bytes) {
  char buffer[32];
  if (size_bytes >= 1024 * 1024) {
    double size_mb = static_cast<double>(size_bytes) / (1024.0 * 1024.0);
    snprintf(buffer, sizeof(buffer), "%.1f MB", size_mb);
    return std::string(buffer);
  }
  else if (size_bytes >= 1024) {
    double size_kb = static_cast<double>(size_bytes) / 1024.0;
    snprintf(buffer, sizeof(buffer), "%.1f KB", size_kb);
    return std::string(buffer);
  }
  return std::to_string(size_bytes) + " bytes";
}

void ensure_executable_working_directory() {
#ifdef _WIN32
  wchar_t path_buffer[MAX_PATH] = L"";
  DWORD length = GetModuleFileNameW(nullptr, path_buffer, MAX_PATH);
  if (length == 0 || length == MAX_PATH) {
    return;
  }

  fs::path exe_dir = fs::path(path_buffer).parent_path();
  if (exe_dir.empty()) {
    return;
  }

  std::error_code ec;
  fs::current_path(exe_dir, ec);
  if (ec) {
    LOG_WARN("Failed to switch working directory to executable directory: {}", exe_dir.u8string());
  }
#endif
}

const std::vector<std::string>& supported_image_extensions() {
  static const std::vector<std::string> extensions = {
    ".jpg", ".jpeg", ".png", ".bmp", ".gif", ".tga", ".psd", ".hdr", ".pic", ".pnm", ".ppm", ".pgm"
  };
  return extensions;
}

bool is_supported_image(const fs::path& path) {
  std::string extension = to_lowercase(path.extension().u8string());
  const auto& extensions = supported_image_extensions();
  return std::find(extensions.begin(), extensions.end(), extension) != extensions.end();
}

bool open_with_system_viewer(const std::string& file_path) {
  std::string command;
#ifdef _WIN32
  std::string windows_path = file_path;
  std::replace(windows_path.begin(), windows_path.end(), '/', '\\');
  command = "start \"\" \"" + windows_path + "\"";
#elif __APPLE__
  command = "open \"" + file_path + "\"";
#else
  command = "xdg-open \"" + file_path + "\" >/dev/null 2>&1 &";
#endif

  int result = std::system(command.c_str());
  if (result == -1) {
    LOG_ERROR("Failed to execute viewer command: {}", command);
    return false;
  }
  return true;
}
