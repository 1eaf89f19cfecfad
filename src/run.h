#pragma once

#include <atomic>
#include <string>

#include "logger.h"

struct RunOptions {
  std::string photos_directory;  // Overrides (and persists) the configured directory when set
  bool demo = false;             // Synthetic collection instead of a directory scan
  int demo_count = 0;            // 0 uses Config::DEMO_ITEM_COUNT
  LogLevel log_level = LogLevel::Info;
};

// Main application entry point
// shutdown_requested: Optional atomic flag for graceful shutdown
// Returns 0 on success, non-zero on error
int run(const RunOptions& options, std::atomic<bool>* shutdown_requested = nullptr);
