#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <cstdlib>

#include "grid/grid_types.h"

class SettingsDatabase;

class Config {
public:
  // =============================================================================
  // WINDOW
  // =============================================================================

  static constexpr int WINDOW_WIDTH = 1600;
  static constexpr int WINDOW_HEIGHT = 1000;
  static constexpr float STATUS_BAR_HEIGHT = 32.0f;

  // =============================================================================
  // GRID
  // =============================================================================

  static constexpr int GRID_COLUMN_COUNT_DEFAULT = 4;
  static constexpr int GRID_COLUMN_COUNT_MAX = 12;
  static constexpr float GRID_ITEM_WIDTH = 280.0f;
  static constexpr float GRID_ITEM_HEIGHT = 360.0f;
  static constexpr float GRID_GAP = 16.0f;
  static constexpr int GRID_OVERSCAN_DEFAULT = 3;
  static constexpr int GRID_OVERSCAN_MAX = 20;
  static constexpr float GRID_MIN_ITEM_WIDTH = 250.0f;
  static constexpr int GRID_LOADING_SKELETON_COUNT = 12;

  // Lazy reveal: pre-trigger margin hides thumbnail latency, tiny threshold fires on first pixel
  static constexpr float REVEAL_ROOT_MARGIN = 100.0f;
  static constexpr float REVEAL_THRESHOLD = 0.01f;
  static constexpr float REVEAL_FADE_MS = 300.0f;
  static constexpr float REVEAL_SLIDE_DISTANCE = 20.0f;

  // Zoom levels scale the item box; level 3 matches the default item size
  static constexpr int GRID_ZOOM_LEVEL_MIN = 0;
  static constexpr int GRID_ZOOM_LEVEL_MAX = 5;
  static constexpr float GRID_ZOOM_STEP = 0.25f;

  // =============================================================================
  // RESOURCE BOUNDS
  // =============================================================================

  static constexpr size_t REVEALED_ITEM_CAPACITY = 4096;
  static constexpr size_t THUMBNAIL_TEXTURE_CAPACITY = 512;
  static constexpr int THUMBNAIL_WORKER_COUNT = 2;
  static constexpr size_t THUMBNAIL_MAX_OUTSTANDING = 96;
  static constexpr int THUMBNAIL_UPLOADS_PER_FRAME = 8;
  static constexpr int THUMBNAIL_MAX_DIMENSION = 384;
  static constexpr int THUMBNAIL_MAX_ATTEMPTS = 2;
  static constexpr size_t THUMBNAIL_FAILURE_MEMORY = 1024;  // Ids whose failed attempts are remembered

  // Synthetic collection shown when no photos directory is configured
  static constexpr int DEMO_ITEM_COUNT = 100000;

  // =============================================================================
  // PERSISTED SETTINGS
  // =============================================================================

  static inline constexpr const char* CONFIG_KEY_PHOTOS_DIRECTORY = "photos_directory";
  static inline constexpr const char* CONFIG_KEY_GRID_COLUMN_COUNT = "grid_column_count";
  static inline constexpr const char* CONFIG_KEY_GRID_ZOOM_LEVEL = "grid_zoom_level";
  static inline constexpr const char* CONFIG_KEY_GRID_OVERSCAN = "grid_overscan";
  static constexpr int CONFIG_DEFAULT_GRID_ZOOM_LEVEL = 3;

  static constexpr const char* DATABASE_FILENAME = "settings.db";

  // =============================================================================
  // PATH UTILITIES
  // =============================================================================

  static std::filesystem::path get_data_directory() {
    if (std::getenv("TESTING")) {
      return "build/data";
    }

  #ifdef _WIN32
    const char* localappdata = std::getenv("LOCALAPPDATA");
    if (localappdata) {
      return std::filesystem::path(localappdata) / "PhotoVault";
    }
    return "data";
  #elif __APPLE__
    const char* home = std::getenv("HOME");
    if (home) {
      return std::filesystem::path(home) / "Library" / "Application Support" / "PhotoVault";
    }
    return "data";
  #else
    return "data";
  #endif
  }

  static std::filesystem::path get_database_path() {
    return get_data_directory() / DATABASE_FILENAME;
  }

  // Returns false when the data directory cannot be created
  static bool initialize_directories();

  // =============================================================================
  // RUNTIME CONFIGURATION
  // =============================================================================

  static bool initialize(SettingsDatabase* database);
  static void shutdown();

  static const std::string& photos_directory();
  static int grid_column_count();
  static int grid_zoom_level();
  static int grid_overscan();

  static bool set_photos_directory(const std::string& path);
  static bool set_grid_column_count(int columns);
  static bool set_grid_zoom_level(int level);
  static bool set_grid_overscan(int overscan);

  // Item box for a zoom level (clamped)
  static float zoom_scale(int level);

  // Grid options from the compile-time defaults and the persisted settings
  static GridOptions grid_options();

private:
  static std::string load_string_setting(const std::string& key, const std::string& default_value);
  static int load_int_setting(const std::string& key, int default_value, int min_value, int max_value);
  static bool persist_value(const std::string& key, const std::string& value);

  static SettingsDatabase* database_;
  static bool initialized_;
  static std::string photos_directory_value_;
  static int grid_column_count_value_;
  static int grid_zoom_level_value_;
  static int grid_overscan_value_;
};
