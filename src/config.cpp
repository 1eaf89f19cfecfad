#include "config.h"

#include <algorithm>
#include <system_error>

#include "database.h"
#include "logger.h"

SettingsDatabase* Config::database_ = nullptr;
bool Config::initialized_ = false;
std::string Config::photos_directory_value_;
int Config::grid_column_count_value_ = Config::GRID_COLUMN_COUNT_DEFAULT;
int Config::grid_zoom_level_value_ = Config::CONFIG_DEFAULT_GRID_ZOOM_LEVEL;
int Config::grid_overscan_value_ = Config::GRID_OVERSCAN_DEFAULT;

bool Config::initialize_directories() {
  std::filesystem::path data_dir = get_data_directory();
  std::error_code ec;
  std::filesystem::create_directories(data_dir, ec);
  if (ec) {
    LOG_ERROR("Failed to create data directory {}: {}", data_dir.u8string(), ec.message());
    return false;
  }
  return true;
}

bool Config::initialize(SettingsDatabase* database) {
  database_ = database;
  if (!database_) {
    LOG_ERROR("Config requires a valid database instance");
    return false;
  }

  photos_directory_value_ = load_string_setting(CONFIG_KEY_PHOTOS_DIRECTORY, "");
  grid_column_count_value_ = load_int_setting(CONFIG_KEY_GRID_COLUMN_COUNT, GRID_COLUMN_COUNT_DEFAULT,
    1, GRID_COLUMN_COUNT_MAX);
  grid_zoom_level_value_ = load_int_setting(CONFIG_KEY_GRID_ZOOM_LEVEL, CONFIG_DEFAULT_GRID_ZOOM_LEVEL,
    GRID_ZOOM_LEVEL_MIN, GRID_ZOOM_LEVEL_MAX);
  grid_overscan_value_ = load_int_setting(CONFIG_KEY_GRID_OVERSCAN, GRID_OVERSCAN_DEFAULT,
    0, GRID_OVERSCAN_MAX);
  initialized_ = true;

  LOG_DEBUG("Config loaded: photos_directory='{}' columns={} zoom={} overscan={}",
    photos_directory_value_, grid_column_count_value_, grid_zoom_level_value_, grid_overscan_value_);
  return true;
}

void Config::shutdown() {
  database_ = nullptr;
  initialized_ = false;
  photos_directory_value_.clear();
  grid_column_count_value_ = GRID_COLUMN_COUNT_DEFAULT;
  grid_zoom_level_value_ = CONFIG_DEFAULT_GRID_ZOOM_LEVEL;
  grid_overscan_value_ = GRID_OVERSCAN_DEFAULT;
}

const std::string& Config::photos_directory() {
  return photos_directory_value_;
}

int Config::grid_column_count() {
  return grid_column_count_value_;
}

int Config::grid_zoom_level() {
  return grid_zoom_level_value_;
}

int Config::grid_overscan() {
  return grid_overscan_value_;
}

bool Config::set_photos_directory(const std::string& path) {
  if (!persist_value(CONFIG_KEY_PHOTOS_DIRECTORY, path)) {
    return false;
  }
  photos_directory_value_ = path;
  return true;
}

bool Config::set_grid_column_count(int columns) {
  columns = std::clamp(columns, 1, GRID_COLUMN_COUNT_MAX);
  if (!persist_value(CONFIG_KEY_GRID_COLUMN_COUNT, std::to_string(columns))) {
    return false;
  }
  grid_column_count_value_ = columns;
  return true;
}

bool Config::set_grid_zoom_level(int level) {
  level = std::clamp(level, GRID_ZOOM_LEVEL_MIN, GRID_ZOOM_LEVEL_MAX);
  if (!persist_value(CONFIG_KEY_GRID_ZOOM_LEVEL, std::to_string(level))) {
    return false;
  }
  grid_zoom_level_value_ = level;
  return true;
}

bool Config::set_grid_overscan(int overscan) {
  overscan = std::clamp(overscan, 0, GRID_OVERSCAN_MAX);
  if (!persist_value(CONFIG_KEY_GRID_OVERSCAN, std::to_string(overscan))) {
    return false;
  }
  grid_overscan_value_ = overscan;
  return true;
}

float Config::zoom_scale(int level) {
  level = std::clamp(level, GRID_ZOOM_LEVEL_MIN, GRID_ZOOM_LEVEL_MAX);
  return 1.0f + GRID_ZOOM_STEP * static_cast<float>(level - CONFIG_DEFAULT_GRID_ZOOM_LEVEL);
}

GridOptions Config::grid_options() {
  float scale = zoom_scale(grid_zoom_level_value_);

  GridOptions options;
  options.column_count = grid_column_count_value_;
  options.item_width = GRID_ITEM_WIDTH * scale;
  options.item_height = GRID_ITEM_HEIGHT * scale;
  options.gap = GRID_GAP;
  options.overscan = grid_overscan_value_;
  options.min_item_width = GRID_MIN_ITEM_WIDTH * scale;
  options.reveal_root_margin = REVEAL_ROOT_MARGIN;
  options.reveal_threshold = REVEAL_THRESHOLD;
  options.reveal_fade_ms = REVEAL_FADE_MS;
  options.loading_skeleton_count = GRID_LOADING_SKELETON_COUNT;
  options.revealed_capacity = REVEALED_ITEM_CAPACITY;
  return options;
}

std::string Config::load_string_setting(const std::string& key, const std::string& default_value) {
  if (!database_) {
    return default_value;
  }

  std::string value;
  if (database_->try_get_config_value(key, value)) {
    return value;
  }

  if (!database_->upsert_config_value(key, default_value)) {
    LOG_WARN("Failed to persist default config value for key {}", key);
  }
  return default_value;
}

int Config::load_int_setting(const std::string& key, int default_value, int min_value, int max_value) {
  std::string stored = load_string_setting(key, std::to_string(default_value));
  try {
    int value = std::stoi(stored);
    if (value < min_value || value > max_value) {
      LOG_WARN("Config value {} for key {} outside [{}, {}], clamping", value, key, min_value, max_value);
      value = std::clamp(value, min_value, max_value);
    }
    return value;
  }
  catch (const std::exception& ex) {
    LOG_WARN("Invalid integer config value '{}' for key {}: {}", stored, key, ex.what());
  }
  return default_value;
}

bool Config::persist_value(const std::string& key, const std::string& value) {
  if (!database_) {
    return false;
  }

  if (!database_->upsert_config_value(key, value)) {
    LOG_WARN("Failed to persist config value for key {}", key);
    return false;
  }
  return true;
}
