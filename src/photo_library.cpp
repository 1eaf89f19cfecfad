#include "photo_library.h"

#include <algorithm>
#include <chrono>
#include <cstdio>
#include <system_error>

#include "logger.h"
#include "utils.h"

namespace fs = std::filesystem;

PhotoLibrary::PhotoLibrary() : scanning_(false), cancel_requested_(false), scanned_count_(0) {}

PhotoLibrary::~PhotoLibrary() {
  cancel_scan();
}

bool PhotoLibrary::start_scan(const std::string& directory) {
  std::error_code ec;
  if (directory.empty() || !fs::is_directory(fs::u8path(directory), ec)) {
    LOG_ERROR("Photos directory does not exist: '{}'", directory);
    return false;
  }

  cancel_scan();
  cancel_requested_ = false;
  scanned_count_ = 0;
  scanning_ = true;

  scan_thread_ = std::thread([this, directory]() {
    auto start_time = std::chrono::steady_clock::now();
    std::vector<Photo> photos = scan_directory(directory, cancel_requested_, scanned_count_);
    if (cancel_requested_) {
      LOG_DEBUG("Scan of {} cancelled after {} photos", directory, photos.size());
      scanning_ = false;
      return;
    }
    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - start_time);
    LOG_INFO("Scanned {} photos in {} ({} ms)", photos.size(), directory, elapsed.count());

    {
      std::lock_guard<std::mutex> lock(result_mutex_);
      pending_result_ = std::move(photos);
      pending_root_ = directory;
    }
    scanning_ = false;
  });

  LOG_INFO("Scanning photos in {}", directory);
  return true;
}

void PhotoLibrary::cancel_scan() {
  cancel_requested_ = true;
  join_scan_thread();
  scanning_ = false;
  std::lock_guard<std::mutex> lock(result_mutex_);
  pending_result_.reset();
}

void PhotoLibrary::join_scan_thread() {
  if (scan_thread_.joinable()) {
    scan_thread_.join();
  }
}

void PhotoLibrary::load_demo(int count) {
  cancel_scan();

  std::vector<Photo> photos;
  photos.reserve(static_cast<size_t>(std::max(0, count)));
  char buffer[32];
  for (int i = 0; i < count; ++i) {
    snprintf(buffer, sizeof(buffer), "demo/%06d", i);
    Photo photo;
    photo.id = buffer;
    photo.name = "Photo " + std::to_string(i + 1);
    photo.synthetic = true;
    photos.push_back(std::move(photo));
  }

  publish(std::move(photos), "");
  LOG_INFO("Loaded {} demo photos", photos_.size());
}

bool PhotoLibrary::poll() {
  std::optional<std::vector<Photo>> result;
  std::string root;
  {
    std::lock_guard<std::mutex> lock(result_mutex_);
    if (!pending_result_) {
      return false;
    }
    result = std::move(pending_result_);
    pending_result_.reset();
    root = pending_root_;
  }

  join_scan_thread();
  publish(std::move(*result), root);
  return true;
}

void PhotoLibrary::publish(std::vector<Photo> photos, const std::string& root) {
  photos_ = std::move(photos);
  root_directory_ = root;
  index_by_id_.clear();
  index_by_id_.reserve(photos_.size());
  for (size_t i = 0; i < photos_.size(); ++i) {
    index_by_id_.emplace(photos_[i].id, i);
  }
}

std::vector<ItemId> PhotoLibrary::ids() const {
  std::vector<ItemId> result;
  result.reserve(photos_.size());
  for (const Photo& photo : photos_) {
    result.push_back(photo.id);
  }
  return result;
}

const Photo* PhotoLibrary::find(const ItemId& id) const {
  auto it = index_by_id_.find(id);
  return it == index_by_id_.end() ? nullptr : &photos_[it->second];
}

const Photo* PhotoLibrary::at(int index) const {
  if (index < 0 || index >= static_cast<int>(photos_.size())) {
    return nullptr;
  }
  return &photos_[index];
}

std::vector<Photo> PhotoLibrary::scan_directory(const std::string& directory, const std::atomic<bool>& cancel,
    std::atomic<size_t>& progress) {
  std::vector<Photo> photos;
  fs::path root = fs::u8path(directory);

  std::error_code ec;
  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  if (ec) {
    LOG_ERROR("Cannot scan {}: {}", directory, ec.message());
    return photos;
  }

  for (fs::recursive_directory_iterator end; it != end; it.increment(ec)) {
    if (ec) {
      LOG_WARN("Scan of {} stopped early: {}", directory, ec.message());
      break;
    }
    if (cancel) {
      break;
    }

    const fs::directory_entry& entry = *it;
    std::error_code entry_ec;
    if (!entry.is_regular_file(entry_ec) || !is_supported_image(entry.path())) {
      continue;
    }

    Photo photo;
    photo.full_path = entry.path();
    photo.id = get_relative_path(entry.path().u8string(), root.u8string());
    photo.name = entry.path().filename().u8string();
    uint64_t size = entry.file_size(entry_ec);
    photo.size = entry_ec ? 0 : size;
    photos.push_back(std::move(photo));
    ++progress;
  }

  std::sort(photos.begin(), photos.end(), [](const Photo& a, const Photo& b) { return a.id < b.id; });
  return photos;
}
