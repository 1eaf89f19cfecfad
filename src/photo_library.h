#pragma once

#include <atomic>
#include <cstdint>
#include <filesystem>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

#include "grid/grid_types.h"

struct Photo {
  ItemId id;  // Path relative to the library root, forward slashes
  std::filesystem::path full_path;
  std::string name;
  uint64_t size = 0;
  bool synthetic = false;  // Demo entry without a file
};

// Ordered, unique-keyed photo collection. Directory scans run on a background thread;
// poll() publishes the finished list on the UI thread.
class PhotoLibrary {
public:
  PhotoLibrary();
  ~PhotoLibrary();

  PhotoLibrary(const PhotoLibrary&) = delete;
  PhotoLibrary& operator=(const PhotoLibrary&) = delete;

  // Starts a background scan, cancelling one in flight. Returns false for a missing directory.
  bool start_scan(const std::string& directory);
  void cancel_scan();

  // Replaces the collection with count synthetic entries
  void load_demo(int count);

  // Publishes a finished scan. Returns true when the collection changed.
  bool poll();

  bool is_scanning() const { return scanning_; }
  size_t scanned_count() const { return scanned_count_; }

  const std::vector<Photo>& photos() const { return photos_; }
  size_t size() const { return photos_.size(); }
  std::vector<ItemId> ids() const;
  const Photo* find(const ItemId& id) const;
  const Photo* at(int index) const;
  const std::string& root_directory() const { return root_directory_; }

  // Recursive scan for decodable images ordered by id. Stops early (returning what it has) when
  // cancel becomes true.
  static std::vector<Photo> scan_directory(const std::string& directory, const std::atomic<bool>& cancel,
    std::atomic<size_t>& progress);

private:
  void publish(std::vector<Photo> photos, const std::string& root);
  void join_scan_thread();

  std::vector<Photo> photos_;
  std::unordered_map<ItemId, size_t> index_by_id_;
  std::string root_directory_;

  std::thread scan_thread_;
  std::atomic<bool> scanning_;
  std::atomic<bool> cancel_requested_;
  std::atomic<size_t> scanned_count_;

  std::mutex result_mutex_;
  std::optional<std::vector<Photo>> pending_result_;
  std::string pending_root_;
};
