#pragma once

#include <cstdint>
#include <string>
#include <unordered_map>
#include <unordered_set>

#include "grid/grid_types.h"
#include "image_data.h"
#include "thumbnail_loader.h"

struct ThumbnailTexture {
  unsigned int texture_id = 0;
  int width = 0;
  int height = 0;
};

// Texture cache entry structure
struct TextureCacheEntry {
  ThumbnailTexture texture;
  std::string file_path;
  bool loaded = false;
  uint64_t last_used_frame = 0;
};

// OpenGL thumbnail cache for revealed grid items. Requests go through the bounded ThumbnailLoader;
// a fixed number of decoded images is uploaded per frame and the least recently drawn textures are
// released past capacity. Must be used from the thread that owns the GL context.
class TextureManager {
public:
  TextureManager(ThumbnailLoader& loader, size_t capacity, int uploads_per_frame, int max_attempts,
    size_t failure_memory);
  ~TextureManager();

  TextureManager(const TextureManager&) = delete;
  TextureManager& operator=(const TextureManager&) = delete;

  void begin_frame();

  // Texture for an item drawn this frame; nullptr while loading or after repeated failures
  const ThumbnailTexture* get_thumbnail(const ItemId& id, const std::string& path);

  bool has_failed(const ItemId& id) const;

  // Uploads finished decodes, cancels requests for items not drawn this frame, evicts past capacity
  void end_frame();

  void clear();
  size_t texture_count() const { return loaded_count_; }

  static unsigned int create_opengl_texture(const ImageData& image);

private:
  void upload_completed();
  void release_untouched();
  void evict_least_recently_used();
  void delete_texture(TextureCacheEntry& entry);

  ThumbnailLoader& loader_;
  size_t capacity_;
  int uploads_per_frame_;
  ThumbnailRetryTracker failures_;

  uint64_t frame_ = 0;
  size_t loaded_count_ = 0;
  std::unordered_map<ItemId, TextureCacheEntry> texture_cache_;
  std::unordered_set<ItemId> touched_;
};
