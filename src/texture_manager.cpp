#include "texture_manager.h"

#include <algorithm>
#include <vector>

#include <glad/glad.h>

#include "logger.h"

TextureManager::TextureManager(ThumbnailLoader& loader, size_t capacity, int uploads_per_frame,
    int max_attempts, size_t failure_memory)
  : loader_(loader), capacity_(std::max<size_t>(1, capacity)), uploads_per_frame_(std::max(1, uploads_per_frame)),
  failures_(max_attempts, failure_memory) {
}

TextureManager::~TextureManager() {
  clear();
}

void TextureManager::begin_frame() {
  ++frame_;
  touched_.clear();
}

const ThumbnailTexture* TextureManager::get_thumbnail(const ItemId& id, const std::string& path) {
  touched_.insert(id);
  if (failures_.has_given_up(id)) {
    return nullptr;
  }

  TextureCacheEntry& entry = texture_cache_[id];
  entry.last_used_frame = frame_;
  if (entry.loaded) {
    return &entry.texture;
  }

  entry.file_path = path;
  if (!loader_.is_outstanding(id)) {
    ThumbnailRequest request;
    request.id = id;
    request.path = path;
    // Full loader: retried on a later frame
    loader_.request(request);
  }
  return nullptr;
}

bool TextureManager::has_failed(const ItemId& id) const {
  return failures_.has_given_up(id);
}

void TextureManager::end_frame() {
  upload_completed();
  loader_.cancel_except(touched_);
  release_untouched();
  evict_least_recently_used();
}

void TextureManager::upload_completed() {
  std::vector<ThumbnailResult> results = loader_.take_completed(static_cast<size_t>(uploads_per_frame_));
  for (ThumbnailResult& result : results) {
    auto it = texture_cache_.find(result.id);
    if (it == texture_cache_.end()) {
      continue;
    }
    TextureCacheEntry& entry = it->second;

    unsigned int texture_id = result.success ? create_opengl_texture(result.image) : 0;
    if (texture_id == 0) {
      if (failures_.record_failure(result.id)) {
        LOG_WARN("Giving up on thumbnail for '{}' after {} attempts", result.id, failures_.attempts(result.id));
      }
      continue;
    }
    failures_.forget(result.id);

    delete_texture(entry);
    entry.texture.texture_id = texture_id;
    entry.texture.width = result.image.width;
    entry.texture.height = result.image.height;
    entry.loaded = true;
    loaded_count_++;
  }
}

void TextureManager::release_untouched() {
  // Entries still loading are only kept while drawn; failure counts live in failures_
  for (auto it = texture_cache_.begin(); it != texture_cache_.end();) {
    if (!it->second.loaded && touched_.count(it->first) == 0 && !loader_.is_outstanding(it->first)) {
      it = texture_cache_.erase(it);
    } else {
      ++it;
    }
  }
}

void TextureManager::evict_least_recently_used() {
  if (loaded_count_ <= capacity_) {
    return;
  }

  std::vector<std::pair<uint64_t, ItemId>> candidates;
  for (const auto& [id, entry] : texture_cache_) {
    if (entry.loaded && entry.last_used_frame != frame_) {
      candidates.emplace_back(entry.last_used_frame, id);
    }
  }
  std::sort(candidates.begin(), candidates.end());

  size_t evicted = 0;
  for (const auto& candidate : candidates) {
    if (loaded_count_ <= capacity_) {
      break;
    }
    auto it = texture_cache_.find(candidate.second);
    delete_texture(it->second);
    texture_cache_.erase(it);
    ++evicted;
  }
  LOG_TRACE("Evicted {} thumbnail textures, {} resident", evicted, loaded_count_);
}

void TextureManager::delete_texture(TextureCacheEntry& entry) {
  if (entry.texture.texture_id != 0) {
    glDeleteTextures(1, &entry.texture.texture_id);
    entry.texture.texture_id = 0;
  }
  if (entry.loaded) {
    entry.loaded = false;
    loaded_count_--;
  }
}

void TextureManager::clear() {
  for (auto& [id, entry] : texture_cache_) {
    delete_texture(entry);
  }
  texture_cache_.clear();
  touched_.clear();
  failures_.clear();
  loaded_count_ = 0;
}

unsigned int TextureManager::create_opengl_texture(const ImageData& image) {
  if (!image.is_valid()) {
    LOG_WARN("[OPENGL_TEXTURE] Cannot create OpenGL texture from invalid image");
    return 0;
  }

  unsigned int texture_id = 0;
  glGenTextures(1, &texture_id);
  glBindTexture(GL_TEXTURE_2D, texture_id);

  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_S, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_WRAP_T, GL_CLAMP_TO_EDGE);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MIN_FILTER, GL_LINEAR);
  glTexParameteri(GL_TEXTURE_2D, GL_TEXTURE_MAG_FILTER, GL_LINEAR);

  glPixelStorei(GL_UNPACK_ALIGNMENT, 1);
  glTexImage2D(GL_TEXTURE_2D, 0, GL_RGBA, image.width, image.height, 0, GL_RGBA, GL_UNSIGNED_BYTE,
    image.pixels.data());

  LOG_TRACE("[OPENGL_TEXTURE] Created OpenGL texture ID {} ({}x{})", texture_id, image.width, image.height);
  return texture_id;
}
