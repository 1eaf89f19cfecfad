#include "grid/revealed_cache.h"

#include "logger.h"

RevealedCache::RevealedCache(size_t capacity) : capacity_(capacity) {}

bool RevealedCache::contains(const ItemId& id) const {
  return index_.find(id) != index_.end();
}

bool RevealedCache::touch(const ItemId& id) {
  auto it = index_.find(id);
  if (it == index_.end()) {
    return false;
  }
  order_.splice(order_.begin(), order_, it->second);
  return true;
}

size_t RevealedCache::insert(const ItemId& id) {
  if (touch(id)) {
    return 0;
  }
  order_.push_front(id);
  index_.emplace(id, order_.begin());
  return evict_overflow();
}

void RevealedCache::erase(const ItemId& id) {
  auto it = index_.find(id);
  if (it == index_.end()) {
    return;
  }
  order_.erase(it->second);
  index_.erase(it);
}

void RevealedCache::clear() {
  order_.clear();
  index_.clear();
}

void RevealedCache::set_capacity(size_t capacity) {
  capacity_ = capacity;
  size_t evicted = evict_overflow();
  if (evicted > 0) {
    LOG_DEBUG("[RevealedCache] Capacity {} evicted {} ids", capacity_, evicted);
  }
}

size_t RevealedCache::evict_overflow() {
  size_t evicted = 0;
  while (order_.size() > capacity_) {
    index_.erase(order_.back());
    order_.pop_back();
    ++evicted;
  }
  return evicted;
}
