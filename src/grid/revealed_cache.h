#pragma once

#include <cstddef>
#include <list>
#include <unordered_map>

#include "grid/grid_types.h"

// Bounded memory of item ids that were already revealed, least recently used evicted first.
// Lets an item scrolled out of the window and back come back Visible without a second reveal.
class RevealedCache {
public:
  explicit RevealedCache(size_t capacity);

  bool contains(const ItemId& id) const;

  // Marks id as most recently used; returns false when it is not cached
  bool touch(const ItemId& id);

  // Inserts or refreshes id; returns the number of evicted ids
  size_t insert(const ItemId& id);

  void erase(const ItemId& id);
  void clear();

  size_t size() const { return index_.size(); }
  size_t capacity() const { return capacity_; }
  void set_capacity(size_t capacity);

private:
  size_t evict_overflow();

  size_t capacity_;
  std::list<ItemId> order_;  // Front is most recent
  std::unordered_map<ItemId, std::list<ItemId>::iterator> index_;
};
