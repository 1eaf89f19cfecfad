#pragma once

#include <memory>

#include "grid/grid_types.h"
#include "grid/selection_store.h"

enum class ClickResult {
  Forwarded,  // Host callback invoked
  Toggled,    // Selection membership flipped, host not called
  Ignored
};

// Routes item clicks: forwarded to the host outside selection mode, selection toggles inside it.
// Never affects layout.
class SelectionOverlay {
public:
  explicit SelectionOverlay(std::shared_ptr<SelectionStore> store);

  void set_on_item_click(ItemClickCallback callback) { on_click_ = std::move(callback); }
  void set_on_item_double_click(ItemClickCallback callback) { on_double_click_ = std::move(callback); }

  ClickResult handle_click(const ItemId& id, int index);

  // Double clicks are dropped while selecting
  ClickResult handle_double_click(const ItemId& id, int index);

  bool selection_mode() const { return store_->selection_mode(); }
  bool is_selected(const ItemId& id) const { return store_->is_selected(id); }

  SelectionStore& store() { return *store_; }
  const std::shared_ptr<SelectionStore>& shared_store() const { return store_; }

private:
  std::shared_ptr<SelectionStore> store_;
  ItemClickCallback on_click_;
  ItemClickCallback on_double_click_;
};
