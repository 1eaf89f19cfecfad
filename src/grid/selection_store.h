#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <unordered_set>
#include <vector>

#include "grid/grid_types.h"

// Selection state shared by every item of one grid: the selection-mode flag and the selected ids.
// Always mutated in place through these operations, so consecutive toggles from different items
// each see the result of the previous one. Shared by reference (std::shared_ptr) between the grid
// and the host.
class SelectionStore {
public:
  using ListenerId = uint64_t;
  using Listener = std::function<void(const SelectionStore&)>;

  SelectionStore() = default;

  SelectionStore(const SelectionStore&) = delete;
  SelectionStore& operator=(const SelectionStore&) = delete;

  bool selection_mode() const { return selection_mode_; }

  // Leaving selection mode clears the selection
  void toggle_selection_mode();
  void enable_selection_mode();
  void disable_selection_mode();

  // Adds id when absent, removes it when present. Returns the new membership.
  bool toggle(const ItemId& id);

  // Replaces the selection with ids and enables selection mode
  void select_all(const std::vector<ItemId>& ids);

  void clear();

  bool is_selected(const ItemId& id) const;
  size_t selected_count() const { return selected_.size(); }

  // Sorted copy of the selected ids
  std::vector<ItemId> selected_ids() const;

  // Listeners run after every change that actually modified the state
  ListenerId add_listener(Listener listener);
  void remove_listener(ListenerId id);

private:
  void notify();

  bool selection_mode_ = false;
  std::unordered_set<ItemId> selected_;

  ListenerId next_listener_id_ = 1;
  std::map<ListenerId, Listener> listeners_;
};
