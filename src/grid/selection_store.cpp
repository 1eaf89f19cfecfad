#include "grid/selection_store.h"

#include <algorithm>

#include "logger.h"

void SelectionStore::toggle_selection_mode() {
  if (selection_mode_) {
    disable_selection_mode();
  } else {
    enable_selection_mode();
  }
}

void SelectionStore::enable_selection_mode() {
  if (selection_mode_) {
    return;
  }
  selection_mode_ = true;
  LOG_DEBUG("[Selection] Selection mode on");
  notify();
}

void SelectionStore::disable_selection_mode() {
  if (!selection_mode_ && selected_.empty()) {
    return;
  }
  selection_mode_ = false;
  selected_.clear();
  LOG_DEBUG("[Selection] Selection mode off");
  notify();
}

bool SelectionStore::toggle(const ItemId& id) {
  bool selected;
  auto it = selected_.find(id);
  if (it != selected_.end()) {
    selected_.erase(it);
    selected = false;
  } else {
    selected_.insert(id);
    selected = true;
  }
  notify();
  return selected;
}

void SelectionStore::select_all(const std::vector<ItemId>& ids) {
  std::unordered_set<ItemId> next(ids.begin(), ids.end());
  if (selection_mode_ && next == selected_) {
    return;
  }
  selected_ = std::move(next);
  selection_mode_ = true;
  LOG_DEBUG("[Selection] Selected all {} items", selected_.size());
  notify();
}

void SelectionStore::clear() {
  if (selected_.empty()) {
    return;
  }
  selected_.clear();
  notify();
}

bool SelectionStore::is_selected(const ItemId& id) const {
  return selected_.find(id) != selected_.end();
}

std::vector<ItemId> SelectionStore::selected_ids() const {
  std::vector<ItemId> ids(selected_.begin(), selected_.end());
  std::sort(ids.begin(), ids.end());
  return ids;
}

SelectionStore::ListenerId SelectionStore::add_listener(Listener listener) {
  if (!listener) {
    return 0;
  }
  ListenerId id = next_listener_id_++;
  listeners_.emplace(id, std::move(listener));
  return id;
}

void SelectionStore::remove_listener(ListenerId id) {
  listeners_.erase(id);
}

void SelectionStore::notify() {
  // Listeners may remove themselves
  std::vector<Listener> snapshot;
  snapshot.reserve(listeners_.size());
  for (const auto& [id, listener] : listeners_) {
    snapshot.push_back(listener);
  }
  for (const auto& listener : snapshot) {
    listener(*this);
  }
}
