#include "grid/selection_overlay.h"

#include "logger.h"

SelectionOverlay::SelectionOverlay(std::shared_ptr<SelectionStore> store) : store_(std::move(store)) {
  if (!store_) {
    LOG_WARN("[SelectionOverlay] No selection store supplied, using a private one");
    store_ = std::make_shared<SelectionStore>();
  }
}

ClickResult SelectionOverlay::handle_click(const ItemId& id, int index) {
  if (store_->selection_mode()) {
    bool selected = store_->toggle(id);
    LOG_TRACE("[SelectionOverlay] {} '{}' ({} selected)", selected ? "Selected" : "Deselected", id,
      store_->selected_count());
    return ClickResult::Toggled;
  }
  if (!on_click_) {
    return ClickResult::Ignored;
  }
  on_click_(id, index);
  return ClickResult::Forwarded;
}

ClickResult SelectionOverlay::handle_double_click(const ItemId& id, int index) {
  if (store_->selection_mode() || !on_double_click_) {
    return ClickResult::Ignored;
  }
  on_double_click_(id, index);
  return ClickResult::Forwarded;
}
