#include "grid/virtual_grid.h"

#include <algorithm>
#include <unordered_set>

#include "logger.h"

VirtualGrid::VirtualGrid(const GridOptions& options, VisibilityMonitor& visibility_monitor,
    ResizeNotifier& resize_notifier, std::shared_ptr<SelectionStore> selection)
  : options_(options),
    visibility_monitor_(visibility_monitor),
    layout_(options.column_count, options.min_item_width, options.gap),
    revealed_cache_(options.revealed_capacity),
    selection_overlay_(std::move(selection)) {
  SubscriptionId subscription_id = resize_notifier.subscribe(
    [this](const ContainerSize& size) { handle_resize(size); });
  resize_subscription_ = ResizeSubscription(&resize_notifier, subscription_id);
  sync_virtualizer();
}

VirtualGrid::~VirtualGrid() {
  // Observations first, while the monitor is still alive
  wrappers_.clear();
}

bool VirtualGrid::set_items(std::vector<ItemId> items) {
  std::unordered_set<ItemId> seen;
  seen.reserve(items.size());
  for (const ItemId& id : items) {
    if (!seen.insert(id).second) {
      LOG_WARN("[VirtualGrid] Rejecting item list of {} with duplicate id '{}'", items.size(), id);
      return false;
    }
  }

  items_ = std::move(items);
  wrappers_dirty_ = true;
  LOG_DEBUG("[VirtualGrid] {} items, {} rows", items_.size(), row_count());
  return true;
}

void VirtualGrid::set_options(const GridOptions& options) {
  bool columns_changed = false;
  columns_changed |= layout_.set_gap(options.gap);
  columns_changed |= layout_.set_min_item_width(options.min_item_width);
  columns_changed |= layout_.set_requested_columns(options.column_count);

  if (options.item_height != options_.item_height || options.gap != options_.gap || columns_changed) {
    virtualizer_.reset_measurements();
  }
  if (options.revealed_capacity != options_.revealed_capacity) {
    revealed_cache_.set_capacity(options.revealed_capacity);
  }

  options_ = options;
  wrappers_dirty_ = true;
  sync_virtualizer();
}

void VirtualGrid::on_scroll(float scroll_offset) {
  if (tracker_.on_scroll(scroll_offset)) {
    virtualizer_.set_scroll_offset(tracker_.viewport().scroll_offset);
  }
}

void VirtualGrid::handle_resize(const ContainerSize& size) {
  if (!tracker_.on_resize(size)) {
    return;
  }
  if (layout_.update_width(tracker_.viewport().container_width)) {
    // Row membership changed; old measurements describe different rows
    virtualizer_.reset_measurements();
  }
  virtualizer_.set_viewport_size(tracker_.viewport().container_height);
  wrappers_dirty_ = true;
}

void VirtualGrid::sync_virtualizer() {
  VirtualizerOptions virtualizer_options;
  virtualizer_options.count = compute_row_count(item_count(), layout_.column_count());
  virtualizer_options.estimate_size = std::max(0.0f, options_.item_height + options_.gap);
  virtualizer_options.overscan = options_.overscan;
  virtualizer_.set_options(virtualizer_options);
  virtualizer_.set_scroll_offset(tracker_.viewport().scroll_offset);
  virtualizer_.set_viewport_size(tracker_.viewport().container_height);
}

const std::vector<VirtualRow>& VirtualGrid::update() {
  sync_virtualizer();
  const std::vector<RowSpan>& spans = virtualizer_.get_virtual_rows();
  const std::vector<VirtualRow>& rows = composer_.compose(spans, virtualizer_.version(), item_count(),
    layout_.column_count());

  if (composer_.last_compose_rebuilt() || wrappers_dirty_) {
    reconcile(rows);
    wrappers_dirty_ = false;
  }
  return rows;
}

float VirtualGrid::total_size() {
  sync_virtualizer();
  return virtualizer_.total_size();
}

VisibilityOptions VirtualGrid::visibility_options() const {
  VisibilityOptions visibility;
  visibility.root_margin = options_.reveal_root_margin;
  visibility.threshold = options_.reveal_threshold;
  return visibility;
}

GridRect VirtualGrid::bounds_for(const VirtualRow& row, const GridCell& cell) const {
  return GridRect(layout_.column_x(cell.column_index), row.start, layout_.column_width(),
    std::max(0.0f, row.size - options_.gap));
}

void VirtualGrid::reconcile(const std::vector<VirtualRow>& rows) {
  std::unordered_set<ItemId> in_window;
  size_t mounted = 0;

  for (const VirtualRow& row : rows) {
    for (const GridCell& cell : row.cells) {
      if (cell.global_index < 0 || cell.global_index >= item_count()) {
        continue;
      }
      const ItemId& id = items_[cell.global_index];
      in_window.insert(id);
      GridRect bounds = bounds_for(row, cell);

      auto it = wrappers_.find(id);
      if (it != wrappers_.end()) {
        it->second->set_bounds(bounds);
        continue;
      }

      auto wrapper = std::make_unique<LazyRevealItem>(id, visibility_monitor_, visibility_options(),
        options_.reveal_fade_ms);
      wrapper->set_on_revealed([this](const ItemId& revealed_id) { revealed_cache_.insert(revealed_id); });
      if (revealed_cache_.touch(id)) {
        wrapper->mount_revealed(bounds);
      } else {
        wrapper->mount(bounds);
      }
      wrappers_.emplace(id, std::move(wrapper));
      ++mounted;
    }
  }

  size_t unmounted = 0;
  for (auto it = wrappers_.begin(); it != wrappers_.end();) {
    if (in_window.find(it->first) == in_window.end()) {
      it->second->unmount();
      it = wrappers_.erase(it);
      ++unmounted;
    } else {
      ++it;
    }
  }

  if (mounted > 0 || unmounted > 0) {
    LOG_TRACE("[VirtualGrid] Mounted {}, unmounted {}, live {}", mounted, unmounted, wrappers_.size());
  }
}

CellView VirtualGrid::make_view(const VirtualRow& row, const GridCell& cell, Clock::time_point now) const {
  CellView view;
  view.id = items_[cell.global_index];
  view.index = cell.global_index;
  view.column = cell.column_index;
  view.row = cell.row_index;
  view.bounds = bounds_for(row, cell);
  view.selection_mode = selection_overlay_.selection_mode();
  view.selected = selection_overlay_.is_selected(view.id);

  auto it = wrappers_.find(view.id);
  if (it != wrappers_.end()) {
    view.revealed = it->second->is_visible();
    view.reveal_progress = it->second->reveal_progress(now);
  }
  return view;
}

void VirtualGrid::render(const GridCallbacks& callbacks, Clock::time_point now) {
  if (loading_) {
    if (!callbacks.render_loading) {
      return;
    }
    int columns = layout_.column_count();
    float row_size = options_.item_height + options_.gap;
    for (int i = 0; i < options_.loading_skeleton_count; ++i) {
      int row = i / columns;
      int column = i % columns;
      GridRect bounds(layout_.column_x(column), row * row_size, layout_.column_width(), options_.item_height);
      callbacks.render_loading(i, bounds);
    }
    return;
  }

  if (items_.empty()) {
    if (callbacks.render_empty) {
      callbacks.render_empty();
    }
    return;
  }

  const std::vector<VirtualRow>& rows = update();
  for (const VirtualRow& row : rows) {
    for (const GridCell& cell : row.cells) {
      if (cell.global_index < 0 || cell.global_index >= item_count()) {
        continue;
      }
      CellView view = make_view(row, cell, now);
      if (view.revealed) {
        if (callbacks.render_item) {
          callbacks.render_item(view);
        }
      } else if (callbacks.render_placeholder) {
        callbacks.render_placeholder(view);
      }
    }
  }
}

GridRect VirtualGrid::cell_bounds(int index) {
  if (index < 0 || index >= item_count()) {
    return GridRect();
  }
  sync_virtualizer();
  int columns = layout_.column_count();
  RowSpan span = virtualizer_.row_span(index / columns);
  VirtualRow row;
  row.row_index = span.index;
  row.start = span.start;
  row.size = span.size;
  GridCell cell;
  cell.global_index = index;
  cell.column_index = index % columns;
  cell.row_index = span.index;
  return bounds_for(row, cell);
}

float VirtualGrid::scroll_to_index(int index, ScrollAlign align) {
  if (items_.empty()) {
    return 0.0f;
  }
  if (index < 0 || index >= item_count()) {
    LOG_WARN("[VirtualGrid] scroll_to_index({}) outside [0, {}), clamping", index, item_count());
    index = std::clamp(index, 0, item_count() - 1);
  }
  sync_virtualizer();
  float offset = virtualizer_.scroll_to_row(index / layout_.column_count(), align);
  tracker_.on_scroll(offset);
  return offset;
}

void VirtualGrid::measure_element(int row_index, float height) {
  sync_virtualizer();
  virtualizer_.measure_row(row_index, height);
  wrappers_dirty_ = true;
}

void VirtualGrid::set_on_item_click(ItemClickCallback callback) {
  selection_overlay_.set_on_item_click(std::move(callback));
}

void VirtualGrid::set_on_item_double_click(ItemClickCallback callback) {
  selection_overlay_.set_on_item_double_click(std::move(callback));
}

ClickResult VirtualGrid::handle_click(int index) {
  if (index < 0 || index >= item_count()) {
    return ClickResult::Ignored;
  }
  return selection_overlay_.handle_click(items_[index], index);
}

ClickResult VirtualGrid::handle_double_click(int index) {
  if (index < 0 || index >= item_count()) {
    return ClickResult::Ignored;
  }
  return selection_overlay_.handle_double_click(items_[index], index);
}

const LazyRevealItem* VirtualGrid::find_mounted(const ItemId& id) const {
  auto it = wrappers_.find(id);
  return it == wrappers_.end() ? nullptr : it->second.get();
}
