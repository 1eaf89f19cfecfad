#pragma once

#include <chrono>
#include <functional>
#include <memory>
#include <unordered_map>
#include <vector>

#include "grid/column_layout.h"
#include "grid/grid_composer.h"
#include "grid/grid_types.h"
#include "grid/lazy_reveal_item.h"
#include "grid/resize_notifier.h"
#include "grid/revealed_cache.h"
#include "grid/row_virtualizer.h"
#include "grid/selection_overlay.h"
#include "grid/selection_store.h"
#include "grid/viewport_tracker.h"
#include "grid/visibility_monitor.h"

// Everything the host needs to draw one cell
struct CellView {
  ItemId id;
  int index = 0;
  int column = 0;
  int row = 0;
  GridRect bounds;
  bool revealed = false;
  float reveal_progress = 0.0f;
  bool selected = false;
  bool selection_mode = false;
};

struct GridCallbacks {
  std::function<void(const CellView&)> render_item;
  std::function<void(const CellView&)> render_placeholder;
  std::function<void()> render_empty;
  std::function<void(int skeleton_index, const GridRect& bounds)> render_loading;
};

// Windowed grid over an ordered list of unique item ids. The host maps indices back to its own
// payload. Only rows inside the viewport plus overscan get cells and live reveal wrappers, so the
// number of live instances is bounded by the viewport, not by the item count.
//
// Frame flow: the resize notifier and on_scroll() feed the viewport, update() recomputes columns,
// the row window and the composed cells (each step memoized), then reconciles the wrappers by id.
class VirtualGrid {
public:
  using Clock = std::chrono::steady_clock;

  VirtualGrid(const GridOptions& options, VisibilityMonitor& visibility_monitor,
    ResizeNotifier& resize_notifier, std::shared_ptr<SelectionStore> selection);
  ~VirtualGrid();

  VirtualGrid(const VirtualGrid&) = delete;
  VirtualGrid& operator=(const VirtualGrid&) = delete;

  // Rejects lists with duplicate ids and keeps the previous list
  bool set_items(std::vector<ItemId> items);
  const std::vector<ItemId>& items() const { return items_; }
  int item_count() const { return static_cast<int>(items_.size()); }

  void set_options(const GridOptions& options);
  const GridOptions& options() const { return options_; }

  void set_loading(bool loading) { loading_ = loading; }
  bool loading() const { return loading_; }

  void on_scroll(float scroll_offset);
  const Viewport& viewport() const { return tracker_.viewport(); }

  // Recomputes layout and window, reconciles wrappers; returns the composed rows
  const std::vector<VirtualRow>& update();

  // Emits cells of the window in row order. Stale indices are skipped.
  void render(const GridCallbacks& callbacks, Clock::time_point now = Clock::now());

  const std::vector<VirtualRow>& virtual_rows() { return update(); }
  float total_size();
  int column_count() const { return layout_.column_count(); }
  int row_count() const { return compute_row_count(item_count(), layout_.column_count()); }
  float column_width() const { return layout_.column_width(); }

  // Box of an item in content coordinates; zero rect for out-of-range indices
  GridRect cell_bounds(int index);

  // Moves the viewport so the row holding index is aligned; returns the new scroll offset
  float scroll_to_index(int index, ScrollAlign align = ScrollAlign::Auto);

  // Real extent of a row (including the gap below it)
  void measure_element(int row_index, float height);

  void set_on_item_click(ItemClickCallback callback);
  void set_on_item_double_click(ItemClickCallback callback);
  ClickResult handle_click(int index);
  ClickResult handle_double_click(int index);

  SelectionStore& selection() { return selection_overlay_.store(); }
  const std::shared_ptr<SelectionStore>& shared_selection() const { return selection_overlay_.shared_store(); }

  size_t mounted_count() const { return wrappers_.size(); }
  const LazyRevealItem* find_mounted(const ItemId& id) const;
  const RevealedCache& revealed_cache() const { return revealed_cache_; }

private:
  void handle_resize(const ContainerSize& size);
  void sync_virtualizer();
  void reconcile(const std::vector<VirtualRow>& rows);
  GridRect bounds_for(const VirtualRow& row, const GridCell& cell) const;
  VisibilityOptions visibility_options() const;
  CellView make_view(const VirtualRow& row, const GridCell& cell, Clock::time_point now) const;

  GridOptions options_;
  VisibilityMonitor& visibility_monitor_;

  std::vector<ItemId> items_;
  bool loading_ = false;

  ViewportTracker tracker_;
  ColumnLayout layout_;
  RowVirtualizer virtualizer_;
  GridComposer composer_;
  RevealedCache revealed_cache_;
  SelectionOverlay selection_overlay_;

  bool wrappers_dirty_ = true;
  std::unordered_map<ItemId, std::unique_ptr<LazyRevealItem>> wrappers_;

  ResizeSubscription resize_subscription_;
};
