#pragma once

#include <cstddef>
#include <cstdint>
#include <utility>
#include <vector>

#include "grid/grid_types.h"

// A row that must exist in the render output, positioned at start
struct RowSpan {
  int index = 0;
  float start = 0.0f;
  float size = 0.0f;

  float end() const { return start + size; }

  bool operator==(const RowSpan& other) const {
    return index == other.index && start == other.start && size == other.size;
  }
  bool operator!=(const RowSpan& other) const { return !(*this == other); }
};

struct VirtualizerOptions {
  int count = 0;
  float estimate_size = 0.0f;  // itemHeight + gap
  int overscan = 0;
};

// Decides which rows must be materialized for the current scroll offset and viewport size.
//
// Rows start with the constant size estimate. A host that knows real heights reports them through
// measure_row(); offsets are then recomputed incrementally from the first changed row.
// The returned row list is cached and only rebuilt when the count, sizes, overscan or viewport change,
// so repeated calls with unchanged input return the same vector.
class RowVirtualizer {
public:
  RowVirtualizer();
  explicit RowVirtualizer(const VirtualizerOptions& options);

  void set_options(const VirtualizerOptions& options);
  const VirtualizerOptions& options() const { return options_; }

  void set_scroll_offset(float offset);
  void set_viewport_size(float size);
  float scroll_offset() const { return scroll_offset_; }
  float viewport_size() const { return viewport_size_; }

  int row_count() const { return options_.count; }

  // Rows intersecting the viewport extended by overscan rows on each side
  const std::vector<RowSpan>& get_virtual_rows();

  // Full logical extent (sum of all row sizes); 0 when there are no rows
  float total_size();

  // First and last row (inclusive) intersecting the viewport without overscan; {-1, -1} when empty
  std::pair<int, int> visible_range();

  // Start offset and size of a row, measured or estimated
  RowSpan row_span(int row_index);

  // Scroll offset that brings a row to the requested alignment, clamped to the scrollable range
  float scroll_offset_for_row(int row_index, ScrollAlign align);

  // Applies scroll_offset_for_row and returns the new offset
  float scroll_to_row(int row_index, ScrollAlign align);

  // Records a real row height (measureElement)
  void measure_row(int row_index, float size);
  void reset_measurements();
  bool is_measured(int row_index) const;

  // Incremented every time get_virtual_rows() produces a different row list
  uint64_t version() const { return version_; }

private:
  void ensure_spans();
  double row_size(size_t row_index) const;
  float max_scroll_offset();
  int find_first_row_ending_after(float offset) const;

  VirtualizerOptions options_;
  float scroll_offset_ = 0.0f;
  float viewport_size_ = 0.0f;

  // Negative entries are rows that were never measured
  std::vector<float> measured_sizes_;
  std::vector<RowSpan> spans_;
  std::vector<double> offsets_;
  double total_extent_ = 0.0;
  size_t first_dirty_span_ = 0;
  uint64_t spans_revision_ = 0;

  struct RangeKey {
    uint64_t spans_revision = 0;
    float scroll_offset = 0.0f;
    float viewport_size = 0.0f;
    int overscan = 0;

    bool operator==(const RangeKey& other) const {
      return spans_revision == other.spans_revision && scroll_offset == other.scroll_offset &&
        viewport_size == other.viewport_size && overscan == other.overscan;
    }
  };

  bool rows_valid_ = false;
  RangeKey rows_key_;
  std::vector<RowSpan> virtual_rows_;
  uint64_t version_ = 0;
};
