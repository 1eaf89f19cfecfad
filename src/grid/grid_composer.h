#pragma once

#include <cstdint>
#include <vector>

#include "grid/row_virtualizer.h"

// One item slot inside a virtual row
struct GridCell {
  int global_index = 0;
  int column_index = 0;
  int row_index = 0;

  bool operator==(const GridCell& other) const {
    return global_index == other.global_index && column_index == other.column_index &&
      row_index == other.row_index;
  }
};

// Derived, never persisted
struct VirtualRow {
  int row_index = 0;
  float start = 0.0f;
  float size = 0.0f;
  std::vector<GridCell> cells;

  bool operator==(const VirtualRow& other) const {
    return row_index == other.row_index && start == other.start && size == other.size &&
      cells == other.cells;
  }
};

// Number of rows needed for item_count items in column_count columns (ceil division)
int compute_row_count(int item_count, int column_count);

// Items of a row: global indices [row*C, min((row+1)*C, item_count)), column = index - row*C
std::vector<GridCell> cells_for_row(int row_index, int column_count, int item_count);

// Maps virtual rows to item indices. The result is cached and recomputed only when the item count,
// the column count or the virtualizer's row list changes.
class GridComposer {
public:
  GridComposer() = default;

  const std::vector<VirtualRow>& compose(const std::vector<RowSpan>& rows, uint64_t rows_version,
    int item_count, int column_count);

  const std::vector<VirtualRow>& rows() const { return rows_; }

  // True when the last compose() call rebuilt the rows instead of returning the cache
  bool last_compose_rebuilt() const { return last_rebuilt_; }

  void invalidate() { valid_ = false; }

private:
  bool valid_ = false;
  bool last_rebuilt_ = false;
  uint64_t rows_version_ = 0;
  int item_count_ = 0;
  int column_count_ = 0;
  std::vector<VirtualRow> rows_;
};
