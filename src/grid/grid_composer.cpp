#include "grid/grid_composer.h"

#include <algorithm>

#include "logger.h"

int compute_row_count(int item_count, int column_count) {
  if (item_count <= 0) {
    return 0;
  }
  int columns = std::max(1, column_count);
  return (item_count + columns - 1) / columns;
}

std::vector<GridCell> cells_for_row(int row_index, int column_count, int item_count) {
  std::vector<GridCell> cells;
  if (row_index < 0 || item_count <= 0) {
    return cells;
  }
  int columns = std::max(1, column_count);
  long long start_index = static_cast<long long>(row_index) * columns;
  if (start_index >= item_count) {
    // Stale row from a list that shrank since the window was computed
    return cells;
  }
  int end_index = static_cast<int>(std::min<long long>(start_index + columns, item_count));

  cells.reserve(static_cast<size_t>(end_index - start_index));
  for (int i = static_cast<int>(start_index); i < end_index; ++i) {
    GridCell cell;
    cell.global_index = i;
    cell.column_index = i - static_cast<int>(start_index);
    cell.row_index = row_index;
    cells.push_back(cell);
  }
  return cells;
}

const std::vector<VirtualRow>& GridComposer::compose(const std::vector<RowSpan>& rows,
    uint64_t rows_version, int item_count, int column_count) {
  if (column_count < 1) {
    LOG_WARN("[GridComposer] Column count {} clamped to 1", column_count);
    column_count = 1;
  }
  item_count = std::max(0, item_count);

  if (valid_ && rows_version == rows_version_ && item_count == item_count_ && column_count == column_count_) {
    last_rebuilt_ = false;
    return rows_;
  }

  std::vector<VirtualRow> composed;
  composed.reserve(rows.size());
  for (const RowSpan& span : rows) {
    VirtualRow row;
    row.row_index = span.index;
    row.start = span.start;
    row.size = span.size;
    row.cells = cells_for_row(span.index, column_count, item_count);
    composed.push_back(std::move(row));
  }

  rows_ = std::move(composed);
  rows_version_ = rows_version;
  item_count_ = item_count;
  column_count_ = column_count;
  valid_ = true;
  last_rebuilt_ = true;
  return rows_;
}
