#pragma once

// Effective column count for a container:
//   max(1, floor((container_width + gap) / (min_item_width + gap))), capped at requested_columns.
// Zero, negative or non-finite widths yield a single column.
int compute_column_count(float container_width, int requested_columns, float min_item_width, float gap);

// Tracks container width and the derived column count. Recomputed on every resize.
class ColumnLayout {
public:
  ColumnLayout(int requested_columns, float min_item_width, float gap);

  // Returns true when the effective column count changed
  bool update_width(float container_width);
  bool set_requested_columns(int requested_columns);
  bool set_min_item_width(float min_item_width);
  bool set_gap(float gap);

  int column_count() const { return column_count_; }
  int requested_columns() const { return requested_columns_; }
  float container_width() const { return container_width_; }
  float gap() const { return gap_; }

  // Width of one column when the container is split into equal tracks separated by gap
  float column_width() const;

  // Left edge of a column in container coordinates
  float column_x(int column_index) const;

private:
  bool recompute();

  int requested_columns_;
  float min_item_width_;
  float gap_;
  float container_width_ = 0.0f;
  int column_count_ = 1;
};
