#include "grid/row_virtualizer.h"

#include <algorithm>
#include <cmath>

#include "logger.h"

namespace {
float sanitize_size(float value) {
  if (!std::isfinite(value) || value < 0.0f) {
    return 0.0f;
  }
  return value;
}

VirtualizerOptions sanitize_options(const VirtualizerOptions& options) {
  VirtualizerOptions result = options;
  if (result.count < 0) {
    LOG_WARN("[RowVirtualizer] Negative row count {} clamped to 0", result.count);
    result.count = 0;
  }
  result.estimate_size = sanitize_size(result.estimate_size);
  result.overscan = std::max(0, result.overscan);
  return result;
}
}

RowVirtualizer::RowVirtualizer() : RowVirtualizer(VirtualizerOptions()) {}

RowVirtualizer::RowVirtualizer(const VirtualizerOptions& options) {
  set_options(options);
}

void RowVirtualizer::set_options(const VirtualizerOptions& options) {
  VirtualizerOptions next = sanitize_options(options);

  if (next.count != options_.count || measured_sizes_.size() != static_cast<size_t>(next.count)) {
    size_t old_count = measured_sizes_.size();
    size_t new_count = static_cast<size_t>(next.count);
    measured_sizes_.resize(new_count, -1.0f);
    first_dirty_span_ = std::min(first_dirty_span_, std::min(old_count, new_count));
    ++spans_revision_;
  }

  if (next.estimate_size != options_.estimate_size) {
    first_dirty_span_ = 0;
    ++spans_revision_;
  }

  options_ = next;
}

void RowVirtualizer::set_scroll_offset(float offset) {
  scroll_offset_ = sanitize_size(offset);
}

void RowVirtualizer::set_viewport_size(float size) {
  viewport_size_ = sanitize_size(size);
}

void RowVirtualizer::ensure_spans() {
  size_t count = static_cast<size_t>(options_.count);
  if (spans_.size() != count) {
    spans_.resize(count);
    offsets_.resize(count);
  }
  if (first_dirty_span_ >= count) {
    first_dirty_span_ = count;
    return;
  }

  // Offsets are kept in double. A run of estimated rows is laid out as base + k * estimate so
  // rounding never accumulates across the run.
  double estimate = options_.estimate_size;
  double run_base = 0.0;
  size_t run_first = 0;
  for (size_t i = first_dirty_span_; i > 0; --i) {
    if (measured_sizes_[i - 1] >= 0.0f) {
      run_base = offsets_[i - 1] + measured_sizes_[i - 1];
      run_first = i;
      break;
    }
  }

  for (size_t i = first_dirty_span_; i < count; ++i) {
    double start = run_base + static_cast<double>(i - run_first) * estimate;
    double size = row_size(i);
    if (measured_sizes_[i] >= 0.0f) {
      run_base = start + size;
      run_first = i + 1;
    }
    offsets_[i] = start;
    RowSpan& span = spans_[i];
    span.index = static_cast<int>(i);
    span.start = static_cast<float>(start);
    span.size = static_cast<float>(size);
  }

  total_extent_ = run_base + static_cast<double>(count - run_first) * estimate;
  LOG_TRACE("[RowVirtualizer] Recomputed offsets for rows [{}, {})", first_dirty_span_, count);
  first_dirty_span_ = count;
}

double RowVirtualizer::row_size(size_t row_index) const {
  float measured = measured_sizes_[row_index];
  return measured >= 0.0f ? measured : options_.estimate_size;
}

float RowVirtualizer::total_size() {
  ensure_spans();
  if (spans_.empty()) {
    return 0.0f;
  }
  return static_cast<float>(total_extent_);
}

float RowVirtualizer::max_scroll_offset() {
  return std::max(0.0f, total_size() - viewport_size_);
}

int RowVirtualizer::find_first_row_ending_after(float offset) const {
  auto it = std::upper_bound(spans_.begin(), spans_.end(), offset,
    [](float value, const RowSpan& span) { return value < span.end(); });
  return static_cast<int>(it - spans_.begin());
}

std::pair<int, int> RowVirtualizer::visible_range() {
  ensure_spans();
  int count = options_.count;
  if (count == 0) {
    return {-1, -1};
  }

  int first = std::min(find_first_row_ending_after(scroll_offset_), count - 1);
  float window_end = scroll_offset_ + viewport_size_;
  int last = first;
  while (last + 1 < count && spans_[last + 1].start < window_end) {
    ++last;
  }
  return {first, last};
}

const std::vector<RowSpan>& RowVirtualizer::get_virtual_rows() {
  ensure_spans();

  RangeKey key;
  key.spans_revision = spans_revision_;
  key.scroll_offset = scroll_offset_;
  key.viewport_size = viewport_size_;
  key.overscan = options_.overscan;
  if (rows_valid_ && key == rows_key_) {
    return virtual_rows_;
  }

  std::vector<RowSpan> rows;
  auto [first, last] = visible_range();
  if (first >= 0) {
    int start_index = std::max(0, first - options_.overscan);
    int end_index = std::min(options_.count - 1, last + options_.overscan);
    rows.reserve(static_cast<size_t>(end_index - start_index + 1));
    for (int i = start_index; i <= end_index; ++i) {
      rows.push_back(spans_[i]);
    }
  }

  if (!rows_valid_ || rows != virtual_rows_) {
    virtual_rows_ = std::move(rows);
    ++version_;
    LOG_TRACE("[RowVirtualizer] Window offset={:.1f} viewport={:.1f} -> {} rows (version {})",
      scroll_offset_, viewport_size_, virtual_rows_.size(), version_);
  }
  rows_key_ = key;
  rows_valid_ = true;
  return virtual_rows_;
}

RowSpan RowVirtualizer::row_span(int row_index) {
  ensure_spans();
  if (row_index < 0 || row_index >= options_.count) {
    RowSpan empty;
    empty.index = -1;
    return empty;
  }
  return spans_[row_index];
}

float RowVirtualizer::scroll_offset_for_row(int row_index, ScrollAlign align) {
  ensure_spans();
  if (options_.count == 0) {
    return 0.0f;
  }
  if (row_index < 0 || row_index >= options_.count) {
    LOG_WARN("[RowVirtualizer] Scroll target row {} outside [0, {}), clamping", row_index, options_.count);
    row_index = std::clamp(row_index, 0, options_.count - 1);
  }

  const RowSpan& span = spans_[row_index];
  float target = scroll_offset_;
  switch (align) {
    case ScrollAlign::Start:
      target = span.start;
      break;
    case ScrollAlign::End:
      target = span.end() - viewport_size_;
      break;
    case ScrollAlign::Center:
      target = span.start + span.size * 0.5f - viewport_size_ * 0.5f;
      break;
    case ScrollAlign::Auto:
      if (span.start >= scroll_offset_ && span.end() <= scroll_offset_ + viewport_size_) {
        target = scroll_offset_;
      } else if (span.start < scroll_offset_) {
        target = span.start;
      } else {
        target = span.end() - viewport_size_;
      }
      break;
  }

  return std::clamp(target, 0.0f, max_scroll_offset());
}

float RowVirtualizer::scroll_to_row(int row_index, ScrollAlign align) {
  scroll_offset_ = scroll_offset_for_row(row_index, align);
  return scroll_offset_;
}

void RowVirtualizer::measure_row(int row_index, float size) {
  if (row_index < 0 || row_index >= options_.count) {
    LOG_WARN("[RowVirtualizer] Ignoring measurement for row {} outside [0, {})", row_index, options_.count);
    return;
  }
  float measured = sanitize_size(size);
  if (measured_sizes_[row_index] == measured) {
    return;
  }
  measured_sizes_[row_index] = measured;
  first_dirty_span_ = std::min(first_dirty_span_, static_cast<size_t>(row_index));
  ++spans_revision_;
}

void RowVirtualizer::reset_measurements() {
  std::fill(measured_sizes_.begin(), measured_sizes_.end(), -1.0f);
  first_dirty_span_ = 0;
  ++spans_revision_;
}

bool RowVirtualizer::is_measured(int row_index) const {
  if (row_index < 0 || row_index >= static_cast<int>(measured_sizes_.size())) {
    return false;
  }
  return measured_sizes_[row_index] >= 0.0f;
}
