#include "grid/column_layout.h"

#include <algorithm>
#include <cmath>

#include "logger.h"

int compute_column_count(float container_width, int requested_columns, float min_item_width, float gap) {
  int requested = std::max(1, requested_columns);
  if (!std::isfinite(container_width) || container_width <= 0.0f) {
    return 1;
  }

  float safe_gap = std::isfinite(gap) ? std::max(0.0f, gap) : 0.0f;
  float track = std::isfinite(min_item_width) ? std::max(0.0f, min_item_width) + safe_gap : 0.0f;
  if (track <= 0.0f) {
    // Zero-width items always fit; only the requested maximum applies
    return requested;
  }

  float fitting = std::floor((container_width + safe_gap) / track);
  int effective = fitting >= static_cast<float>(requested) ? requested : static_cast<int>(fitting);
  return std::clamp(effective, 1, requested);
}

ColumnLayout::ColumnLayout(int requested_columns, float min_item_width, float gap)
  : requested_columns_(std::max(1, requested_columns)),
  min_item_width_(std::max(0.0f, min_item_width)),
  gap_(std::max(0.0f, gap)) {
  if (requested_columns < 1) {
    LOG_WARN("[ColumnLayout] Requested column count {} clamped to 1", requested_columns);
  }
  recompute();
}

bool ColumnLayout::update_width(float container_width) {
  container_width_ = std::isfinite(container_width) ? std::max(0.0f, container_width) : 0.0f;
  return recompute();
}

bool ColumnLayout::set_requested_columns(int requested_columns) {
  if (requested_columns < 1) {
    LOG_WARN("[ColumnLayout] Requested column count {} clamped to 1", requested_columns);
  }
  requested_columns_ = std::max(1, requested_columns);
  return recompute();
}

bool ColumnLayout::set_min_item_width(float min_item_width) {
  min_item_width_ = std::max(0.0f, min_item_width);
  return recompute();
}

bool ColumnLayout::set_gap(float gap) {
  gap_ = std::max(0.0f, gap);
  return recompute();
}

float ColumnLayout::column_width() const {
  float usable = container_width_ - gap_ * static_cast<float>(column_count_ - 1);
  return std::max(0.0f, usable / static_cast<float>(column_count_));
}

float ColumnLayout::column_x(int column_index) const {
  return static_cast<float>(column_index) * (column_width() + gap_);
}

bool ColumnLayout::recompute() {
  int next = compute_column_count(container_width_, requested_columns_, min_item_width_, gap_);
  if (next == column_count_) {
    return false;
  }
  LOG_DEBUG("[ColumnLayout] width={:.1f} columns {} -> {}", container_width_, column_count_, next);
  column_count_ = next;
  return true;
}
