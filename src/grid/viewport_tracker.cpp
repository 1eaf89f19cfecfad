#include "grid/viewport_tracker.h"

#include <cmath>

#include "logger.h"

namespace {
float sanitize_extent(float value) {
  if (!std::isfinite(value) || value < 0.0f) {
    return 0.0f;
  }
  return value;
}
}

bool ViewportTracker::on_scroll(float scroll_offset) {
  float offset = sanitize_extent(scroll_offset);
  if (offset == viewport_.scroll_offset) {
    return false;
  }
  viewport_.scroll_offset = offset;
  return true;
}

bool ViewportTracker::on_resize(const ContainerSize& size) {
  float width = sanitize_extent(size.width);
  float height = sanitize_extent(size.height);
  if (width == viewport_.container_width && height == viewport_.container_height) {
    return false;
  }
  LOG_TRACE("[Viewport] Resized {}x{} -> {}x{}", viewport_.container_width,
    viewport_.container_height, width, height);
  viewport_.container_width = width;
  viewport_.container_height = height;
  return true;
}
