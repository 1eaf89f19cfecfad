#pragma once

#include "grid/grid_types.h"

// Current scroll position and size of the scroll container
struct Viewport {
  float scroll_offset = 0.0f;
  float container_width = 0.0f;
  float container_height = 0.0f;

  GridRect visible_rect() const {
    return GridRect(0.0f, scroll_offset, container_width, container_height);
  }

  bool operator==(const Viewport& other) const {
    return scroll_offset == other.scroll_offset &&
      container_width == other.container_width &&
      container_height == other.container_height;
  }
  bool operator!=(const Viewport& other) const { return !(*this == other); }
};

// Observes the scroll container. Mutated only from platform scroll/resize events.
class ViewportTracker {
public:
  ViewportTracker() = default;

  // Both return true when the stored viewport changed
  bool on_scroll(float scroll_offset);
  bool on_resize(const ContainerSize& size);

  const Viewport& viewport() const { return viewport_; }

private:
  Viewport viewport_;
};
