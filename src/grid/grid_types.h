#pragma once

#include <cstddef>
#include <functional>
#include <string>

// Stable item identity. Used for keying wrappers, recycling and selection, never position.
using ItemId = std::string;

// Axis-aligned rectangle in grid content coordinates (y grows downward from the top of the grid)
struct GridRect {
  float x = 0.0f;
  float y = 0.0f;
  float width = 0.0f;
  float height = 0.0f;

  GridRect() = default;
  GridRect(float x_, float y_, float width_, float height_)
    : x(x_), y(y_), width(width_), height(height_) {}

  float right() const { return x + width; }
  float bottom() const { return y + height; }
  float area() const { return width > 0.0f && height > 0.0f ? width * height : 0.0f; }

  // Grows the rectangle by margin on every side
  GridRect expanded(float margin) const {
    return GridRect(x - margin, y - margin, width + margin * 2.0f, height + margin * 2.0f);
  }

  bool operator==(const GridRect& other) const {
    return x == other.x && y == other.y && width == other.width && height == other.height;
  }
  bool operator!=(const GridRect& other) const { return !(*this == other); }
};

// Overlap of two rectangles; zero-sized when they do not intersect
inline GridRect intersect_rects(const GridRect& a, const GridRect& b) {
  float left = a.x > b.x ? a.x : b.x;
  float top = a.y > b.y ? a.y : b.y;
  float right = a.right() < b.right() ? a.right() : b.right();
  float bottom = a.bottom() < b.bottom() ? a.bottom() : b.bottom();
  if (right < left || bottom < top) {
    return GridRect(left, top, 0.0f, 0.0f);
  }
  return GridRect(left, top, right - left, bottom - top);
}

// Size of the observed scroll container
struct ContainerSize {
  float width = 0.0f;
  float height = 0.0f;

  bool operator==(const ContainerSize& other) const {
    return width == other.width && height == other.height;
  }
  bool operator!=(const ContainerSize& other) const { return !(*this == other); }
};

// Where a scrolled-to row should land inside the viewport
enum class ScrollAlign {
  Start,
  Center,
  End,
  Auto
};

// Host callbacks for item interaction
using ItemClickCallback = std::function<void(const ItemId& id, int index)>;

// Grid configuration supplied by the host. column_count is a requested maximum.
struct GridOptions {
  int column_count = 4;
  float item_width = 280.0f;
  float item_height = 360.0f;
  float gap = 16.0f;
  int overscan = 3;
  float min_item_width = 250.0f;

  // Lazy reveal: items become visible this many pixels before entering the viewport
  float reveal_root_margin = 100.0f;
  float reveal_threshold = 0.01f;
  float reveal_fade_ms = 300.0f;

  // Number of skeleton cells rendered while the host reports loading
  int loading_skeleton_count = 12;

  // Upper bound on remembered revealed items (see RevealedCache)
  size_t revealed_capacity = 4096;
};
