#pragma once

#include <cstdint>
#include <string>
#include <vector>

// Decoded RGBA8 image owned by value so it can cross threads
struct ImageData {
  int width = 0;
  int height = 0;
  std::vector<unsigned char> pixels;  // width * height * 4 bytes

  bool is_valid() const {
    return width > 0 && height > 0 && pixels.size() == static_cast<size_t>(width) * height * 4;
  }
};

// Size that fits inside max_dimension on both axes keeping the aspect ratio; never upscales
void fit_dimensions(int width, int height, int max_dimension, int& out_width, int& out_height);

// Box-filter (area average) downscale of an RGBA image. Returns the input unchanged when it already fits.
ImageData downscale_rgba(const ImageData& source, int max_dimension);

// Deterministic gradient tile for synthetic library entries, seeded by the item id
ImageData generate_demo_image(const std::string& seed, int width, int height);
