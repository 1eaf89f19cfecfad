#include "image_data.h"

#include <algorithm>
#include <cmath>
#include <functional>

void fit_dimensions(int width, int height, int max_dimension, int& out_width, int& out_height) {
  out_width = std::max(0, width);
  out_height = std::max(0, height);
  if (out_width == 0 || out_height == 0 || max_dimension <= 0) {
    return;
  }
  int largest = std::max(out_width, out_height);
  if (largest <= max_dimension) {
    return;
  }
  double scale = static_cast<double>(max_dimension) / largest;
  out_width = std::max(1, static_cast<int>(std::lround(width * scale)));
  out_height = std::max(1, static_cast<int>(std::lround(height * scale)));
}

ImageData downscale_rgba(const ImageData& source, int max_dimension) {
  if (!source.is_valid()) {
    return ImageData();
  }

  int target_width = 0;
  int target_height = 0;
  fit_dimensions(source.width, source.height, max_dimension, target_width, target_height);
  if (target_width == source.width && target_height == source.height) {
    return source;
  }

  ImageData result;
  result.width = target_width;
  result.height = target_height;
  result.pixels.resize(static_cast<size_t>(target_width) * target_height * 4);

  double x_ratio = static_cast<double>(source.width) / target_width;
  double y_ratio = static_cast<double>(source.height) / target_height;

  for (int y = 0; y < target_height; ++y) {
    int src_y0 = static_cast<int>(y * y_ratio);
    int src_y1 = std::max(src_y0 + 1, std::min(source.height, static_cast<int>(std::ceil((y + 1) * y_ratio))));
    for (int x = 0; x < target_width; ++x) {
      int src_x0 = static_cast<int>(x * x_ratio);
      int src_x1 = std::max(src_x0 + 1, std::min(source.width, static_cast<int>(std::ceil((x + 1) * x_ratio))));

      uint64_t sum[4] = {0, 0, 0, 0};
      uint64_t count = 0;
      for (int sy = src_y0; sy < src_y1; ++sy) {
        const unsigned char* row = source.pixels.data() + (static_cast<size_t>(sy) * source.width) * 4;
        for (int sx = src_x0; sx < src_x1; ++sx) {
          const unsigned char* pixel = row + static_cast<size_t>(sx) * 4;
          sum[0] += pixel[0];
          sum[1] += pixel[1];
          sum[2] += pixel[2];
          sum[3] += pixel[3];
          ++count;
        }
      }

      unsigned char* out = result.pixels.data() + (static_cast<size_t>(y) * target_width + x) * 4;
      for (int c = 0; c < 4; ++c) {
        out[c] = static_cast<unsigned char>((sum[c] + count / 2) / count);
      }
    }
  }
  return result;
}

ImageData generate_demo_image(const std::string& seed, int width, int height) {
  ImageData image;
  if (width <= 0 || height <= 0) {
    return image;
  }
  image.width = width;
  image.height = height;
  image.pixels.resize(static_cast<size_t>(width) * height * 4);

  size_t hash = std::hash<std::string>{}(seed);
  unsigned char base_r = static_cast<unsigned char>(64 + (hash & 0x7F));
  unsigned char base_g = static_cast<unsigned char>(64 + ((hash >> 8) & 0x7F));
  unsigned char base_b = static_cast<unsigned char>(64 + ((hash >> 16) & 0x7F));

  for (int y = 0; y < height; ++y) {
    float shade = 0.6f + 0.4f * (1.0f - static_cast<float>(y) / height);
    for (int x = 0; x < width; ++x) {
      float tint = 0.85f + 0.15f * static_cast<float>(x) / width;
      unsigned char* out = image.pixels.data() + (static_cast<size_t>(y) * width + x) * 4;
      out[0] = static_cast<unsigned char>(std::min(255.0f, base_r * shade * tint));
      out[1] = static_cast<unsigned char>(std::min(255.0f, base_g * shade));
      out[2] = static_cast<unsigned char>(std::min(255.0f, base_b * shade / tint));
      out[3] = 255;
    }
  }
  return image;
}
