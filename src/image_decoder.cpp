#include "image_decoder.h"

#include <cstring>
#include <memory>

#include "config.h"
#include "logger.h"

#ifdef _WIN32
#define STBI_WINDOWS_UTF8
#endif
#define STB_IMAGE_IMPLEMENTATION
#include "stb_image.h"

namespace {
struct StbiDeleter {
  void operator()(unsigned char* data) const {
    stbi_image_free(data);
  }
};
}

ImageData decode_thumbnail(const std::string& path, int max_dimension) {
  int width = 0;
  int height = 0;
  int channels = 0;
  std::unique_ptr<unsigned char, StbiDeleter> data(stbi_load(path.c_str(), &width, &height, &channels, 4));
  if (!data) {
    LOG_WARN("stb_image failed on {}: {}", path, stbi_failure_reason());
    return ImageData();
  }

  ImageData image;
  image.width = width;
  image.height = height;
  image.pixels.resize(static_cast<size_t>(width) * height * 4);
  std::memcpy(image.pixels.data(), data.get(), image.pixels.size());

  return downscale_rgba(image, max_dimension);
}

ImageData decode_photo_request(const ThumbnailRequest& request) {
  if (request.path.empty()) {
    return generate_demo_image(request.id, Config::THUMBNAIL_MAX_DIMENSION,
      static_cast<int>(Config::THUMBNAIL_MAX_DIMENSION * Config::GRID_ITEM_HEIGHT / Config::GRID_ITEM_WIDTH));
  }
  return decode_thumbnail(request.path, Config::THUMBNAIL_MAX_DIMENSION);
}
