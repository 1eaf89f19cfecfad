#pragma once

#include <string>

#include "image_data.h"
#include "thumbnail_loader.h"

// Decodes an image file to RGBA with stb_image and downscales it to max_dimension.
// Returns an invalid ImageData on failure.
ImageData decode_thumbnail(const std::string& path, int max_dimension);

// Decode function for the thumbnail loader: files through stb_image, synthetic items as gradients
ImageData decode_photo_request(const ThumbnailRequest& request);
