#pragma once

#include "core/types.hpp"
#include <string>

namespace cascii {

bool is_image_path(const std::string& path);

Result probe_image(const std::string& path, Size& size);
Result load_image(const std::string& path, FrameBuffer& out);
Result save_png(const std::string& path, const FrameBuffer& image);

// Lanczos resample through libswscale. Copies when the size already matches.
Result resample(const FrameBuffer& input, Size target, FrameBuffer& output);

}
