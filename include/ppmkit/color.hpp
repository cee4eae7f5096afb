#pragma once

#include "ppmkit/image.hpp"

namespace pk {

// 負片效果：v -> 255 - v
Image invert(const Image& src);

// 轉灰階：gray = round((r + g + b) / 3)，三個 channel 都設成 gray
Image to_grayscale(const Image& src);

} // namespace pk
