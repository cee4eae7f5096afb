#pragma once

#include "ppmkit/image.hpp"

namespace pk {

// 浮雕效果：固定 3x3 kernel
//   [-2 -1  0
//    -1  1  1
//     0  1  2]
// 只算內部像素，最外一圈保持 (0,0,0)
Image emboss(const Image& src);

} // namespace pk
