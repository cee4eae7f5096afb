#pragma once

#include "ppmkit/image.hpp"

namespace pk {

// 水平動態模糊的視窗長度（自己 + 右邊 4 個）
constexpr int kMotionBlurWindow = 5;

// 動態模糊：每個像素取 (x .. x+4, y) 中還在圖內的樣本做平均
// 右邊界樣本數會變少（最右一欄只有自己），所有像素都會寫到
Image motion_blur(const Image& src);

} // namespace pk
