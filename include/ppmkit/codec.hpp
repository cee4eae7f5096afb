#pragma once

#include <string>
#include <string_view>
#include "ppmkit/image.hpp"
#include "ppmkit/errors.hpp"

namespace pk {

// 唯一支援的最大 channel 值
constexpr int kMaxChannelValue = 255;

// P3 文字 -> Image
// 格式有任何問題都丟 FormatError（見 FormatError::Kind）
Image decode(std::string_view text);

// Image -> P3 文字
// "P3" / "W H" / "255" / 每個像素一行 "r g b"，用 '\n' 串接，結尾不加換行
std::string encode(const Image& img);

// 整個檔案讀進來再 decode；開檔失敗丟 std::runtime_error
Image load_ppm(const std::string& path);

// encode 後寫檔；寫入失敗丟 std::runtime_error
void save_ppm(const std::string& path, const Image& img);

} // namespace pk
