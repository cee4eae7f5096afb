#pragma once

#include <string>
#include <string_view>
#include "ppmkit/image.hpp"
#include "ppmkit/errors.hpp"

namespace pk {

// ------------------------------------------------------------
// 可用的濾鏡（封閉列舉）
// ------------------------------------------------------------
enum class FilterKind {
    Emboss,
    Invert,
    Grayscale,
    MotionBlur,
};

// "emboss" / "invert" / "grayscale" / "motionblur" -> FilterKind
// 其他字串丟 UnknownFilterError
FilterKind parse_filter_kind(const std::string& name);

// FilterKind -> 對外名稱
const char* filter_name(FilterKind kind);

// 套用單一濾鏡，回傳新的 Image
Image apply(const Image& src, FilterKind kind);

struct ProcessResult {
    std::string text;     // encode 後的 P3 文字
    FilterKind  kind;
    std::string message;  // "Filter applied successfully: <name>"
};

// 文字進、文字出：先檢查濾鏡名稱，再 decode -> apply -> encode
ProcessResult process(std::string_view text, const std::string& filter);

// 檔案版本：src_path 讀入，成功後才寫到 dst_path
FilterKind run(const std::string& src_path,
               const std::string& dst_path,
               const std::string& filter);

} // namespace pk
