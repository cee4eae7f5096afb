#pragma once

#include <stdexcept>
#include <string>

namespace pk {

// ------------------------------------------------------------
// 解碼 P3 文字時的格式錯誤
// ------------------------------------------------------------
class FormatError : public std::runtime_error {
public:
    enum class Kind {
        BadMagic,
        BadDimensions,
        UnsupportedMaxValue,
        TruncatedPixelData,
        InvalidChannelValue,
        PixelCountMismatch,
    };

    // x / y 沒有對應座標時給 -1
    FormatError(Kind kind,
                const std::string& message,
                int x = -1,
                int y = -1,
                std::string detail = {});

    Kind kind() const { return kind_; }
    int  x() const { return x_; }
    int  y() const { return y_; }

    // 出錯的 token（或 "r, g, b" 三元組）
    const std::string& detail() const { return detail_; }

private:
    Kind kind_;
    int  x_;
    int  y_;
    std::string detail_;
};

const char* to_string(FormatError::Kind kind);

// ------------------------------------------------------------
// 濾鏡名稱不在 emboss / invert / grayscale / motionblur 之中
// ------------------------------------------------------------
class UnknownFilterError : public std::runtime_error {
public:
    explicit UnknownFilterError(const std::string& name);

    const std::string& name() const { return name_; }

private:
    std::string name_;
};

} // namespace pk
