#pragma once
#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <utility>
#include <vector>

namespace pk {

// ------------------------------------------------------------
// 單一 RGB 像素
// 用 int 存，讓 convolution 的中間值可以是負數或 > 255
// ------------------------------------------------------------
struct Color {
    int red   = 0;
    int green = 0;
    int blue  = 0;

    Color() = default;
    Color(int r, int g, int b) : red(r), green(g), blue(b) {}

    // 每個 channel 限制在 [0, 255]
    void clamp() {
        red   = std::clamp(red,   0, 255);
        green = std::clamp(green, 0, 255);
        blue  = std::clamp(blue,  0, 255);
    }

    bool operator==(const Color& o) const {
        return red == o.red && green == o.green && blue == o.blue;
    }
    bool operator!=(const Color& o) const { return !(*this == o); }
};

class Image {
public:
    // 新配置的影像，全部像素為 (0,0,0)
    Image(int w, int h)
        : w_(w), h_(h)
    {
        if (w <= 0 || h <= 0)
            throw std::invalid_argument("Image: invalid shape");
        data_.resize(static_cast<std::size_t>(w_) * h_);
    }

    // 接手已經填好的像素（row-major，大小必須是 w * h）
    Image(int w, int h, std::vector<Color> pixels)
        : w_(w), h_(h), data_(std::move(pixels))
    {
        if (w <= 0 || h <= 0)
            throw std::invalid_argument("Image: invalid shape");
        if (data_.size() != static_cast<std::size_t>(w_) * h_)
            throw std::invalid_argument("Image: pixel buffer size does not match shape");
    }

    // 值語意：複製就是深拷貝，輸出永遠不會跟來源共用像素
    Image(const Image&)            = default;
    Image& operator=(const Image&) = default;
    Image(Image&&)                 = default;
    Image& operator=(Image&&)      = default;

    int w() const { return w_; }
    int h() const { return h_; }

    const Color& get(int x, int y) const { return data_[index(x, y)]; }
    void set(int x, int y, const Color& c) { data_[index(x, y)] = c; }

    Color*       data()       { return data_.data(); }
    const Color* data() const { return data_.data(); }
    std::size_t  size() const { return data_.size(); }

    bool operator==(const Image& o) const {
        return w_ == o.w_ && h_ == o.h_ && data_ == o.data_;
    }
    bool operator!=(const Image& o) const { return !(*this == o); }

private:
    std::size_t index(int x, int y) const {
        if (x < 0 || x >= w_ || y < 0 || y >= h_)
            throw std::out_of_range("Image: coordinate out of range");
        return static_cast<std::size_t>(y) * w_ + x;
    }

    int w_ = 0, h_ = 0;
    std::vector<Color> data_;
};

} // namespace pk
