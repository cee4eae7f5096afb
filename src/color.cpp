#include "ppmkit/color.hpp"

#include <cmath>
#include <cstddef>

namespace pk {

Image invert(const Image& src)
{
    const Color* in = src.data();
    Image dst(src.w(), src.h());
    Color* out = dst.data();

    const std::size_t total = src.size();
    for (std::size_t i = 0; i < total; ++i) {
        out[i] = Color(255 - in[i].red,
                       255 - in[i].green,
                       255 - in[i].blue);
    }

    return dst;
}

Image to_grayscale(const Image& src)
{
    const Color* in = src.data();
    Image dst(src.w(), src.h());
    Color* out = dst.data();

    const std::size_t total = src.size();
    for (std::size_t i = 0; i < total; ++i) {
        const int sum = in[i].red + in[i].green + in[i].blue;

        // 平均值的小數部分只會是 0 / .333 / .667，不會剛好落在 .5
        const int gray = static_cast<int>(std::lround(sum / 3.0));
        out[i] = Color(gray, gray, gray);
    }

    return dst;
}

} // namespace pk
