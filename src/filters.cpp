#include "ppmkit/filters.hpp"

#include <cmath>

namespace pk {

// 四捨五入（.5 遠離 0）
static inline int round_div(int sum, int count)
{
    return static_cast<int>(std::lround(static_cast<double>(sum) / count));
}

Image motion_blur(const Image& src)
{
    const int H = src.h();
    const int W = src.w();

    Image dst(W, H);

    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            Color acc;
            int count = 0;

            for (int kx = 0; kx < kMotionBlurWindow && x + kx < W; ++kx) {
                const Color& n = src.get(x + kx, y);
                acc.red   += n.red;
                acc.green += n.green;
                acc.blue  += n.blue;
                ++count;
            }

            Color v(round_div(acc.red,   count),
                    round_div(acc.green, count),
                    round_div(acc.blue,  count));
            v.clamp();
            dst.set(x, y, v);
        }
    }

    return dst;
}

} // namespace pk
