#include "ppmkit/effects.hpp"

namespace pk {

static constexpr int kEmbossKernel[3][3] = {
    {-2, -1, 0},
    {-1,  1, 1},
    { 0,  1, 2},
};

Image emboss(const Image& src)
{
    const int H = src.h();
    const int W = src.w();

    // dst 一開始全黑，邊框不寫，就留在 (0,0,0)
    Image dst(W, H);

    for (int y = 1; y < H - 1; ++y) {
        for (int x = 1; x < W - 1; ++x) {
            Color acc;

            for (int ky = -1; ky <= 1; ++ky) {
                for (int kx = -1; kx <= 1; ++kx) {
                    const Color& n = src.get(x + kx, y + ky);
                    const int k = kEmbossKernel[ky + 1][kx + 1];

                    acc.red   += k * n.red;
                    acc.green += k * n.green;
                    acc.blue  += k * n.blue;
                }
            }

            acc.clamp();
            dst.set(x, y, acc);
        }
    }

    return dst;
}

} // namespace pk
