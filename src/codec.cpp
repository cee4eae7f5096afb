#include "ppmkit/codec.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace pk {

// ============================================================
// 小工具：切 token / 解析整數
// ============================================================

// 以任意連續空白切開；前後空白不會產生空 token
static std::vector<std::string_view> tokenize(std::string_view text)
{
    std::vector<std::string_view> tokens;

    std::size_t i = 0;
    const std::size_t n = text.size();
    while (i < n) {
        while (i < n && std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        if (i >= n) break;

        const std::size_t start = i;
        while (i < n && !std::isspace(static_cast<unsigned char>(text[i]))) ++i;
        tokens.push_back(text.substr(start, i - start));
    }
    return tokens;
}

// 整個 token 必須是十進位整數（可有前置 '-'），否則回傳 false
// 不取數字前綴："12abc"、"1.5"、"+3" 整個 token 都算不合法
static bool parse_int(std::string_view token, int& out)
{
    const char* first = token.data();
    const char* last  = token.data() + token.size();

    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc() && ptr == last;
}

static std::string coord_str(int x, int y)
{
    return "(" + std::to_string(x) + ", " + std::to_string(y) + ")";
}

// ============================================================
// decode
// ============================================================

Image decode(std::string_view text)
{
    using Kind = FormatError::Kind;

    const std::vector<std::string_view> tokens = tokenize(text);

    if (tokens.empty() || tokens[0] != "P3") {
        throw FormatError(Kind::BadMagic,
                          "decode: invalid PPM format, expected 'P3' header",
                          -1, -1,
                          tokens.empty() ? std::string() : std::string(tokens[0]));
    }

    std::size_t index = 1;

    int W = 0, H = 0;
    if (tokens.size() < 3
        || !parse_int(tokens[1], W)
        || !parse_int(tokens[2], H)
        || W <= 0 || H <= 0) {
        throw FormatError(Kind::BadDimensions,
                          "decode: invalid image dimensions, width and height "
                          "must be positive integers");
    }
    index += 2;

    int max_value = 0;
    if (tokens.size() < 4 || !parse_int(tokens[3], max_value)
        || max_value != kMaxChannelValue) {
        throw FormatError(Kind::UnsupportedMaxValue,
                          "decode: invalid or unsupported maximum color value, "
                          "expected 255",
                          -1, -1,
                          tokens.size() < 4 ? std::string() : std::string(tokens[3]));
    }
    ++index;

    const std::size_t expected = static_cast<std::size_t>(W) * H;

    // 只依實際存在的資料量預留，宣告超大尺寸但沒資料時不會先配一整張
    std::vector<Color> pixels;
    pixels.reserve(std::min(expected, (tokens.size() - index) / 3));

    for (int y = 0; y < H; ++y) {
        for (int x = 0; x < W; ++x) {
            if (tokens.size() - index < 3) {
                throw FormatError(Kind::TruncatedPixelData,
                                  "decode: not enough pixel data to fill the image at "
                                      + coord_str(x, y),
                                  x, y);
            }

            const std::string_view tr = tokens[index++];
            const std::string_view tg = tokens[index++];
            const std::string_view tb = tokens[index++];

            Color c;
            const bool ok = parse_int(tr, c.red)
                         && parse_int(tg, c.green)
                         && parse_int(tb, c.blue)
                         && c.red   >= 0 && c.red   <= kMaxChannelValue
                         && c.green >= 0 && c.green <= kMaxChannelValue
                         && c.blue  >= 0 && c.blue  <= kMaxChannelValue;
            if (!ok) {
                std::string triplet = std::string(tr) + ", "
                                    + std::string(tg) + ", "
                                    + std::string(tb);
                throw FormatError(Kind::InvalidChannelValue,
                                  "decode: invalid pixel data at " + coord_str(x, y)
                                      + ": (" + triplet + ")",
                                  x, y, triplet);
            }

            pixels.push_back(c);
        }
    }

    // 上面逐像素已檢查過長度，這裡只是保底
    if (pixels.size() != expected) {
        throw FormatError(Kind::PixelCountMismatch,
                          "decode: mismatch in pixel count: expected "
                              + std::to_string(expected) + ", but got "
                              + std::to_string(pixels.size()));
    }

    // 多出來的 token 直接忽略
    return Image(W, H, std::move(pixels));
}

// ============================================================
// encode
// ============================================================

std::string encode(const Image& img)
{
    std::string out;
    // 每個像素最多 "255 255 255\n" = 12 字元
    out.reserve(32 + img.size() * 12);

    out += "P3\n";
    out += std::to_string(img.w());
    out += ' ';
    out += std::to_string(img.h());
    out += '\n';
    out += std::to_string(kMaxChannelValue);

    const Color* in = img.data();
    for (std::size_t i = 0; i < img.size(); ++i) {
        Color c = in[i];
        c.clamp();

        out += '\n';
        out += std::to_string(c.red);
        out += ' ';
        out += std::to_string(c.green);
        out += ' ';
        out += std::to_string(c.blue);
    }
    return out;
}

// ============================================================
// 檔案 I/O
// ============================================================

Image load_ppm(const std::string& path)
{
    std::ifstream in(path, std::ios::in | std::ios::binary);
    if (!in)
        throw std::runtime_error("load_ppm: failed to open " + path);

    std::ostringstream buf;
    buf << in.rdbuf();
    if (in.bad())
        throw std::runtime_error("load_ppm: failed to read " + path);

    return decode(buf.str());
}

void save_ppm(const std::string& path, const Image& img)
{
    // 先 encode 完再開檔，避免中途失敗留下半個檔案
    const std::string text = encode(img);

    std::ofstream out(path, std::ios::out | std::ios::binary | std::ios::trunc);
    if (!out)
        throw std::runtime_error("save_ppm: failed to open " + path);

    out.write(text.data(), static_cast<std::streamsize>(text.size()));
    out.flush();
    if (!out)
        throw std::runtime_error("save_ppm: failed to write " + path);
}

} // namespace pk
