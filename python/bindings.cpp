#include <pybind11/pybind11.h>
#include <pybind11/numpy.h>

#include "ppmkit/image.hpp"
#include "ppmkit/codec.hpp"
#include "ppmkit/color.hpp"
#include "ppmkit/effects.hpp"
#include "ppmkit/filters.hpp"
#include "ppmkit/pipeline.hpp"
#include <cstdint>
#include <stdexcept>
#include <string>
#include <vector>

namespace py = pybind11;

namespace pkpy {

using pk::Color;
using pk::Image;

// ------------------------------------------------------------
// 共用：檢查 numpy array (uint8, C-contiguous, HxWx3)
// ------------------------------------------------------------
struct ShapeInfo {
    int h;
    int w;
};

static ShapeInfo check_uint8_hwc3(const py::buffer_info& info) {
    if (info.ndim != 3 || info.shape[2] != 3) {
        throw std::runtime_error("expected HxWx3 uint8 array");
    }
    // itemsize 為 1 的還有 int8 / bool，要看 format
    if (info.itemsize != 1 ||
        info.format != py::format_descriptor<uint8_t>::format()) {
        throw std::runtime_error("expected dtype=uint8");
    }

    const int h = static_cast<int>(info.shape[0]);
    const int w = static_cast<int>(info.shape[1]);

    // H x W x 3: strides = [W*3, 3, 1]
    if (!(info.strides[0] == static_cast<ssize_t>(w * 3) &&
          info.strides[1] == 3 &&
          info.strides[2] == 1)) {
        throw std::runtime_error("expected C-contiguous array (HxWx3)");
    }

    return {h, w};
}

// ------------------------------------------------------------
// numpy.ndarray -> Image
// Image 的 channel 是 int，沒辦法零拷貝，一律複製
// ------------------------------------------------------------
static Image numpy_to_image(const py::array& array) {
    py::buffer_info info = array.request();
    auto shape = check_uint8_hwc3(info);

    const auto* in = static_cast<const uint8_t*>(info.ptr);

    std::vector<Color> pixels(static_cast<std::size_t>(shape.h) * shape.w);
    for (std::size_t i = 0; i < pixels.size(); ++i) {
        pixels[i] = Color(in[i * 3 + 0], in[i * 3 + 1], in[i * 3 + 2]);
    }

    return Image(shape.w, shape.h, std::move(pixels));
}

// ------------------------------------------------------------
// Image -> numpy.ndarray（HxWx3 uint8，值先 clamp）
// ------------------------------------------------------------
static py::array image_to_numpy(const Image& img) {
    const int h = img.h();
    const int w = img.w();

    py::array_t<uint8_t> out({static_cast<ssize_t>(h),
                              static_cast<ssize_t>(w),
                              static_cast<ssize_t>(3)});
    auto* dst = static_cast<uint8_t*>(out.request().ptr);

    const Color* src = img.data();
    for (std::size_t i = 0; i < img.size(); ++i) {
        Color c = src[i];
        c.clamp();
        dst[i * 3 + 0] = static_cast<uint8_t>(c.red);
        dst[i * 3 + 1] = static_cast<uint8_t>(c.green);
        dst[i * 3 + 2] = static_cast<uint8_t>(c.blue);
    }
    return out;
}

// ------------------------------------------------------------
// 共用 wrap：numpy -> Image -> filter -> numpy
// ------------------------------------------------------------
template <typename FilterFunc>
static py::array wrap_filter(const py::array& src, FilterFunc&& func) {
    Image in  = numpy_to_image(src);
    Image out = func(in);
    return image_to_numpy(out);
}

} // namespace pkpy

// ------------------------------------------------------------
// pybind11 module
// ------------------------------------------------------------
PYBIND11_MODULE(_core, m) {
    using namespace pkpy;

    m.doc() = "ppmkit core (plain PPM codec + filters)";

    // C++ 例外 -> Python ValueError 子類別
    py::register_exception<pk::FormatError>(m, "FormatError", PyExc_ValueError);
    py::register_exception<pk::UnknownFilterError>(m, "UnknownFilterError", PyExc_ValueError);

    // Codec
    m.def("decode",
          [](const std::string& text) { return image_to_numpy(pk::decode(text)); },
          py::arg("text"),
          "Decode plain PPM (P3) text into numpy.ndarray (uint8, HxWx3).");

    m.def("encode",
          [](const py::array& img) { return pk::encode(numpy_to_image(img)); },
          py::arg("img"),
          "Encode numpy.ndarray (uint8, HxWx3) as plain PPM (P3) text.");

    m.def("load_image",
          [](const std::string& path) { return image_to_numpy(pk::load_ppm(path)); },
          py::arg("path"),
          "Load a plain PPM (P3) file as numpy.ndarray (uint8, HxWx3).");

    m.def("save_image",
          [](const std::string& path, const py::array& img) {
              pk::save_ppm(path, numpy_to_image(img));
          },
          py::arg("path"), py::arg("img"),
          "Save numpy.ndarray (uint8, HxWx3) as a plain PPM (P3) file.");

    // Filters
    m.def("emboss",
          [](const py::array& src) { return wrap_filter(src, pk::emboss); },
          py::arg("img"),
          "3x3 emboss; the outer border is left black.");

    m.def("invert",
          [](const py::array& src) { return wrap_filter(src, pk::invert); },
          py::arg("img"),
          "Invert pixel values: v -> 255 - v.");

    m.def("to_grayscale",
          [](const py::array& src) { return wrap_filter(src, pk::to_grayscale); },
          py::arg("img"),
          "Average the three channels (result stays HxWx3).");

    m.def("motion_blur",
          [](const py::array& src) { return wrap_filter(src, pk::motion_blur); },
          py::arg("img"),
          "Horizontal 1x5 motion blur.");

    // Dispatcher
    m.def("apply",
          [](const py::array& src, const std::string& filter) {
              pk::FilterKind kind = pk::parse_filter_kind(filter);
              return wrap_filter(src, [kind](const Image& in) {
                  return pk::apply(in, kind);
              });
          },
          py::arg("img"), py::arg("filter"),
          "Apply one of: emboss, invert, grayscale, motionblur.");

    m.def("process",
          [](const std::string& text, const std::string& filter) {
              pk::ProcessResult r = pk::process(text, filter);
              return py::make_tuple(r.text, r.message);
          },
          py::arg("text"), py::arg("filter"),
          "Decode, filter and re-encode P3 text; returns (text, message).");
}
