#include "ppmkit/pipeline.hpp"
#include "ppmkit/codec.hpp"
#include "ppmkit/color.hpp"
#include "ppmkit/effects.hpp"
#include "ppmkit/filters.hpp"

namespace pk {

FilterKind parse_filter_kind(const std::string& name)
{
    if (name == "emboss")     return FilterKind::Emboss;
    if (name == "invert")     return FilterKind::Invert;
    if (name == "grayscale")  return FilterKind::Grayscale;
    if (name == "motionblur") return FilterKind::MotionBlur;
    throw UnknownFilterError(name);
}

const char* filter_name(FilterKind kind)
{
    switch (kind) {
    case FilterKind::Emboss:     return "emboss";
    case FilterKind::Invert:     return "invert";
    case FilterKind::Grayscale:  return "grayscale";
    case FilterKind::MotionBlur: return "motionblur";
    }
    return "unknown";
}

Image apply(const Image& src, FilterKind kind)
{
    switch (kind) {
    case FilterKind::Emboss:     return emboss(src);
    case FilterKind::Invert:     return invert(src);
    case FilterKind::Grayscale:  return to_grayscale(src);
    case FilterKind::MotionBlur: return motion_blur(src);
    }
    // 只有把整數硬轉成 FilterKind 才會走到這裡
    throw UnknownFilterError(std::to_string(static_cast<int>(kind)));
}

static std::string status_message(FilterKind kind)
{
    return std::string("Filter applied successfully: ") + filter_name(kind);
}

ProcessResult process(std::string_view text, const std::string& filter)
{
    const FilterKind kind = parse_filter_kind(filter);

    const Image src = decode(text);
    const Image out = apply(src, kind);

    return ProcessResult{encode(out), kind, status_message(kind)};
}

FilterKind run(const std::string& src_path,
               const std::string& dst_path,
               const std::string& filter)
{
    const FilterKind kind = parse_filter_kind(filter);

    const Image src = load_ppm(src_path);
    const Image out = apply(src, kind);

    save_ppm(dst_path, out);
    return kind;
}

} // namespace pk
