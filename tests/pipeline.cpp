#define BOOST_TEST_MODULE ppmkit_pipeline
#include <boost/test/unit_test.hpp>

#include <filesystem>
#include <fstream>
#include <string>

#include "ppmkit/codec.hpp"
#include "ppmkit/color.hpp"
#include "ppmkit/effects.hpp"
#include "ppmkit/filters.hpp"
#include "ppmkit/pipeline.hpp"

namespace fs = std::filesystem;

using pk::Color;
using pk::FilterKind;
using pk::Image;

namespace {

const std::string white_3x3 =
    "P3\n3 3\n255\n"
    "255 255 255 255 255 255 255 255 255\n"
    "255 255 255 255 255 255 255 255 255\n"
    "255 255 255 255 255 255 255 255 255\n";

Image sample()
{
    Image img(4, 3);
    for (int y = 0; y < 3; ++y)
        for (int x = 0; x < 4; ++x)
            img.set(x, y, Color(x * 60, y * 100, (x + y) * 30));
    return img;
}

} // namespace

BOOST_AUTO_TEST_CASE(filter_names_round_trip)
{
    for (FilterKind k : {FilterKind::Emboss, FilterKind::Invert,
                         FilterKind::Grayscale, FilterKind::MotionBlur}) {
        BOOST_CHECK(pk::parse_filter_kind(pk::filter_name(k)) == k);
    }
    BOOST_CHECK_EQUAL(std::string(pk::filter_name(FilterKind::MotionBlur)), "motionblur");
}

BOOST_AUTO_TEST_CASE(unknown_filter_names)
{
    BOOST_CHECK_THROW(pk::parse_filter_kind("sepia"), pk::UnknownFilterError);
    BOOST_CHECK_THROW(pk::parse_filter_kind("Invert"), pk::UnknownFilterError);
    BOOST_CHECK_THROW(pk::parse_filter_kind("motion_blur"), pk::UnknownFilterError);
    BOOST_CHECK_THROW(pk::parse_filter_kind(""), pk::UnknownFilterError);

    try {
        pk::parse_filter_kind("sepia");
        BOOST_FAIL("expected UnknownFilterError");
    } catch (const pk::UnknownFilterError& e) {
        BOOST_CHECK_EQUAL(e.name(), "sepia");
        BOOST_CHECK_EQUAL(std::string(e.what()), "Unknown filter type: sepia");
    }
}

BOOST_AUTO_TEST_CASE(apply_dispatches_to_each_filter)
{
    const Image img = sample();

    BOOST_CHECK(pk::apply(img, FilterKind::Emboss)     == pk::emboss(img));
    BOOST_CHECK(pk::apply(img, FilterKind::Invert)     == pk::invert(img));
    BOOST_CHECK(pk::apply(img, FilterKind::Grayscale)  == pk::to_grayscale(img));
    BOOST_CHECK(pk::apply(img, FilterKind::MotionBlur) == pk::motion_blur(img));
}

BOOST_AUTO_TEST_CASE(invert_white_gives_black)
{
    pk::ProcessResult r = pk::process(white_3x3, "invert");

    std::string expected = "P3\n3 3\n255";
    for (int i = 0; i < 9; ++i)
        expected += "\n0 0 0";

    BOOST_CHECK_EQUAL(r.text, expected);
    BOOST_CHECK(r.kind == FilterKind::Invert);
    BOOST_CHECK_EQUAL(r.message, "Filter applied successfully: invert");
}

BOOST_AUTO_TEST_CASE(process_rejects_unknown_filter)
{
    BOOST_CHECK_THROW(pk::process(white_3x3, "sepia"), pk::UnknownFilterError);
}

BOOST_AUTO_TEST_CASE(process_propagates_format_errors)
{
    BOOST_CHECK_THROW(pk::process("P3 1 1 255 10 10", "invert"), pk::FormatError);
}

struct fixture
{
    const std::string src_;
    const std::string dst_;

    fixture() : src_("pipeline-in.ppm"), dst_("pipeline-out.ppm")
    {
        pk::save_ppm(src_, sample());
    }
    ~fixture()
    {
        fs::remove(src_);
        fs::remove(dst_);
    }
};

BOOST_FIXTURE_TEST_CASE(run_writes_filtered_file, fixture)
{
    FilterKind k = pk::run(src_, dst_, "grayscale");

    BOOST_CHECK(k == FilterKind::Grayscale);
    BOOST_REQUIRE(fs::exists(dst_));
    BOOST_CHECK(pk::load_ppm(dst_) == pk::to_grayscale(sample()));
}

BOOST_FIXTURE_TEST_CASE(run_writes_nothing_for_unknown_filter, fixture)
{
    BOOST_CHECK_THROW(pk::run(src_, dst_, "sepia"), pk::UnknownFilterError);
    BOOST_CHECK(!fs::exists(dst_));
}

BOOST_FIXTURE_TEST_CASE(run_writes_nothing_for_bad_input, fixture)
{
    {
        std::ofstream out(src_, std::ios::trunc);
        out << "P3 2 2 255 0 0 0";
    }
    BOOST_CHECK_THROW(pk::run(src_, dst_, "emboss"), pk::FormatError);
    BOOST_CHECK(!fs::exists(dst_));
}
