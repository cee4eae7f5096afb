#define BOOST_TEST_MODULE ppmkit_color
#include <boost/test/unit_test.hpp>

#include "ppmkit/color.hpp"

using pk::Color;
using pk::Image;

namespace {

Image sample()
{
    Image img(3, 2);
    img.set(0, 0, Color(0, 0, 0));
    img.set(1, 0, Color(255, 255, 255));
    img.set(2, 0, Color(10, 20, 31));
    img.set(0, 1, Color(10, 20, 32));
    img.set(1, 1, Color(200, 3, 77));
    img.set(2, 1, Color(1, 1, 2));
    return img;
}

} // namespace

BOOST_AUTO_TEST_CASE(invert_each_channel)
{
    Image out = pk::invert(sample());

    BOOST_CHECK(out.get(0, 0) == Color(255, 255, 255));
    BOOST_CHECK(out.get(1, 0) == Color(0, 0, 0));
    BOOST_CHECK(out.get(1, 1) == Color(55, 252, 178));
}

BOOST_AUTO_TEST_CASE(invert_twice_is_identity)
{
    Image img = sample();
    BOOST_CHECK(pk::invert(pk::invert(img)) == img);
}

BOOST_AUTO_TEST_CASE(invert_leaves_source_untouched)
{
    const Image img = sample();
    const Image copy = img;

    Image out = pk::invert(img);
    BOOST_CHECK(img == copy);
    BOOST_CHECK(out != img);
}

BOOST_AUTO_TEST_CASE(grayscale_rounds_the_average)
{
    Image out = pk::to_grayscale(sample());

    BOOST_CHECK(out.get(0, 0) == Color(0, 0, 0));
    BOOST_CHECK(out.get(1, 0) == Color(255, 255, 255));
    BOOST_CHECK(out.get(2, 0) == Color(20, 20, 20));   // 61 / 3 = 20.33
    BOOST_CHECK(out.get(0, 1) == Color(21, 21, 21));   // 62 / 3 = 20.67
    BOOST_CHECK(out.get(1, 1) == Color(93, 93, 93));   // 280 / 3 = 93.33
    BOOST_CHECK(out.get(2, 1) == Color(1, 1, 1));      // 4 / 3 = 1.33
}

BOOST_AUTO_TEST_CASE(grayscale_is_idempotent)
{
    Image once = pk::to_grayscale(sample());
    BOOST_CHECK(pk::to_grayscale(once) == once);
}

BOOST_AUTO_TEST_CASE(filters_keep_shape)
{
    Image img(5, 7);

    Image a = pk::invert(img);
    Image b = pk::to_grayscale(img);
    BOOST_CHECK_EQUAL(a.w(), 5);
    BOOST_CHECK_EQUAL(a.h(), 7);
    BOOST_CHECK_EQUAL(b.w(), 5);
    BOOST_CHECK_EQUAL(b.h(), 7);
}
