#include <gtest/gtest.h>

#include "enrichment/geolocator.hpp"

namespace osintpipe::enrichment {
namespace {

TEST(GazetteerGeolocatorTest, FindsPlacesInTextOrder) {
    GazetteerGeolocator geolocator;
    const std::string text = "Shelling in Kharkiv and Bakhmut";
    const auto found = geolocator.Locate(text);

    ASSERT_EQ(found.size(), 2u);
    EXPECT_EQ(found[0].name, "Kharkiv");
    EXPECT_EQ(found[0].source_span, (TextSpan{12, 19}));
    EXPECT_NEAR(found[0].lat, 49.99, 0.01);
    EXPECT_EQ(found[1].name, "Bakhmut");
    EXPECT_EQ(text.substr(found[1].source_span.begin, found[1].source_span.end - found[1].source_span.begin),
              "Bakhmut");
}

TEST(GazetteerGeolocatorTest, InflectedCyrillicFormSpansWholeWord) {
    GazetteerGeolocator geolocator;
    const std::string text = "Вибухи у Києві";
    const auto found = geolocator.Locate(text);

    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].name, "Kyiv");
    EXPECT_EQ(found[0].source_span.end, text.size());
}

TEST(GazetteerGeolocatorTest, CyrillicMatchIgnoresCase) {
    GazetteerGeolocator geolocator;
    const auto found = geolocator.Locate("ВИБУХИ У КИЄВІ");
    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].name, "Kyiv");
}

TEST(GazetteerGeolocatorTest, ExplicitCoordinates) {
    GazetteerGeolocator geolocator;
    const auto found = geolocator.Locate("Position 48.5953, 38.0003 confirmed");

    ASSERT_EQ(found.size(), 1u);
    EXPECT_DOUBLE_EQ(found[0].lat, 48.5953);
    EXPECT_DOUBLE_EQ(found[0].lon, 38.0003);
    EXPECT_EQ(found[0].name, "48.5953, 38.0003");
}

TEST(GazetteerGeolocatorTest, OutOfRangeCoordinatesAreIgnored) {
    GazetteerGeolocator geolocator;
    EXPECT_TRUE(geolocator.Locate("grid 95.00, 10.00").empty());
}

TEST(GazetteerGeolocatorTest, OverlappingMentionsKeepLongestMatch) {
    GazetteerGeolocator geolocator({
        GazetteerEntry{"Yar", 1.0, 1.0, {"Yar"}},
        GazetteerEntry{"Chasiv Yar", 48.58, 37.83, {"Chasiv Yar"}},
    });
    const auto found = geolocator.Locate("Near Chasiv Yar today");

    ASSERT_EQ(found.size(), 1u);
    EXPECT_EQ(found[0].name, "Chasiv Yar");
}

TEST(GazetteerGeolocatorTest, IgnoresMatchesInsideWords) {
    GazetteerGeolocator geolocator({GazetteerEntry{"Lviv", 49.84, 24.03, {"Lviv"}}});
    EXPECT_TRUE(geolocator.Locate("xlviv is not a city").empty());
    EXPECT_EQ(geolocator.Locate("LVIV station").size(), 1u);
}

}  // namespace
}  // namespace osintpipe::enrichment
