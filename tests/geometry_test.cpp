#include <gtest/gtest.h>
#include <limits>
#include "errors.h"
#include "geometry/geometry.h"
#include "geometry/line_zone.h"
#include "geometry/rect_zone.h"

using namespace zc;

TEST(ReferenceSpaceTest, RejectsNonPositiveSize) {
    EXPECT_THROW(ReferenceSpace(0.0f, 720.0f), ValidationError);
    EXPECT_THROW(ReferenceSpace(1300.0f, -1.0f), ValidationError);
    EXPECT_THROW(ReferenceSpace(std::numeric_limits<float>::infinity(), 720.0f), ValidationError);
}

TEST(ReferenceSpaceTest, BoundsAreInclusive) {
    ReferenceSpace space(1300.0f, 720.0f);
    EXPECT_TRUE(space.contains(Point(0, 0)));
    EXPECT_TRUE(space.contains(Point(1300, 720)));
    EXPECT_FALSE(space.contains(Point(-0.5f, 10)));
    EXPECT_FALSE(space.contains(Point(10, 720.5f)));
    EXPECT_FALSE(space.contains(Point(std::numeric_limits<float>::quiet_NaN(), 10)));
}

TEST(RectZoneTest, RequiresStrictlyOrderedCorners) {
    ReferenceSpace space(1300.0f, 720.0f);
    EXPECT_NO_THROW(RectZone(Point(0, 0), Point(100, 100), space));
    EXPECT_THROW(RectZone(Point(100, 0), Point(100, 100), space), ValidationError);
    EXPECT_THROW(RectZone(Point(0, 100), Point(100, 50), space), ValidationError);
    EXPECT_THROW(RectZone(Point(200, 200), Point(100, 100), space), ValidationError);
}

TEST(RectZoneTest, RejectsCornersOutsideSpace) {
    ReferenceSpace space(1300.0f, 720.0f);
    EXPECT_THROW(RectZone(Point(0, 0), Point(1400, 100), space), ValidationError);
    EXPECT_THROW(RectZone(Point(-1, 0), Point(100, 100), space), ValidationError);
}

TEST(RectZoneTest, ContainsIncludesEdges) {
    ReferenceSpace space(1300.0f, 720.0f);
    RectZone zone(Point(10, 10), Point(100, 100), space);
    EXPECT_TRUE(zone.contains(Point(10, 10)));
    EXPECT_TRUE(zone.contains(Point(100, 55)));
    EXPECT_TRUE(zone.contains(Point(50, 50)));
    EXPECT_FALSE(zone.contains(Point(9.9f, 50)));
    EXPECT_FALSE(zone.contains(Point(50, 100.1f)));
}

TEST(LineZoneTest, RejectsCoincidentEndpoints) {
    ReferenceSpace space(1300.0f, 720.0f);
    EXPECT_THROW(LineZone(Point(5, 5), Point(5, 5), space), ValidationError);
    EXPECT_THROW(LineZone(Point(0, 0), Point(2000, 5), space), ValidationError);
}

TEST(LineZoneTest, SideOfHorizontalLine) {
    ReferenceSpace space(1300.0f, 720.0f);
    LineZone line(Point(0, 100), Point(200, 100), space);

    EXPECT_EQ(line.sideOf(Point(50, 50)), 1);
    EXPECT_EQ(line.sideOf(Point(50, 150)), -1);
    EXPECT_EQ(line.sideOf(Point(50, 100)), 0);
    // Sides extend past the drawn segment
    EXPECT_EQ(line.sideOf(Point(900, 50)), 1);
}

TEST(LineZoneTest, ReversedLineFlipsSides) {
    ReferenceSpace space(1300.0f, 720.0f);
    LineZone line(Point(200, 100), Point(0, 100), space);
    EXPECT_EQ(line.sideOf(Point(50, 50)), -1);
    EXPECT_EQ(line.sideOf(Point(50, 150)), 1);
}

TEST(LineZoneTest, Classify) {
    EXPECT_EQ(LineZone::classify(1, -1), CrossingDirection::IN);
    EXPECT_EQ(LineZone::classify(-1, 1), CrossingDirection::OUT);
    EXPECT_EQ(LineZone::classify(1, 1), CrossingDirection::NONE);
    EXPECT_EQ(LineZone::classify(1, 0), CrossingDirection::NONE);
    EXPECT_EQ(LineZone::classify(0, -1), CrossingDirection::NONE);
}

TEST(AnchorPointTest, ReducesBoundingBox) {
    BoundingBox box{10, 20, 30, 60};
    EXPECT_EQ(anchorPoint(box, Position::BOTTOM_CENTER), Point(20, 60));
    EXPECT_EQ(anchorPoint(box, Position::CENTER), Point(20, 40));
    EXPECT_EQ(anchorPoint(box, Position::TOP_LEFT), Point(10, 20));
    EXPECT_EQ(anchorPoint(box, Position::CENTER_RIGHT), Point(30, 40));
}

TEST(AnchorPointTest, PositionNames) {
    Position pos;
    ASSERT_TRUE(StringToPosition("TOP_CENTER", pos));
    EXPECT_EQ(pos, Position::TOP_CENTER);
    EXPECT_EQ(PositionToString(pos), "TOP_CENTER");
    EXPECT_FALSE(StringToPosition("MIDDLE", pos));
}
