#include <gtest/gtest.h>
#include <strata/core/Types.h>

using namespace strata;

TEST(TypesTest, PointArithmetic) {
    Point a{1.0f, 2.0f};
    Point b{3.0f, 5.0f};

    EXPECT_EQ(a + b, Point(4.0f, 7.0f));
    EXPECT_EQ(b - a, Point(2.0f, 3.0f));
    EXPECT_EQ(a * 2.0f, Point(2.0f, 4.0f));
}

TEST(TypesTest, PointDistance) {
    Point origin;
    Point p{3.0f, 4.0f};

    EXPECT_FLOAT_EQ(p.length(), 5.0f);
    EXPECT_FLOAT_EQ(origin.distanceTo(p), 5.0f);
}

TEST(TypesTest, RectContainsEdges) {
    Rect r{10.0f, 20.0f, 30.0f, 40.0f};

    EXPECT_FLOAT_EQ(r.right(), 40.0f);
    EXPECT_FLOAT_EQ(r.bottom(), 60.0f);
    EXPECT_TRUE(r.contains({10.0f, 20.0f}));
    EXPECT_TRUE(r.contains({40.0f, 60.0f}));
    EXPECT_FALSE(r.contains({41.0f, 30.0f}));
}
