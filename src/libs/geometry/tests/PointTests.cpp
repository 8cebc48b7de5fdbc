// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "geometry/Point.hpp"

#include <cmath>

using Geometry::Point;

TEST(PointTests, PureOperationsLeaveOperandsUntouched)
{
    const Point a(1.5, -2.5);
    const Point b(0.5, 4.0);

    EXPECT_EQ(a + b, Point(2.0, 1.5));
    EXPECT_EQ(a - b, Point(1.0, -6.5));
    EXPECT_EQ(a * 2.0, Point(3.0, -5.0));
    EXPECT_EQ(b / 2.0, Point(0.25, 2.0));
    EXPECT_EQ(a.scaledBy(Point(2.0, 2.0)), Point(3.0, -5.0));
    EXPECT_EQ(a, Point(1.5, -2.5));
}

TEST(PointTests, InPlaceOperationsChain)
{
    Point p(10.4, -3.6);
    p.round().scaleBy(Point(2.0, 3.0)) += Point(1.0, 1.0);
    EXPECT_EQ(p, Point(21.0, -11.0));
}

TEST(PointTests, RoundingMatchesHalfUpConvention)
{
    EXPECT_EQ(Point(2.5, -2.5).rounded(), Point(3.0, -2.0));
    EXPECT_EQ(Point(2.7, -2.7).floored(), Point(2.0, -3.0));
    EXPECT_EQ(Point(2.2, -2.7).ceiled(), Point(3.0, -2.0));
    EXPECT_EQ(Point(2.7, -2.7).truncated(), Point(2.0, -2.0));
}

TEST(PointTests, DistanceAndContainment)
{
    EXPECT_DOUBLE_EQ(Point(0.0, 0.0).distanceTo(Point(3.0, 4.0)), 5.0);

    const Point size(1536.0, 1280.0);
    EXPECT_TRUE(size.contains(Point(-256.0, 0.0)));
    EXPECT_FALSE(size.contains(Point(1537.0, 0.0)));
    EXPECT_FALSE(Point(std::nan(""), 0.0).isFinite());
}
