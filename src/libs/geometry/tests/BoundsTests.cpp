// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "geometry/Bounds.hpp"
#include "geometry/Transformation.hpp"

#include <limits>

using Geometry::Bounds;
using Geometry::Point;

TEST(BoundsTests, DefaultIsInvalidUntilExtended)
{
    Bounds b;
    EXPECT_FALSE(b.isValid());
    EXPECT_FALSE(b.contains(Point(0.0, 0.0)));

    b.extend(Point(3.0, 4.0));
    ASSERT_TRUE(b.isValid());
    EXPECT_EQ(b.min(), Point(3.0, 4.0));
    EXPECT_EQ(b.max(), Point(3.0, 4.0));

    b.extend(Point(-1.0, 10.0));
    EXPECT_EQ(b.min(), Point(-1.0, 4.0));
    EXPECT_EQ(b.max(), Point(3.0, 10.0));
}

TEST(BoundsTests, CornersAndCenter)
{
    const Bounds b(Point(100.0, 50.0), Point(105.0, 54.0));
    EXPECT_EQ(b.bottomLeft(), Point(100.0, 54.0));
    EXPECT_EQ(b.topRight(), Point(105.0, 50.0));
    EXPECT_EQ(b.center(), Point(102.5, 52.0));
    EXPECT_EQ(b.center(true), Point(103.0, 52.0));
    EXPECT_EQ(b.size(), Point(5.0, 4.0));
}

TEST(BoundsTests, IntersectsCountsTouchingEdgesOverlapsDoesNot)
{
    const Bounds a(Point(0.0, 0.0), Point(10.0, 10.0));
    const Bounds touching(Point(10.0, 0.0), Point(20.0, 10.0));
    const Bounds inside(Point(2.0, 2.0), Point(4.0, 4.0));

    EXPECT_TRUE(a.intersects(touching));
    EXPECT_FALSE(a.overlaps(touching));
    EXPECT_TRUE(a.overlaps(inside));
    EXPECT_TRUE(a.contains(inside));
    EXPECT_FALSE(inside.contains(a));
}

TEST(BoundsTests, PadGrowsEachSide)
{
    const Bounds padded = Bounds(Point(0.0, 0.0), Point(10.0, 20.0)).pad(0.5);
    EXPECT_EQ(padded.min(), Point(-5.0, -10.0));
    EXPECT_EQ(padded.max(), Point(15.0, 30.0));
}

TEST(BoundsTests, NonFiniteCornersAreReported)
{
    const double inf = std::numeric_limits<double>::infinity();
    EXPECT_FALSE(Bounds(Point(0.0, 0.0), Point(inf, 1.0)).isFinite());
    EXPECT_FALSE(Bounds().isFinite());
}

TEST(TransformationTests, UntransformInvertsTransform)
{
    const Geometry::Transformation t(2.0, 5.0, -1.0, 3.0);
    const Point p(7.25, -1.5);

    const Point forward = t.transform(p, 4.0);
    EXPECT_EQ(forward, Point(4.0 * (2.0 * 7.25 + 5.0), 4.0 * (1.5 + 3.0)));
    EXPECT_EQ(t.untransform(forward, 4.0), p);
    EXPECT_EQ(t.transform(p, 0.0), t.transform(p));
}
