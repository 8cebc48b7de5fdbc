// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "mapview/Viewport.hpp"
#include "mapview/tests/ManualFrameClock.hpp"

#include <QtCore/QStringList>
#include <QtTest/QSignalSpy>

#include <algorithm>
#include <limits>

using Geo::LatLng;
using Geo::LatLngBounds;
using Geometry::Point;
using MapView::FitBoundsOptions;
using MapView::FlyToOptions;
using MapView::InvalidateSizeOptions;
using MapView::MoveEvent;
using MapView::PanOptions;
using MapView::Viewport;
using MapView::ViewportOptions;
using MapView::ZoomAnimEvent;
using MapView::ZoomOptions;
using MapView::ZoomPanOptions;
using MapView::Testing::ManualFrameClock;

namespace {

// Pixel (26368, 13440) at zoom 10 on the Simple CRS.
constexpr LatLng kCenter(-13.125, 25.75);

ViewportOptions simpleOptions()
{
    ViewportOptions options;
    options.crs = Geo::Crs::simple();
    return options;
}

Point viewSize()
{
    return Point(1536, 1280);
}

ZoomPanOptions instant()
{
    ZoomPanOptions options;
    options.animate = false;
    return options;
}

// Records the order in which the viewport publishes changes.
struct SignalLog {
    explicit SignalLog(Viewport& viewport)
    {
        QObject::connect(&viewport, &Viewport::viewPreReset, [this] { names << QStringLiteral("viewPreReset"); });
        QObject::connect(&viewport, &Viewport::viewReset, [this] { names << QStringLiteral("viewReset"); });
        QObject::connect(&viewport, &Viewport::moveStarted, [this] { names << QStringLiteral("moveStarted"); });
        QObject::connect(&viewport, &Viewport::zoomStarted, [this] { names << QStringLiteral("zoomStarted"); });
        QObject::connect(&viewport, &Viewport::zoomed, [this](const MoveEvent& e) {
            names << QStringLiteral("zoomed");
            flyToEvents += e.flyTo ? 1 : 0;
        });
        QObject::connect(&viewport, &Viewport::moved, [this](const MoveEvent& e) {
            names << QStringLiteral("moved");
            flyToEvents += e.flyTo ? 1 : 0;
        });
        QObject::connect(&viewport, &Viewport::moveEnded, [this] { names << QStringLiteral("moveEnded"); });
        QObject::connect(&viewport, &Viewport::zoomEnded, [this] { names << QStringLiteral("zoomEnded"); });
        QObject::connect(&viewport, &Viewport::zoomAnimated, [this](const ZoomAnimEvent&) {
            names << QStringLiteral("zoomAnimated");
        });
    }

    int count(const QString& name) const { return static_cast<int>(names.count(name)); }

    QStringList names;
    int flyToEvents = 0;
};

} // namespace

TEST(ViewportTests, ConversionsAreConsistent)
{
    ManualFrameClock clock;
    Viewport viewport(&clock, viewSize(), kCenter, 10.0, simpleOptions());

    EXPECT_EQ(viewport.pixelOrigin(), Point(25600, 12800));
    EXPECT_EQ(viewport.latLngToContainerPoint(kCenter), Point(768, 640));
    EXPECT_TRUE(viewport.containerPointToLatLng(Point(768, 640)).equals(kCenter));
    EXPECT_EQ(viewport.project(kCenter), Point(26368, 13440));
    EXPECT_TRUE(viewport.unproject(Point(26368, 13440)).equals(kCenter));
    EXPECT_EQ(viewport.project(kCenter, 12), Point(105472, 53760));

    const Geometry::Bounds px = viewport.pixelBounds();
    EXPECT_EQ(px.min(), Point(25600, 12800));
    EXPECT_EQ(px.max(), Point(27136, 14080));

    const LatLngBounds bounds = viewport.bounds();
    EXPECT_DOUBLE_EQ(bounds.west(), 25.0);
    EXPECT_DOUBLE_EQ(bounds.east(), 26.5);
    EXPECT_DOUBLE_EQ(bounds.north(), -12.5);
    EXPECT_DOUBLE_EQ(bounds.south(), -13.75);

    EXPECT_DOUBLE_EQ(viewport.zoomScale(12), 4.0);
    EXPECT_DOUBLE_EQ(viewport.zoomScale(8, 10), 0.25);
    EXPECT_DOUBLE_EQ(viewport.scaleZoom(4), 12.0);
    EXPECT_DOUBLE_EQ(viewport.distance(LatLng(0, 0), LatLng(3, 4)), 5.0);
    EXPECT_FALSE(viewport.pixelWorldBounds().has_value());

    // Layer points stay put while the pane moves; container points follow it.
    const Point layer = viewport.latLngToLayerPoint(kCenter);
    PanOptions pan;
    pan.animate = false;
    viewport.panBy(Point(100, 50), pan);
    EXPECT_EQ(viewport.panePos(), Point(-100, -50));
    EXPECT_EQ(viewport.latLngToLayerPoint(kCenter), layer);
    EXPECT_EQ(viewport.latLngToContainerPoint(kCenter), Point(668, 590));
    EXPECT_EQ(viewport.containerPointToLayerPoint(Point(0, 0)), Point(100, 50));
    EXPECT_EQ(viewport.layerPointToContainerPoint(Point(100, 50)), Point(0, 0));
}

TEST(ViewportTests, WrapsThroughTheCrs)
{
    ManualFrameClock clock;
    Viewport viewport(&clock, viewSize(), LatLng(0, 0), 2.0);

    const LatLng wrapped = viewport.wrapLatLng(LatLng(10, 190));
    EXPECT_DOUBLE_EQ(wrapped.lng, -170.0);
    EXPECT_DOUBLE_EQ(wrapped.lat, 10.0);

    const LatLngBounds b = viewport.wrapLatLngBounds(LatLngBounds(LatLng(0, 170), LatLng(10, 200)));
    EXPECT_DOUBLE_EQ(b.west(), -190.0);
    EXPECT_DOUBLE_EQ(b.east(), -160.0);

    ASSERT_TRUE(viewport.pixelWorldBounds().has_value());
    EXPECT_NEAR(viewport.pixelWorldBounds()->max().x, 1024.0, 1e-6);
}

TEST(ViewportTests, ZoomIsSnappedAndClamped)
{
    ManualFrameClock clock;
    ViewportOptions options = simpleOptions();
    options.minZoom = 2;
    options.maxZoom = 12;
    Viewport viewport(&clock, viewSize(), kCenter, 10.0, options);

    viewport.setView(kCenter, 3.4, instant());
    EXPECT_DOUBLE_EQ(viewport.zoom(), 3.0);

    viewport.setView(kCenter, 15.0, instant());
    EXPECT_DOUBLE_EQ(viewport.zoom(), 12.0);

    viewport.setView(kCenter, -1.0, instant());
    EXPECT_DOUBLE_EQ(viewport.zoom(), 2.0);

    ZoomOptions noAnim;
    noAnim.animate = false;
    viewport.zoomIn(std::nullopt, noAnim);
    EXPECT_DOUBLE_EQ(viewport.zoom(), 3.0);
    viewport.zoomOut(2.0, noAnim);
    EXPECT_DOUBLE_EQ(viewport.zoom(), 2.0);
}

TEST(ViewportTests, ResetPublishesChangesInOrder)
{
    ManualFrameClock clock;
    Viewport viewport(&clock, viewSize(), kCenter, 10.0, simpleOptions());
    SignalLog log(viewport);

    viewport.setView(LatLng(0, 0), 11.0, instant());

    const QStringList expected{QStringLiteral("viewPreReset"),
                               QStringLiteral("zoomStarted"),
                               QStringLiteral("moveStarted"),
                               QStringLiteral("zoomed"),
                               QStringLiteral("moved"),
                               QStringLiteral("zoomEnded"),
                               QStringLiteral("moveEnded"),
                               QStringLiteral("viewReset")};
    EXPECT_EQ(log.names, expected);
    EXPECT_DOUBLE_EQ(viewport.zoom(), 11.0);
    EXPECT_TRUE(viewport.center().equals(LatLng(0, 0)));
    EXPECT_EQ(clock.pendingFrames(), 0);
}

TEST(ViewportTests, AnimatedPanMovesPaneAndEndsOnce)
{
    ManualFrameClock clock;
    Viewport viewport(&clock, viewSize(), kCenter, 10.0, simpleOptions());
    SignalLog log(viewport);

    viewport.panBy(Point(100, 0));
    EXPECT_TRUE(viewport.isPanning());
    EXPECT_EQ(log.count(QStringLiteral("moveStarted")), 1);

    clock.settle();

    EXPECT_FALSE(viewport.isPanning());
    EXPECT_EQ(viewport.panePos(), Point(-100, 0));
    EXPECT_GT(log.count(QStringLiteral("moved")), 2);
    EXPECT_EQ(log.count(QStringLiteral("moveEnded")), 1);
    EXPECT_EQ(log.names.last(), QStringLiteral("moveEnded"));
    EXPECT_TRUE(viewport.center().equals(LatLng(-13.125, 25.75 + 100.0 / 1024.0)));
    EXPECT_EQ(clock.pendingFrames(), 0);
}

TEST(ViewportTests, ZeroPanOnlyEndsMove)
{
    ManualFrameClock clock;
    Viewport viewport(&clock, viewSize(), kCenter, 10.0, simpleOptions());
    SignalLog log(viewport);

    viewport.panBy(Point(0.3, -0.2));

    EXPECT_EQ(log.names, QStringList{QStringLiteral("moveEnded")});
    EXPECT_EQ(clock.pendingFrames(), 0);
}

TEST(ViewportTests, PanBeyondViewResets)
{
    ManualFrameClock clock;
    Viewport viewport(&clock, viewSize(), kCenter, 10.0, simpleOptions());
    SignalLog log(viewport);

    viewport.panBy(Point(4096, 0));

    EXPECT_EQ(log.count(QStringLiteral("viewReset")), 1);
    EXPECT_TRUE(viewport.panePos().isNull());
    EXPECT_TRUE(viewport.center().equals(LatLng(-13.125, 29.75)));
    EXPECT_FALSE(viewport.isPanning());
}

TEST(ViewportTests, SecondPanTargetWins)
{
    ManualFrameClock clock;
    Viewport viewport(&clock, viewSize(), kCenter, 10.0, simpleOptions());

    const LatLng first = viewport.unproject(viewport.project(kCenter) + Point(300, 0));
    const LatLng second = viewport.unproject(viewport.project(kCenter) + Point(0, 200));

    viewport.panTo(first);
    clock.advance(64);
    viewport.panTo(second);
    clock.settle();

    EXPECT_TRUE(viewport.center().equals(second, 1e-6));
    EXPECT_FALSE(viewport.isPanning());
    EXPECT_EQ(clock.pendingFrames(), 0);
}

TEST(ViewportTests, ZoomAnimationReportsTargetAndCommits)
{
    ManualFrameClock clock;
    Viewport viewport(&clock, viewSize(), kCenter, 10.0, simpleOptions());
    SignalLog log(viewport);
    QSignalSpy steps(&viewport, &Viewport::zoomAnimationStepped);

    viewport.setZoom(12);

    ASSERT_TRUE(viewport.isAnimatingZoom());
    EXPECT_DOUBLE_EQ(viewport.zoom(), 12.0);
    EXPECT_DOUBLE_EQ(viewport.animationTargetZoom(), 12.0);
    EXPECT_EQ(log.names,
              (QStringList{QStringLiteral("zoomStarted"), QStringLiteral("moveStarted"), QStringLiteral("zoomAnimated")}));

    clock.advance(100);
    EXPECT_GT(steps.count(), 0);
    const ZoomAnimEvent frame = steps.last().at(0).value<ZoomAnimEvent>();
    EXPECT_GT(frame.zoom, 10.0);
    EXPECT_LT(frame.zoom, 12.0);
    EXPECT_GT(frame.scale, 1.0);
    EXPECT_LT(frame.scale, 4.0);
    EXPECT_TRUE(frame.center.equals(kCenter, 1e-9));

    clock.advance(200);
    EXPECT_FALSE(viewport.isAnimatingZoom());
    EXPECT_DOUBLE_EQ(viewport.zoom(), 12.0);
    EXPECT_EQ(log.count(QStringLiteral("zoomed")), 1);
    EXPECT_EQ(log.count(QStringLiteral("zoomEnded")), 1);
    EXPECT_EQ(log.count(QStringLiteral("moveEnded")), 1);
    EXPECT_EQ(log.names.last(), QStringLiteral("moveEnded"));
    EXPECT_EQ(clock.pendingFrames(), 0);
}

TEST(ViewportTests, ZoomInDuringAnimationChainsFromTarget)
{
    ManualFrameClock clock;
    Viewport viewport(&clock, viewSize(), kCenter, 10.0, simpleOptions());
    SignalLog log(viewport);

    viewport.zoomIn();
    clock.advance(100);
    viewport.zoomIn();
    clock.settle();

    EXPECT_DOUBLE_EQ(viewport.zoom(), 12.0);
    EXPECT_FALSE(viewport.isAnimatingZoom());
    EXPECT_EQ(log.count(QStringLiteral("zoomEnded")), 2);
    EXPECT_EQ(clock.pendingFrames(), 0);
}

TEST(ViewportTests, LargeZoomJumpIsNotAnimated)
{
    ManualFrameClock clock;
    Viewport viewport(&clock, viewSize(), kCenter, 10.0, simpleOptions());
    SignalLog log(viewport);

    viewport.setZoom(15);

    EXPECT_FALSE(viewport.isAnimatingZoom());
    EXPECT_DOUBLE_EQ(viewport.zoom(), 15.0);
    EXPECT_EQ(log.count(QStringLiteral("viewReset")), 1);
    EXPECT_EQ(clock.pendingFrames(), 0);
}

TEST(ViewportTests, StopCommitsZoomAnimation)
{
    ManualFrameClock clock;
    Viewport viewport(&clock, viewSize(), kCenter, 10.0, simpleOptions());
    SignalLog log(viewport);

    viewport.setZoom(11);
    clock.advance(48);
    viewport.stop();

    EXPECT_FALSE(viewport.isAnimatingZoom());
    EXPECT_DOUBLE_EQ(viewport.zoom(), 11.0);
    EXPECT_EQ(log.count(QStringLiteral("zoomEnded")), 1);
    EXPECT_EQ(clock.pendingFrames(), 0);
}

TEST(ViewportTests, StopWithoutSnapResetsView)
{
    ManualFrameClock clock;
    ViewportOptions options = simpleOptions();
    options.zoomSnap = 0.0;
    Viewport viewport(&clock, viewSize(), kCenter, 10.3, options);
    QSignalSpy reset(&viewport, &Viewport::viewReset);

    viewport.stop();

    EXPECT_DOUBLE_EQ(viewport.zoom(), 10.3);
    EXPECT_EQ(reset.count(), 1);
}

TEST(ViewportTests, FlyToZoomsOutAlongTheWay)
{
    ManualFrameClock clock;
    Viewport viewport(&clock, viewSize(), kCenter, 10.0, simpleOptions());
    SignalLog log(viewport);

    double lowest = viewport.zoom();
    QObject::connect(&viewport, &Viewport::zoomed, [&] { lowest = std::min(lowest, viewport.zoom()); });

    const LatLng target = viewport.unproject(viewport.project(kCenter) + Point(5000, 0));
    viewport.flyTo(target, 12.0);
    EXPECT_TRUE(viewport.isFlying());

    clock.settle();

    EXPECT_FALSE(viewport.isFlying());
    EXPECT_LT(lowest, 9.5);
    EXPECT_DOUBLE_EQ(viewport.zoom(), 12.0);
    EXPECT_TRUE(viewport.center().equals(target, 1e-9));
    EXPECT_GT(log.flyToEvents, 0);
    EXPECT_EQ(log.count(QStringLiteral("zoomEnded")), 1);
    EXPECT_EQ(log.count(QStringLiteral("moveEnded")), 1);
    EXPECT_EQ(clock.pendingFrames(), 0);
}

TEST(ViewportTests, NewViewAbandonsFlight)
{
    ManualFrameClock clock;
    Viewport viewport(&clock, viewSize(), kCenter, 10.0, simpleOptions());

    FlyToOptions options;
    options.duration = 2.0;
    viewport.flyTo(LatLng(40, 40), 8.0, options);
    clock.advance(200);
    ASSERT_TRUE(viewport.isFlying());

    viewport.setView(LatLng(1, 1), 9.0, instant());

    EXPECT_FALSE(viewport.isFlying());
    EXPECT_EQ(clock.pendingFrames(), 0);
    EXPECT_DOUBLE_EQ(viewport.zoom(), 9.0);
    EXPECT_TRUE(viewport.center().equals(LatLng(1, 1)));

    clock.advance(3000);
    EXPECT_TRUE(viewport.center().equals(LatLng(1, 1)));
}

TEST(ViewportTests, FitBoundsCentersAndPicksZoom)
{
    ManualFrameClock clock;
    Viewport viewport(&clock, viewSize(), kCenter, 10.0, simpleOptions());

    // 2048 px square at zoom 10; 1536x1280 fits it at zoom 9.
    const LatLngBounds bounds(LatLng(-14, 24), LatLng(-12, 26));
    EXPECT_DOUBLE_EQ(viewport.boundsZoom(bounds), 9.0);
    EXPECT_DOUBLE_EQ(viewport.boundsZoom(bounds, true), 10.0);

    FitBoundsOptions options;
    options.view = instant();
    const Utils::Result result = viewport.fitBounds(bounds, options);
    ASSERT_TRUE(result.ok) << result.joined().toStdString();
    EXPECT_DOUBLE_EQ(viewport.zoom(), 9.0);
    EXPECT_TRUE(viewport.center().equals(LatLng(-13, 25), 1e-9));

    options.maxZoom = 8.0;
    ASSERT_TRUE(viewport.fitBounds(bounds, options).ok);
    EXPECT_DOUBLE_EQ(viewport.zoom(), 8.0);
}

TEST(ViewportTests, FitBoundsRejectsUnusableBounds)
{
    ManualFrameClock clock;
    Viewport viewport(&clock, viewSize(), kCenter, 10.0, simpleOptions());
    QSignalSpy moved(&viewport, &Viewport::moved);

    const Utils::Result invalid = viewport.fitBounds(LatLngBounds());
    EXPECT_FALSE(invalid.ok);
    EXPECT_FALSE(invalid.errors.isEmpty());

    const Utils::Result point = viewport.fitBounds(LatLngBounds(LatLng(1, 1), LatLng(1, 1)));
    EXPECT_FALSE(point.ok);

    EXPECT_FALSE(viewport.flyToBounds(LatLngBounds()).ok);

    EXPECT_EQ(moved.count(), 0);
    EXPECT_DOUBLE_EQ(viewport.zoom(), 10.0);
    EXPECT_TRUE(viewport.center().equals(kCenter));
}

TEST(ViewportTests, MaxBoundsKeepsViewInside)
{
    ManualFrameClock clock;
    ViewportOptions options = simpleOptions();
    options.maxBounds = LatLngBounds(LatLng(-20, 20), LatLng(-10, 30));
    Viewport viewport(&clock, viewSize(), kCenter, 10.0, options);
    const LatLngBounds allowed = options.maxBounds.pad(0.001);

    viewport.setView(LatLng(0, 0), 10.0, instant());
    EXPECT_TRUE(allowed.contains(viewport.bounds()));

    PanOptions pan;
    pan.animate = false;
    viewport.panBy(Point(-8000, 0), pan);
    EXPECT_TRUE(allowed.contains(viewport.bounds()));

    viewport.setMaxBounds(LatLngBounds());
    viewport.panBy(Point(-8000, 0), pan);
    EXPECT_FALSE(allowed.contains(viewport.bounds()));
}

TEST(ViewportTests, PanInsideBringsPointIntoView)
{
    ManualFrameClock clock;
    Viewport viewport(&clock, viewSize(), kCenter, 10.0, simpleOptions());

    const LatLng outside = viewport.unproject(viewport.project(kCenter) + Point(1000, 0));
    FitBoundsOptions options;
    options.padding = Point(50, 50);
    options.view.pan.animate = false;
    viewport.panInside(outside, options);

    const Point container = viewport.latLngToContainerPoint(outside);
    EXPECT_LE(container.x, viewSize().x - 50 + 1);
    EXPECT_GE(container.x, 0.0);
}

TEST(ViewportTests, ZoomLimitsClampCurrentZoom)
{
    ManualFrameClock clock;
    Viewport viewport(&clock, viewSize(), kCenter, 10.0, simpleOptions());
    QSignalSpy limits(&viewport, &Viewport::zoomLimitsChanged);

    viewport.setMinZoom(11);
    clock.settle();
    EXPECT_DOUBLE_EQ(viewport.zoom(), 11.0);

    viewport.setMaxZoom(11);
    viewport.setMaxZoom(11);
    EXPECT_EQ(limits.count(), 2);

    viewport.setMinZoom(3);
    viewport.setMaxZoom(5);
    clock.settle();
    EXPECT_DOUBLE_EQ(viewport.zoom(), 5.0);
}

TEST(ViewportTests, SetZoomAroundKeepsPointFixed)
{
    ManualFrameClock clock;
    Viewport viewport(&clock, viewSize(), kCenter, 10.0, simpleOptions());

    const Point fixed(200, 300);
    const LatLng anchor = viewport.containerPointToLatLng(fixed);

    ZoomOptions options;
    options.animate = false;
    viewport.setZoomAround(fixed, 12.0, options);

    EXPECT_DOUBLE_EQ(viewport.zoom(), 12.0);
    const Point after = viewport.latLngToContainerPoint(anchor);
    EXPECT_NEAR(after.x, fixed.x, 1.0);
    EXPECT_NEAR(after.y, fixed.y, 1.0);
}

TEST(ViewportTests, InvalidateSizeKeepsCenter)
{
    ManualFrameClock clock;
    Viewport viewport(&clock, viewSize(), kCenter, 10.0, simpleOptions());
    SignalLog log(viewport);
    QSignalSpy resized(&viewport, &Viewport::resized);

    viewport.invalidateSize(Point(1600, 1280));

    EXPECT_EQ(viewport.size(), Point(1600, 1280));
    EXPECT_EQ(viewport.panePos(), Point(32, 0));
    EXPECT_TRUE(viewport.center().equals(kCenter, 1e-9));
    EXPECT_EQ(resized.count(), 1);
    EXPECT_EQ(log.count(QStringLiteral("moved")), 1);
    EXPECT_EQ(log.count(QStringLiteral("moveEnded")), 1);

    viewport.invalidateSize(Point(1600, 1280));
    EXPECT_EQ(resized.count(), 1);
}

TEST(ViewportTests, InvalidateSizeCanDebounceMoveEnd)
{
    ManualFrameClock clock;
    Viewport viewport(&clock, viewSize(), kCenter, 10.0, simpleOptions());
    QSignalSpy moveEnded(&viewport, &Viewport::moveEnded);

    InvalidateSizeOptions options;
    options.debounceMoveEnd = true;
    viewport.invalidateSize(Point(1500, 1200), options);
    viewport.invalidateSize(Point(1400, 1100), options);

    EXPECT_EQ(moveEnded.count(), 0);
    clock.advance(150);
    EXPECT_EQ(moveEnded.count(), 0);
    clock.advance(100);
    EXPECT_EQ(moveEnded.count(), 1);
    EXPECT_EQ(clock.pendingFrames(), 0);
}

TEST(ViewportTests, PaneOffsetBeyondLimitResetsView)
{
    ManualFrameClock clock;
    ViewportOptions options = simpleOptions();
    options.transform3DLimit = 1000;
    Viewport viewport(&clock, viewSize(), kCenter, 10.0, options);
    QSignalSpy reset(&viewport, &Viewport::viewReset);

    PanOptions pan;
    pan.animate = false;
    viewport.panBy(Point(600, 0), pan);
    EXPECT_EQ(reset.count(), 0);
    EXPECT_EQ(viewport.panePos(), Point(-600, 0));

    viewport.panBy(Point(600, 0), pan);
    EXPECT_EQ(reset.count(), 1);
    EXPECT_TRUE(viewport.panePos().isNull());
    EXPECT_TRUE(viewport.center().equals(LatLng(-13.125, 25.75 + 1200.0 / 1024.0), 1e-9));
}

TEST(ViewportTests, DestroyingViewportDisarmsClock)
{
    ManualFrameClock clock;
    {
        Viewport viewport(&clock, viewSize(), kCenter, 10.0, simpleOptions());
        viewport.setZoom(11);
        viewport.flyTo(LatLng(1, 1), 9.0);
        ASSERT_GT(clock.pendingFrames(), 0);
    }
    EXPECT_EQ(clock.pendingFrames(), 0);
}
