// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "mapview/FlyToPath.hpp"
#include "mapview/FrameScheduling.hpp"
#include "mapview/MapViewTypes.hpp"
#include "mapview/PosAnimation.hpp"
#include "mapview/TimerFrameClock.hpp"
#include "mapview/tests/ManualFrameClock.hpp"

#include <QtCore/QCoreApplication>
#include <QtCore/QDeadlineTimer>
#include <QtCore/QEventLoop>
#include <QtTest/QSignalSpy>

#include <algorithm>
#include <cmath>
#include <functional>

using Geometry::Point;
using MapView::FlyToPath;
using MapView::FrameThrottle;
using MapView::FrameTimer;
using MapView::PosAnimation;
using MapView::TileCoord;
using MapView::Testing::ManualFrameClock;

namespace {

QCoreApplication* ensureCoreApp()
{
    if (auto* existing = QCoreApplication::instance())
        return existing;

    static int argc = 1;
    static char appName[] = "MapViewAnimationTests";
    static char* argv[] = {appName, nullptr};
    static QCoreApplication app(argc, argv);
    return &app;
}

void drainUntil(const std::function<bool()>& done, int timeoutMs = 2000)
{
    QDeadlineTimer deadline(timeoutMs);
    while (!done() && !deadline.hasExpired())
        QCoreApplication::processEvents(QEventLoop::AllEvents, 10);
}

} // namespace

TEST(FrameTimerTests, FiresOnceAfterDeadline)
{
    ManualFrameClock clock;
    FrameTimer timer(&clock);
    int fired = 0;

    timer.start(50, [&] { ++fired; });
    EXPECT_TRUE(timer.isActive());

    clock.advance(32);
    EXPECT_EQ(fired, 0);
    clock.advance(32);
    EXPECT_EQ(fired, 1);
    EXPECT_FALSE(timer.isActive());

    clock.advance(200);
    EXPECT_EQ(fired, 1);
    EXPECT_EQ(clock.pendingFrames(), 0);
}

TEST(FrameTimerTests, RestartReplacesPendingAction)
{
    ManualFrameClock clock;
    FrameTimer timer(&clock);
    int first = 0;
    int second = 0;

    timer.start(50, [&] { ++first; });
    clock.advance(32);
    timer.start(50, [&] { ++second; });
    clock.advance(32);
    EXPECT_EQ(first + second, 0);

    clock.advance(32);
    EXPECT_EQ(first, 0);
    EXPECT_EQ(second, 1);
}

TEST(FrameTimerTests, CancelAndDestructionDisarmClock)
{
    ManualFrameClock clock;
    int fired = 0;
    {
        FrameTimer timer(&clock);
        timer.start(50, [&] { ++fired; });
        timer.cancel();
        EXPECT_EQ(clock.pendingFrames(), 0);

        timer.start(50, [&] { ++fired; });
        EXPECT_EQ(clock.pendingFrames(), 1);
    }
    EXPECT_EQ(clock.pendingFrames(), 0);
    clock.advance(100);
    EXPECT_EQ(fired, 0);
}

TEST(FrameThrottleTests, RunsImmediatelyAndReplaysOnce)
{
    ManualFrameClock clock;
    int runs = 0;
    FrameThrottle throttle(&clock, 100, [&] { ++runs; });

    throttle.trigger();
    EXPECT_EQ(runs, 1);
    EXPECT_TRUE(throttle.isLocked());

    throttle.trigger();
    throttle.trigger();
    EXPECT_EQ(runs, 1);

    clock.advance(100);
    EXPECT_EQ(runs, 2);
    EXPECT_TRUE(throttle.isLocked());

    clock.advance(100);
    EXPECT_EQ(runs, 2);
    EXPECT_FALSE(throttle.isLocked());
    EXPECT_EQ(clock.pendingFrames(), 0);
}

TEST(FrameThrottleTests, CancelDropsPendingTrigger)
{
    ManualFrameClock clock;
    int runs = 0;
    FrameThrottle throttle(&clock, 100, [&] { ++runs; });

    throttle.trigger();
    throttle.trigger();
    throttle.cancel();
    EXPECT_FALSE(throttle.isLocked());

    clock.advance(200);
    EXPECT_EQ(runs, 1);
}

TEST(PosAnimationTests, EaseOutPowerFollowsLinearity)
{
    EXPECT_DOUBLE_EQ(PosAnimation::easeOutPower(0.5), 2.0);
    EXPECT_DOUBLE_EQ(PosAnimation::easeOutPower(0.25), 4.0);
    EXPECT_DOUBLE_EQ(PosAnimation::easeOutPower(0.1), 5.0);
    EXPECT_DOUBLE_EQ(PosAnimation::easeOutPower(0.0), 2.0);
}

TEST(PosAnimationTests, RunsToTargetAndFinishesOnce)
{
    ManualFrameClock clock;
    PosAnimation anim(&clock);
    QSignalSpy started(&anim, &PosAnimation::started);
    QSignalSpy stepped(&anim, &PosAnimation::stepped);
    QSignalSpy finished(&anim, &PosAnimation::finished);

    anim.run(Point(0, 0), Point(100, -40));
    EXPECT_TRUE(anim.isRunning());
    EXPECT_EQ(started.count(), 1);
    EXPECT_EQ(stepped.count(), 1);

    clock.advance(128);
    EXPECT_TRUE(anim.isRunning());
    // Ease-out: past the halfway mark at half time.
    EXPECT_GT(anim.position().x, 50.0);
    EXPECT_LT(anim.position().x, 100.0);

    clock.settle();
    EXPECT_FALSE(anim.isRunning());
    EXPECT_EQ(anim.position(), Point(100, -40));
    EXPECT_EQ(finished.count(), 1);
    EXPECT_EQ(clock.pendingFrames(), 0);
}

TEST(PosAnimationTests, StopRoundsAndFinishes)
{
    ManualFrameClock clock;
    PosAnimation anim(&clock);
    QSignalSpy finished(&anim, &PosAnimation::finished);

    anim.run(Point(0, 0), Point(333, 0), 1.0);
    clock.advance(48);
    anim.stop();

    EXPECT_FALSE(anim.isRunning());
    EXPECT_EQ(finished.count(), 1);
    EXPECT_DOUBLE_EQ(anim.position().x, std::round(anim.position().x));
    EXPECT_GT(anim.position().x, 0.0);
    EXPECT_EQ(clock.pendingFrames(), 0);

    anim.stop();
    EXPECT_EQ(finished.count(), 1);
}

TEST(PosAnimationTests, RerunFinishesPreviousRun)
{
    ManualFrameClock clock;
    PosAnimation anim(&clock);
    QSignalSpy finished(&anim, &PosAnimation::finished);

    anim.run(Point(0, 0), Point(100, 0));
    clock.advance(32);
    anim.run(anim.position(), Point(0, 100));
    EXPECT_EQ(finished.count(), 1);
    EXPECT_EQ(clock.pendingFrames(), 1);

    clock.settle();
    EXPECT_EQ(finished.count(), 2);
    EXPECT_EQ(anim.position(), Point(0, 100));
}

TEST(PosAnimationTests, ZeroDurationCompletesImmediately)
{
    ManualFrameClock clock;
    PosAnimation anim(&clock);
    QSignalSpy finished(&anim, &PosAnimation::finished);

    anim.run(Point(5, 5), Point(10, 10), 0.0);

    EXPECT_FALSE(anim.isRunning());
    EXPECT_EQ(anim.position(), Point(10, 10));
    EXPECT_EQ(finished.count(), 1);
    EXPECT_EQ(clock.pendingFrames(), 0);
}

TEST(FlyToPathTests, EndpointsMatchRequestedWidthsAndDistance)
{
    const double w0 = 1536.0;
    const double w1 = 384.0;
    const double u1 = 5000.0;
    const FlyToPath path(w0, w1, u1);

    ASSERT_TRUE(std::isfinite(path.length()));
    EXPECT_GT(path.length(), 0.0);
    EXPECT_NEAR(path.distance(0.0), 0.0, 1e-9);
    EXPECT_NEAR(path.distance(path.length()), u1, u1 * 1e-6);
    EXPECT_NEAR(path.width(0.0), w0, 1e-9);
    EXPECT_NEAR(path.width(path.length()), w1, w1 * 1e-6);
}

TEST(FlyToPathTests, LongFlightsWidenBeyondBothEnds)
{
    const FlyToPath path(1536.0, 384.0, 5000.0);

    double widest = 0.0;
    for (int i = 0; i <= 100; ++i)
        widest = std::max(widest, path.width(path.length() * i / 100.0));

    EXPECT_GT(widest, 1536.0 * 2.0);
}

TEST(FlyToPathTests, ZeroDistanceUsesUnitDistance)
{
    const FlyToPath path(1000.0, 250.0, 0.0);

    EXPECT_DOUBLE_EQ(path.u1(), 1.0);
    EXPECT_TRUE(std::isfinite(path.length()));
    EXPECT_NEAR(path.width(path.length()), 250.0, 1e-6);
}

TEST(TileCoordTests, KeyRoundTripsIncludingNegativeIndices)
{
    const TileCoord coords{-3, 7, 5};
    EXPECT_EQ(coords.key(), QStringLiteral("-3:7:5"));

    const auto parsed = TileCoord::fromKey(coords.key());
    ASSERT_TRUE(parsed.has_value());
    EXPECT_EQ(*parsed, coords);
}

TEST(TileCoordTests, MalformedKeysAreRejected)
{
    EXPECT_FALSE(TileCoord::fromKey(QStringLiteral("1:2")).has_value());
    EXPECT_FALSE(TileCoord::fromKey(QStringLiteral("1:2:3:4")).has_value());
    EXPECT_FALSE(TileCoord::fromKey(QStringLiteral("a:2:3")).has_value());
    EXPECT_FALSE(TileCoord::fromKey(QString()).has_value());
}

TEST(TileCoordTests, ParentFloorsTowardNegativeInfinity)
{
    EXPECT_EQ(TileCoord({5, 4, 3}).parent(), TileCoord({2, 2, 2}));
    EXPECT_EQ(TileCoord({-1, -3, 3}).parent(), TileCoord({-1, -2, 2}));
}

TEST(TimerFrameClockTests, RunsRequestedFramesOnTheEventLoop)
{
    ensureCoreApp();
    MapView::TimerFrameClock clock;

    int ran = 0;
    bool cancelledRan = false;
    clock.requestFrame([&] { ++ran; });
    const auto cancelled = clock.requestFrame([&] { cancelledRan = true; });
    clock.cancelFrame(cancelled);
    EXPECT_EQ(clock.pendingFrames(), 1);

    drainUntil([&] { return ran > 0; });

    EXPECT_EQ(ran, 1);
    EXPECT_FALSE(cancelledRan);
    EXPECT_EQ(clock.pendingFrames(), 0);
}

TEST(TimerFrameClockTests, FramesRequestedDuringAFrameRunNextFrame)
{
    ensureCoreApp();
    MapView::TimerFrameClock clock;

    int outer = 0;
    int inner = 0;
    clock.requestFrame([&] {
        ++outer;
        clock.requestFrame([&] { ++inner; });
        EXPECT_EQ(inner, 0);
    });

    drainUntil([&] { return inner > 0; });

    EXPECT_EQ(outer, 1);
    EXPECT_EQ(inner, 1);
    EXPECT_GE(clock.now(), 0);
}
