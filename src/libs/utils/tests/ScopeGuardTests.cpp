// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include <gtest/gtest.h>

#include "utils/Macros.hpp"
#include "utils/ScopeGuard.hpp"

#include <QtCore/QString>

#include <stdexcept>

TEST(ScopeGuardTests, RunsOnScopeExit)
{
    int calls = 0;
    {
        UTILS_DEFER(++calls);
        EXPECT_EQ(calls, 0);
    }
    EXPECT_EQ(calls, 1);
}

TEST(ScopeGuardTests, ReleasedGuardDoesNothing)
{
    int calls = 0;
    {
        Utils::ScopeGuard guard([&] { ++calls; });
        guard.release();
    }
    EXPECT_EQ(calls, 0);
}

TEST(ScopeGuardTests, GuardsRunInReverseOrder)
{
    QString order;
    {
        UTILS_DEFER(order += QLatin1Char('a'));
        UTILS_DEFER(order += QLatin1Char('b'));
    }
    EXPECT_EQ(order, QStringLiteral("ba"));
}

TEST(ScopedAssignTests, RestoresPreviousValue)
{
    bool busy = false;
    {
        const Utils::ScopedAssign<bool> outer(busy, true);
        EXPECT_TRUE(busy);
        EXPECT_FALSE(outer.previous());
        {
            const Utils::ScopedAssign<bool> inner(busy, true);
            EXPECT_TRUE(inner.previous());
        }
        // The inner guard must not clear the outer one.
        EXPECT_TRUE(busy);
    }
    EXPECT_FALSE(busy);
}

TEST(ScopedAssignTests, RestoresOnException)
{
    int depth = 1;
    try {
        const Utils::ScopedAssign<int> guard(depth, 5);
        throw std::runtime_error("boom");
    } catch (const std::runtime_error&) {
    }
    EXPECT_EQ(depth, 1);
}
