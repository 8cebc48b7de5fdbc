// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "mapview/MapViewGlobal.hpp"
#include "mapview/api/IFrameClock.hpp"

#include <functional>

namespace MapView {

// Single-shot delay measured on a frame clock. Polls once per frame until the
// deadline passes, so it stops requesting frames as soon as it fires or is
// cancelled.
class MAPVIEW_EXPORT FrameTimer final
{
public:
    explicit FrameTimer(Api::IFrameClock* clock);
    ~FrameTimer();

    FrameTimer(const FrameTimer&) = delete;
    FrameTimer& operator=(const FrameTimer&) = delete;

    void start(int delayMs, std::function<void()> action);
    void cancel();
    bool isActive() const { return m_token != 0; }

private:
    void poll();

    Api::IFrameClock* m_clock = nullptr;
    Api::FrameToken m_token = 0;
    qint64 m_deadline = 0;
    std::function<void()> m_action;
};

// Runs the action at most once per interval. A trigger during the quiet
// period is remembered and replayed when the period ends.
class MAPVIEW_EXPORT FrameThrottle final
{
public:
    FrameThrottle(Api::IFrameClock* clock, int intervalMs, std::function<void()> action);

    void trigger();
    void cancel();
    bool isLocked() const { return m_locked; }

private:
    void lock();

    FrameTimer m_timer;
    int m_intervalMs = 0;
    std::function<void()> m_action;
    bool m_locked = false;
    bool m_pending = false;
};

} // namespace MapView
