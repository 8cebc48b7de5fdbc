// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "mapview/FrameScheduling.hpp"

#include <algorithm>

namespace MapView {

FrameTimer::FrameTimer(Api::IFrameClock* clock)
    : m_clock(clock)
{
}

FrameTimer::~FrameTimer()
{
    cancel();
}

void FrameTimer::start(int delayMs, std::function<void()> action)
{
    cancel();
    if (!m_clock)
        return;

    m_action = std::move(action);
    m_deadline = m_clock->now() + std::max(delayMs, 0);
    m_token = m_clock->requestFrame([this] { poll(); });
}

void FrameTimer::cancel()
{
    if (m_token != 0 && m_clock)
        m_clock->cancelFrame(m_token);
    m_token = 0;
    m_action = nullptr;
}

void FrameTimer::poll()
{
    m_token = 0;
    if (m_clock->now() < m_deadline) {
        m_token = m_clock->requestFrame([this] { poll(); });
        return;
    }

    auto action = std::move(m_action);
    m_action = nullptr;
    if (action)
        action();
}

FrameThrottle::FrameThrottle(Api::IFrameClock* clock, int intervalMs, std::function<void()> action)
    : m_timer(clock)
    , m_intervalMs(intervalMs)
    , m_action(std::move(action))
{
}

void FrameThrottle::trigger()
{
    if (m_locked) {
        m_pending = true;
        return;
    }

    if (m_action)
        m_action();
    lock();
}

void FrameThrottle::cancel()
{
    m_timer.cancel();
    m_locked = false;
    m_pending = false;
}

void FrameThrottle::lock()
{
    m_locked = true;
    m_timer.start(m_intervalMs, [this] {
        m_locked = false;
        if (m_pending) {
            m_pending = false;
            trigger();
        }
    });
}

} // namespace MapView
