// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "mapview/TimerFrameClock.hpp"

#include "mapview/MapViewConstants.hpp"

namespace MapView {

TimerFrameClock::TimerFrameClock(QObject* parent)
    : QObject(parent)
{
    m_elapsed.start();
    m_timer.setTimerType(Qt::PreciseTimer);
    m_timer.setInterval(Constants::kFrameIntervalMs);
    connect(&m_timer, &QTimer::timeout, this, &TimerFrameClock::tick);
}

TimerFrameClock::~TimerFrameClock()
{
    m_timer.stop();
    m_pending.clear();
}

Api::FrameToken TimerFrameClock::requestFrame(Api::FrameCallback callback)
{
    const Api::FrameToken token = m_nextToken++;
    m_pending.emplace(token, std::move(callback));
    if (!m_timer.isActive())
        m_timer.start();
    return token;
}

void TimerFrameClock::cancelFrame(Api::FrameToken token)
{
    m_pending.erase(token);
    if (m_pending.empty())
        m_timer.stop();
}

qint64 TimerFrameClock::now() const
{
    return m_elapsed.elapsed();
}

void TimerFrameClock::tick()
{
    // Callbacks requested while this frame runs belong to the next one;
    // callbacks cancelled by an earlier one in this frame do not run.
    const Api::FrameToken lastDue = m_nextToken - 1;
    while (!m_pending.empty() && m_pending.begin()->first <= lastDue) {
        auto node = m_pending.extract(m_pending.begin());
        if (node.mapped())
            node.mapped()();
    }

    if (m_pending.empty())
        m_timer.stop();
}

} // namespace MapView
