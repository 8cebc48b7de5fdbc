// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "mapview/PosAnimation.hpp"

#include <algorithm>
#include <cmath>

namespace MapView {

PosAnimation::PosAnimation(Api::IFrameClock* clock, QObject* parent)
    : QObject(parent)
    , m_clock(clock)
{
}

PosAnimation::~PosAnimation()
{
    if (m_frame != 0)
        m_clock->cancelFrame(m_frame);
}

double PosAnimation::easeOutPower(double easeLinearity)
{
    const double linearity = easeLinearity > 0.0 ? easeLinearity : Constants::kPanEaseLinearity;
    return 1.0 / std::max(linearity, Constants::kMinEaseLinearity);
}

void PosAnimation::run(const Geometry::Point& from,
                       const Geometry::Point& to,
                       double durationSec,
                       double easeLinearity)
{
    stop();

    m_running = true;
    m_durationMs = std::max(durationSec, 0.0) * 1000.0;
    m_easeOutPower = easeOutPower(easeLinearity);
    m_start = from;
    m_position = from;
    m_offset = to - from;
    m_startTime = m_clock->now();

    emit started();
    animate();
}

void PosAnimation::stop()
{
    if (!m_running)
        return;
    step(true);
    complete();
}

void PosAnimation::animate()
{
    m_frame = m_clock->requestFrame([this] {
        m_frame = 0;
        animate();
    });
    step(false);
}

void PosAnimation::step(bool round)
{
    const double elapsed = static_cast<double>(m_clock->now() - m_startTime);
    if (elapsed < m_durationMs) {
        const double t = elapsed / m_durationMs;
        runFrame(1.0 - std::pow(1.0 - t, m_easeOutPower), round);
        return;
    }

    runFrame(1.0, false);
    complete();
}

void PosAnimation::runFrame(double progress, bool round)
{
    Geometry::Point pos = m_start + m_offset * progress;
    if (round)
        pos.round();
    m_position = pos;
    emit stepped(m_position);
}

void PosAnimation::complete()
{
    if (!m_running)
        return;
    if (m_frame != 0) {
        m_clock->cancelFrame(m_frame);
        m_frame = 0;
    }
    m_running = false;
    emit finished();
}

} // namespace MapView
