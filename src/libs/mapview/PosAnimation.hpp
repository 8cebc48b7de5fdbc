// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "mapview/MapViewGlobal.hpp"
#include "mapview/MapViewConstants.hpp"
#include "mapview/api/IFrameClock.hpp"
#include "geometry/Point.hpp"

#include <QtCore/QObject>

namespace MapView {

// Eases a position from its start to a target over a fixed duration, one step
// per frame. finished() is emitted both on natural completion and on stop().
class MAPVIEW_EXPORT PosAnimation final : public QObject
{
    Q_OBJECT

public:
    explicit PosAnimation(Api::IFrameClock* clock, QObject* parent = nullptr);
    ~PosAnimation() override;

    void run(const Geometry::Point& from,
             const Geometry::Point& to,
             double durationSec = Constants::kPanDurationSec,
             double easeLinearity = Constants::kPanEaseLinearity);

    // Jumps to the rounded current position and completes.
    void stop();

    bool isRunning() const { return m_running; }
    const Geometry::Point& position() const { return m_position; }

    static double easeOutPower(double easeLinearity);

signals:
    void started();
    void stepped(const Geometry::Point& position);
    void finished();

private:
    void animate();
    void step(bool round);
    void runFrame(double progress, bool round);
    void complete();

    Api::IFrameClock* m_clock = nullptr;
    Api::FrameToken m_frame = 0;
    bool m_running = false;
    double m_durationMs = 250.0;
    double m_easeOutPower = 2.0;
    qint64 m_startTime = 0;
    Geometry::Point m_start;
    Geometry::Point m_offset;
    Geometry::Point m_position;
};

} // namespace MapView
