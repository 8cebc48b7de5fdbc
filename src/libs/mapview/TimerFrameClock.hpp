// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "mapview/MapViewGlobal.hpp"
#include "mapview/api/IFrameClock.hpp"

#include <QtCore/QElapsedTimer>
#include <QtCore/QObject>
#include <QtCore/QTimer>

#include <map>

namespace MapView {

// IFrameClock driven by a QTimer at display rate. The timer only runs while
// callbacks are pending.
class MAPVIEW_EXPORT TimerFrameClock final : public QObject, public Api::IFrameClock
{
    Q_OBJECT

public:
    explicit TimerFrameClock(QObject* parent = nullptr);
    ~TimerFrameClock() override;

    Api::FrameToken requestFrame(Api::FrameCallback callback) override;
    void cancelFrame(Api::FrameToken token) override;
    qint64 now() const override;

    int pendingFrames() const { return static_cast<int>(m_pending.size()); }

private:
    void tick();

    QTimer m_timer;
    QElapsedTimer m_elapsed;
    std::map<Api::FrameToken, Api::FrameCallback> m_pending;
    Api::FrameToken m_nextToken = 1;
};

} // namespace MapView
