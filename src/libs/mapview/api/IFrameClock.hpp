// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "mapview/MapViewGlobal.hpp"

#include <QtCore/QtGlobal>

#include <functional>

namespace MapView::Api {

using FrameToken = quint64;
using FrameCallback = std::function<void()>;

// Display-refresh callback source. A requested callback fires once, on the
// next frame; cancelling an unknown or already fired token is a no-op.
class MAPVIEW_EXPORT IFrameClock
{
public:
    virtual ~IFrameClock() = default;

    virtual FrameToken requestFrame(FrameCallback callback) = 0;
    virtual void cancelFrame(FrameToken token) = 0;

    // Monotonic milliseconds.
    virtual qint64 now() const = 0;
};

} // namespace MapView::Api
