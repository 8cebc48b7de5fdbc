// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "mapview/MapViewGlobal.hpp"
#include "mapview/MapViewTypes.hpp"

#include <QtCore/QPointer>
#include <QtCore/QString>

#include <memory>

namespace MapView {

class TileGrid;

// Exactly-once completion handle for an asynchronous tile load. Copies share
// state: whichever copy settles first wins, later calls are logged and
// ignored. Settling after the grid dropped the tile is harmless.
class MAPVIEW_EXPORT TileCompletion final
{
public:
    TileCompletion() = default;

    void resolve() const;

    // |fallback|, when valid, replaces the tile's visual and the tile is
    // treated as loaded.
    void reject(const QString& error, VisualId fallback = {}) const;

    bool isSettled() const;

    // True once the grid no longer waits for this request.
    bool isStale() const;

    TileCoord coords() const;

private:
    friend class TileGrid;

    struct State {
        QPointer<TileGrid> grid;
        TileCoord coords;
        quint64 requestId = 0;
        bool settled = false;
    };

    explicit TileCompletion(std::shared_ptr<State> state)
        : m_state(std::move(state))
    {
    }

    bool settle(const char* what) const;

    std::shared_ptr<State> m_state;
};

} // namespace MapView
