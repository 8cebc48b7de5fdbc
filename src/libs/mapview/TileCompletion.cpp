// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "mapview/TileCompletion.hpp"

#include "mapview/TileGrid.hpp"

namespace MapView {

bool TileCompletion::settle(const char* what) const
{
    if (!m_state) {
        qCWarning(tilegridlog) << what << "called on an empty tile completion";
        return false;
    }
    if (m_state->settled) {
        qCWarning(tilegridlog) << what << "ignored, tile" << m_state->coords << "was already settled";
        return false;
    }
    m_state->settled = true;
    return true;
}

void TileCompletion::resolve() const
{
    if (!settle("resolve"))
        return;
    if (TileGrid* grid = m_state->grid.data())
        grid->tileReady(m_state->coords, m_state->requestId, QString(), VisualId{});
}

void TileCompletion::reject(const QString& error, VisualId fallback) const
{
    if (!settle("reject"))
        return;
    if (TileGrid* grid = m_state->grid.data())
        grid->tileReady(m_state->coords,
                        m_state->requestId,
                        error.isEmpty() ? QStringLiteral("Tile load failed") : error,
                        fallback);
}

bool TileCompletion::isSettled() const
{
    return !m_state || m_state->settled;
}

bool TileCompletion::isStale() const
{
    if (!m_state || m_state->settled)
        return true;
    TileGrid* grid = m_state->grid.data();
    return !grid || !grid->isRequestPending(m_state->coords, m_state->requestId);
}

TileCoord TileCompletion::coords() const
{
    return m_state ? m_state->coords : TileCoord{};
}

} // namespace MapView
