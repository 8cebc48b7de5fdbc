// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "mapview/api/ITileProvider.hpp"

#include <QtCore/QHash>

#include <vector>

namespace MapView::Testing {

// Records every call the grid makes. Pending loads keep their completion
// until the test settles it.
class FakeTileProvider final : public Api::ITileProvider
{
public:
    enum class Mode {
        Pending,
        Ready,
        // Resolves from inside createTile().
        ResolveInline
    };

    Mode mode = Mode::Pending;

    TileLoad createTile(const TileCoord& coords, const TileCompletion& completion) override
    {
        const VisualId visual(m_nextVisual++);
        created.push_back(coords);
        ++createCount[coords];
        visualCoords.insert(visual.value(), coords);
        completions.insert(coords, completion);

        switch (mode) {
        case Mode::Ready:
            return TileLoad::ready(visual);
        case Mode::ResolveInline:
            completion.resolve();
            return TileLoad::pending(visual);
        case Mode::Pending:
            break;
        }
        return TileLoad::pending(visual);
    }

    void releaseTile(VisualId visual) override
    {
        released.push_back(visual);
        ++releaseCount[visualCoords.value(visual.value())];
    }

    void abortTile(VisualId visual) override
    {
        aborted.push_back(visual);
        ++abortCount[visualCoords.value(visual.value())];
    }

    VisualId createLevel(int zoom) override
    {
        const VisualId container(m_nextVisual++);
        levelsCreated.push_back(zoom);
        return container;
    }

    void releaseLevel(VisualId container) override { levelsReleased.push_back(container); }

    // Newest completion handed out for |coords|.
    TileCompletion completion(const TileCoord& coords) const { return completions.value(coords); }

    bool resolve(const TileCoord& coords)
    {
        const auto it = completions.constFind(coords);
        if (it == completions.cend() || it->isSettled())
            return false;
        it->resolve();
        return true;
    }

    bool reject(const TileCoord& coords, const QString& error, VisualId fallback = {})
    {
        const auto it = completions.constFind(coords);
        if (it == completions.cend() || it->isSettled())
            return false;
        it->reject(error, fallback);
        return true;
    }

    // Resolves every unsettled completion; returns how many were settled.
    int resolveAll()
    {
        const QList<TileCompletion> pending = completions.values();
        int count = 0;
        for (const TileCompletion& c : pending) {
            if (c.isSettled())
                continue;
            c.resolve();
            ++count;
        }
        return count;
    }

    VisualId makeFallback() { return VisualId(m_nextVisual++); }

    std::vector<TileCoord> created;
    QHash<TileCoord, int> createCount;
    QHash<TileCoord, int> releaseCount;
    QHash<TileCoord, int> abortCount;
    QHash<VisualId::value_type, TileCoord> visualCoords;
    QHash<TileCoord, TileCompletion> completions;
    std::vector<VisualId> released;
    std::vector<VisualId> aborted;
    std::vector<int> levelsCreated;
    std::vector<VisualId> levelsReleased;

private:
    VisualId::value_type m_nextVisual = 1;
};

} // namespace MapView::Testing
