// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "mapview/MapViewGlobal.hpp"
#include "mapview/MapViewTypes.hpp"
#include "mapview/TileCompletion.hpp"

namespace MapView {

// What createTile() hands back: the visual, and whether its content is
// already complete or will be reported through the TileCompletion.
struct TileLoad final {
	enum class Mode {
		Ready,
		Pending
	};

	Mode mode = Mode::Pending;
	VisualId visual;

	static TileLoad ready(VisualId v) { return TileLoad{Mode::Ready, v}; }
	static TileLoad pending(VisualId v) { return TileLoad{Mode::Pending, v}; }
};

namespace Api {

// Creates and disposes of tile visuals. The grid never inspects a visual; it
// only passes the handles back.
class MAPVIEW_EXPORT ITileProvider
{
public:
    virtual ~ITileProvider() = default;

    // |coords| are already wrapped for the grid's CRS. A Pending load must
    // settle |completion| exactly once, possibly after the tile was pruned.
    virtual TileLoad createTile(const TileCoord& coords, const TileCompletion& completion) = 0;

    // Called once per visual returned from createTile().
    virtual void releaseTile(VisualId visual) = 0;

    // Called before releaseTile() for tiles whose content never arrived.
    virtual void abortTile(VisualId visual) { Q_UNUSED(visual); }

    virtual VisualId createLevel(int zoom) { Q_UNUSED(zoom); return {}; }
    virtual void releaseLevel(VisualId container) { Q_UNUSED(container); }
};

} // namespace Api
} // namespace MapView
