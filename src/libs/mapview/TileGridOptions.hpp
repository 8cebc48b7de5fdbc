// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "mapview/MapViewConstants.hpp"
#include "geo/LatLngBounds.hpp"
#include "geometry/Point.hpp"

#include <optional>

namespace MapView {

struct TileGridOptions final {
	Geometry::Point tileSize{Constants::kDefaultTileSize, Constants::kDefaultTileSize};
	double opacity = 1.0;
	// Load new tiles only once the view settles instead of while it moves.
	bool updateWhenIdle = false;
	bool updateWhenZooming = true;
	// Minimum spacing of updates while the view moves, in milliseconds.
	int updateInterval = 200;
	int zIndex = 1;
	// Tiles outside these bounds are never requested; invalid means unbounded.
	Geo::LatLngBounds bounds;
	int minZoom = 0;
	int maxZoom = 18;
	// Zoom levels outside the native range are drawn from the nearest native
	// level, scaled.
	std::optional<int> minNativeZoom;
	std::optional<int> maxNativeZoom;
	bool noWrap = false;
	// Tiles kept around the visible range, per side.
	int keepBuffer = 2;
	int fadeDuration = 200;
	// Delay of the prune that follows a completed batch while fading.
	int pruneDelay = 250;
	// Fraction of the view added on every side before computing the range.
	double boundsPadding = 0.0;
	int ancestorSearchDepth = 5;
	int descendantSearchDepth = 2;
};

} // namespace MapView
