// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "mapview/MapViewConstants.hpp"
#include "geo/Crs.hpp"
#include "geo/LatLngBounds.hpp"
#include "geometry/Point.hpp"

#include <limits>
#include <optional>

namespace MapView {

struct ViewportOptions final {
	Geo::CrsPtr crs = Geo::Crs::epsg3857();
	double minZoom = 0.0;
	double maxZoom = std::numeric_limits<double>::infinity();
	// Invalid bounds mean the view is not restricted.
	Geo::LatLngBounds maxBounds;
	// Zero disables snapping.
	double zoomSnap = 1.0;
	double zoomDelta = 1.0;
	bool zoomAnimation = true;
	double zoomAnimationThreshold = 4.0;
	bool fadeAnimation = true;
	// Zero disables the pane offset check on moveEnded.
	double transform3DLimit = Constants::kTransformLimit;
};

struct PanOptions final {
	std::optional<bool> animate;
	// Seconds.
	std::optional<double> duration;
	double easeLinearity = Constants::kPanEaseLinearity;
	bool noMoveStart = false;
};

struct ZoomOptions final {
	std::optional<bool> animate;
};

// animate and duration, when set, are pushed down into zoom and pan unless
// those carry their own values.
struct ZoomPanOptions final {
	std::optional<bool> animate;
	std::optional<double> duration;
	ZoomOptions zoom;
	PanOptions pan;
};

struct FitBoundsOptions final {
	Geometry::Point padding;
	std::optional<Geometry::Point> paddingTopLeft;
	std::optional<Geometry::Point> paddingBottomRight;
	std::optional<double> maxZoom;
	ZoomPanOptions view;
};

struct FlyToOptions final {
	// Seconds; derived from the path length when unset.
	std::optional<double> duration;
	bool noMoveStart = false;
};

struct InvalidateSizeOptions final {
	bool animate = false;
	bool pan = true;
	bool debounceMoveEnd = false;
};

} // namespace MapView
