// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "mapview/MapViewGlobal.hpp"
#include "mapview/TileGridOptions.hpp"
#include "mapview/TileUrlTemplate.hpp"
#include "mapview/ViewportOptions.hpp"
#include "geo/LatLng.hpp"
#include "utils/Result.hpp"

#include <QtCore/QJsonObject>
#include <QtCore/QString>

namespace MapView {

// Everything needed to bring up a map: the viewport, the initial view, the
// tile grid and the tile source. Documents look like
//
//   {
//     "crs": "EPSG:3857",
//     "view": { "center": [51.5, -0.09], "zoom": 13 },
//     "viewport": { "minZoom": 0, "maxZoom": 19, "maxBounds": [[s, w], [n, e]] },
//     "tiles": { "tileSize": 256, "keepBuffer": 2, "maxNativeZoom": 17 },
//     "url": { "template": "https://{s}.tiles.example/{z}/{x}/{y}.png" }
//   }
//
// Every section and key is optional; missing keys keep their defaults.
struct MAPVIEW_EXPORT MapConfig final {
	QString crsCode = QStringLiteral("EPSG:3857");
	ViewportOptions viewport;
	Geo::LatLng center;
	double zoom = 0.0;
	TileGridOptions tiles;
	QString urlTemplate;
	TileUrlTemplate::Options url;

	// Fills |out| from |json|. On failure every problem is listed and |out| is
	// left unchanged.
	static Utils::Result fromJson(const QJsonObject& json, MapConfig* out);
	static Utils::Result load(const QString& path, MapConfig* out);

	QJsonObject toJson() const;

	static QJsonObject viewStateToJson(const Geo::LatLng& center, double zoom);
	// Replaces center and zoom with a stored view; the zoom is clamped to the
	// viewport limits.
	Utils::Result applyViewState(const QJsonObject& state);

	TileUrlTemplate makeUrlTemplate() const;
};

} // namespace MapView
