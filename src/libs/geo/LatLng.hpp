// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "geo/GeoGlobal.hpp"

#include <QtCore/QDebug>
#include <QtCore/QMetaType>

#include <algorithm>
#include <cmath>

namespace Geo {

inline constexpr double kLatLngEpsilon = 1.0e-9;

struct GEO_EXPORT LatLng final {
	double lat = 0.0;
	double lng = 0.0;

	constexpr LatLng() = default;
	constexpr LatLng(double latitude, double longitude) : lat(latitude), lng(longitude) {}

	bool isFinite() const { return std::isfinite(lat) && std::isfinite(lng); }

	bool equals(const LatLng& o, double maxMargin = kLatLngEpsilon) const
	{
		return std::max(std::abs(lat - o.lat), std::abs(lng - o.lng)) <= maxMargin;
	}

	friend bool operator==(const LatLng& a, const LatLng& b) { return a.lat == b.lat && a.lng == b.lng; }
	friend bool operator!=(const LatLng& a, const LatLng& b) { return !(a == b); }
};

inline QDebug operator<<(QDebug dbg, const LatLng& ll)
{
	QDebugStateSaver saver(dbg);
	dbg.nospace() << "LatLng(" << ll.lat << ", " << ll.lng << ')';
	return dbg;
}

} // namespace Geo

Q_DECLARE_METATYPE(Geo::LatLng)
