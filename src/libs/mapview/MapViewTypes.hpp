// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "mapview/MapViewGlobal.hpp"
#include "geo/LatLng.hpp"
#include "geometry/Point.hpp"

#include <QtCore/QHashFunctions>
#include <QtCore/QMetaType>
#include <QtCore/QString>

#include <optional>

namespace MapView {

// Opaque handle to something a tile provider created for display.
class VisualId final
{
public:
	using value_type = quint64;

	constexpr VisualId() = default;
	explicit constexpr VisualId(value_type v) : m_value(v) {}

	constexpr value_type value() const { return m_value; }
	constexpr bool isValid() const { return m_value != 0; }

	explicit operator bool() const { return isValid(); }

	friend constexpr bool operator==(VisualId a, VisualId b) { return a.m_value == b.m_value; }
	friend constexpr bool operator!=(VisualId a, VisualId b) { return a.m_value != b.m_value; }

private:
	value_type m_value = 0;
};

inline size_t qHash(VisualId id, size_t seed = 0) noexcept
{
	return ::qHash(id.value(), seed);
}

// Integer tile index at an integer zoom.
struct MAPVIEW_EXPORT TileCoord final {
	int x = 0;
	int y = 0;
	int z = 0;

	// "x:y:z"
	QString key() const;
	static std::optional<TileCoord> fromKey(const QString& key);

	TileCoord parent() const;
	Geometry::Point toPoint() const { return Geometry::Point(x, y); }

	friend bool operator==(const TileCoord& a, const TileCoord& b) { return a.x == b.x && a.y == b.y && a.z == b.z; }
	friend bool operator!=(const TileCoord& a, const TileCoord& b) { return !(a == b); }
};

inline size_t qHash(const TileCoord& c, size_t seed = 0) noexcept
{
	return qHashMulti(seed, c.x, c.y, c.z);
}

MAPVIEW_EXPORT QDebug operator<<(QDebug dbg, const TileCoord& c);

// Flags carried by the viewport's moved/zoomed notifications.
struct MoveEvent final {
	bool flyTo = false;
};

// Published when a zoom animation starts and on every animation frame.
struct ZoomAnimEvent final {
	Geo::LatLng center;
	double zoom = 0.0;
	bool noUpdate = false;
	// Scale of the frame relative to the zoom the animation started from.
	double scale = 1.0;
};

} // namespace MapView

Q_DECLARE_METATYPE(MapView::TileCoord)
Q_DECLARE_METATYPE(MapView::VisualId)
Q_DECLARE_METATYPE(MapView::MoveEvent)
Q_DECLARE_METATYPE(MapView::ZoomAnimEvent)
