// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "geometry/GeometryGlobal.hpp"

#include <QtCore/QDebug>
#include <QtCore/QMetaType>
#include <QtCore/QPointF>

#include <cmath>

namespace Geometry {

// Rounds halves toward +infinity, so -2.5 becomes -2.
inline double roundHalfUp(double v) { return std::floor(v + 0.5); }

// Pixel-space or projected coordinate pair. Pure operations return a new
// point; the in-place variants mutate and return *this for chaining.
struct GEOMETRY_EXPORT Point final {
	double x = 0.0;
	double y = 0.0;

	constexpr Point() = default;
	constexpr Point(double px, double py) : x(px), y(py) {}
	explicit Point(const QPointF& p) : x(p.x()), y(p.y()) {}

	QPointF toPointF() const { return QPointF(x, y); }

	Point& operator+=(const Point& o) { x += o.x; y += o.y; return *this; }
	Point& operator-=(const Point& o) { x -= o.x; y -= o.y; return *this; }
	Point& operator*=(double k) { x *= k; y *= k; return *this; }
	Point& operator/=(double k) { x /= k; y /= k; return *this; }

	Point& scaleBy(const Point& o) { x *= o.x; y *= o.y; return *this; }
	Point& unscaleBy(const Point& o) { x /= o.x; y /= o.y; return *this; }
	Point& round() { x = roundHalfUp(x); y = roundHalfUp(y); return *this; }
	Point& floor() { x = std::floor(x); y = std::floor(y); return *this; }
	Point& ceil() { x = std::ceil(x); y = std::ceil(y); return *this; }
	Point& trunc() { x = std::trunc(x); y = std::trunc(y); return *this; }

	Point scaledBy(const Point& o) const { return Point(x * o.x, y * o.y); }
	Point unscaledBy(const Point& o) const { return Point(x / o.x, y / o.y); }
	Point rounded() const { return Point(roundHalfUp(x), roundHalfUp(y)); }
	Point floored() const { return Point(std::floor(x), std::floor(y)); }
	Point ceiled() const { return Point(std::ceil(x), std::ceil(y)); }
	Point truncated() const { return Point(std::trunc(x), std::trunc(y)); }

	double distanceTo(const Point& o) const { return std::hypot(o.x - x, o.y - y); }

	// True when |o| fits inside this point taken as a size.
	bool contains(const Point& o) const { return std::abs(o.x) <= std::abs(x) && std::abs(o.y) <= std::abs(y); }

	bool isNull() const { return x == 0.0 && y == 0.0; }
	bool isFinite() const { return std::isfinite(x) && std::isfinite(y); }

	friend Point operator+(Point a, const Point& b) { return a += b; }
	friend Point operator-(Point a, const Point& b) { return a -= b; }
	friend Point operator*(Point a, double k) { return a *= k; }
	friend Point operator/(Point a, double k) { return a /= k; }
	friend Point operator-(const Point& a) { return Point(-a.x, -a.y); }

	friend bool operator==(const Point& a, const Point& b) { return a.x == b.x && a.y == b.y; }
	friend bool operator!=(const Point& a, const Point& b) { return !(a == b); }
};

inline QDebug operator<<(QDebug dbg, const Point& p)
{
	QDebugStateSaver saver(dbg);
	dbg.nospace() << "Point(" << p.x << ", " << p.y << ')';
	return dbg;
}

} // namespace Geometry

Q_DECLARE_METATYPE(Geometry::Point)
