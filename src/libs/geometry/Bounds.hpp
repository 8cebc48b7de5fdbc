// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "geometry/GeometryGlobal.hpp"
#include "geometry/Point.hpp"

#include <QtCore/QRectF>

#include <initializer_list>

namespace Geometry {

// Axis-aligned rectangle grown by extend(). A default-constructed Bounds is
// invalid until it has been extended at least once.
class GEOMETRY_EXPORT Bounds final
{
public:
    Bounds() = default;
    Bounds(const Point& a, const Point& b);
    Bounds(std::initializer_list<Point> points);

    bool isValid() const noexcept { return m_valid; }

    const Point& min() const;
    const Point& max() const;

    Bounds& extend(const Point& p);
    Bounds& extend(const Bounds& other);

    Point center(bool round = false) const;
    Point bottomLeft() const;
    Point topRight() const;
    Point topLeft() const;
    Point bottomRight() const;
    Point size() const;

    bool contains(const Point& p) const;
    bool contains(const Bounds& other) const;

    // Touching edges count as intersecting but not as overlapping.
    bool intersects(const Bounds& other) const;
    bool overlaps(const Bounds& other) const;

    Bounds pad(double bufferRatio) const;

    bool isFinite() const;
    QRectF toRectF() const;

    friend bool operator==(const Bounds& a, const Bounds& b)
    {
        if (!a.m_valid || !b.m_valid)
            return a.m_valid == b.m_valid;
        return a.m_min == b.m_min && a.m_max == b.m_max;
    }
    friend bool operator!=(const Bounds& a, const Bounds& b) { return !(a == b); }

private:
    Point m_min;
    Point m_max;
    bool m_valid = false;
};

GEOMETRY_EXPORT QDebug operator<<(QDebug dbg, const Bounds& b);

} // namespace Geometry
