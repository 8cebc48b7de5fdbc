// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "geometry/Bounds.hpp"

#include "utils/Macros.hpp"

#include <algorithm>
#include <cmath>

namespace Geometry {

Bounds::Bounds(const Point& a, const Point& b)
{
    extend(a);
    extend(b);
}

Bounds::Bounds(std::initializer_list<Point> points)
{
    for (const Point& p : points)
        extend(p);
}

const Point& Bounds::min() const
{
    UTILS_ASSERT_MSG(m_valid, "reading an invalid Bounds");
    return m_min;
}

const Point& Bounds::max() const
{
    UTILS_ASSERT_MSG(m_valid, "reading an invalid Bounds");
    return m_max;
}

Bounds& Bounds::extend(const Point& p)
{
    if (!m_valid) {
        m_min = p;
        m_max = p;
        m_valid = true;
        return *this;
    }

    m_min.x = std::min(p.x, m_min.x);
    m_min.y = std::min(p.y, m_min.y);
    m_max.x = std::max(p.x, m_max.x);
    m_max.y = std::max(p.y, m_max.y);
    return *this;
}

Bounds& Bounds::extend(const Bounds& other)
{
    if (!other.m_valid)
        return *this;
    extend(other.m_min);
    return extend(other.m_max);
}

Point Bounds::center(bool round) const
{
    Point c((m_min.x + m_max.x) / 2.0, (m_min.y + m_max.y) / 2.0);
    return round ? c.round() : c;
}

Point Bounds::bottomLeft() const
{
    return Point(m_min.x, m_max.y);
}

Point Bounds::topRight() const
{
    return Point(m_max.x, m_min.y);
}

Point Bounds::topLeft() const
{
    return m_min;
}

Point Bounds::bottomRight() const
{
    return m_max;
}

Point Bounds::size() const
{
    return m_max - m_min;
}

bool Bounds::contains(const Point& p) const
{
    UTILS_GUARD_RET(m_valid, false);
    return p.x >= m_min.x && p.x <= m_max.x && p.y >= m_min.y && p.y <= m_max.y;
}

bool Bounds::contains(const Bounds& other) const
{
    UTILS_GUARD_RET(m_valid && other.m_valid, false);
    return other.m_min.x >= m_min.x && other.m_max.x <= m_max.x
           && other.m_min.y >= m_min.y && other.m_max.y <= m_max.y;
}

bool Bounds::intersects(const Bounds& other) const
{
    UTILS_GUARD_RET(m_valid && other.m_valid, false);
    const bool xIntersects = other.m_max.x >= m_min.x && other.m_min.x <= m_max.x;
    const bool yIntersects = other.m_max.y >= m_min.y && other.m_min.y <= m_max.y;
    return xIntersects && yIntersects;
}

bool Bounds::overlaps(const Bounds& other) const
{
    UTILS_GUARD_RET(m_valid && other.m_valid, false);
    const bool xOverlaps = other.m_max.x > m_min.x && other.m_min.x < m_max.x;
    const bool yOverlaps = other.m_max.y > m_min.y && other.m_min.y < m_max.y;
    return xOverlaps && yOverlaps;
}

Bounds Bounds::pad(double bufferRatio) const
{
    UTILS_GUARD_RET(m_valid, Bounds{});
    const double dx = std::abs(m_min.x - m_max.x) * bufferRatio;
    const double dy = std::abs(m_min.y - m_max.y) * bufferRatio;
    return Bounds(Point(m_min.x - dx, m_min.y - dy), Point(m_max.x + dx, m_max.y + dy));
}

bool Bounds::isFinite() const
{
    return m_valid && m_min.isFinite() && m_max.isFinite();
}

QRectF Bounds::toRectF() const
{
    UTILS_GUARD_RET(m_valid, QRectF{});
    return QRectF(m_min.toPointF(), m_max.toPointF());
}

QDebug operator<<(QDebug dbg, const Bounds& b)
{
    QDebugStateSaver saver(dbg);
    if (!b.isValid()) {
        dbg.nospace() << "Bounds(invalid)";
        return dbg;
    }
    dbg.nospace() << "Bounds(" << b.min() << ", " << b.max() << ')';
    return dbg;
}

} // namespace Geometry
