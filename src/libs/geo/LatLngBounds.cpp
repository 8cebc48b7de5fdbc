// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "geo/LatLngBounds.hpp"

#include "utils/Macros.hpp"

#include <algorithm>
#include <cmath>

namespace Geo {

LatLngBounds::LatLngBounds(const LatLng& a, const LatLng& b)
{
    extend(a);
    extend(b);
}

LatLngBounds& LatLngBounds::extend(const LatLng& ll)
{
    if (!m_valid) {
        m_southWest = ll;
        m_northEast = ll;
        m_valid = true;
        return *this;
    }

    m_southWest.lat = std::min(ll.lat, m_southWest.lat);
    m_southWest.lng = std::min(ll.lng, m_southWest.lng);
    m_northEast.lat = std::max(ll.lat, m_northEast.lat);
    m_northEast.lng = std::max(ll.lng, m_northEast.lng);
    return *this;
}

LatLngBounds& LatLngBounds::extend(const LatLngBounds& other)
{
    if (!other.m_valid)
        return *this;
    extend(other.m_southWest);
    return extend(other.m_northEast);
}

LatLngBounds LatLngBounds::pad(double bufferRatio) const
{
    UTILS_GUARD_RET(m_valid, LatLngBounds{});
    const double heightBuffer = std::abs(m_southWest.lat - m_northEast.lat) * bufferRatio;
    const double widthBuffer = std::abs(m_southWest.lng - m_northEast.lng) * bufferRatio;
    return LatLngBounds(LatLng(m_southWest.lat - heightBuffer, m_southWest.lng - widthBuffer),
                        LatLng(m_northEast.lat + heightBuffer, m_northEast.lng + widthBuffer));
}

LatLng LatLngBounds::center() const
{
    return LatLng((m_southWest.lat + m_northEast.lat) / 2.0, (m_southWest.lng + m_northEast.lng) / 2.0);
}

bool LatLngBounds::contains(const LatLng& ll) const
{
    UTILS_GUARD_RET(m_valid, false);
    return ll.lat >= m_southWest.lat && ll.lat <= m_northEast.lat
           && ll.lng >= m_southWest.lng && ll.lng <= m_northEast.lng;
}

bool LatLngBounds::contains(const LatLngBounds& other) const
{
    UTILS_GUARD_RET(m_valid && other.m_valid, false);
    return contains(other.m_southWest) && contains(other.m_northEast);
}

bool LatLngBounds::intersects(const LatLngBounds& other) const
{
    UTILS_GUARD_RET(m_valid && other.m_valid, false);
    const bool latIntersects = other.north() >= south() && other.south() <= north();
    const bool lngIntersects = other.east() >= west() && other.west() <= east();
    return latIntersects && lngIntersects;
}

bool LatLngBounds::overlaps(const LatLngBounds& other) const
{
    UTILS_GUARD_RET(m_valid && other.m_valid, false);
    const bool latOverlaps = other.north() > south() && other.south() < north();
    const bool lngOverlaps = other.east() > west() && other.west() < east();
    return latOverlaps && lngOverlaps;
}

bool LatLngBounds::equals(const LatLngBounds& other, double maxMargin) const
{
    if (!m_valid || !other.m_valid)
        return m_valid == other.m_valid;
    return m_southWest.equals(other.m_southWest, maxMargin) && m_northEast.equals(other.m_northEast, maxMargin);
}

QDebug operator<<(QDebug dbg, const LatLngBounds& b)
{
    QDebugStateSaver saver(dbg);
    if (!b.isValid()) {
        dbg.nospace() << "LatLngBounds(invalid)";
        return dbg;
    }
    dbg.nospace() << "LatLngBounds(" << b.southWest() << ", " << b.northEast() << ')';
    return dbg;
}

} // namespace Geo
