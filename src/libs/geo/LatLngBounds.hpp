// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "geo/GeoGlobal.hpp"
#include "geo/LatLng.hpp"

namespace Geo {

// Geographic rectangle grown by extend(); invalid until extended once.
class GEO_EXPORT LatLngBounds final
{
public:
    LatLngBounds() = default;
    LatLngBounds(const LatLng& a, const LatLng& b);

    bool isValid() const noexcept { return m_valid; }

    LatLngBounds& extend(const LatLng& ll);
    LatLngBounds& extend(const LatLngBounds& other);

    LatLngBounds pad(double bufferRatio) const;

    LatLng center() const;
    const LatLng& southWest() const { return m_southWest; }
    const LatLng& northEast() const { return m_northEast; }
    LatLng northWest() const { return LatLng(north(), west()); }
    LatLng southEast() const { return LatLng(south(), east()); }

    double west() const { return m_southWest.lng; }
    double south() const { return m_southWest.lat; }
    double east() const { return m_northEast.lng; }
    double north() const { return m_northEast.lat; }

    bool contains(const LatLng& ll) const;
    bool contains(const LatLngBounds& other) const;
    bool intersects(const LatLngBounds& other) const;
    bool overlaps(const LatLngBounds& other) const;

    bool equals(const LatLngBounds& other, double maxMargin = kLatLngEpsilon) const;

private:
    LatLng m_southWest;
    LatLng m_northEast;
    bool m_valid = false;
};

GEO_EXPORT QDebug operator<<(QDebug dbg, const LatLngBounds& b);

} // namespace Geo
