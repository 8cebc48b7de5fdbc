// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "geo/GeoGlobal.hpp"
#include "geo/LatLng.hpp"
#include "geometry/Bounds.hpp"
#include "geometry/Point.hpp"

namespace Geo {

// Maps geographic coordinates onto an unbounded plane and back.
class GEO_EXPORT Projection
{
public:
    virtual ~Projection() = default;

    virtual Geometry::Point project(const LatLng& latlng) const = 0;
    virtual LatLng unproject(const Geometry::Point& point) const = 0;

    // Extent of the valid plane, in projected units.
    virtual Geometry::Bounds bounds() const = 0;
};

// Equirectangular: x = lng, y = lat.
class GEO_EXPORT LonLatProjection final : public Projection
{
public:
    Geometry::Point project(const LatLng& latlng) const override;
    LatLng unproject(const Geometry::Point& point) const override;
    Geometry::Bounds bounds() const override;
};

// Web Mercator on a sphere of radius kRadius. Latitudes beyond kMaxLatitude
// are clamped before projecting.
class GEO_EXPORT SphericalMercatorProjection final : public Projection
{
public:
    static constexpr double kRadius = 6378137.0;
    static constexpr double kMaxLatitude = 85.0511287798;

    Geometry::Point project(const LatLng& latlng) const override;
    LatLng unproject(const Geometry::Point& point) const override;
    Geometry::Bounds bounds() const override;
};

// Mercator on the WGS84 ellipsoid. The inverse is iterative.
class GEO_EXPORT EllipticalMercatorProjection final : public Projection
{
public:
    static constexpr double kRadius = 6378137.0;
    static constexpr double kRadiusMinor = 6356752.314245179;

    Geometry::Point project(const LatLng& latlng) const override;
    LatLng unproject(const Geometry::Point& point) const override;
    Geometry::Bounds bounds() const override;
};

} // namespace Geo
