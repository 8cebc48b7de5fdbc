// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "geo/Projection.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>

using Geometry::Bounds;
using Geometry::Point;

namespace Geo {

namespace {

constexpr double kDegToRad = std::numbers::pi / 180.0;
constexpr double kRadToDeg = 180.0 / std::numbers::pi;

// Stop once the latitude correction is this small (radians).
constexpr double kInverseTolerance = 1.0e-12;
constexpr int kInverseMaxIterations = 15;

double eccentricity()
{
    const double ratio = EllipticalMercatorProjection::kRadiusMinor / EllipticalMercatorProjection::kRadius;
    return std::sqrt(1.0 - ratio * ratio);
}

} // namespace

// -----------------------------------------------------------------------------
// LonLat
// -----------------------------------------------------------------------------

Point LonLatProjection::project(const LatLng& latlng) const
{
    return Point(latlng.lng, latlng.lat);
}

LatLng LonLatProjection::unproject(const Point& point) const
{
    return LatLng(point.y, point.x);
}

Bounds LonLatProjection::bounds() const
{
    return Bounds(Point(-180.0, -90.0), Point(180.0, 90.0));
}

// -----------------------------------------------------------------------------
// Spherical Mercator
// -----------------------------------------------------------------------------

Point SphericalMercatorProjection::project(const LatLng& latlng) const
{
    const double lat = std::clamp(latlng.lat, -kMaxLatitude, kMaxLatitude);
    const double s = std::sin(lat * kDegToRad);
    return Point(kRadius * latlng.lng * kDegToRad, kRadius * std::log((1.0 + s) / (1.0 - s)) / 2.0);
}

LatLng SphericalMercatorProjection::unproject(const Point& point) const
{
    return LatLng((2.0 * std::atan(std::exp(point.y / kRadius)) - std::numbers::pi / 2.0) * kRadToDeg,
                  point.x * kRadToDeg / kRadius);
}

Bounds SphericalMercatorProjection::bounds() const
{
    const double d = kRadius * std::numbers::pi;
    return Bounds(Point(-d, -d), Point(d, d));
}

// -----------------------------------------------------------------------------
// Elliptical Mercator
// -----------------------------------------------------------------------------

Point EllipticalMercatorProjection::project(const LatLng& latlng) const
{
    const double e = eccentricity();
    const double y = latlng.lat * kDegToRad;
    const double con = e * std::sin(y);
    const double ts = std::tan(std::numbers::pi / 4.0 - y / 2.0) / std::pow((1.0 - con) / (1.0 + con), e / 2.0);
    return Point(latlng.lng * kDegToRad * kRadius, -kRadius * std::log(std::max(ts, 1.0e-10)));
}

LatLng EllipticalMercatorProjection::unproject(const Point& point) const
{
    const double e = eccentricity();
    const double ts = std::exp(-point.y / kRadius);
    double phi = std::numbers::pi / 2.0 - 2.0 * std::atan(ts);

    double dphi = 0.1;
    for (int i = 0; i < kInverseMaxIterations && std::abs(dphi) > kInverseTolerance; ++i) {
        double con = e * std::sin(phi);
        con = std::pow((1.0 - con) / (1.0 + con), e / 2.0);
        dphi = std::numbers::pi / 2.0 - 2.0 * std::atan(ts * con) - phi;
        phi += dphi;
    }

    return LatLng(phi * kRadToDeg, point.x * kRadToDeg / kRadius);
}

Bounds EllipticalMercatorProjection::bounds() const
{
    return Bounds(Point(-20037508.34279, -15496570.73972), Point(20037508.34279, 18764656.23138));
}

} // namespace Geo
