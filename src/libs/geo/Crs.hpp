// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "geo/GeoGlobal.hpp"
#include "geo/GeoUtil.hpp"
#include "geo/LatLng.hpp"
#include "geo/LatLngBounds.hpp"
#include "geo/Projection.hpp"
#include "geometry/Bounds.hpp"
#include "geometry/Transformation.hpp"

#include <QtCore/QString>
#include <QtCore/QStringList>

#include <memory>
#include <optional>

namespace Geo {

// Coordinate reference system: a projection plus the linear transformation
// and zoom scale that take projected coordinates to pixels. Instances are
// immutable and shared through CrsPtr.
class GEO_EXPORT Crs
{
public:
    enum class DistanceModel {
        Haversine,
        Euclidean
    };

    struct Definition {
        QString code;
        std::shared_ptr<const Projection> projection;
        Geometry::Transformation transformation;
        std::optional<WrapRange> wrapLng;
        std::optional<WrapRange> wrapLat;
        bool infinite = false;
        // scale(zoom) = scaleBase * 2^zoom
        double scaleBase = 256.0;
        DistanceModel distanceModel = DistanceModel::Haversine;
        double earthRadius = 6371000.0;
    };

    explicit Crs(Definition definition);
    virtual ~Crs() = default;

    const QString& code() const { return m_def.code; }
    const Projection& projection() const { return *m_def.projection; }
    const Geometry::Transformation& transformation() const { return m_def.transformation; }
    const std::optional<WrapRange>& wrapLng() const { return m_def.wrapLng; }
    const std::optional<WrapRange>& wrapLat() const { return m_def.wrapLat; }
    bool isInfinite() const { return m_def.infinite; }

    Geometry::Point project(const LatLng& latlng) const;
    LatLng unproject(const Geometry::Point& point) const;

    Geometry::Point latLngToPoint(const LatLng& latlng, double zoom) const;
    LatLng pointToLatLng(const Geometry::Point& point, double zoom) const;

    virtual double scale(double zoom) const;
    virtual double zoom(double scale) const;
    virtual double distance(const LatLng& a, const LatLng& b) const;

    // Projection extent in pixels at |zoom|; empty for infinite systems.
    std::optional<Geometry::Bounds> projectedBounds(double zoom) const;

    LatLng wrapLatLng(const LatLng& latlng) const;
    LatLngBounds wrapLatLngBounds(const LatLngBounds& bounds) const;

    static std::shared_ptr<const Crs> epsg3857();
    static std::shared_ptr<const Crs> epsg3395();
    static std::shared_ptr<const Crs> epsg4326();
    static std::shared_ptr<const Crs> simple();

    // Looks a system up by code ("EPSG:3857", "EPSG:900913", "EPSG:3395",
    // "EPSG:4326", "Simple"); null when unknown.
    static std::shared_ptr<const Crs> fromCode(const QString& code);
    static QStringList knownCodes();

private:
    Definition m_def;
};

using CrsPtr = std::shared_ptr<const Crs>;

} // namespace Geo
