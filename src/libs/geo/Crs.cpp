// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "geo/Crs.hpp"

#include "utils/Macros.hpp"

#include <cmath>
#include <numbers>

using namespace Qt::StringLiterals;

namespace Geo {

namespace {

constexpr WrapRange kEarthLngRange{-180.0, 180.0};

Crs::Definition earthDefinition(const QString& code)
{
    Crs::Definition def;
    def.code = code;
    def.wrapLng = kEarthLngRange;
    def.distanceModel = Crs::DistanceModel::Haversine;
    return def;
}

Geometry::Transformation mercatorTransformation(double radius)
{
    const double scale = 0.5 / (std::numbers::pi * radius);
    return Geometry::Transformation(scale, 0.5, -scale, 0.5);
}

} // namespace

Crs::Crs(Definition definition)
    : m_def(std::move(definition))
{
    UTILS_ASSERT(m_def.projection);
}

Geometry::Point Crs::project(const LatLng& latlng) const
{
    return m_def.projection->project(latlng);
}

LatLng Crs::unproject(const Geometry::Point& point) const
{
    return m_def.projection->unproject(point);
}

Geometry::Point Crs::latLngToPoint(const LatLng& latlng, double zoom) const
{
    return m_def.transformation.transform(project(latlng), scale(zoom));
}

LatLng Crs::pointToLatLng(const Geometry::Point& point, double zoom) const
{
    return unproject(m_def.transformation.untransform(point, scale(zoom)));
}

double Crs::scale(double zoom) const
{
    return m_def.scaleBase * std::pow(2.0, zoom);
}

double Crs::zoom(double scale) const
{
    return std::log2(scale / m_def.scaleBase);
}

double Crs::distance(const LatLng& a, const LatLng& b) const
{
    if (m_def.distanceModel == DistanceModel::Euclidean)
        return std::hypot(b.lng - a.lng, b.lat - a.lat);

    constexpr double rad = std::numbers::pi / 180.0;
    const double lat1 = a.lat * rad;
    const double lat2 = b.lat * rad;
    const double sinDLat = std::sin((b.lat - a.lat) * rad / 2.0);
    const double sinDLon = std::sin((b.lng - a.lng) * rad / 2.0);
    const double h = sinDLat * sinDLat + std::cos(lat1) * std::cos(lat2) * sinDLon * sinDLon;
    const double c = 2.0 * std::atan2(std::sqrt(h), std::sqrt(1.0 - h));
    return m_def.earthRadius * c;
}

std::optional<Geometry::Bounds> Crs::projectedBounds(double zoom) const
{
    if (m_def.infinite)
        return std::nullopt;

    const Geometry::Bounds b = m_def.projection->bounds();
    const double s = scale(zoom);
    return Geometry::Bounds(m_def.transformation.transform(b.min(), s),
                            m_def.transformation.transform(b.max(), s));
}

LatLng Crs::wrapLatLng(const LatLng& latlng) const
{
    const double lng = m_def.wrapLng ? wrapNum(latlng.lng, *m_def.wrapLng, true) : latlng.lng;
    const double lat = m_def.wrapLat ? wrapNum(latlng.lat, *m_def.wrapLat, true) : latlng.lat;
    return LatLng(lat, lng);
}

LatLngBounds Crs::wrapLatLngBounds(const LatLngBounds& bounds) const
{
    UTILS_GUARD_RET(bounds.isValid(), bounds);

    const LatLng center = bounds.center();
    const LatLng newCenter = wrapLatLng(center);
    const double latShift = center.lat - newCenter.lat;
    const double lngShift = center.lng - newCenter.lng;

    if (latShift == 0.0 && lngShift == 0.0)
        return bounds;

    const LatLng& sw = bounds.southWest();
    const LatLng& ne = bounds.northEast();
    return LatLngBounds(LatLng(sw.lat - latShift, sw.lng - lngShift),
                        LatLng(ne.lat - latShift, ne.lng - lngShift));
}

std::shared_ptr<const Crs> Crs::epsg3857()
{
    Definition def = earthDefinition(u"EPSG:3857"_s);
    def.projection = std::make_shared<SphericalMercatorProjection>();
    def.transformation = mercatorTransformation(SphericalMercatorProjection::kRadius);
    return std::make_shared<Crs>(std::move(def));
}

std::shared_ptr<const Crs> Crs::epsg3395()
{
    Definition def = earthDefinition(u"EPSG:3395"_s);
    def.projection = std::make_shared<EllipticalMercatorProjection>();
    def.transformation = mercatorTransformation(EllipticalMercatorProjection::kRadius);
    return std::make_shared<Crs>(std::move(def));
}

std::shared_ptr<const Crs> Crs::epsg4326()
{
    Definition def = earthDefinition(u"EPSG:4326"_s);
    def.projection = std::make_shared<LonLatProjection>();
    def.transformation = Geometry::Transformation(1.0 / 180.0, 1.0, -1.0 / 180.0, 0.5);
    return std::make_shared<Crs>(std::move(def));
}

std::shared_ptr<const Crs> Crs::simple()
{
    Definition def;
    def.code = u"Simple"_s;
    def.projection = std::make_shared<LonLatProjection>();
    def.transformation = Geometry::Transformation(1.0, 0.0, -1.0, 0.0);
    def.infinite = true;
    def.scaleBase = 1.0;
    def.distanceModel = DistanceModel::Euclidean;
    return std::make_shared<Crs>(std::move(def));
}

std::shared_ptr<const Crs> Crs::fromCode(const QString& code)
{
    const QString normalized = code.trimmed();
    if (normalized.compare(u"EPSG:3857"_s, Qt::CaseInsensitive) == 0
        || normalized.compare(u"EPSG:900913"_s, Qt::CaseInsensitive) == 0)
        return epsg3857();
    if (normalized.compare(u"EPSG:3395"_s, Qt::CaseInsensitive) == 0)
        return epsg3395();
    if (normalized.compare(u"EPSG:4326"_s, Qt::CaseInsensitive) == 0)
        return epsg4326();
    if (normalized.compare(u"Simple"_s, Qt::CaseInsensitive) == 0)
        return simple();

    qCWarning(geolog).noquote() << "Unknown CRS code" << normalized;
    return {};
}

QStringList Crs::knownCodes()
{
    return {u"EPSG:3857"_s, u"EPSG:900913"_s, u"EPSG:3395"_s, u"EPSG:4326"_s, u"Simple"_s};
}

} // namespace Geo
