// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "mapview/MapConfig.hpp"

#include "geo/Crs.hpp"
#include "mapview/MapViewConstants.hpp"
#include "utils/filesystem/JsonFileUtils.hpp"

#include <QtCore/QJsonArray>
#include <QtCore/QJsonValue>

#include <algorithm>
#include <cmath>

using namespace Qt::StringLiterals;

namespace MapView {

namespace {

struct ParseContext final {
    Utils::Result result;

    void addError(const QString& message)
    {
        qCWarning(mapviewlog).noquote() << "Invalid map config:" << message;
        result.addError(message);
    }
};

QString pathKey(const QString& base, const QString& key)
{
    if (base.isEmpty())
        return key;
    return base + QLatin1Char('.') + key;
}

// The readers below leave |target| untouched when |key| is absent and report
// a present value of the wrong type.

void readDouble(const QJsonObject& obj, const QString& key, const QString& path, ParseContext& ctx, double& target)
{
    const QJsonValue value = obj.value(key);
    if (value.isUndefined())
        return;
    if (!value.isDouble()) {
        ctx.addError(u"Expected number at %1"_s.arg(pathKey(path, key)));
        return;
    }
    target = value.toDouble();
}

void readInt(const QJsonObject& obj, const QString& key, const QString& path, ParseContext& ctx, int& target)
{
    const QJsonValue value = obj.value(key);
    if (value.isUndefined())
        return;
    const double number = value.toDouble();
    if (!value.isDouble() || number != std::floor(number)) {
        ctx.addError(u"Expected integer at %1"_s.arg(pathKey(path, key)));
        return;
    }
    target = value.toInt();
}

void readOptionalInt(const QJsonObject& obj,
                     const QString& key,
                     const QString& path,
                     ParseContext& ctx,
                     std::optional<int>& target)
{
    if (obj.value(key).isNull()) {
        target.reset();
        return;
    }
    if (!obj.contains(key))
        return;
    int value = 0;
    const auto errorsBefore = ctx.result.errors.size();
    readInt(obj, key, path, ctx, value);
    if (ctx.result.errors.size() == errorsBefore)
        target = value;
}

void readBool(const QJsonObject& obj, const QString& key, const QString& path, ParseContext& ctx, bool& target)
{
    const QJsonValue value = obj.value(key);
    if (value.isUndefined())
        return;
    if (!value.isBool()) {
        ctx.addError(u"Expected boolean at %1"_s.arg(pathKey(path, key)));
        return;
    }
    target = value.toBool();
}

void readString(const QJsonObject& obj, const QString& key, const QString& path, ParseContext& ctx, QString& target)
{
    const QJsonValue value = obj.value(key);
    if (value.isUndefined())
        return;
    if (!value.isString()) {
        ctx.addError(u"Expected string at %1"_s.arg(pathKey(path, key)));
        return;
    }
    target = value.toString();
}

QJsonObject optionalObject(const QJsonObject& obj, const QString& key, const QString& path, ParseContext& ctx)
{
    const QJsonValue value = obj.value(key);
    if (value.isUndefined())
        return {};
    if (!value.isObject()) {
        ctx.addError(u"Expected object at %1"_s.arg(pathKey(path, key)));
        return {};
    }
    return value.toObject();
}

// [lat, lng]
bool parseLatLng(const QJsonValue& value, const QString& path, ParseContext& ctx, Geo::LatLng& out)
{
    const QJsonArray arr = value.toArray();
    if (!value.isArray() || arr.size() != 2 || !arr.at(0).isDouble() || !arr.at(1).isDouble()) {
        ctx.addError(u"Expected [lat, lng] at %1"_s.arg(path));
        return false;
    }
    out = Geo::LatLng(arr.at(0).toDouble(), arr.at(1).toDouble());
    return true;
}

// [[lat, lng], [lat, lng]]; null clears the bounds.
void readLatLngBounds(const QJsonObject& obj,
                      const QString& key,
                      const QString& path,
                      ParseContext& ctx,
                      Geo::LatLngBounds& target)
{
    const QJsonValue value = obj.value(key);
    if (value.isUndefined())
        return;
    if (value.isNull()) {
        target = Geo::LatLngBounds();
        return;
    }

    const QString where = pathKey(path, key);
    const QJsonArray corners = value.toArray();
    if (!value.isArray() || corners.size() != 2) {
        ctx.addError(u"Expected [[lat, lng], [lat, lng]] at %1"_s.arg(where));
        return;
    }

    Geo::LatLng a;
    Geo::LatLng b;
    if (!parseLatLng(corners.at(0), u"%1[0]"_s.arg(where), ctx, a)
        || !parseLatLng(corners.at(1), u"%1[1]"_s.arg(where), ctx, b))
        return;
    target = Geo::LatLngBounds(a, b);
}

// A single number for square tiles or [width, height].
void readTileSize(const QJsonObject& obj, const QString& path, ParseContext& ctx, Geometry::Point& target)
{
    const QString key = u"tileSize"_s;
    const QJsonValue value = obj.value(key);
    if (value.isUndefined())
        return;

    Geometry::Point size;
    if (value.isDouble()) {
        size = Geometry::Point(value.toDouble(), value.toDouble());
    } else if (value.isArray() && value.toArray().size() == 2 && value.toArray().at(0).isDouble()
               && value.toArray().at(1).isDouble()) {
        const QJsonArray arr = value.toArray();
        size = Geometry::Point(arr.at(0).toDouble(), arr.at(1).toDouble());
    } else {
        ctx.addError(u"Expected number or [width, height] at %1"_s.arg(pathKey(path, key)));
        return;
    }

    if (!(size.x > 0.0 && size.y > 0.0) || !size.isFinite()) {
        ctx.addError(u"Tile size must be positive at %1"_s.arg(pathKey(path, key)));
        return;
    }
    target = size;
}

void readSubdomains(const QJsonObject& obj, const QString& path, ParseContext& ctx, QStringList& target)
{
    const QString key = u"subdomains"_s;
    const QJsonValue value = obj.value(key);
    if (value.isUndefined())
        return;

    QStringList out;
    if (value.isString()) {
        // "abc" is shorthand for ["a", "b", "c"].
        for (const QChar c : value.toString())
            out.push_back(QString(c));
    } else if (value.isArray()) {
        const QJsonArray arr = value.toArray();
        for (int i = 0; i < arr.size(); ++i) {
            if (!arr.at(i).isString()) {
                ctx.addError(u"Expected string at %1[%2]"_s.arg(pathKey(path, key)).arg(i));
                return;
            }
            out.push_back(arr.at(i).toString());
        }
    } else {
        ctx.addError(u"Expected string or array at %1"_s.arg(pathKey(path, key)));
        return;
    }

    if (out.isEmpty()) {
        ctx.addError(u"At least one subdomain is required at %1"_s.arg(pathKey(path, key)));
        return;
    }
    target = out;
}

void parseView(const QJsonObject& obj, const QString& path, ParseContext& ctx, MapConfig& config)
{
    if (obj.contains(u"center"_s)) {
        Geo::LatLng center;
        if (parseLatLng(obj.value(u"center"_s), pathKey(path, u"center"_s), ctx, center)) {
            if (center.isFinite())
                config.center = center;
            else
                ctx.addError(u"Center must be finite at %1"_s.arg(pathKey(path, u"center"_s)));
        }
    }

    readDouble(obj, u"zoom"_s, path, ctx, config.zoom);
    if (!std::isfinite(config.zoom))
        ctx.addError(u"Zoom must be finite at %1"_s.arg(pathKey(path, u"zoom"_s)));
}

void parseViewport(const QJsonObject& obj, const QString& path, ParseContext& ctx, ViewportOptions& options)
{
    readDouble(obj, u"minZoom"_s, path, ctx, options.minZoom);
    readDouble(obj, u"maxZoom"_s, path, ctx, options.maxZoom);
    readLatLngBounds(obj, u"maxBounds"_s, path, ctx, options.maxBounds);
    readDouble(obj, u"zoomSnap"_s, path, ctx, options.zoomSnap);
    readDouble(obj, u"zoomDelta"_s, path, ctx, options.zoomDelta);
    readBool(obj, u"zoomAnimation"_s, path, ctx, options.zoomAnimation);
    readDouble(obj, u"zoomAnimationThreshold"_s, path, ctx, options.zoomAnimationThreshold);
    readBool(obj, u"fadeAnimation"_s, path, ctx, options.fadeAnimation);
    readDouble(obj, u"transform3DLimit"_s, path, ctx, options.transform3DLimit);

    if (options.minZoom > options.maxZoom)
        ctx.addError(u"minZoom %1 exceeds maxZoom %2 at %3"_s.arg(options.minZoom).arg(options.maxZoom).arg(path));
    if (options.zoomSnap < 0.0)
        ctx.addError(u"zoomSnap must not be negative at %1"_s.arg(path));
    if (!(options.zoomDelta > 0.0))
        ctx.addError(u"zoomDelta must be positive at %1"_s.arg(path));
    if (options.transform3DLimit < 0.0)
        ctx.addError(u"transform3DLimit must not be negative at %1"_s.arg(path));
}

void parseTiles(const QJsonObject& obj, const QString& path, ParseContext& ctx, TileGridOptions& options)
{
    readTileSize(obj, path, ctx, options.tileSize);
    readDouble(obj, u"opacity"_s, path, ctx, options.opacity);
    readBool(obj, u"updateWhenIdle"_s, path, ctx, options.updateWhenIdle);
    readBool(obj, u"updateWhenZooming"_s, path, ctx, options.updateWhenZooming);
    readInt(obj, u"updateInterval"_s, path, ctx, options.updateInterval);
    readInt(obj, u"zIndex"_s, path, ctx, options.zIndex);
    readLatLngBounds(obj, u"bounds"_s, path, ctx, options.bounds);
    readInt(obj, u"minZoom"_s, path, ctx, options.minZoom);
    readInt(obj, u"maxZoom"_s, path, ctx, options.maxZoom);
    readOptionalInt(obj, u"minNativeZoom"_s, path, ctx, options.minNativeZoom);
    readOptionalInt(obj, u"maxNativeZoom"_s, path, ctx, options.maxNativeZoom);
    readBool(obj, u"noWrap"_s, path, ctx, options.noWrap);
    readInt(obj, u"keepBuffer"_s, path, ctx, options.keepBuffer);
    readInt(obj, u"fadeDuration"_s, path, ctx, options.fadeDuration);
    readInt(obj, u"pruneDelay"_s, path, ctx, options.pruneDelay);
    readDouble(obj, u"boundsPadding"_s, path, ctx, options.boundsPadding);
    readInt(obj, u"ancestorSearchDepth"_s, path, ctx, options.ancestorSearchDepth);
    readInt(obj, u"descendantSearchDepth"_s, path, ctx, options.descendantSearchDepth);

    if (options.opacity < 0.0 || options.opacity > 1.0)
        ctx.addError(u"opacity must be within [0, 1] at %1"_s.arg(path));
    if (options.maxZoom > Constants::kMaxTileZoom)
        ctx.addError(u"maxZoom must not exceed %1 at %2"_s.arg(Constants::kMaxTileZoom).arg(path));
    if (options.minZoom > options.maxZoom)
        ctx.addError(u"minZoom %1 exceeds maxZoom %2 at %3"_s.arg(options.minZoom).arg(options.maxZoom).arg(path));
    if (options.minNativeZoom && options.maxNativeZoom && *options.minNativeZoom > *options.maxNativeZoom)
        ctx.addError(u"minNativeZoom exceeds maxNativeZoom at %1"_s.arg(path));
    if (options.keepBuffer < 0)
        ctx.addError(u"keepBuffer must not be negative at %1"_s.arg(path));
    if (options.updateInterval < 0 || options.fadeDuration < 0 || options.pruneDelay < 0)
        ctx.addError(u"Durations must not be negative at %1"_s.arg(path));
    if (options.boundsPadding < 0.0)
        ctx.addError(u"boundsPadding must not be negative at %1"_s.arg(path));
    if (options.ancestorSearchDepth < 0 || options.descendantSearchDepth < 0)
        ctx.addError(u"Search depths must not be negative at %1"_s.arg(path));
}

void parseUrl(const QJsonObject& obj, const QString& path, ParseContext& ctx, MapConfig& config)
{
    readString(obj, u"template"_s, path, ctx, config.urlTemplate);
    readSubdomains(obj, path, ctx, config.url.subdomains);
    readBool(obj, u"tms"_s, path, ctx, config.url.tms);
    readInt(obj, u"zoomOffset"_s, path, ctx, config.url.zoomOffset);
    readBool(obj, u"zoomReverse"_s, path, ctx, config.url.zoomReverse);
    readBool(obj, u"retina"_s, path, ctx, config.url.retina);

    const QJsonObject values = optionalObject(obj, u"values"_s, path, ctx);
    for (auto it = values.begin(); it != values.end(); ++it) {
        if (it.value().isString()) {
            config.url.values.insert(it.key(), it.value().toString());
        } else if (it.value().isDouble()) {
            config.url.values.insert(it.key(), QString::number(it.value().toDouble()));
        } else {
            ctx.addError(u"Expected string or number at %1"_s.arg(pathKey(pathKey(path, u"values"_s), it.key())));
        }
    }
}

QJsonArray latLngToJson(const Geo::LatLng& ll)
{
    return QJsonArray{ll.lat, ll.lng};
}

QJsonValue boundsToJson(const Geo::LatLngBounds& bounds)
{
    if (!bounds.isValid())
        return QJsonValue(QJsonValue::Null);
    return QJsonArray{latLngToJson(bounds.southWest()), latLngToJson(bounds.northEast())};
}

} // namespace

Utils::Result MapConfig::fromJson(const QJsonObject& json, MapConfig* out)
{
    if (!out)
        return Utils::Result::failure(u"No output configuration supplied."_s);

    ParseContext ctx;
    MapConfig config;

    readString(json, u"crs"_s, {}, ctx, config.crsCode);
    if (Geo::CrsPtr crs = Geo::Crs::fromCode(config.crsCode)) {
        config.viewport.crs = std::move(crs);
    } else {
        ctx.addError(u"Unknown CRS '%1'; known codes: %2"_s.arg(config.crsCode, Geo::Crs::knownCodes().join(u", "_s)));
    }

    parseView(optionalObject(json, u"view"_s, {}, ctx), u"view"_s, ctx, config);
    parseViewport(optionalObject(json, u"viewport"_s, {}, ctx), u"viewport"_s, ctx, config.viewport);
    parseTiles(optionalObject(json, u"tiles"_s, {}, ctx), u"tiles"_s, ctx, config.tiles);
    parseUrl(optionalObject(json, u"url"_s, {}, ctx), u"url"_s, ctx, config);
    config.url.maxZoom = config.tiles.maxZoom;

    if (!ctx.result.ok)
        return ctx.result;

    *out = std::move(config);
    return ctx.result;
}

Utils::Result MapConfig::load(const QString& path, MapConfig* out)
{
    QString error;
    const QJsonObject json = Utils::JsonFileUtils::readObject(path, &error);
    if (!error.isEmpty())
        return Utils::Result::failure(error);

    Utils::Result result = Utils::Result::success();
    result.merge(fromJson(json, out), path);
    return result;
}

QJsonObject MapConfig::toJson() const
{
    QJsonObject view;
    view.insert(u"center"_s, latLngToJson(center));
    view.insert(u"zoom"_s, zoom);

    QJsonObject vp;
    vp.insert(u"minZoom"_s, viewport.minZoom);
    if (std::isfinite(viewport.maxZoom))
        vp.insert(u"maxZoom"_s, viewport.maxZoom);
    vp.insert(u"maxBounds"_s, boundsToJson(viewport.maxBounds));
    vp.insert(u"zoomSnap"_s, viewport.zoomSnap);
    vp.insert(u"zoomDelta"_s, viewport.zoomDelta);
    vp.insert(u"zoomAnimation"_s, viewport.zoomAnimation);
    vp.insert(u"zoomAnimationThreshold"_s, viewport.zoomAnimationThreshold);
    vp.insert(u"fadeAnimation"_s, viewport.fadeAnimation);
    vp.insert(u"transform3DLimit"_s, viewport.transform3DLimit);

    QJsonObject tileObj;
    tileObj.insert(u"tileSize"_s, QJsonArray{tiles.tileSize.x, tiles.tileSize.y});
    tileObj.insert(u"opacity"_s, tiles.opacity);
    tileObj.insert(u"updateWhenIdle"_s, tiles.updateWhenIdle);
    tileObj.insert(u"updateWhenZooming"_s, tiles.updateWhenZooming);
    tileObj.insert(u"updateInterval"_s, tiles.updateInterval);
    tileObj.insert(u"zIndex"_s, tiles.zIndex);
    tileObj.insert(u"bounds"_s, boundsToJson(tiles.bounds));
    tileObj.insert(u"minZoom"_s, tiles.minZoom);
    tileObj.insert(u"maxZoom"_s, tiles.maxZoom);
    if (tiles.minNativeZoom)
        tileObj.insert(u"minNativeZoom"_s, *tiles.minNativeZoom);
    if (tiles.maxNativeZoom)
        tileObj.insert(u"maxNativeZoom"_s, *tiles.maxNativeZoom);
    tileObj.insert(u"noWrap"_s, tiles.noWrap);
    tileObj.insert(u"keepBuffer"_s, tiles.keepBuffer);
    tileObj.insert(u"fadeDuration"_s, tiles.fadeDuration);
    tileObj.insert(u"pruneDelay"_s, tiles.pruneDelay);
    tileObj.insert(u"boundsPadding"_s, tiles.boundsPadding);
    tileObj.insert(u"ancestorSearchDepth"_s, tiles.ancestorSearchDepth);
    tileObj.insert(u"descendantSearchDepth"_s, tiles.descendantSearchDepth);

    QJsonObject values;
    for (auto it = url.values.cbegin(); it != url.values.cend(); ++it)
        values.insert(it.key(), it.value());

    QJsonObject urlObj;
    urlObj.insert(u"template"_s, urlTemplate);
    urlObj.insert(u"subdomains"_s, QJsonArray::fromStringList(url.subdomains));
    urlObj.insert(u"tms"_s, url.tms);
    urlObj.insert(u"zoomOffset"_s, url.zoomOffset);
    urlObj.insert(u"zoomReverse"_s, url.zoomReverse);
    urlObj.insert(u"retina"_s, url.retina);
    urlObj.insert(u"values"_s, values);

    QJsonObject json;
    json.insert(u"crs"_s, crsCode);
    json.insert(u"view"_s, view);
    json.insert(u"viewport"_s, vp);
    json.insert(u"tiles"_s, tileObj);
    json.insert(u"url"_s, urlObj);
    return json;
}

QJsonObject MapConfig::viewStateToJson(const Geo::LatLng& center, double zoom)
{
    QJsonObject state;
    state.insert(u"center"_s, latLngToJson(center));
    state.insert(u"zoom"_s, zoom);
    return state;
}

Utils::Result MapConfig::applyViewState(const QJsonObject& state)
{
    ParseContext ctx;
    Geo::LatLng storedCenter = center;
    double storedZoom = zoom;

    if (!state.contains(u"center"_s) || !state.contains(u"zoom"_s))
        ctx.addError(u"View state needs both center and zoom"_s);
    else if (parseLatLng(state.value(u"center"_s), u"center"_s, ctx, storedCenter))
        readDouble(state, u"zoom"_s, {}, ctx, storedZoom);

    if (ctx.result.ok && (!storedCenter.isFinite() || !std::isfinite(storedZoom)))
        ctx.addError(u"View state must be finite"_s);
    if (!ctx.result.ok)
        return ctx.result;

    center = storedCenter;
    zoom = std::clamp(storedZoom, viewport.minZoom, viewport.maxZoom);
    return ctx.result;
}

TileUrlTemplate MapConfig::makeUrlTemplate() const
{
    return TileUrlTemplate(urlTemplate, url);
}

} // namespace MapView
