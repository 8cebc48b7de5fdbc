// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "mapview/TileGrid.hpp"

#include "mapview/ConfigurationError.hpp"
#include "mapview/MapViewConstants.hpp"
#include "mapview/Viewport.hpp"
#include "utils/Macros.hpp"

#include <QtCore/QDebug>

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <memory>
#include <utility>

namespace MapView {

TileGrid::TileGrid(Api::ITileProvider* provider,
                   Api::IFrameClock* clock,
                   TileGridOptions options,
                   QObject* parent)
    : QObject(parent)
    , m_provider(provider)
    , m_clock(clock)
    , m_options(std::move(options))
    , m_pruneTimer(clock)
    , m_moveThrottle(clock, m_options.updateInterval, [this] { onMoveEnd(); })
{
    UTILS_ASSERT(m_provider);
    UTILS_ASSERT(m_clock);
}

TileGrid::~TileGrid()
{
    cancelScheduled();
    releaseAllSilently();
}

// ---- Attachment ----

void TileGrid::attach(Viewport* viewport)
{
    if (m_viewport == viewport)
        return;
    detach();
    UTILS_GUARD(viewport);

    m_viewport = viewport;

    connect(viewport, &Viewport::viewPreReset, this, &TileGrid::invalidateAll);
    connect(viewport, &Viewport::viewReset, this, [this] { resetView(MoveEvent{}); });
    connect(viewport, &Viewport::zoomed, this, &TileGrid::resetView);
    connect(viewport, &Viewport::moveEnded, this, &TileGrid::onMoveEnd);
    if (!m_options.updateWhenIdle)
        connect(viewport, &Viewport::moved, this, [this] { m_moveThrottle.trigger(); });
    connect(viewport, &Viewport::zoomAnimated, this, [this](const ZoomAnimEvent& event) {
        setView(event.center, event.zoom, true, event.noUpdate);
    });
    connect(viewport, &Viewport::zoomAnimationStepped, this, [this](const ZoomAnimEvent& event) {
        setZoomTransforms(event.center, event.zoom, false);
    });
    connect(viewport, &QObject::destroyed, this, [this] {
        cancelScheduled();
        releaseAllSilently();
        m_tileZoom.reset();
        m_loading = false;
    });

    qCDebug(tilegridlog) << "Attached to viewport at zoom" << viewport->zoom();

    try {
        resetView(MoveEvent{});
    } catch (const ConfigurationError&) {
        detach();
        throw;
    }
}

void TileGrid::detach()
{
    UTILS_GUARD(m_viewport);

    disconnect(m_viewport, nullptr, this, nullptr);
    cancelScheduled();
    removeAllTiles();

    const std::map<int, TileLevel> levels = std::exchange(m_levels, {});
    for (const auto& [z, level] : levels) {
        if (level.container)
            m_provider->releaseLevel(level.container);
        emit levelRemoved(z);
    }

    m_tileZoom.reset();
    m_globalTileRange.reset();
    m_loading = false;
    m_viewport = nullptr;
}

// ---- Public operations ----

void TileGrid::setOpacity(double opacity)
{
    m_options.opacity = opacity;
    emit opacityChanged(opacity);
    updateOpacity();
}

void TileGrid::setZIndex(int zIndex)
{
    UTILS_GUARD(zIndex != m_options.zIndex);
    m_options.zIndex = zIndex;
    emit zIndexChanged(zIndex);
}

void TileGrid::redraw()
{
    UTILS_GUARD(m_viewport);

    removeAllTiles();

    const int tileZoom = static_cast<int>(Geometry::roundHalfUp(clampZoom(m_viewport->zoom())));
    if (tileZoom != m_tileZoom) {
        m_tileZoom = tileZoom;
        updateLevels();
    }
    update();
}

bool TileGrid::loadTile(const TileCoord& coords)
{
    UTILS_GUARD_RET(m_viewport, false);
    UTILS_GUARD_RET(!m_tiles.contains(coords), false);

    if (!m_loading) {
        m_loading = true;
        emit loadingStarted();
    }
    addTile(coords);
    return true;
}

const TileRecord* TileGrid::tile(const TileCoord& coords) const
{
    const auto it = m_tiles.constFind(coords);
    return it == m_tiles.cend() ? nullptr : &it.value();
}

const TileLevel* TileGrid::level(int zoom) const
{
    const auto it = m_levels.find(zoom);
    return it == m_levels.end() ? nullptr : &it->second;
}

Geometry::Point TileGrid::tilePosition(const TileCoord& coords) const
{
    const Geometry::Point pos = coords.toPoint().scaledBy(m_options.tileSize);
    const TileLevel* lvl = level(coords.z);
    return lvl ? pos - lvl->origin : pos;
}

Geo::LatLngBounds TileGrid::tileCoordsToBounds(const TileCoord& coords) const
{
    UTILS_GUARD_RET(m_viewport, Geo::LatLngBounds{});

    const Geometry::Point nwPoint = coords.toPoint().scaledBy(m_options.tileSize);
    const Geometry::Point sePoint = nwPoint + m_options.tileSize;
    const Geo::LatLngBounds bounds(m_viewport->unproject(nwPoint, coords.z),
                                   m_viewport->unproject(sePoint, coords.z));

    return m_options.noWrap ? bounds : m_viewport->wrapLatLngBounds(bounds);
}

bool TileGrid::isValidTile(const TileCoord& coords) const
{
    UTILS_GUARD_RET(m_viewport, false);

    const Geo::Crs& crs = m_viewport->crs();
    if (!crs.isInfinite() && m_globalTileRange) {
        const Geometry::Bounds& range = *m_globalTileRange;
        if ((!crs.wrapLng() && (coords.x < range.min().x || coords.x > range.max().x))
            || (!crs.wrapLat() && (coords.y < range.min().y || coords.y > range.max().y))) {
            return false;
        }
    }

    if (!m_options.bounds.isValid())
        return true;

    return m_options.bounds.overlaps(tileCoordsToBounds(coords));
}

TileCoord TileGrid::wrapCoords(const TileCoord& coords) const
{
    TileCoord wrapped = coords;
    if (m_wrapX)
        wrapped.x = static_cast<int>(Geo::wrapNum(coords.x, *m_wrapX));
    if (m_wrapY)
        wrapped.y = static_cast<int>(Geo::wrapNum(coords.y, *m_wrapY));
    return wrapped;
}

Geometry::Bounds TileGrid::pixelBoundsToTileRange(const Geometry::Bounds& pixelBounds) const
{
    return Geometry::Bounds(pixelBounds.min().unscaledBy(m_options.tileSize).floored(),
                            pixelBounds.max().unscaledBy(m_options.tileSize).ceiled() - Geometry::Point(1, 1));
}

// ---- Completion ----

void TileGrid::tileReady(const TileCoord& coords, quint64 requestId, const QString& error, VisualId fallback)
{
    ReadyEntry entry{coords, requestId, error, fallback};

    // The record does not hold its visual until createTile() returns.
    if (m_inCreateTile) {
        m_ready.push_back(std::move(entry));
        scheduleFlush();
        return;
    }
    handleTileReady(entry);
}

bool TileGrid::isRequestPending(const TileCoord& coords, quint64 requestId) const
{
    const TileRecord* record = tile(coords);
    return record && record->requestId == requestId && !record->isLoaded() && !record->failed;
}

void TileGrid::scheduleFlush()
{
    if (m_readyFrame == 0)
        m_readyFrame = m_clock->requestFrame([this] { flushReady(); });
}

void TileGrid::flushReady()
{
    m_readyFrame = 0;
    const std::vector<ReadyEntry> entries = std::exchange(m_ready, {});
    for (const ReadyEntry& entry : entries)
        handleTileReady(entry);
}

void TileGrid::handleTileReady(const ReadyEntry& entry)
{
    auto it = m_tiles.find(entry.coords);
    if (!m_viewport || it == m_tiles.end() || it->requestId != entry.requestId) {
        qCDebug(tilegridlog) << "Discarding stale completion for" << entry.coords;
        if (entry.fallback)
            m_provider->releaseTile(entry.fallback);
        return;
    }

    const TileCoord coords = entry.coords;
    const bool hasError = !entry.error.isEmpty();

    if (hasError) {
        qCDebug(tilegridlog).noquote() << "Tile" << coords.key() << "failed:" << entry.error;
        if (entry.fallback) {
            if (it->visual && it->visual != entry.fallback)
                m_provider->releaseTile(it->visual);
            it->visual = entry.fallback;
        } else {
            it->failed = true;
        }
        emit tileError(coords, entry.error);
        it = m_tiles.find(coords);
        if (it == m_tiles.end() || it->requestId != entry.requestId)
            return;
    }

    if (!it->failed) {
        it->loaded = m_clock->now();

        if (fadeEnabled()) {
            it->opacity = 0.0;
            if (m_fadeFrame != 0)
                m_clock->cancelFrame(m_fadeFrame);
            m_fadeFrame = m_clock->requestFrame([this] { updateOpacity(); });
        } else {
            it->active = true;
            it->opacity = 1.0;
            pruneTiles();
        }

        if (!hasError)
            emit tileLoaded(coords);
    }

    if (m_loading && noTilesToLoad()) {
        m_loading = false;
        emit loadFinished();
        schedulePrune();
    }
}

// ---- View tracking ----

void TileGrid::invalidateAll()
{
    const std::map<int, TileLevel> levels = std::exchange(m_levels, {});
    for (const auto& [z, level] : levels) {
        if (level.container)
            m_provider->releaseLevel(level.container);
        emit levelRemoved(z);
    }

    removeAllTiles();
    m_tileZoom.reset();
}

void TileGrid::resetView(const MoveEvent& event)
{
    UTILS_GUARD(m_viewport);

    const bool animating = event.flyTo;
    setView(m_viewport->center(), m_viewport->zoom(), animating, animating);
}

void TileGrid::onMoveEnd()
{
    if (!m_viewport || m_viewport->isAnimatingZoom())
        return;
    update();
}

void TileGrid::setView(const Geo::LatLng& center, double zoom, bool noPrune, bool noUpdate)
{
    UTILS_GUARD(m_viewport);

    std::optional<int> tileZoom = static_cast<int>(Geometry::roundHalfUp(zoom));
    if (*tileZoom > m_options.maxZoom || *tileZoom < m_options.minZoom)
        tileZoom.reset();
    else
        tileZoom = static_cast<int>(clampZoom(*tileZoom));

    const bool tileZoomChanged = m_options.updateWhenZooming && tileZoom != m_tileZoom;

    if (!noUpdate || tileZoomChanged) {
        m_tileZoom = tileZoom;

        abortLoading();
        updateLevels();
        resetGrid();

        if (m_tileZoom)
            update(center);

        if (!noPrune)
            pruneTiles();

        m_noPrune = noPrune;
    }

    setZoomTransforms(center, zoom, true);
}

void TileGrid::setZoomTransforms(const Geo::LatLng& center, double zoom, bool round)
{
    UTILS_GUARD(m_viewport);

    for (auto& [z, level] : m_levels)
        setZoomTransform(level, center, zoom, round);
    emit transformsChanged();
}

void TileGrid::setZoomTransform(TileLevel& level, const Geo::LatLng& center, double zoom, bool round) const
{
    const double scale = m_viewport->zoomScale(zoom, level.zoom);
    Geometry::Point translate = level.origin * scale - m_viewport->newPixelOrigin(center, zoom, round);
    if (round)
        translate.round();
    level.transform = TileTransform{translate, scale};
}

Geometry::Bounds TileGrid::tiledPixelBounds(const Geo::LatLng& center) const
{
    const double viewZoom = m_viewport->zoom();
    const double mapZoom = m_viewport->isAnimatingZoom()
                               ? std::max(m_viewport->animationTargetZoom(), viewZoom)
                               : viewZoom;
    const double scale = m_viewport->zoomScale(mapZoom, *m_tileZoom);
    const Geometry::Point pixelCenter = m_viewport->project(center, *m_tileZoom).floored();
    const Geometry::Point halfSize = m_viewport->size() / (scale * 2.0);

    const Geometry::Bounds bounds(pixelCenter - halfSize, pixelCenter + halfSize);
    return m_options.boundsPadding > 0.0 ? bounds.pad(m_options.boundsPadding) : bounds;
}

void TileGrid::update(std::optional<Geo::LatLng> center)
{
    UTILS_GUARD(m_viewport);

    const double viewZoom = m_viewport->isAnimatingZoom() ? m_viewport->animationTargetZoom()
                                                          : m_viewport->zoom();
    const double zoom = clampZoom(viewZoom);
    const Geo::LatLng viewCenter = center.value_or(m_viewport->center());

    // Outside [minZoom, maxZoom].
    UTILS_GUARD(m_tileZoom);

    const Geometry::Bounds tileRange = pixelBoundsToTileRange(tiledPixelBounds(viewCenter));
    if (!tileRange.isFinite())
        throw ConfigurationError("Attempted to load an infinite number of tiles");
    if (tileRange.min().x < -Constants::kMaxTileIndex || tileRange.min().y < -Constants::kMaxTileIndex
        || tileRange.max().x > Constants::kMaxTileIndex || tileRange.max().y > Constants::kMaxTileIndex)
        throw ConfigurationError("Tile range exceeds the largest addressable tile index");

    const Geometry::Point tileCenter = tileRange.center();
    const double margin = m_options.keepBuffer;
    const Geometry::Bounds noPruneRange(tileRange.bottomLeft() - Geometry::Point(margin, -margin),
                                        tileRange.topRight() + Geometry::Point(margin, -margin));

    for (TileRecord& record : m_tiles) {
        if (record.coords.z != *m_tileZoom || !noPruneRange.contains(record.coords.toPoint()))
            record.current = false;
    }

    // More than one level away: switch levels first.
    if (std::abs(zoom - *m_tileZoom) > 1.0) {
        setView(viewCenter, zoom, false, false);
        return;
    }

    std::vector<TileCoord> queue;
    const int minX = static_cast<int>(tileRange.min().x);
    const int maxX = static_cast<int>(tileRange.max().x);
    const int minY = static_cast<int>(tileRange.min().y);
    const int maxY = static_cast<int>(tileRange.max().y);
    for (int j = minY; j <= maxY; ++j) {
        for (int i = minX; i <= maxX; ++i) {
            const TileCoord coords{i, j, *m_tileZoom};
            if (!isValidTile(coords))
                continue;

            auto it = m_tiles.find(coords);
            if (it != m_tiles.end())
                it->current = true;
            else
                queue.push_back(coords);
        }
    }

    std::stable_sort(queue.begin(), queue.end(), [&tileCenter](const TileCoord& a, const TileCoord& b) {
        return a.toPoint().distanceTo(tileCenter) < b.toPoint().distanceTo(tileCenter);
    });

    UTILS_GUARD(!queue.empty());

    if (!m_loading) {
        m_loading = true;
        emit loadingStarted();
    }

    qCDebug(tilegridlog) << "Requesting" << queue.size() << "tiles at zoom" << *m_tileZoom;

    for (const TileCoord& coords : queue)
        addTile(coords);
}

void TileGrid::updateLevels()
{
    UTILS_GUARD(m_tileZoom);

    const int zoom = *m_tileZoom;

    std::vector<int> kept;
    std::vector<int> dropped;
    for (const auto& [z, level] : m_levels) {
        if (z == zoom || hasTilesAtZoom(z))
            kept.push_back(z);
        else
            dropped.push_back(z);
    }

    for (int z : kept) {
        m_levels[z].zIndex = m_options.maxZoom - std::abs(zoom - z);
        emit levelUpdated(z);
    }

    for (int z : dropped) {
        const TileLevel level = m_levels[z];
        m_levels.erase(z);
        if (level.container)
            m_provider->releaseLevel(level.container);
        qCDebug(tilegridlog) << "Removed level" << z;
        emit levelRemoved(z);
    }

    ensureLevel(zoom);
}

TileLevel& TileGrid::ensureLevel(int zoom)
{
    auto it = m_levels.find(zoom);
    if (it != m_levels.end())
        return it->second;

    TileLevel level;
    level.zoom = zoom;
    level.origin = m_viewport->project(m_viewport->unproject(m_viewport->pixelOrigin()), zoom).rounded();
    level.zIndex = m_tileZoom ? m_options.maxZoom - std::abs(*m_tileZoom - zoom) : m_options.maxZoom;
    level.container = m_provider->createLevel(zoom);
    setZoomTransform(level, m_viewport->center(), m_viewport->zoom(), true);

    it = m_levels.emplace(zoom, level).first;

    qCDebug(tilegridlog) << "Created level" << zoom << "origin" << level.origin;
    emit levelCreated(zoom);
    return it->second;
}

void TileGrid::resetGrid()
{
    const Geo::Crs& crs = m_viewport->crs();
    const double zoom = m_tileZoom ? *m_tileZoom : m_viewport->zoom();
    const Geometry::Point& ts = m_options.tileSize;

    const std::optional<Geometry::Bounds> worldBounds = m_viewport->pixelWorldBounds(zoom);
    m_globalTileRange.reset();
    if (worldBounds)
        m_globalTileRange = pixelBoundsToTileRange(*worldBounds);

    m_wrapX.reset();
    if (crs.wrapLng() && !m_options.noWrap) {
        const double west = m_viewport->project(Geo::LatLng(0.0, crs.wrapLng()->min), zoom).x;
        const double east = m_viewport->project(Geo::LatLng(0.0, crs.wrapLng()->max), zoom).x;
        m_wrapX = Geo::WrapRange{std::floor(west / ts.x), std::ceil(east / ts.x)};
    }

    m_wrapY.reset();
    if (crs.wrapLat() && !m_options.noWrap) {
        const double first = m_viewport->project(Geo::LatLng(crs.wrapLat()->min, 0.0), zoom).y;
        const double second = m_viewport->project(Geo::LatLng(crs.wrapLat()->max, 0.0), zoom).y;
        m_wrapY = Geo::WrapRange{std::floor(first / ts.y), std::ceil(second / ts.y)};
    }
}

void TileGrid::abortLoading()
{
    std::vector<TileCoord> aborted;
    for (const TileRecord& record : std::as_const(m_tiles)) {
        if (record.coords.z != m_tileZoom && !record.isLoaded() && !record.failed)
            aborted.push_back(record.coords);
    }

    for (const TileCoord& coords : aborted) {
        const TileRecord record = m_tiles.take(coords);
        if (record.visual) {
            m_provider->abortTile(record.visual);
            m_provider->releaseTile(record.visual);
        }
        qCDebug(tilegridlog) << "Aborted" << coords;
        emit tileAborted(coords);
    }
}

// ---- Tile records ----

void TileGrid::addTile(const TileCoord& coords)
{
    ensureLevel(coords.z);

    TileRecord record;
    record.coords = coords;
    record.current = true;
    record.requestId = ++m_requestSerial;
    m_tiles.insert(coords, record);

    auto state = std::make_shared<TileCompletion::State>();
    state->grid = this;
    state->coords = coords;
    state->requestId = record.requestId;

    TileLoad load;
    {
        m_inCreateTile = true;
        UTILS_DEFER(m_inCreateTile = false);
        load = m_provider->createTile(wrapCoords(coords), TileCompletion(state));
    }

    auto it = m_tiles.find(coords);
    if (it == m_tiles.end() || it->requestId != record.requestId) {
        if (load.visual)
            m_provider->releaseTile(load.visual);
        return;
    }
    it->visual = load.visual;

    if (load.mode == TileLoad::Mode::Ready && !state->settled) {
        state->settled = true;
        m_ready.push_back(ReadyEntry{coords, record.requestId, QString(), VisualId{}});
        scheduleFlush();
    }

    emit tileLoadStarted(coords);
}

void TileGrid::removeTile(const TileCoord& coords)
{
    auto it = m_tiles.find(coords);
    UTILS_GUARD(it != m_tiles.end());

    const TileRecord record = *it;
    m_tiles.erase(it);

    if (record.visual) {
        if (!record.isLoaded() && !record.failed)
            m_provider->abortTile(record.visual);
        m_provider->releaseTile(record.visual);
    }

    emit tileUnloaded(coords);
}

void TileGrid::removeAllTiles()
{
    const QList<TileCoord> keys = m_tiles.keys();
    for (const TileCoord& coords : keys)
        removeTile(coords);
}

void TileGrid::releaseAllSilently()
{
    for (const TileRecord& record : std::as_const(m_tiles)) {
        if (record.visual)
            m_provider->releaseTile(record.visual);
    }
    m_tiles.clear();

    for (const auto& [z, level] : m_levels) {
        if (level.container)
            m_provider->releaseLevel(level.container);
    }
    m_levels.clear();
}

void TileGrid::pruneTiles()
{
    UTILS_GUARD(m_viewport);

    const double zoom = m_viewport->zoom();
    if (zoom > m_options.maxZoom || zoom < m_options.minZoom) {
        removeAllTiles();
        return;
    }

    std::vector<TileCoord> pending;
    for (TileRecord& record : m_tiles) {
        record.retain = record.current;
        if (record.current && !record.active)
            pending.push_back(record.coords);
    }

    for (const TileCoord& c : pending) {
        const bool covered = m_options.ancestorSearchDepth > 0
                             && retainParent(c.x, c.y, c.z, c.z - m_options.ancestorSearchDepth);
        if (!covered && m_options.descendantSearchDepth > 0)
            retainChildren(c.x, c.y, c.z, c.z + m_options.descendantSearchDepth);
    }

    std::vector<TileCoord> evicted;
    for (const TileRecord& record : std::as_const(m_tiles)) {
        if (!record.retain)
            evicted.push_back(record.coords);
    }

    for (const TileCoord& coords : evicted)
        removeTile(coords);
}

bool TileGrid::retainParent(int x, int y, int z, int minZoom)
{
    const TileCoord parent = TileCoord{x, y, z}.parent();

    auto it = m_tiles.find(parent);
    if (it != m_tiles.end()) {
        if (it->active) {
            it->retain = true;
            return true;
        }
        if (it->isLoaded())
            it->retain = true;
    }

    if (parent.z > minZoom)
        return retainParent(parent.x, parent.y, parent.z, minZoom);

    return false;
}

void TileGrid::retainChildren(int x, int y, int z, int maxZoom)
{
    // Nothing below the addressable range can have been loaded.
    if (std::abs(x) > Constants::kMaxTileIndex || std::abs(y) > Constants::kMaxTileIndex)
        return;

    for (int dx = 0; dx < 2; ++dx) {
        for (int dy = 0; dy < 2; ++dy) {
            const int i = 2 * x + dx;
            const int j = 2 * y + dy;
            auto it = m_tiles.find(TileCoord{i, j, z + 1});
            if (it != m_tiles.end()) {
                if (it->active) {
                    it->retain = true;
                    continue;
                }
                if (it->isLoaded())
                    it->retain = true;
            }

            if (z + 1 < maxZoom)
                retainChildren(i, j, z + 1, maxZoom);
        }
    }
}

void TileGrid::updateOpacity()
{
    m_fadeFrame = 0;
    UTILS_GUARD(m_viewport);

    const qint64 now = m_clock->now();
    bool nextFrame = false;
    bool willPrune = false;

    for (TileRecord& record : m_tiles) {
        if (!record.current || !record.isLoaded())
            continue;

        const double elapsed = static_cast<double>(now - *record.loaded);
        const double fade = m_options.fadeDuration > 0 ? std::min(1.0, elapsed / m_options.fadeDuration) : 1.0;
        record.opacity = fade;

        if (fade < 1.0) {
            nextFrame = true;
        } else {
            if (record.active)
                willPrune = true;
            record.active = true;
        }
    }

    emit fadeProgressed();

    if (willPrune && !m_noPrune)
        pruneTiles();

    if (nextFrame && m_fadeFrame == 0)
        m_fadeFrame = m_clock->requestFrame([this] { updateOpacity(); });
}

void TileGrid::schedulePrune()
{
    if (fadeEnabled()) {
        m_pruneTimer.start(m_options.pruneDelay, [this] { pruneTiles(); });
        return;
    }

    if (m_pruneFrame != 0)
        m_clock->cancelFrame(m_pruneFrame);
    m_pruneFrame = m_clock->requestFrame([this] {
        m_pruneFrame = 0;
        pruneTiles();
    });
}

void TileGrid::cancelScheduled()
{
    for (Api::FrameToken* token : {&m_readyFrame, &m_fadeFrame, &m_pruneFrame}) {
        if (*token != 0)
            m_clock->cancelFrame(*token);
        *token = 0;
    }
    m_ready.clear();
    m_pruneTimer.cancel();
    m_moveThrottle.cancel();
}

// ---- Helpers ----

double TileGrid::clampZoom(double zoom) const
{
    if (m_options.minNativeZoom && zoom < *m_options.minNativeZoom)
        return *m_options.minNativeZoom;
    if (m_options.maxNativeZoom && *m_options.maxNativeZoom < zoom)
        return *m_options.maxNativeZoom;
    return zoom;
}

bool TileGrid::hasTilesAtZoom(int zoom) const
{
    return std::any_of(m_tiles.cbegin(), m_tiles.cend(), [zoom](const TileRecord& r) { return r.coords.z == zoom; });
}

bool TileGrid::noTilesToLoad() const
{
    return std::all_of(m_tiles.cbegin(), m_tiles.cend(), [](const TileRecord& r) { return r.isLoaded() || r.failed; });
}

bool TileGrid::fadeEnabled() const
{
    return m_viewport && m_viewport->options().fadeAnimation;
}

} // namespace MapView
