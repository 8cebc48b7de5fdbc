// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "mapview/MapViewGlobal.hpp"
#include "mapview/MapViewTypes.hpp"
#include "mapview/FrameScheduling.hpp"
#include "mapview/TileCompletion.hpp"
#include "mapview/TileGridOptions.hpp"
#include "mapview/api/IFrameClock.hpp"
#include "mapview/api/ITileProvider.hpp"
#include "geo/GeoUtil.hpp"
#include "geo/LatLng.hpp"
#include "geo/LatLngBounds.hpp"
#include "geometry/Bounds.hpp"
#include "geometry/Point.hpp"

#include <QtCore/QHash>
#include <QtCore/QObject>
#include <QtCore/QPointer>
#include <QtCore/QString>

#include <map>
#include <optional>
#include <vector>

namespace MapView {

class Viewport;

struct TileTransform final {
	Geometry::Point translate;
	double scale = 1.0;
};

// Container for the tiles of one integer zoom. Tiles are positioned relative
// to |origin|; |transform| maps the level onto the current view.
struct TileLevel final {
	int zoom = 0;
	Geometry::Point origin;
	int zIndex = 0;
	VisualId container;
	TileTransform transform;
};

struct TileRecord final {
	TileCoord coords;
	VisualId visual;
	// Inside the visible range plus the keep buffer at the tile zoom.
	bool current = false;
	// Clock time the content arrived.
	std::optional<qint64> loaded;
	// Fully faded in.
	bool active = false;
	bool retain = false;
	quint64 requestId = 0;
	// The provider reported an error and supplied no replacement.
	bool failed = false;
	double opacity = 0.0;

	bool isLoaded() const { return loaded.has_value(); }
};

// Cache of the tiles covering a Viewport. Requests what enters the visible
// range from an ITileProvider, keeps ancestors and descendants on screen while
// replacements load, and releases the rest.
class MAPVIEW_EXPORT TileGrid final : public QObject
{
    Q_OBJECT

public:
    TileGrid(Api::ITileProvider* provider,
             Api::IFrameClock* clock,
             TileGridOptions options = {},
             QObject* parent = nullptr);
    ~TileGrid() override;

    // Starts following |viewport| and loads the current view. Throws
    // ConfigurationError when the view cannot be tiled, leaving the grid detached.
    void attach(Viewport* viewport);
    void detach();
    Viewport* viewport() const { return m_viewport.data(); }

    const TileGridOptions& options() const { return m_options; }

    void setOpacity(double opacity);
    double opacity() const { return m_options.opacity; }
    void setZIndex(int zIndex);
    int zIndex() const { return m_options.zIndex; }

    bool isLoading() const { return m_loading; }

    // Drops every tile and loads the view again.
    void redraw();

    // Requests |coords| unless a record for it exists already. Returns whether
    // a request was issued.
    bool loadTile(const TileCoord& coords);

    std::optional<int> tileZoom() const { return m_tileZoom; }

    const QHash<TileCoord, TileRecord>& tiles() const { return m_tiles; }
    const TileRecord* tile(const TileCoord& coords) const;
    int tileCount() const { return static_cast<int>(m_tiles.size()); }

    const std::map<int, TileLevel>& levels() const { return m_levels; }
    const TileLevel* level(int zoom) const;

    Geometry::Point tileSize() const { return m_options.tileSize; }

    // Position of the tile inside its level.
    Geometry::Point tilePosition(const TileCoord& coords) const;

    Geo::LatLngBounds tileCoordsToBounds(const TileCoord& coords) const;
    bool isValidTile(const TileCoord& coords) const;
    TileCoord wrapCoords(const TileCoord& coords) const;

    // Tile range covering the CRS world at the tile zoom; empty for infinite
    // systems.
    const std::optional<Geometry::Bounds>& globalTileRange() const { return m_globalTileRange; }
    Geometry::Bounds pixelBoundsToTileRange(const Geometry::Bounds& pixelBounds) const;

signals:
    void loadingStarted();
    void loadFinished();
    void tileLoadStarted(const MapView::TileCoord& coords);
    void tileLoaded(const MapView::TileCoord& coords);
    void tileError(const MapView::TileCoord& coords, const QString& message);
    void tileUnloaded(const MapView::TileCoord& coords);
    void tileAborted(const MapView::TileCoord& coords);
    void levelCreated(int zoom);
    void levelUpdated(int zoom);
    void levelRemoved(int zoom);
    void transformsChanged();
    void fadeProgressed();
    void opacityChanged(double opacity);
    void zIndexChanged(int zIndex);

private:
    friend class TileCompletion;

    struct ReadyEntry {
        TileCoord coords;
        quint64 requestId = 0;
        QString error;
        VisualId fallback;
    };

    // Entry point for TileCompletion.
    void tileReady(const TileCoord& coords, quint64 requestId, const QString& error, VisualId fallback);
    bool isRequestPending(const TileCoord& coords, quint64 requestId) const;

    void handleTileReady(const ReadyEntry& entry);
    void flushReady();
    void scheduleFlush();

    void invalidateAll();
    void resetView(const MoveEvent& event);
    void onMoveEnd();
    void setView(const Geo::LatLng& center, double zoom, bool noPrune, bool noUpdate);
    void setZoomTransforms(const Geo::LatLng& center, double zoom, bool round);
    void setZoomTransform(TileLevel& level, const Geo::LatLng& center, double zoom, bool round) const;
    void update(std::optional<Geo::LatLng> center = std::nullopt);
    void updateLevels();
    TileLevel& ensureLevel(int zoom);
    void resetGrid();
    void abortLoading();
    void addTile(const TileCoord& coords);
    void removeTile(const TileCoord& coords);
    void removeAllTiles();
    void releaseAllSilently();
    void pruneTiles();
    bool retainParent(int x, int y, int z, int minZoom);
    void retainChildren(int x, int y, int z, int maxZoom);
    void updateOpacity();
    void schedulePrune();
    void cancelScheduled();

    double clampZoom(double zoom) const;
    bool hasTilesAtZoom(int zoom) const;
    bool noTilesToLoad() const;
    bool fadeEnabled() const;
    Geometry::Bounds tiledPixelBounds(const Geo::LatLng& center) const;

    Api::ITileProvider* m_provider = nullptr;
    Api::IFrameClock* m_clock = nullptr;
    TileGridOptions m_options;
    QPointer<Viewport> m_viewport;

    QHash<TileCoord, TileRecord> m_tiles;
    std::map<int, TileLevel> m_levels;
    std::optional<int> m_tileZoom;
    std::optional<Geometry::Bounds> m_globalTileRange;
    std::optional<Geo::WrapRange> m_wrapX;
    std::optional<Geo::WrapRange> m_wrapY;

    quint64 m_requestSerial = 0;
    bool m_loading = false;
    bool m_noPrune = false;
    bool m_inCreateTile = false;

    std::vector<ReadyEntry> m_ready;
    Api::FrameToken m_readyFrame = 0;
    Api::FrameToken m_fadeFrame = 0;
    Api::FrameToken m_pruneFrame = 0;
    FrameTimer m_pruneTimer;
    FrameThrottle m_moveThrottle;
};

} // namespace MapView
