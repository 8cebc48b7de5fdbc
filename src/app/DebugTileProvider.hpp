// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "mapview/TileUrlTemplate.hpp"
#include "mapview/api/ITileProvider.hpp"
#include "geometry/Point.hpp"
#include "utils/async/AsyncTask.hpp"

#include <QtCore/QHash>
#include <QtCore/QObject>
#include <QtCore/QThreadPool>
#include <QtGui/QImage>

#include <functional>
#include <optional>

namespace Meridian {

// Renders labelled placeholder tiles on a worker pool instead of fetching
// them. Each tile shows its coordinates and the URL the template expands to.
class DebugTileProvider final : public QObject, public MapView::Api::ITileProvider
{
    Q_OBJECT

public:
    DebugTileProvider(MapView::TileUrlTemplate urlTemplate,
                      const Geometry::Point& tileSize,
                      QObject* parent = nullptr);
    ~DebugTileProvider() override;

    // Last tile row of the world at a zoom, for {-y} and tms. Returns
    // nothing when the CRS is unbounded.
    using RowLimit = std::function<std::optional<int>(int zoom)>;
    void setRowLimit(RowLimit rowLimit) { m_rowLimit = std::move(rowLimit); }

    MapView::TileLoad createTile(const MapView::TileCoord& coords,
                                 const MapView::TileCompletion& completion) override;
    void releaseTile(MapView::VisualId visual) override;
    void abortTile(MapView::VisualId visual) override;

    // Null until the image for |visual| has been rendered.
    const QImage* image(MapView::VisualId visual) const;

    int liveTiles() const { return static_cast<int>(m_tiles.size()); }

signals:
    void imageReady();

private:
    struct Tile {
        MapView::TileCoord coords;
        QImage image;
        Utils::Async::CancelToken token;
    };

    MapView::VisualId insertTile(const MapView::TileCoord& coords);

    MapView::TileUrlTemplate m_template;
    Geometry::Point m_tileSize;
    RowLimit m_rowLimit;
    QHash<MapView::VisualId, Tile> m_tiles;
    MapView::VisualId::value_type m_nextId = 1;
    QThreadPool m_pool;
};

} // namespace Meridian
