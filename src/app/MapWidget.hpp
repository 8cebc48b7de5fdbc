// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "DebugTileProvider.hpp"

#include "mapview/MapConfig.hpp"
#include "mapview/TileGrid.hpp"
#include "mapview/TimerFrameClock.hpp"
#include "mapview/Viewport.hpp"
#include "utils/Result.hpp"

#include <QtCore/QPointF>
#include <QtWidgets/QWidget>

#include <memory>

namespace Meridian {

// Paints the tile levels of a TileGrid and turns mouse and keyboard input
// into viewport changes.
class MapWidget final : public QWidget
{
    Q_OBJECT

public:
    explicit MapWidget(const MapView::MapConfig& config, QWidget* parent = nullptr);
    ~MapWidget() override;

    // Attaches the grid; fails when the configured view cannot be tiled.
    Utils::Result start();

    MapView::Viewport& viewport() { return *m_viewport; }
    const MapView::TileGrid& grid() const { return *m_grid; }

signals:
    // Emitted once the view has settled after a change.
    void viewSettled(const Geo::LatLng& center, double zoom);

protected:
    void paintEvent(QPaintEvent* e) override;
    void resizeEvent(QResizeEvent* e) override;
    void wheelEvent(QWheelEvent* e) override;
    void mousePressEvent(QMouseEvent* e) override;
    void mouseMoveEvent(QMouseEvent* e) override;
    void mouseReleaseEvent(QMouseEvent* e) override;
    void mouseDoubleClickEvent(QMouseEvent* e) override;
    void keyPressEvent(QKeyEvent* e) override;

private:
    void drawLevels(QPainter& p) const;
    void drawOverlay(QPainter& p) const;

    Geo::LatLng m_home;
    double m_homeZoom = 0.0;

    MapView::TimerFrameClock m_clock;
    DebugTileProvider m_provider;
    std::unique_ptr<MapView::Viewport> m_viewport;
    std::unique_ptr<MapView::TileGrid> m_grid;

    bool m_dragging = false;
    QPointF m_lastMousePos;
};

} // namespace Meridian
