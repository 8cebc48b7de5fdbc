// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "MapWidget.hpp"

#include "AppLogging.hpp"

#include "mapview/ConfigurationError.hpp"

#include <QtGui/QColor>
#include <QtGui/QKeyEvent>
#include <QtGui/QMouseEvent>
#include <QtGui/QPainter>
#include <QtGui/QWheelEvent>

#include <algorithm>
#include <cmath>
#include <vector>

using namespace Qt::StringLiterals;

namespace Meridian {

namespace {

constexpr double kKeyPanPx = 80.0;
constexpr int kWheelStep = 120;

Geometry::Point toPoint(const QPointF& p)
{
    return Geometry::Point(p.x(), p.y());
}

} // namespace

MapWidget::MapWidget(const MapView::MapConfig& config, QWidget* parent)
    : QWidget(parent)
    , m_home(config.center)
    , m_homeZoom(config.zoom)
    , m_provider(config.makeUrlTemplate(), config.tiles.tileSize)
{
    setFocusPolicy(Qt::StrongFocus);
    setAttribute(Qt::WA_OpaquePaintEvent, true);

    m_viewport = std::make_unique<MapView::Viewport>(&m_clock,
                                                     Geometry::Point(width(), height()),
                                                     config.center,
                                                     config.zoom,
                                                     config.viewport);
    m_grid = std::make_unique<MapView::TileGrid>(&m_provider, &m_clock, config.tiles);

    m_provider.setRowLimit([this](int zoom) -> std::optional<int> {
        const std::optional<Geometry::Bounds> world = m_viewport->pixelWorldBounds(zoom);
        if (!world)
            return std::nullopt;
        return static_cast<int>(std::ceil(world->max().y / m_grid->tileSize().y)) - 1;
    });

    auto repaint = [this] { update(); };
    connect(m_viewport.get(), &MapView::Viewport::moved, this, repaint);
    connect(m_viewport.get(), &MapView::Viewport::viewReset, this, repaint);
    connect(m_viewport.get(), &MapView::Viewport::zoomAnimationStepped, this, repaint);
    connect(m_viewport.get(), &MapView::Viewport::moveEnded, this, [this] {
        emit viewSettled(m_viewport->center(), m_viewport->zoom());
    });

    connect(m_grid.get(), &MapView::TileGrid::transformsChanged, this, repaint);
    connect(m_grid.get(), &MapView::TileGrid::fadeProgressed, this, repaint);
    connect(m_grid.get(), &MapView::TileGrid::tileLoaded, this, repaint);
    connect(m_grid.get(), &MapView::TileGrid::tileUnloaded, this, repaint);
    connect(m_grid.get(), &MapView::TileGrid::levelRemoved, this, repaint);
    connect(m_grid.get(), &MapView::TileGrid::loadFinished, this, repaint);
    connect(m_grid.get(), &MapView::TileGrid::tileError, this,
            [](const MapView::TileCoord& coords, const QString& message) {
                qCWarning(applog).noquote() << "Tile" << coords.key() << "failed:" << message;
            });
    connect(&m_provider, &DebugTileProvider::imageReady, this, repaint);
}

MapWidget::~MapWidget()
{
    m_grid->detach();
}

Utils::Result MapWidget::start()
{
    try {
        m_grid->attach(m_viewport.get());
    } catch (const MapView::ConfigurationError& e) {
        return Utils::Result::failure(QString::fromUtf8(e.what()));
    }

    qCDebug(applog).noquote() << "Map started at" << m_viewport->center() << "zoom" << m_viewport->zoom();
    return Utils::Result::success();
}

void MapWidget::paintEvent(QPaintEvent* e)
{
    Q_UNUSED(e);

    QPainter p(this);
    p.fillRect(rect(), QColor(0xdd, 0xe3, 0xe8));
    p.setRenderHint(QPainter::SmoothPixmapTransform, true);

    drawLevels(p);
    drawOverlay(p);
}

void MapWidget::drawLevels(QPainter& p) const
{
    std::vector<const MapView::TileLevel*> levels;
    for (const auto& [zoom, level] : m_grid->levels())
        levels.push_back(&level);
    std::stable_sort(levels.begin(), levels.end(), [](const auto* a, const auto* b) { return a->zIndex < b->zIndex; });

    const Geometry::Point& panePos = m_viewport->panePos();
    const Geometry::Point tileSize = m_grid->tileSize();
    const double layerOpacity = m_grid->opacity();

    for (const MapView::TileLevel* level : levels) {
        const MapView::TileTransform& transform = level->transform;
        const Geometry::Point size = tileSize * transform.scale;

        for (const MapView::TileRecord& tile : m_grid->tiles()) {
            if (tile.coords.z != level->zoom || !tile.isLoaded())
                continue;
            const QImage* image = m_provider.image(tile.visual);
            if (!image)
                continue;

            const Geometry::Point topLeft = panePos + transform.translate
                                            + m_grid->tilePosition(tile.coords) * transform.scale;
            p.setOpacity(layerOpacity * tile.opacity);
            p.drawImage(QRectF(topLeft.x, topLeft.y, size.x, size.y), *image);
        }
    }
    p.setOpacity(1.0);
}

void MapWidget::drawOverlay(QPainter& p) const
{
    const Geo::LatLng center = m_viewport->center();
    const QString status = u"%1, %2  z%3  tiles %4%5"_s.arg(center.lat, 0, 'f', 5)
                               .arg(center.lng, 0, 'f', 5)
                               .arg(m_viewport->zoom(), 0, 'f', 2)
                               .arg(m_grid->tileCount())
                               .arg(m_grid->isLoading() ? u"  loading"_s : QString());

    const QRectF box(8, height() - 30.0, p.fontMetrics().horizontalAdvance(status) + 16.0, 22);
    p.fillRect(box, QColor(255, 255, 255, 200));
    p.setPen(QColor(0x33, 0x3d, 0x47));
    p.drawText(box, Qt::AlignCenter, status);
}

void MapWidget::resizeEvent(QResizeEvent* e)
{
    QWidget::resizeEvent(e);

    MapView::InvalidateSizeOptions options;
    options.debounceMoveEnd = true;
    m_viewport->invalidateSize(Geometry::Point(width(), height()), options);
}

void MapWidget::wheelEvent(QWheelEvent* e)
{
    const int steps = e->angleDelta().y() / kWheelStep;
    if (steps != 0) {
        const double zoom = m_viewport->animationTargetZoom() + steps * m_viewport->options().zoomDelta;
        m_viewport->setZoomAround(toPoint(e->position()), zoom);
    }
    e->accept();
}

void MapWidget::mousePressEvent(QMouseEvent* e)
{
    if (e->button() == Qt::LeftButton) {
        m_viewport->stop();
        m_dragging = true;
        m_lastMousePos = e->position();
        setCursor(Qt::ClosedHandCursor);
    }
    e->accept();
}

void MapWidget::mouseMoveEvent(QMouseEvent* e)
{
    if (m_dragging) {
        const QPointF delta = m_lastMousePos - e->position();
        m_lastMousePos = e->position();

        MapView::PanOptions options;
        options.animate = false;
        m_viewport->panBy(toPoint(delta), options);
    }
    e->accept();
}

void MapWidget::mouseReleaseEvent(QMouseEvent* e)
{
    if (e->button() == Qt::LeftButton && m_dragging) {
        m_dragging = false;
        unsetCursor();
    }
    e->accept();
}

void MapWidget::mouseDoubleClickEvent(QMouseEvent* e)
{
    const double delta = m_viewport->options().zoomDelta;
    const double zoom = m_viewport->zoom() + ((e->modifiers() & Qt::ShiftModifier) ? -delta : delta);
    m_viewport->setZoomAround(toPoint(e->position()), zoom);
    e->accept();
}

void MapWidget::keyPressEvent(QKeyEvent* e)
{
    switch (e->key()) {
    case Qt::Key_Left:
        m_viewport->panBy(Geometry::Point(-kKeyPanPx, 0));
        break;
    case Qt::Key_Right:
        m_viewport->panBy(Geometry::Point(kKeyPanPx, 0));
        break;
    case Qt::Key_Up:
        m_viewport->panBy(Geometry::Point(0, -kKeyPanPx));
        break;
    case Qt::Key_Down:
        m_viewport->panBy(Geometry::Point(0, kKeyPanPx));
        break;
    case Qt::Key_Plus:
    case Qt::Key_Equal:
        m_viewport->zoomIn();
        break;
    case Qt::Key_Minus:
        m_viewport->zoomOut();
        break;
    case Qt::Key_F:
        m_viewport->flyTo(m_home, m_homeZoom);
        break;
    case Qt::Key_Escape:
        m_viewport->stop();
        break;
    default:
        QWidget::keyPressEvent(e);
        return;
    }
    e->accept();
}

} // namespace Meridian
