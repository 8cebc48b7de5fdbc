// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "DebugTileProvider.hpp"

#include "AppLogging.hpp"

#include <QtGui/QColor>
#include <QtGui/QFont>
#include <QtGui/QPainter>

#include <algorithm>
#include <cmath>

using namespace Qt::StringLiterals;

namespace Meridian {

namespace {

QImage renderTile(const MapView::TileCoord& coords, const QString& label, const QSize& size, bool failed)
{
    QImage image(size, QImage::Format_ARGB32_Premultiplied);

    // Checkerboard shading so neighbouring tiles are told apart.
    const bool odd = ((coords.x + coords.y) & 1) != 0;
    QColor fill = failed ? QColor(0xf4, 0xd6, 0xd6) : (odd ? QColor(0xe8, 0xee, 0xf4) : QColor(0xf6, 0xf8, 0xfa));
    image.fill(fill);

    QPainter p(&image);
    p.setRenderHint(QPainter::Antialiasing, true);
    p.setPen(QColor(0x9a, 0xa8, 0xb6));
    p.drawRect(QRectF(0.5, 0.5, size.width() - 1.0, size.height() - 1.0));

    p.setPen(failed ? QColor(0xa0, 0x30, 0x30) : QColor(0x33, 0x3d, 0x47));
    QFont font = p.font();
    font.setPointSizeF(std::max(8.0, size.height() / 16.0));
    p.setFont(font);
    p.drawText(QRectF(0, 0, size.width(), size.height() / 2.0),
               Qt::AlignCenter,
               u"%1 / %2 / %3"_s.arg(coords.z).arg(coords.x).arg(coords.y));

    font.setPointSizeF(std::max(6.0, size.height() / 32.0));
    p.setFont(font);
    p.drawText(QRectF(8, size.height() / 2.0, size.width() - 16.0, size.height() / 2.0 - 8.0),
               Qt::AlignHCenter | Qt::AlignTop | Qt::TextWrapAnywhere,
               label);
    return image;
}

QSize imageSize(const Geometry::Point& tileSize)
{
    return QSize(static_cast<int>(std::ceil(tileSize.x)), static_cast<int>(std::ceil(tileSize.y)));
}

} // namespace

DebugTileProvider::DebugTileProvider(MapView::TileUrlTemplate urlTemplate,
                                     const Geometry::Point& tileSize,
                                     QObject* parent)
    : QObject(parent)
    , m_template(std::move(urlTemplate))
    , m_tileSize(tileSize)
{
    m_pool.setMaxThreadCount(2);
}

DebugTileProvider::~DebugTileProvider()
{
    for (const Tile& tile : std::as_const(m_tiles))
        tile.token.cancel();
    m_pool.clear();
    m_pool.waitForDone();
}

MapView::VisualId DebugTileProvider::insertTile(const MapView::TileCoord& coords)
{
    const MapView::VisualId id(m_nextId++);
    m_tiles.insert(id, Tile{coords, QImage(), Utils::Async::CancelToken()});
    return id;
}

MapView::TileLoad DebugTileProvider::createTile(const MapView::TileCoord& coords,
                                                const MapView::TileCompletion& completion)
{
    const MapView::VisualId id = insertTile(coords);
    const QSize size = imageSize(m_tileSize);

    const std::optional<int> maxTileY = m_rowLimit ? m_rowLimit(coords.z) : std::nullopt;
    QString error;
    const QString url = m_template.url(coords, maxTileY, &error);
    if (url.isEmpty() && !error.isEmpty()) {
        // Rendered on the spot so the grid has something to show instead.
        const MapView::VisualId fallback = insertTile(coords);
        m_tiles[fallback].image = renderTile(coords, error, size, true);
        completion.reject(error, fallback);
        return MapView::TileLoad::pending(id);
    }

    const Utils::Async::CancelToken token = m_tiles.value(id).token;
    Utils::Async::run<QImage>(
        this,
        [coords, url, size] { return renderTile(coords, url, size, false); },
        [this, id, completion](QImage image) {
            auto it = m_tiles.find(id);
            if (it == m_tiles.end())
                return;
            it->image = std::move(image);
            completion.resolve();
            emit imageReady();
        },
        token,
        &m_pool);

    return MapView::TileLoad::pending(id);
}

void DebugTileProvider::releaseTile(MapView::VisualId visual)
{
    auto it = m_tiles.find(visual);
    if (it == m_tiles.end()) {
        qCWarning(applog) << "Release of unknown tile visual" << visual.value();
        return;
    }
    it->token.cancel();
    m_tiles.erase(it);
}

void DebugTileProvider::abortTile(MapView::VisualId visual)
{
    const auto it = m_tiles.constFind(visual);
    if (it == m_tiles.cend())
        return;
    it->token.cancel();
    qCDebug(applog) << "Aborted render of" << it->coords;
}

const QImage* DebugTileProvider::image(MapView::VisualId visual) const
{
    const auto it = m_tiles.constFind(visual);
    if (it == m_tiles.cend() || it->image.isNull())
        return nullptr;
    return &it->image;
}

} // namespace Meridian
