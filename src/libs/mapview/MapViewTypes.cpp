// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "mapview/MapViewTypes.hpp"

#include <QtCore/QDebug>
#include <QtCore/QStringList>

#include <cmath>

Q_LOGGING_CATEGORY(mapviewlog, "meridian.mapview")
Q_LOGGING_CATEGORY(tilegridlog, "meridian.mapview.tiles")

namespace MapView {

QString TileCoord::key() const
{
    return QStringLiteral("%1:%2:%3").arg(x).arg(y).arg(z);
}

std::optional<TileCoord> TileCoord::fromKey(const QString& key)
{
    const QStringList parts = key.split(QLatin1Char(':'));
    if (parts.size() != 3)
        return std::nullopt;

    TileCoord coords;
    int* const fields[] = {&coords.x, &coords.y, &coords.z};
    for (int i = 0; i < 3; ++i) {
        bool ok = false;
        *fields[i] = parts.at(i).toInt(&ok);
        if (!ok)
            return std::nullopt;
    }
    return coords;
}

TileCoord TileCoord::parent() const
{
    return TileCoord{static_cast<int>(std::floor(x / 2.0)), static_cast<int>(std::floor(y / 2.0)), z - 1};
}

QDebug operator<<(QDebug dbg, const TileCoord& c)
{
    QDebugStateSaver saver(dbg);
    dbg.nospace() << "TileCoord(" << c.x << ", " << c.y << ", " << c.z << ')';
    return dbg;
}

} // namespace MapView
