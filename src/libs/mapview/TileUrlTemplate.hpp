// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "mapview/MapViewGlobal.hpp"
#include "mapview/MapViewTypes.hpp"

#include <QtCore/QHash>
#include <QtCore/QString>
#include <QtCore/QStringList>

#include <optional>

namespace MapView {

// Expands tile URL templates such as "https://{s}.tile.example/{z}/{x}/{y}{r}.png".
// Placeholders: {s} subdomain, {x}, {y}, {-y} (inverted row), {z}, {r} (retina
// suffix) and any key of |values|.
class MAPVIEW_EXPORT TileUrlTemplate final
{
public:
    struct Options {
        QStringList subdomains{QStringLiteral("a"), QStringLiteral("b"), QStringLiteral("c")};
        // Rows counted from the bottom.
        bool tms = false;
        int zoomOffset = 0;
        // z becomes maxZoom - z.
        bool zoomReverse = false;
        int maxZoom = 18;
        bool retina = false;
        QHash<QString, QString> values;
    };

    TileUrlTemplate() = default;
    explicit TileUrlTemplate(QString pattern, Options options = {});

    const QString& pattern() const { return m_pattern; }
    const Options& options() const { return m_options; }

    // |maxTileY| is the last row of the world at coords.z; without it {-y}
    // is unavailable and tms has no effect. Returns an empty string and sets
    // |error| when a placeholder has no value.
    QString url(const TileCoord& coords, std::optional<int> maxTileY = std::nullopt, QString* error = nullptr) const;

    QString subdomain(const TileCoord& coords) const;
    int zoomForUrl(int tileZoom) const;

private:
    QString m_pattern;
    Options m_options;
};

} // namespace MapView
