// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "mapview/TileUrlTemplate.hpp"

#include <QtCore/QRegularExpression>

#include <cstdlib>

using namespace Qt::StringLiterals;

namespace MapView {

namespace {

const QRegularExpression& placeholderPattern()
{
    static const QRegularExpression re(uR"(\{ *([\w_ -]+) *\})"_s);
    return re;
}

} // namespace

TileUrlTemplate::TileUrlTemplate(QString pattern, Options options)
    : m_pattern(std::move(pattern))
    , m_options(std::move(options))
{
}

QString TileUrlTemplate::subdomain(const TileCoord& coords) const
{
    if (m_options.subdomains.isEmpty())
        return {};
    const qsizetype index = std::abs(coords.x + coords.y) % m_options.subdomains.size();
    return m_options.subdomains.at(index);
}

int TileUrlTemplate::zoomForUrl(int tileZoom) const
{
    const int zoom = m_options.zoomReverse ? m_options.maxZoom - tileZoom : tileZoom;
    return zoom + m_options.zoomOffset;
}

QString TileUrlTemplate::url(const TileCoord& coords, std::optional<int> maxTileY, QString* error) const
{
    QHash<QString, QString> data = m_options.values;
    data.insert(u"s"_s, subdomain(coords));
    data.insert(u"x"_s, QString::number(coords.x));
    data.insert(u"y"_s, QString::number(coords.y));
    data.insert(u"z"_s, QString::number(zoomForUrl(coords.z)));
    data.insert(u"r"_s, m_options.retina ? u"@2x"_s : QString());

    if (maxTileY) {
        const int invertedY = *maxTileY - coords.y;
        if (m_options.tms)
            data.insert(u"y"_s, QString::number(invertedY));
        data.insert(u"-y"_s, QString::number(invertedY));
    }

    QString result;
    qsizetype last = 0;
    auto it = placeholderPattern().globalMatch(m_pattern);
    while (it.hasNext()) {
        const QRegularExpressionMatch match = it.next();
        const auto value = data.constFind(match.captured(1).trimmed());
        if (value == data.cend()) {
            if (error)
                *error = u"No value provided for variable %1"_s.arg(match.captured(0));
            return {};
        }
        result += QStringView(m_pattern).mid(last, match.capturedStart(0) - last);
        result += *value;
        last = match.capturedEnd(0);
    }
    result += QStringView(m_pattern).mid(last);
    return result;
}

} // namespace MapView
