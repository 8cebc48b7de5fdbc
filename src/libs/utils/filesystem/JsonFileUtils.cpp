// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "utils/filesystem/JsonFileUtils.hpp"

#include <QtCore/QDir>
#include <QtCore/QFile>
#include <QtCore/QFileInfo>
#include <QtCore/QJsonParseError>
#include <QtCore/QSaveFile>

namespace Utils::JsonFileUtils {

Result writeObjectAtomic(const QString& path, const QJsonObject& object, QJsonDocument::JsonFormat format)
{
    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty())
        return Result::failure(QStringLiteral("JSON output path is empty."));

    const QDir parent = QFileInfo(cleanedPath).absoluteDir();
    if (!parent.exists() && !QDir().mkpath(parent.absolutePath()))
        return Result::failure(QStringLiteral("Failed to create directory: %1").arg(parent.absolutePath()));

    QSaveFile file(cleanedPath);
    if (!file.open(QIODevice::WriteOnly))
        return Result::failure(QStringLiteral("Failed to open file for writing: %1").arg(cleanedPath));

    if (file.write(QJsonDocument(object).toJson(format)) < 0) {
        const QString error = file.errorString();
        file.cancelWriting();
        return Result::failure(QStringLiteral("Failed to write JSON file: %1 (%2)").arg(cleanedPath, error));
    }

    if (!file.commit())
        return Result::failure(QStringLiteral("Failed to commit JSON file: %1 (%2)")
                                   .arg(cleanedPath, file.errorString()));

    qCDebug(utilslog).noquote() << "Wrote" << cleanedPath;
    return Result::success();
}

QJsonObject parseObject(const QByteArray& bytes, QString* error)
{
    QJsonParseError parseError{};
    const QJsonDocument doc = QJsonDocument::fromJson(bytes, &parseError);
    if (parseError.error != QJsonParseError::NoError) {
        if (error)
            *error = QStringLiteral("Invalid JSON at offset %1 (%2)")
                         .arg(parseError.offset)
                         .arg(parseError.errorString());
        return {};
    }

    if (!doc.isObject()) {
        if (error)
            *error = QStringLiteral("JSON document is not an object");
        return {};
    }

    if (error)
        error->clear();
    return doc.object();
}

QJsonObject readObject(const QString& path, QString* error)
{
    const QString cleanedPath = path.trimmed();
    if (cleanedPath.isEmpty()) {
        if (error)
            *error = QStringLiteral("JSON input path is empty.");
        return {};
    }

    QFile file(cleanedPath);
    if (!file.open(QIODevice::ReadOnly)) {
        if (error) {
            *error = QStringLiteral("Failed to open JSON file: %1 (%2)")
                         .arg(cleanedPath, file.errorString());
        }
        return {};
    }

    QString parseError;
    QJsonObject object = parseObject(file.readAll(), &parseError);
    if (!parseError.isEmpty()) {
        if (error)
            *error = QStringLiteral("%1: %2").arg(cleanedPath, parseError);
        return {};
    }

    if (error)
        error->clear();
    return object;
}

} // namespace Utils::JsonFileUtils
