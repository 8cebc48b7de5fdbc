// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "utils/Result.hpp"
#include "utils/UtilsGlobal.hpp"

#include <QtCore/QJsonDocument>
#include <QtCore/QJsonObject>
#include <QtCore/QString>

namespace Utils::JsonFileUtils {

// Writes through QSaveFile; missing parent directories are created.
UTILS_EXPORT Result writeObjectAtomic(const QString& path,
                                      const QJsonObject& object,
                                      QJsonDocument::JsonFormat format = QJsonDocument::Indented);

// Returns an empty object and fills |error| when the file is missing,
// unparsable or not a JSON object.
UTILS_EXPORT QJsonObject readObject(const QString& path, QString* error = nullptr);

UTILS_EXPORT QJsonObject parseObject(const QByteArray& bytes, QString* error = nullptr);

} // namespace Utils::JsonFileUtils
