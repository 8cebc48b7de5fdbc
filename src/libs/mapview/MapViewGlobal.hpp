// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(MAPVIEW_BUILD_SHARED) && (MAPVIEW_BUILD_SHARED == 1)
#	if defined(MAPVIEW_LIBRARY)
#		define MAPVIEW_EXPORT Q_DECL_EXPORT
#	else
#		define MAPVIEW_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define MAPVIEW_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(mapviewlog)
Q_DECLARE_LOGGING_CATEGORY(tilegridlog)
