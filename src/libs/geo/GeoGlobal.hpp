// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>
#include <QtCore/QLoggingCategory>

#if defined(GEO_BUILD_SHARED) && (GEO_BUILD_SHARED == 1)
#	if defined(GEO_LIBRARY)
#		define GEO_EXPORT Q_DECL_EXPORT
#	else
#		define GEO_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define GEO_EXPORT
#endif

Q_DECLARE_LOGGING_CATEGORY(geolog)
