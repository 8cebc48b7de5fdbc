// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include <QtCore/QtGlobal>

#if defined(GEOMETRY_BUILD_SHARED) && (GEOMETRY_BUILD_SHARED == 1)
#	if defined(GEOMETRY_LIBRARY)
#		define GEOMETRY_EXPORT Q_DECL_EXPORT
#	else
#		define GEOMETRY_EXPORT Q_DECL_IMPORT
#	endif
#else
#	define GEOMETRY_EXPORT
#endif
