// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "geo/GeoGlobal.hpp"

namespace Geo {

struct GEO_EXPORT WrapRange final {
	double min = 0.0;
	double max = 0.0;

	constexpr double span() const { return max - min; }
};

// Folds |x| into [range.min, range.max). With |includeMax| set, range.max
// itself is returned unchanged instead of folding to range.min.
GEO_EXPORT double wrapNum(double x, const WrapRange& range, bool includeMax = false);

} // namespace Geo
