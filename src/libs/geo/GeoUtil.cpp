// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "geo/GeoUtil.hpp"

#include <cmath>

Q_LOGGING_CATEGORY(geolog, "meridian.geo")

namespace Geo {

double wrapNum(double x, const WrapRange& range, bool includeMax)
{
    if (x == range.max && includeMax)
        return x;
    const double d = range.span();
    return std::fmod(std::fmod(x - range.min, d) + d, d) + range.min;
}

} // namespace Geo
