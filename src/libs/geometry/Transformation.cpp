// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "geometry/Transformation.hpp"

namespace Geometry {

Point Transformation::transform(const Point& p, double scale) const
{
    if (scale == 0.0)
        scale = 1.0;
    return Point(scale * (m_a * p.x + m_b), scale * (m_c * p.y + m_d));
}

Point Transformation::untransform(const Point& p, double scale) const
{
    if (scale == 0.0)
        scale = 1.0;
    return Point((p.x / scale - m_b) / m_a, (p.y / scale - m_d) / m_c);
}

} // namespace Geometry
