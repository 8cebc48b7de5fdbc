// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "geometry/GeometryGlobal.hpp"
#include "geometry/Point.hpp"

namespace Geometry {

// Affine map (x, y) -> scale * (a*x + b, c*y + d). A zero scale means 1.
class GEOMETRY_EXPORT Transformation final
{
public:
    constexpr Transformation() = default;
    constexpr Transformation(double a, double b, double c, double d)
        : m_a(a), m_b(b), m_c(c), m_d(d)
    {}

    Point transform(const Point& p, double scale = 1.0) const;
    Point untransform(const Point& p, double scale = 1.0) const;

    constexpr double a() const { return m_a; }
    constexpr double b() const { return m_b; }
    constexpr double c() const { return m_c; }
    constexpr double d() const { return m_d; }

private:
    double m_a = 1.0;
    double m_b = 0.0;
    double m_c = 1.0;
    double m_d = 0.0;
};

} // namespace Geometry
