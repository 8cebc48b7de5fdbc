// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#include "mapview/FlyToPath.hpp"

#include <cmath>

namespace MapView {

namespace {

// Floor for log(sq) once sq underflows; keeps length() finite.
constexpr double kMinLog = -18.0;
constexpr double kMinSq = 1.0e-9;

} // namespace

FlyToPath::FlyToPath(double w0, double w1, double u1, double rho)
    : m_w0(w0)
    , m_w1(w1)
    , m_u1(u1 != 0.0 ? u1 : 1.0)
    , m_rho(rho)
{
    m_r0 = r(0);
    m_length = (r(1) - m_r0) / m_rho;
}

double FlyToPath::r(int i) const
{
    const double rho2 = m_rho * m_rho;
    const double s1 = i ? -1.0 : 1.0;
    const double s2 = i ? m_w1 : m_w0;
    const double t1 = m_w1 * m_w1 - m_w0 * m_w0 + s1 * rho2 * rho2 * m_u1 * m_u1;
    const double b1 = 2.0 * s2 * rho2 * m_u1;
    const double b = t1 / b1;
    const double sq = std::sqrt(b * b + 1.0) - b;
    return sq < kMinSq ? kMinLog : std::log(sq);
}

double FlyToPath::width(double s) const
{
    return m_w0 * (std::cosh(m_r0) / std::cosh(m_r0 + m_rho * s));
}

double FlyToPath::distance(double s) const
{
    const double rho2 = m_rho * m_rho;
    return m_w0 * (std::cosh(m_r0) * std::tanh(m_r0 + m_rho * s) - std::sinh(m_r0)) / rho2;
}

} // namespace MapView
