// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "mapview/MapViewGlobal.hpp"
#include "mapview/MapViewConstants.hpp"

namespace MapView {

// Optimal zoom-and-pan path of van Wijk and Nuij. |w0| and |w1| are the
// visible widths at start and end, |u1| the distance travelled measured at the
// start zoom. Path parameter s runs from 0 to length().
class MAPVIEW_EXPORT FlyToPath final
{
public:
    FlyToPath(double w0, double w1, double u1, double rho = Constants::kFlyToRho);

    double r(int i) const;

    // Visible width at s.
    double width(double s) const;

    // Distance covered at s.
    double distance(double s) const;

    double length() const { return m_length; }
    double u1() const { return m_u1; }
    double w0() const { return m_w0; }

private:
    double m_w0 = 0.0;
    double m_w1 = 0.0;
    double m_u1 = 1.0;
    double m_rho = Constants::kFlyToRho;
    double m_r0 = 0.0;
    double m_length = 0.0;
};

} // namespace MapView
