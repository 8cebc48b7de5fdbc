// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

#include "mapview/MapViewGlobal.hpp"

#include <stdexcept>
#include <string>

namespace MapView {

// The view cannot be tiled as configured, e.g. a CRS whose scale is not finite.
class MAPVIEW_EXPORT ConfigurationError : public std::runtime_error
{
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what)
    {
    }
};

} // namespace MapView
