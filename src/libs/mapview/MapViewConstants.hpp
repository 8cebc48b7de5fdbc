// SPDX-FileCopyrightText: 2026 Samer Ali
// SPDX-License-Identifier: GPL-3.0-only

#pragma once

namespace MapView::Constants {

inline constexpr int kDefaultTileSize = 256;

inline constexpr int kFrameIntervalMs = 16;

// Largest tile index on either axis. Child lookups double it.
inline constexpr int kMaxTileIndex = (1 << 30) - 1;
// Deepest tile zoom whose world still fits kMaxTileIndex.
inline constexpr int kMaxTileZoom = 30;

inline constexpr int kZoomAnimationMs = 250;
inline constexpr double kZoomAnimationEasePower = 2.0;

inline constexpr double kPanDurationSec = 0.25;
inline constexpr double kPanEaseLinearity = 0.5;
inline constexpr double kMinEaseLinearity = 0.2;

inline constexpr double kFlyToRho = 1.42;
inline constexpr double kFlyToEasePower = 1.5;
inline constexpr double kFlyToDurationPerUnit = 0.8;

inline constexpr int kResizeMoveEndDebounceMs = 200;

// 2^23 px: pane offsets beyond this lose sub-pixel precision in transforms.
inline constexpr double kTransformLimit = 8388608.0;

} // namespace MapView::Constants
