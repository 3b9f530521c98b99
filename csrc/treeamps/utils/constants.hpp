// Copyright 2025 The TreeAmps Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file constants.hpp
 * @brief Framework-wide compile-time constants.
 */

#pragma once

#include "types.hpp"
#include <limits>

namespace treeamps {

// ============================================================================
// Leg Labelling Limits
// ============================================================================

/**
 * Maximum number of external legs representable by LegIndex.
 * Leg labels: [1, 255]
 */
inline constexpr int MAX_LEGS = std::numeric_limits<LegIndex>::max();

/**
 * Leg whose momentum is eliminated by momentum conservation is always
 * the last one (n_legs). Leg 1 is the partner dropped from p·e_n when
 * transversality holds.
 */
inline constexpr LegIndex FIRST_LEG = 1;

// ============================================================================
// Built-in Reference Counts (4-point gluon basis)
// ============================================================================

/// (EE)(PE)(PE) structures, one polarization per leg: n=4, deg=3, ee=1.
inline constexpr std::size_t REF_4G_MIXED_COUNT = 24;

/// Pure (EE)(EE) structures, one polarization per leg: n=4, deg=2, ee=2.
inline constexpr std::size_t REF_4G_PURE_EE_COUNT = 3;

} // namespace treeamps
