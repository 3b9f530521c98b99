// Copyright 2025 The TreeAmps Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file types.hpp
 * @brief Platform-independent type aliases.
 *
 * Fixed-width integer types shared by the catalog and the search state.
 */

#pragma once

#include <cstdint>
#include <cstddef>

namespace treeamps {

// Unsigned integers - Leg labels, counters, catalog indices
using u8  = std::uint8_t;
using u32 = std::uint32_t;

/// 1-based external leg label.
using LegIndex = u8;

} // namespace treeamps
