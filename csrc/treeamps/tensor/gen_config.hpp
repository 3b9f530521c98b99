// Copyright 2025 The TreeAmps Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file gen_config.hpp
 * @brief Ruleset selecting which scalar factors and structures are allowed.
 */

#pragma once

#include <treeamps/utils/types.hpp>

namespace treeamps {

/// p·e rules.
enum class Transversality : u8 {
    Allow,          ///< p_i·e_i permitted
    ForbidPiDotEi,  ///< p_i·e_i = 0 (and p_1·e_n eliminated)
};

/// How polarizations may appear per leg.
enum class PolarizationPattern : u8 {
    Unconstrained,
    OnePerLeg,      ///< each e_i in exactly one factor (gluon basis)
};

/**
 * Generation ruleset. Immutable for one generation call.
 *
 * Defaults describe the 3-point gluon basis.
 */
struct GenConfig {
    int n_legs = 3;
    Transversality transversality = Transversality::ForbidPiDotEi;
    PolarizationPattern pol_pattern = PolarizationPattern::OnePerLeg;

    [[nodiscard]] constexpr bool one_per_leg() const noexcept {
        return pol_pattern == PolarizationPattern::OnePerLeg;
    }
    [[nodiscard]] constexpr bool forbid_pi_dot_ei() const noexcept {
        return transversality == Transversality::ForbidPiDotEi;
    }

    /// Leg whose momentum is removed by momentum conservation.
    [[nodiscard]] constexpr LegIndex eliminated_leg() const noexcept {
        return static_cast<LegIndex>(n_legs);
    }

    /**
     * Check n_legs ∈ [1, MAX_LEGS].
     * @throws ConfigError Out-of-range leg count
     */
    void validate() const;

    constexpr bool operator==(const GenConfig&) const = default;
};

} // namespace treeamps
