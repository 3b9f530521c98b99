// Copyright 2025 The TreeAmps Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file scalar_factor.hpp
 * @brief Elementary Lorentz contraction between momentum/polarization vectors.
 *
 * Three kinds of scalar factor on legs a, b ∈ [1, n]:
 *   PP: (p_a·p_b), a < b
 *   PE: (p_a·e_b), a = momentum leg, b = polarization leg
 *   EE: (e_a·e_b), a < b
 *
 * Ordering is lexicographic on (kind, a, b) with PP < PE < EE, which is
 * exactly the catalog order used by the enumerator.
 */

#pragma once

#include <treeamps/utils/types.hpp>

#include <compare>
#include <string>

namespace treeamps {

/// Contraction kind. Declaration order fixes the catalog block order.
enum class ScalarKind : u8 {
    PP,  ///< momentum · momentum
    PE,  ///< momentum · polarization
    EE,  ///< polarization · polarization
};

/// Number of polarization vectors carried by a factor of this kind.
[[nodiscard]] constexpr int n_polarizations(ScalarKind k) noexcept {
    switch (k) {
        case ScalarKind::PP: return 0;
        case ScalarKind::PE: return 1;
        case ScalarKind::EE: return 2;
    }
    return 0;
}

struct ScalarFactor {
    ScalarKind kind;
    LegIndex a;
    LegIndex b;

    /// Three-way comparison (enables ==, !=, <, <=, >, >=)
    constexpr auto operator<=>(const ScalarFactor&) const = default;

    [[nodiscard]] static constexpr ScalarFactor pp(LegIndex i, LegIndex j) noexcept {
        return {ScalarKind::PP, i, j};
    }
    [[nodiscard]] static constexpr ScalarFactor pe(LegIndex i, LegIndex j) noexcept {
        return {ScalarKind::PE, i, j};
    }
    [[nodiscard]] static constexpr ScalarFactor ee(LegIndex i, LegIndex j) noexcept {
        return {ScalarKind::EE, i, j};
    }

    [[nodiscard]] constexpr bool is_ee() const noexcept { return kind == ScalarKind::EE; }

    /// Human-readable form, e.g. "(p1·e3)".
    [[nodiscard]] std::string to_string() const;
};

/// Visit polarization-side legs: {} for PP, {b} for PE, {a, b} for EE.
template<typename Visitor>
constexpr void for_each_polarization_leg(const ScalarFactor& f, Visitor&& visit) {
    switch (f.kind) {
        case ScalarKind::PP:
            break;
        case ScalarKind::PE:
            visit(f.b);
            break;
        case ScalarKind::EE:
            visit(f.a);
            visit(f.b);
            break;
    }
}

/// Visit momentum-side legs: {a, b} for PP, {a} for PE, {} for EE.
template<typename Visitor>
constexpr void for_each_momentum_leg(const ScalarFactor& f, Visitor&& visit) {
    switch (f.kind) {
        case ScalarKind::PP:
            visit(f.a);
            visit(f.b);
            break;
        case ScalarKind::PE:
            visit(f.a);
            break;
        case ScalarKind::EE:
            break;
    }
}

/// Short kind label ("PP", "PE", "EE").
[[nodiscard]] const char* to_string(ScalarKind k) noexcept;

} // namespace treeamps
