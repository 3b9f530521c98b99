// Copyright 2025 The TreeAmps Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ts_validate.hpp
 * @brief Regression checks of enumeration counts and gluon-basis degree rules.
 *
 * Built-in reference points (4-point gluon basis, one polarization per leg):
 *   n=4, deg=3, ee=1  →  24   (EE)(PE)(PE)
 *   n=4, deg=2, ee=2  →   3   (EE)(EE)
 *
 * These guard against regressions; they do not prove correctness for
 * arbitrary (n, deg, ee).
 */

#pragma once

#include <treeamps/generator/ts_enum.hpp>
#include <treeamps/tensor/gen_config.hpp>

#include <string>
#include <vector>

namespace treeamps {

struct CheckResult {
    bool   matches        = false;
    size_t actual_count   = 0;
    size_t expected_count = 0;
};

/// Known closed-form count for one configuration.
struct ReferencePoint {
    std::string label;
    int    n_legs      = 0;
    int    degree      = 0;
    int    ee          = 0;
    bool   one_per_leg = true;
    size_t expected    = 0;
};

struct CrossCheckResult {
    size_t pruned_count   = 0;
    size_t unpruned_count = 0;
    bool   matches        = false;  ///< Counts and ordered contents agree
};

/// Resolved (degree, ee) pair.
struct GluonDegrees {
    int degree = 0;
    int ee     = 0;
};

/**
 * Generate with transversality ForbidPiDotEi and compare cardinality.
 * @throws ConfigError Invalid n_legs/deg/ee
 */
[[nodiscard]] CheckResult check(int n_legs, int deg, int ee, bool one_per_leg,
                                size_t expected_count);

[[nodiscard]] CheckResult check(const ReferencePoint& ref);

[[nodiscard]] const std::vector<ReferencePoint>& builtin_reference_points();

/// One result per builtin_reference_points() entry, same order.
[[nodiscard]] std::vector<CheckResult> run_builtin_checks();

/// Compare the pruned search against enumerate_unpruned().
[[nodiscard]] CrossCheckResult cross_check(const GenConfig& cfg, int deg, int ee);

/**
 * Apply deg + ee = n (one polarization per leg; 2·EE + PE = n, deg = EE + PE).
 *
 * Zero means "infer": (0,0) → (n,0); (0,e) → (n-e,e); (d,0) → (d,n-d).
 * @throws ConfigError n = 0, inconsistent pair, or no valid pair
 */
[[nodiscard]] GluonDegrees resolve_gluon_degrees(int n_legs, int deg, int ee);

} // namespace treeamps
