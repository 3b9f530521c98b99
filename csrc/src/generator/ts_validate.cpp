// Copyright 2025 The TreeAmps Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ts_validate.cpp
 * @brief Count checks against known values and the unpruned reference.
 */

#include <treeamps/generator/ts_validate.hpp>
#include <treeamps/generator/factor_catalog.hpp>
#include <treeamps/utils/constants.hpp>
#include <treeamps/utils/errors.hpp>

#include <string>

namespace treeamps {

CheckResult check(int n_legs, int deg, int ee, bool one_per_leg, size_t expected_count) {
    const GenConfig cfg{
        .n_legs = n_legs,
        .transversality = Transversality::ForbidPiDotEi,
        .pol_pattern = one_per_leg ? PolarizationPattern::OnePerLeg
                                   : PolarizationPattern::Unconstrained,
    };
    const auto ts = generate_tensor_structures(cfg, deg, ee);

    CheckResult r;
    r.actual_count = ts.size();
    r.expected_count = expected_count;
    r.matches = (r.actual_count == r.expected_count);
    return r;
}

CheckResult check(const ReferencePoint& ref) {
    return check(ref.n_legs, ref.degree, ref.ee, ref.one_per_leg, ref.expected);
}

const std::vector<ReferencePoint>& builtin_reference_points() {
    static const std::vector<ReferencePoint> refs = {
        {"4g-mixed-one-pol",   4, 3, 1, true, REF_4G_MIXED_COUNT},
        {"4g-pure-EE-one-pol", 4, 2, 2, true, REF_4G_PURE_EE_COUNT},
    };
    return refs;
}

std::vector<CheckResult> run_builtin_checks() {
    std::vector<CheckResult> out;
    out.reserve(builtin_reference_points().size());
    for (const auto& ref : builtin_reference_points()) {
        out.push_back(check(ref));
    }
    return out;
}

CrossCheckResult cross_check(const GenConfig& cfg, int deg, int ee) {
    const auto catalog = FactorCatalog::build(cfg);
    const auto pruned = generate(catalog, deg, ee, cfg);
    const auto brute = enumerate_unpruned(catalog, deg, ee);

    CrossCheckResult r;
    r.pruned_count = pruned.size();
    r.unpruned_count = brute.size();
    r.matches = (pruned == brute);
    return r;
}

GluonDegrees resolve_gluon_degrees(int n_legs, int deg, int ee) {
    if (n_legs <= 0) {
        throw ConfigError("resolve_gluon_degrees: n must be >= 1");
    }
    if (deg < 0 || ee < 0) {
        throw ConfigError("resolve_gluon_degrees: deg and ee must be non-negative");
    }

    GluonDegrees out{deg, ee};
    if (deg != 0 && ee != 0) {
        if (deg + ee != n_legs) {
            throw ConfigError(
                "resolve_gluon_degrees: inconsistent inputs n=" + std::to_string(n_legs) +
                ", deg=" + std::to_string(deg) + ", ee=" + std::to_string(ee) +
                "; expected deg = n - ee = " + std::to_string(n_legs - ee) +
                " and ee = n - deg = " + std::to_string(n_legs - deg));
        }
    } else if (deg == 0 && ee != 0) {
        out.degree = n_legs - ee;
    } else if (ee == 0 && deg != 0) {
        out.ee = n_legs - deg;
    } else {
        // Pure PE basis
        out.degree = n_legs;
        out.ee = 0;
    }

    if (out.degree < 0 || out.ee < 0) {
        throw ConfigError(
            "resolve_gluon_degrees: no valid (deg, ee) for n=" + std::to_string(n_legs));
    }
    if (out.ee > out.degree) {
        throw ConfigError(
            "resolve_gluon_degrees: ee=" + std::to_string(out.ee) +
            " exceeds deg=" + std::to_string(out.degree));
    }
    return out;
}

} // namespace treeamps
