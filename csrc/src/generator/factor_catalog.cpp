// Copyright 2025 The TreeAmps Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file factor_catalog.cpp
 * @brief PP | PE | EE catalog construction under elimination/transversality.
 */

#include <treeamps/generator/factor_catalog.hpp>
#include <treeamps/utils/constants.hpp>
#include <treeamps/utils/errors.hpp>

#include <string>
#include <utility>

namespace treeamps {

namespace {

/**
 * Whether (p_i·e_j) survives the ruleset.
 *
 * Transversality drops p_i·e_i. Together with momentum conservation,
 * e_n·p_n = 0 makes e_n·p_1 = -Σ_{1<i<n} e_n·p_i, so p_1·e_n goes too.
 */
constexpr bool pe_allowed(const GenConfig& cfg, int i, int j) noexcept {
    if (!cfg.forbid_pi_dot_ei()) return true;
    if (i == j) return false;
    return !(i == FIRST_LEG && j == cfg.n_legs);
}

/// Reject catalogs violating the ordering/elimination contract.
void verify_catalog(const GenConfig& cfg, const std::vector<ScalarFactor>& fs) {
    const LegIndex n = cfg.eliminated_leg();

    for (size_t k = 0; k < fs.size(); ++k) {
        for_each_momentum_leg(fs[k], [&](LegIndex leg) {
            if (leg == n) {
                throw InvariantViolation(
                    "FactorCatalog: " + fs[k].to_string() +
                    " uses eliminated momentum p" + std::to_string(int(n)));
            }
        });
        if (k > 0 && !(fs[k - 1] < fs[k])) {
            throw InvariantViolation(
                "FactorCatalog: order broken at index " + std::to_string(k));
        }
    }
}

} // anonymous namespace

FactorCatalog::FactorCatalog(const GenConfig& cfg, std::vector<ScalarFactor> factors,
                             size_t pe_begin, size_t ee_begin)
    : cfg_(cfg), factors_(std::move(factors)),
      pe_begin_(pe_begin), ee_begin_(ee_begin) {}

FactorCatalog FactorCatalog::build(const GenConfig& cfg) {
    cfg.validate();

    const int n = cfg.n_legs;
    const auto counts = count_valid_factors(cfg);

    std::vector<ScalarFactor> fs;
    fs.reserve(counts.total());

    // PP: momentum legs only, p_n excluded
    for (int i = 1; i < n; ++i) {
        for (int j = i + 1; j < n; ++j) {
            fs.push_back(ScalarFactor::pp(LegIndex(i), LegIndex(j)));
        }
    }
    const size_t pe_begin = fs.size();

    // PE: e_n survives elimination, only p_n is removed
    for (int i = 1; i < n; ++i) {
        for (int j = 1; j <= n; ++j) {
            if (!pe_allowed(cfg, i, j)) continue;
            fs.push_back(ScalarFactor::pe(LegIndex(i), LegIndex(j)));
        }
    }
    const size_t ee_begin = fs.size();

    // EE: all legs carry a polarization
    for (int i = 1; i <= n; ++i) {
        for (int j = i + 1; j <= n; ++j) {
            fs.push_back(ScalarFactor::ee(LegIndex(i), LegIndex(j)));
        }
    }

    verify_catalog(cfg, fs);
    if (fs.size() != counts.total()) {
        throw InvariantViolation(
            "FactorCatalog: built " + std::to_string(fs.size()) +
            " factors, expected " + std::to_string(counts.total()));
    }

    return FactorCatalog(cfg, std::move(fs), pe_begin, ee_begin);
}

CatalogCounts FactorCatalog::counts() const noexcept {
    return {pe_begin_, ee_begin_ - pe_begin_, factors_.size() - ee_begin_};
}

/**
 * Closed-form block sizes:
 *   PP = C(n-1, 2),  EE = C(n, 2)
 *   PE = (n-1)·n                  (Allow)
 *      = (n-1)·(n-1) - [n ≥ 2]    (ForbidPiDotEi)
 */
CatalogCounts count_valid_factors(const GenConfig& cfg) {
    cfg.validate();

    const size_t n = static_cast<size_t>(cfg.n_legs);
    CatalogCounts c;
    c.num_pp = (n - 1) * (n >= 2 ? n - 2 : 0) / 2;
    c.num_ee = n * (n - 1) / 2;
    if (cfg.forbid_pi_dot_ei()) {
        c.num_pe = (n - 1) * (n - 1) - (n >= 2 ? 1 : 0);
    } else {
        c.num_pe = (n - 1) * n;
    }
    return c;
}

} // namespace treeamps
