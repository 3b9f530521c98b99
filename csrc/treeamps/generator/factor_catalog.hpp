// Copyright 2025 The TreeAmps Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file factor_catalog.hpp
 * @brief Ordered universe of legal scalar factors for a given ruleset.
 *
 * Blocks, each ascending in (a, b), concatenated as PP | PE | EE:
 *   PP: 1 ≤ a < b < n                       (p_n eliminated)
 *   PE: a ∈ [1, n-1], b ∈ [1, n]
 *       ForbidPiDotEi: drop a = b and (p_1·e_n)
 *   EE: 1 ≤ a < b ≤ n
 *
 * The enumerator's non-decreasing-index rule relies on this order.
 *
 * Thread-safety: Read-only after construction.
 */

#pragma once

#include <treeamps/tensor/gen_config.hpp>
#include <treeamps/tensor/scalar_factor.hpp>
#include <treeamps/utils/types.hpp>

#include <span>
#include <vector>

namespace treeamps {

/// Per-block catalog sizes.
struct CatalogCounts {
    size_t num_pp = 0;
    size_t num_pe = 0;
    size_t num_ee = 0;

    [[nodiscard]] size_t total() const noexcept { return num_pp + num_pe + num_ee; }
};

class FactorCatalog {
public:
    /**
     * Build the catalog for cfg.
     * @throws ConfigError        n_legs out of range
     * @throws InvariantViolation Catalog order/elimination contract broken
     */
    [[nodiscard]] static FactorCatalog build(const GenConfig& cfg);

    [[nodiscard]] const GenConfig& config() const noexcept { return cfg_; }
    [[nodiscard]] std::span<const ScalarFactor> factors() const noexcept { return factors_; }
    [[nodiscard]] size_t size() const noexcept { return factors_.size(); }
    [[nodiscard]] const ScalarFactor& operator[](size_t i) const noexcept { return factors_[i]; }

    /// First PE index (== number of PP factors).
    [[nodiscard]] size_t pe_begin() const noexcept { return pe_begin_; }
    /// First EE index (== PP + PE factors).
    [[nodiscard]] size_t ee_begin() const noexcept { return ee_begin_; }

    [[nodiscard]] CatalogCounts counts() const noexcept;

    [[nodiscard]] auto begin() const noexcept { return factors_.begin(); }
    [[nodiscard]] auto end()   const noexcept { return factors_.end();   }

private:
    FactorCatalog(const GenConfig& cfg, std::vector<ScalarFactor> factors,
                  size_t pe_begin, size_t ee_begin);

    GenConfig cfg_;
    std::vector<ScalarFactor> factors_;
    size_t pe_begin_ = 0;
    size_t ee_begin_ = 0;
};

/// Block sizes without materializing a catalog.
[[nodiscard]] CatalogCounts count_valid_factors(const GenConfig& cfg);

} // namespace treeamps
