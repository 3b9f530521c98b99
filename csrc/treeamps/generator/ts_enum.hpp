// Copyright 2025 The TreeAmps Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ts_enum.hpp
 * @brief Tensor-structure enumeration by pruned backtracking over the catalog.
 *
 * Selects non-decreasing catalog index sequences of length `deg`
 * (a factor may repeat) whose EE count equals `ee`, and, under
 * OnePerLeg, whose polarization legs cover {1..n} exactly once.
 * Output is deduplicated and in ascending canonical order.
 *
 * Pruning per candidate (all necessary conditions of acceptance):
 *   - EE budget:      ee' ≤ E
 *   - EE reachable:   slots left ≥ E - ee'
 *   - one-per-leg:    no polarization leg already covered
 *   - coverage:       uncovered' ≤ slots left + (E - ee')
 *                     (remaining EE picks cover ≤ 2 legs, others ≤ 1)
 */

#pragma once

#include <treeamps/generator/factor_catalog.hpp>
#include <treeamps/tensor/gen_config.hpp>
#include <treeamps/tensor/tensor_structure.hpp>

#include <vector>

namespace treeamps {

/// Execution options; do not affect the result.
struct GenOptions {
    int n_threads = 1;  ///< 1 = serial; >1 fan out first pick (OpenMP); 0 = OpenMP default
};

/**
 * Enumerate all valid tensor structures over a prebuilt catalog.
 *
 * @param catalog        Catalog built for cfg
 * @param target_degree  Number of factors D ≥ 0
 * @param target_ee      Number of EE factors, 0 ≤ E ≤ D
 * @param cfg            Ruleset (must match catalog.config())
 * @throws ConfigError        Invalid D/E, mismatched catalog, n_threads < 0
 * @throws InvariantViolation Search state contradicted an invariant
 */
[[nodiscard]] std::vector<TensorStructure> generate(
    const FactorCatalog& catalog,
    int target_degree,
    int target_ee,
    const GenConfig& cfg,
    const GenOptions& opts = {}
);

/// Build the catalog for cfg and enumerate.
[[nodiscard]] std::vector<TensorStructure> generate_tensor_structures(
    const GenConfig& cfg,
    int target_degree,
    int target_ee,
    const GenOptions& opts = {}
);

/**
 * Reference enumeration without pruning.
 *
 * Visits every non-decreasing index sequence of length D and applies
 * the acceptance predicate directly. Exponential; intended for small n.
 */
[[nodiscard]] std::vector<TensorStructure> enumerate_unpruned(
    const FactorCatalog& catalog,
    int target_degree,
    int target_ee
);

} // namespace treeamps
