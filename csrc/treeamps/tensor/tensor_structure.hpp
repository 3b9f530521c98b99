// Copyright 2025 The TreeAmps Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file tensor_structure.hpp
 * @brief Tensor structures (multisets of scalar factors) and their canonical set.
 *
 * A structure is stored as a factor sequence in canonical (catalog) order,
 * non-decreasing, repeats allowed. Equality and ordering look at the
 * factor sequence only; ee_contractions is derived data.
 *
 * Thread-safety: StructureSet is not synchronized; merge per-thread sets.
 */

#pragma once

#include <treeamps/tensor/scalar_factor.hpp>
#include <treeamps/utils/types.hpp>

#include <set>
#include <string>
#include <vector>

namespace treeamps {

struct TensorStructure {
    std::vector<ScalarFactor> factors;  ///< Canonical order
    int ee_contractions = 0;            ///< Number of EE factors

    TensorStructure() = default;

    /// Build from factors; ee_contractions is recomputed.
    explicit TensorStructure(std::vector<ScalarFactor> fs);

    [[nodiscard]] int degree() const noexcept {
        return static_cast<int>(factors.size());
    }

    /// Factors joined by " · "; the empty structure renders as "1".
    [[nodiscard]] std::string to_string() const;

    bool operator==(const TensorStructure& o) const noexcept {
        return factors == o.factors;
    }
    auto operator<=>(const TensorStructure& o) const noexcept {
        return factors <=> o.factors;
    }
};

/// Sort factors into catalog order (idempotent).
[[nodiscard]] TensorStructure canonicalize(TensorStructure ts);

/// Count EE factors of a factor sequence.
[[nodiscard]] int count_ee(const std::vector<ScalarFactor>& fs) noexcept;

/**
 * Ordered, duplicate-free collection of structures.
 *
 * Iteration and into_vector() follow ascending canonical key order,
 * independent of insertion order.
 */
class StructureSet {
public:
    /// Insert canonical structure; returns false if already present.
    bool insert(TensorStructure ts);

    /// Union with another set (consumes it).
    void merge(StructureSet&& other);

    [[nodiscard]] bool contains(const TensorStructure& ts) const;
    [[nodiscard]] size_t size() const noexcept { return set_.size(); }
    [[nodiscard]] bool empty() const noexcept { return set_.empty(); }

    [[nodiscard]] auto begin() const noexcept { return set_.begin(); }
    [[nodiscard]] auto end()   const noexcept { return set_.end();   }

    /// Drain into a vector in ascending canonical order.
    [[nodiscard]] std::vector<TensorStructure> into_vector() &&;

private:
    std::set<TensorStructure> set_;
};

} // namespace treeamps
