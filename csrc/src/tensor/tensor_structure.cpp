// Copyright 2025 The TreeAmps Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file tensor_structure.cpp
 * @brief Canonicalization, rendering, and ordered deduplication.
 */

#include <treeamps/tensor/tensor_structure.hpp>

#include <algorithm>
#include <utility>

namespace treeamps {

TensorStructure::TensorStructure(std::vector<ScalarFactor> fs)
    : factors(std::move(fs)), ee_contractions(count_ee(factors)) {}

std::string TensorStructure::to_string() const {
    if (factors.empty()) return "1";

    std::string out;
    for (size_t i = 0; i < factors.size(); ++i) {
        if (i > 0) out += " · ";
        out += factors[i].to_string();
    }
    return out;
}

TensorStructure canonicalize(TensorStructure ts) {
    std::sort(ts.factors.begin(), ts.factors.end());
    ts.ee_contractions = count_ee(ts.factors);
    return ts;
}

int count_ee(const std::vector<ScalarFactor>& fs) noexcept {
    return static_cast<int>(std::count_if(fs.begin(), fs.end(),
        [](const ScalarFactor& f) { return f.is_ee(); }));
}

// ============================================================================
// StructureSet
// ============================================================================

bool StructureSet::insert(TensorStructure ts) {
    return set_.insert(std::move(ts)).second;
}

void StructureSet::merge(StructureSet&& other) {
    // Keys are globally canonical: plain union, colliding nodes stay in other
    set_.merge(other.set_);
    other.set_.clear();
}

bool StructureSet::contains(const TensorStructure& ts) const {
    return set_.find(ts) != set_.end();
}

std::vector<TensorStructure> StructureSet::into_vector() && {
    std::vector<TensorStructure> out;
    out.reserve(set_.size());
    while (!set_.empty()) {
        out.push_back(std::move(set_.extract(set_.begin()).value()));
    }
    return out;
}

} // namespace treeamps
