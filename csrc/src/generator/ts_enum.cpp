// Copyright 2025 The TreeAmps Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file ts_enum.cpp
 * @brief Pruned DFS over the factor catalog with optional OpenMP fan-out.
 *
 * Search state is one owned buffer of catalog indices plus EE and
 * per-leg polarization counters. Every push is undone by PickGuard on
 * scope exit, so sibling branches never observe each other's state.
 */

#include <treeamps/generator/ts_enum.hpp>
#include <treeamps/utils/errors.hpp>

#include <cstddef>
#include <exception>
#include <string>
#include <utility>

#ifdef _OPENMP
  #include <omp.h>
#endif

namespace treeamps {

namespace {

void check_targets(const char* fn, int deg, int ee) {
    if (deg < 0) {
        throw ConfigError(std::string(fn) + ": degree=" + std::to_string(deg) + " is negative");
    }
    if (ee < 0) {
        throw ConfigError(std::string(fn) + ": ee=" + std::to_string(ee) + " is negative");
    }
    if (ee > deg) {
        throw ConfigError(std::string(fn) + ": ee=" + std::to_string(ee) +
                          " exceeds degree=" + std::to_string(deg));
    }
}

// ============================================================================
// DfsSearch: single-owner backtracking state
// ============================================================================

class DfsSearch {
public:
    DfsSearch(const FactorCatalog& cat, int deg, int ee, StructureSet& out)
        : cat_(cat),
          target_deg_(deg),
          target_ee_(ee),
          n_legs_(cat.config().n_legs),
          one_per_leg_(cat.config().one_per_leg()),
          uncovered_(n_legs_),
          pol_count_(static_cast<size_t>(n_legs_) + 1, 0),
          out_(out) {}

    /// Search the subtree whose first pick is `root`.
    void run_from_root(size_t root) {
        if (target_deg_ == 0) return;
        if (!admissible(root)) return;
        PickGuard g(*this, root);
        descend(root);
    }

    /// Full search from catalog index `start`.
    void descend(size_t start) {
        if (depth() == target_deg_) {
            accept();
            return;
        }
        for (size_t idx = start; idx < cat_.size(); ++idx) {
            // EE block is last: once the budget is spent nothing further fits
            if (ee_ == target_ee_ && idx >= cat_.ee_begin()) break;
            if (!admissible(idx)) continue;
            PickGuard g(*this, idx);
            descend(idx);
        }
    }

private:
    /// push on construction, pop on every exit path.
    class PickGuard {
    public:
        PickGuard(DfsSearch& s, size_t idx) : s_(s) { s_.push(idx); }
        ~PickGuard() { s_.pop(); }
        PickGuard(const PickGuard&) = delete;
        PickGuard& operator=(const PickGuard&) = delete;
    private:
        DfsSearch& s_;
    };

    [[nodiscard]] int depth() const noexcept { return static_cast<int>(picks_.size()); }

    [[nodiscard]] bool admissible(size_t idx) const noexcept {
        const ScalarFactor& f = cat_[idx];
        const int slots_after = target_deg_ - depth() - 1;
        const int ee_after = ee_ + (f.is_ee() ? 1 : 0);
        const int ee_missing = target_ee_ - ee_after;

        if (ee_missing < 0) return false;
        if (slots_after < ee_missing) return false;

        if (one_per_leg_) {
            bool clash = false;
            int fresh = 0;
            for_each_polarization_leg(f, [&](LegIndex leg) {
                if (pol_count_[leg] != 0) clash = true;
                else ++fresh;
            });
            if (clash) return false;
            if (uncovered_ - fresh > slots_after + ee_missing) return false;
        }
        return true;
    }

    // picks_ grows with depth; push_back comes first so a throw leaves no state
    void push(size_t idx) {
        const ScalarFactor& f = cat_[idx];
        picks_.push_back(static_cast<u32>(idx));
        if (f.is_ee()) ++ee_;
        if (one_per_leg_) {
            for_each_polarization_leg(f, [&](LegIndex leg) {
                if (pol_count_[leg]++ == 0) --uncovered_;
            });
        }
    }

    void pop() noexcept {
        const ScalarFactor& f = cat_[picks_.back()];
        if (one_per_leg_) {
            for_each_polarization_leg(f, [&](LegIndex leg) {
                if (--pol_count_[leg] == 0) ++uncovered_;
            });
        }
        if (f.is_ee()) --ee_;
        picks_.pop_back();
    }

    /// Acceptance at depth D: ee = E and, under OnePerLeg, every leg once.
    void accept() {
        if (ee_ > target_ee_) {
            throw InvariantViolation(
                "generate: accepted ee=" + std::to_string(ee_) +
                " exceeds target " + std::to_string(target_ee_));
        }
        if (ee_ != target_ee_) return;

        if (one_per_leg_) {
            for (int leg = 1; leg <= n_legs_; ++leg) {
                const u32 c = pol_count_[static_cast<size_t>(leg)];
                if (c > 1) {
                    throw InvariantViolation(
                        "generate: polarization e" + std::to_string(leg) +
                        " used " + std::to_string(c) + " times");
                }
                if (c == 0) return;
            }
        }

        TensorStructure ts;
        ts.factors.reserve(picks_.size());
        for (u32 idx : picks_) ts.factors.push_back(cat_[idx]);
        ts.ee_contractions = ee_;
        out_.insert(std::move(ts));
    }

    const FactorCatalog& cat_;
    const int target_deg_;
    const int target_ee_;
    const int n_legs_;
    const bool one_per_leg_;

    std::vector<u32> picks_;       ///< Non-decreasing catalog indices
    int ee_ = 0;                   ///< EE factors in picks_
    int uncovered_;                ///< Legs with pol_count_ == 0
    std::vector<u32> pol_count_;   ///< Polarization occurrences, 1-based
    StructureSet& out_;
};

/// Fan out the first catalog choice; each root owns its state and set.
StructureSet search_parallel(const FactorCatalog& cat, int deg, int ee, int n_threads) {
    const size_t n_roots = cat.size();
    std::vector<StructureSet> partial(n_roots);
    std::exception_ptr err;

#ifdef _OPENMP
    const int nt = (n_threads > 0) ? n_threads : omp_get_max_threads();
#else
    (void)n_threads;
#endif

#pragma omp parallel for schedule(dynamic, 1) num_threads(nt)
    for (std::ptrdiff_t r = 0; r < static_cast<std::ptrdiff_t>(n_roots); ++r) {
        try {
            DfsSearch s(cat, deg, ee, partial[static_cast<size_t>(r)]);
            s.run_from_root(static_cast<size_t>(r));
        } catch (...) {
#pragma omp critical(treeamps_search_error)
            {
                if (!err) err = std::current_exception();
            }
        }
    }
    if (err) std::rethrow_exception(err);

    StructureSet out;
    for (auto& p : partial) out.merge(std::move(p));
    return out;
}

// ============================================================================
// Unpruned reference
// ============================================================================

bool satisfies(const GenConfig& cfg, const std::vector<ScalarFactor>& fs, int ee) {
    if (count_ee(fs) != ee) return false;
    if (!cfg.one_per_leg()) return true;

    std::vector<int> seen(static_cast<size_t>(cfg.n_legs) + 1, 0);
    for (const auto& f : fs) {
        for_each_polarization_leg(f, [&](LegIndex leg) { ++seen[leg]; });
    }
    for (int leg = 1; leg <= cfg.n_legs; ++leg) {
        if (seen[static_cast<size_t>(leg)] != 1) return false;
    }
    return true;
}

} // anonymous namespace

std::vector<TensorStructure> generate(
    const FactorCatalog& catalog,
    int target_degree,
    int target_ee,
    const GenConfig& cfg,
    const GenOptions& opts
) {
    check_targets("generate", target_degree, target_ee);
    if (!(catalog.config() == cfg)) {
        throw ConfigError("generate: catalog was built for a different GenConfig");
    }
    if (opts.n_threads < 0) {
        throw ConfigError("generate: n_threads=" + std::to_string(opts.n_threads) + " is negative");
    }

    // No factor to pick: only the empty product can exist
    if (catalog.size() == 0 && target_degree > 0) return {};

    StructureSet out;
    if (opts.n_threads == 1 || target_degree == 0) {
        DfsSearch s(catalog, target_degree, target_ee, out);
        s.descend(0);
    } else {
        out = search_parallel(catalog, target_degree, target_ee, opts.n_threads);
    }
    return std::move(out).into_vector();
}

std::vector<TensorStructure> generate_tensor_structures(
    const GenConfig& cfg,
    int target_degree,
    int target_ee,
    const GenOptions& opts
) {
    check_targets("generate_tensor_structures", target_degree, target_ee);
    const auto catalog = FactorCatalog::build(cfg);
    return generate(catalog, target_degree, target_ee, cfg, opts);
}

std::vector<TensorStructure> enumerate_unpruned(
    const FactorCatalog& catalog,
    int target_degree,
    int target_ee
) {
    check_targets("enumerate_unpruned", target_degree, target_ee);

    const GenConfig& cfg = catalog.config();
    const size_t n = catalog.size();
    const size_t d = static_cast<size_t>(target_degree);
    StructureSet out;

    if (d == 0) {
        if (satisfies(cfg, {}, target_ee)) out.insert(TensorStructure{});
        return std::move(out).into_vector();
    }
    if (n == 0) return {};

    // Odometer over non-decreasing index tuples
    std::vector<size_t> idx(d, 0);
    std::vector<ScalarFactor> fs(d);
    while (true) {
        for (size_t k = 0; k < d; ++k) fs[k] = catalog[idx[k]];
        if (satisfies(cfg, fs, target_ee)) out.insert(TensorStructure(fs));

        size_t p = d;
        while (p > 0 && idx[p - 1] == n - 1) --p;
        if (p == 0) break;
        const size_t v = ++idx[p - 1];
        for (size_t k = p; k < d; ++k) idx[k] = v;
    }
    return std::move(out).into_vector();
}

} // namespace treeamps
