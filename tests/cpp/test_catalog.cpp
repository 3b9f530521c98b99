// Copyright 2025 The TreeAmps Authors
// SPDX-License-Identifier: Apache-2.0

/**
 * @file test_catalog.cpp
 * @brief Unit tests for scalar factors, catalog construction, and structure sets.
 */

#define CATCH_CONFIG_MAIN
#include <catch2/catch_test_macros.hpp>

#include <treeamps/generator/factor_catalog.hpp>
#include <treeamps/tensor/gen_config.hpp>
#include <treeamps/tensor/scalar_factor.hpp>
#include <treeamps/tensor/tensor_structure.hpp>
#include <treeamps/utils/errors.hpp>

#include <algorithm>
#include <string>
#include <vector>

using namespace treeamps;

namespace {

GenConfig make_cfg(int n, Transversality t = Transversality::ForbidPiDotEi,
                   PolarizationPattern p = PolarizationPattern::OnePerLeg) {
    return GenConfig{.n_legs = n, .transversality = t, .pol_pattern = p};
}

bool contains(const FactorCatalog& cat, const ScalarFactor& f) {
    return std::find(cat.begin(), cat.end(), f) != cat.end();
}

} // namespace

// -----------------------------------------------------------------------------
// ScalarFactor basics
// -----------------------------------------------------------------------------
TEST_CASE("ScalarFactor: ordering & rendering", "[factor]") {
    SECTION("Kind dominates, then (a, b)") {
        REQUIRE(ScalarFactor::pp(2, 3) < ScalarFactor::pe(1, 2));
        REQUIRE(ScalarFactor::pe(3, 1) < ScalarFactor::ee(1, 2));
        REQUIRE(ScalarFactor::pe(1, 3) < ScalarFactor::pe(2, 1));
        REQUIRE(ScalarFactor::ee(1, 2) == ScalarFactor::ee(1, 2));
    }

    SECTION("Textual form") {
        REQUIRE(ScalarFactor::pp(1, 2).to_string() == "(p1·p2)");
        REQUIRE(ScalarFactor::pe(3, 1).to_string() == "(p3·e1)");
        REQUIRE(ScalarFactor::ee(2, 4).to_string() == "(e2·e4)");
        REQUIRE(std::string(to_string(ScalarKind::PE)) == "PE");
    }

    SECTION("Polarization/momentum leg visitors") {
        std::vector<int> pol, mom;
        auto push_pol = [&](LegIndex l) { pol.push_back(l); };
        auto push_mom = [&](LegIndex l) { mom.push_back(l); };

        for_each_polarization_leg(ScalarFactor::pp(1, 2), push_pol);
        REQUIRE(pol.empty());
        for_each_polarization_leg(ScalarFactor::pe(1, 3), push_pol);
        REQUIRE(pol == std::vector<int>({3}));
        for_each_polarization_leg(ScalarFactor::ee(2, 4), push_pol);
        REQUIRE(pol == std::vector<int>({3, 2, 4}));

        for_each_momentum_leg(ScalarFactor::pp(1, 2), push_mom);
        for_each_momentum_leg(ScalarFactor::pe(3, 1), push_mom);
        for_each_momentum_leg(ScalarFactor::ee(1, 2), push_mom);
        REQUIRE(mom == std::vector<int>({1, 2, 3}));

        REQUIRE(n_polarizations(ScalarKind::PP) == 0);
        REQUIRE(n_polarizations(ScalarKind::EE) == 2);
    }
}

// -----------------------------------------------------------------------------
// Catalog shape
// -----------------------------------------------------------------------------
TEST_CASE("FactorCatalog: 4 legs, transverse", "[catalog]") {
    const auto cat = FactorCatalog::build(make_cfg(4));
    const auto c = cat.counts();

    // PP = C(3,2), PE = 3·3 - 1 (p1·e4 eliminated), EE = C(4,2)
    REQUIRE(c.num_pp == 3);
    REQUIRE(c.num_pe == 8);
    REQUIRE(c.num_ee == 6);
    REQUIRE(cat.size() == 17);
    REQUIRE(cat.pe_begin() == 3);
    REQUIRE(cat.ee_begin() == 11);

    SECTION("Blocks are PP | PE | EE, each ascending") {
        REQUIRE(cat[0] == ScalarFactor::pp(1, 2));
        REQUIRE(cat[2] == ScalarFactor::pp(2, 3));
        REQUIRE(cat[3] == ScalarFactor::pe(1, 2));
        REQUIRE(cat[10] == ScalarFactor::pe(3, 4));
        REQUIRE(cat[11] == ScalarFactor::ee(1, 2));
        REQUIRE(cat[16] == ScalarFactor::ee(3, 4));
        REQUIRE(std::is_sorted(cat.begin(), cat.end()));
        REQUIRE(std::adjacent_find(cat.begin(), cat.end()) == cat.end());
    }

    SECTION("Elimination: p4 never appears as momentum") {
        for (const auto& f : cat) {
            for_each_momentum_leg(f, [](LegIndex l) { REQUIRE(l != 4); });
        }
    }

    SECTION("Transversality: no p_i·e_i, and p1·e4 dropped") {
        for (const auto& f : cat) {
            if (f.kind == ScalarKind::PE) REQUIRE(f.a != f.b);
        }
        REQUIRE_FALSE(contains(cat, ScalarFactor::pe(1, 4)));
        REQUIRE(contains(cat, ScalarFactor::pe(2, 4)));
        REQUIRE(contains(cat, ScalarFactor::pe(3, 4)));
    }
}

TEST_CASE("FactorCatalog: transversality allowed", "[catalog]") {
    const auto cat = FactorCatalog::build(
        make_cfg(4, Transversality::Allow, PolarizationPattern::Unconstrained));
    const auto c = cat.counts();

    REQUIRE(c.num_pp == 3);
    REQUIRE(c.num_pe == 12);
    REQUIRE(c.num_ee == 6);
    REQUIRE(contains(cat, ScalarFactor::pe(2, 2)));
    REQUIRE(contains(cat, ScalarFactor::pe(1, 4)));
    REQUIRE_FALSE(contains(cat, ScalarFactor::pe(4, 1)));
}

TEST_CASE("FactorCatalog: closed-form counts agree with construction", "[catalog]") {
    for (int n = 1; n <= 8; ++n) {
        for (auto t : {Transversality::Allow, Transversality::ForbidPiDotEi}) {
            const auto cfg = make_cfg(n, t);
            const auto built = FactorCatalog::build(cfg).counts();
            const auto closed = count_valid_factors(cfg);
            REQUIRE(built.num_pp == closed.num_pp);
            REQUIRE(built.num_pe == closed.num_pe);
            REQUIRE(built.num_ee == closed.num_ee);
        }
    }

    SECTION("Small leg counts") {
        REQUIRE(FactorCatalog::build(make_cfg(1)).size() == 0);
        // n=2 transverse: p1·e1 and p1·e2 both removed, only (e1·e2) left
        const auto cat2 = FactorCatalog::build(make_cfg(2));
        REQUIRE(cat2.size() == 1);
        REQUIRE(cat2[0] == ScalarFactor::ee(1, 2));
        REQUIRE(FactorCatalog::build(make_cfg(3)).size() == 7);
        REQUIRE(FactorCatalog::build(make_cfg(5)).size() == 31);
    }
}

TEST_CASE("FactorCatalog: invalid leg count", "[catalog][errors]") {
    REQUIRE_THROWS_AS(FactorCatalog::build(make_cfg(0)), ConfigError);
    REQUIRE_THROWS_AS(FactorCatalog::build(make_cfg(-2)), ConfigError);
    REQUIRE_THROWS_AS(count_valid_factors(make_cfg(0)), ConfigError);
    REQUIRE_THROWS_AS(FactorCatalog::build(make_cfg(256)), std::invalid_argument);
}

TEST_CASE("FactorCatalog: deterministic construction", "[catalog]") {
    const auto a = FactorCatalog::build(make_cfg(6));
    const auto b = FactorCatalog::build(make_cfg(6));
    REQUIRE(std::equal(a.begin(), a.end(), b.begin(), b.end()));
    REQUIRE(a.config() == make_cfg(6));
}

// -----------------------------------------------------------------------------
// TensorStructure & StructureSet
// -----------------------------------------------------------------------------
TEST_CASE("TensorStructure: canonical form & rendering", "[structure]") {
    const TensorStructure ts({ScalarFactor::ee(3, 4), ScalarFactor::pe(2, 1),
                              ScalarFactor::pp(1, 2)});
    REQUIRE(ts.ee_contractions == 1);
    REQUIRE(ts.degree() == 3);

    const auto c = canonicalize(ts);
    REQUIRE(c.factors.front() == ScalarFactor::pp(1, 2));
    REQUIRE(c.factors.back() == ScalarFactor::ee(3, 4));
    REQUIRE(c.to_string() == "(p1·p2) · (p2·e1) · (e3·e4)");
    REQUIRE(canonicalize(c) == c);

    REQUIRE(TensorStructure{}.to_string() == "1");
}

TEST_CASE("StructureSet: idempotent insert & ordered output", "[structure]") {
    const TensorStructure x({ScalarFactor::ee(1, 2), ScalarFactor::ee(3, 4)});
    const TensorStructure y({ScalarFactor::ee(1, 3), ScalarFactor::ee(2, 4)});
    const TensorStructure z({ScalarFactor::pp(1, 2), ScalarFactor::pp(1, 2)});

    StructureSet s;
    REQUIRE(s.insert(y));
    REQUIRE(s.insert(x));
    REQUIRE_FALSE(s.insert(x));
    REQUIRE(s.size() == 2);
    REQUIRE(s.contains(x));
    REQUIRE_FALSE(s.contains(z));

    SECTION("Merge is a plain union") {
        StructureSet t;
        t.insert(x);
        t.insert(z);
        s.merge(std::move(t));
        REQUIRE(s.size() == 3);

        const auto v = std::move(s).into_vector();
        REQUIRE(v.size() == 3);
        REQUIRE(v[0] == z);  // PP block sorts first
        REQUIRE(v[1] == x);
        REQUIRE(v[2] == y);
    }
}
