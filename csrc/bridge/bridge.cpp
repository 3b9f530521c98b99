// Copyright 2025 The TreeAmps Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file bridge.cpp
 * @brief Python-C++ nanobind bridge for TreeAmps tensor-structure generation.
 *
 * Provides Python bindings for:
 *  - Factor catalog construction and block counts
 *  - Tensor-structure enumeration (pruned, parallel, unpruned reference)
 *  - Reference-count checks and gluon-basis degree inference
 *
 * ConfigError surfaces as ValueError (std::invalid_argument),
 * InvariantViolation as RuntimeError.
 */

#include <nanobind/nanobind.h>
#include <nanobind/operators.h>
#include <nanobind/stl/string.h>
#include <nanobind/stl/vector.h>

#include <treeamps/generator/factor_catalog.hpp>
#include <treeamps/generator/ts_enum.hpp>
#include <treeamps/generator/ts_validate.hpp>
#include <treeamps/tensor/gen_config.hpp>
#include <treeamps/tensor/scalar_factor.hpp>
#include <treeamps/tensor/tensor_structure.hpp>
#include <treeamps/utils/constants.hpp>

#include <stdexcept>
#include <string>
#include <vector>

namespace nb = nanobind;
using namespace nb::literals;

using treeamps::CatalogCounts;
using treeamps::CheckResult;
using treeamps::CrossCheckResult;
using treeamps::FactorCatalog;
using treeamps::GenConfig;
using treeamps::GenOptions;
using treeamps::PolarizationPattern;
using treeamps::ScalarFactor;
using treeamps::ScalarKind;
using treeamps::TensorStructure;
using treeamps::Transversality;

[[nodiscard]] inline Transversality parse_transversality(const std::string& s) {
    if (s == "allow")            return Transversality::Allow;
    if (s == "forbid_pi_dot_ei") return Transversality::ForbidPiDotEi;
    throw std::invalid_argument("invalid transversality: " + s);
}

[[nodiscard]] inline PolarizationPattern parse_pol_pattern(const std::string& s) {
    if (s == "unconstrained") return PolarizationPattern::Unconstrained;
    if (s == "one_per_leg")   return PolarizationPattern::OnePerLeg;
    throw std::invalid_argument("invalid pol_pattern: " + s);
}

[[nodiscard]] inline GenConfig make_config(int n_legs,
                                           const std::string& transversality,
                                           const std::string& pol_pattern) {
    GenConfig cfg{
        .n_legs = n_legs,
        .transversality = parse_transversality(transversality),
        .pol_pattern = parse_pol_pattern(pol_pattern),
    };
    cfg.validate();
    return cfg;
}

[[nodiscard]] inline std::vector<ScalarFactor> to_factor_vector(const FactorCatalog& cat) {
    return {cat.begin(), cat.end()};
}

// Module definition
NB_MODULE(_treeamps_cpp, m) {
    m.doc() = "TreeAmps C++ tensor-structure core";

    m.attr("MAX_LEGS") = treeamps::MAX_LEGS;

    // Enums
    nb::enum_<ScalarKind>(m, "ScalarKind")
        .value("PP", ScalarKind::PP)
        .value("PE", ScalarKind::PE)
        .value("EE", ScalarKind::EE);

    nb::enum_<Transversality>(m, "Transversality")
        .value("Allow", Transversality::Allow)
        .value("ForbidPiDotEi", Transversality::ForbidPiDotEi);

    nb::enum_<PolarizationPattern>(m, "PolarizationPattern")
        .value("Unconstrained", PolarizationPattern::Unconstrained)
        .value("OnePerLeg", PolarizationPattern::OnePerLeg);

    // Value types
    nb::class_<ScalarFactor>(m, "ScalarFactor", "Elementary contraction (kind, a, b)")
        .def_ro("kind", &ScalarFactor::kind)
        .def_ro("a", &ScalarFactor::a)
        .def_ro("b", &ScalarFactor::b)
        .def("__str__", &ScalarFactor::to_string)
        .def("__repr__", [](const ScalarFactor& f) {
            return "ScalarFactor" + f.to_string();
        })
        .def(nb::self == nb::self)
        .def(nb::self < nb::self);

    nb::class_<TensorStructure>(m, "TensorStructure", "Canonical multiset of scalar factors")
        .def_ro("factors", &TensorStructure::factors)
        .def_ro("ee_contractions", &TensorStructure::ee_contractions)
        .def_prop_ro("degree", &TensorStructure::degree)
        .def("__len__", &TensorStructure::degree)
        .def("__str__", &TensorStructure::to_string)
        .def(nb::self == nb::self)
        .def(nb::self < nb::self);

    nb::class_<GenConfig>(m, "GenConfig", "Generation ruleset")
        .def(nb::init<>())
        .def("__init__",
             [](GenConfig* self, int n_legs, const std::string& transversality,
                const std::string& pol_pattern) {
                 new (self) GenConfig(make_config(n_legs, transversality, pol_pattern));
             },
             "n_legs"_a,
             "transversality"_a = "forbid_pi_dot_ei",
             "pol_pattern"_a = "one_per_leg")
        .def_rw("n_legs", &GenConfig::n_legs)
        .def_rw("transversality", &GenConfig::transversality)
        .def_rw("pol_pattern", &GenConfig::pol_pattern)
        .def("validate", &GenConfig::validate);

    nb::class_<CatalogCounts>(m, "CatalogCounts")
        .def_ro("num_pp", &CatalogCounts::num_pp)
        .def_ro("num_pe", &CatalogCounts::num_pe)
        .def_ro("num_ee", &CatalogCounts::num_ee)
        .def_prop_ro("total", &CatalogCounts::total);

    nb::class_<CheckResult>(m, "CheckResult")
        .def_ro("matches", &CheckResult::matches)
        .def_ro("actual_count", &CheckResult::actual_count)
        .def_ro("expected_count", &CheckResult::expected_count);

    nb::class_<CrossCheckResult>(m, "CrossCheckResult")
        .def_ro("matches", &CrossCheckResult::matches)
        .def_ro("pruned_count", &CrossCheckResult::pruned_count)
        .def_ro("unpruned_count", &CrossCheckResult::unpruned_count);

    // Catalog
    m.def("build_catalog",
          [](const GenConfig& cfg) {
              return to_factor_vector(FactorCatalog::build(cfg));
          },
          "cfg"_a,
          "Ordered PP | PE | EE factor catalog.");

    m.def("count_valid_factors", &treeamps::count_valid_factors, "cfg"_a,
          "Catalog block sizes (closed form).");

    // Enumeration
    m.def("generate_tensor_structures",
          [](const GenConfig& cfg, int deg, int ee, int n_threads) {
              const GenOptions opts{.n_threads = n_threads};
              nb::gil_scoped_release release;
              return treeamps::generate_tensor_structures(cfg, deg, ee, opts);
          },
          "cfg"_a, "deg"_a, "ee"_a, "n_threads"_a = 1,
          "Enumerate canonical tensor structures of given degree and EE count.\n"
          "  n_threads=1: serial search\n"
          "  n_threads>1: OpenMP fan-out of the first factor choice\n"
          "  n_threads=0: OpenMP default thread count");

    m.def("enumerate_unpruned",
          [](const GenConfig& cfg, int deg, int ee) {
              const auto cat = FactorCatalog::build(cfg);
              nb::gil_scoped_release release;
              return treeamps::enumerate_unpruned(cat, deg, ee);
          },
          "cfg"_a, "deg"_a, "ee"_a,
          "Brute-force reference enumeration (small n only).");

    // Validation
    m.def("check",
          nb::overload_cast<int, int, int, bool, size_t>(&treeamps::check),
          "n_legs"_a, "deg"_a, "ee"_a, "one_per_leg"_a, "expected_count"_a,
          "Compare generated count against an expected value.");

    m.def("run_builtin_checks",
          []() {
              nb::list out;
              const auto& refs = treeamps::builtin_reference_points();
              const auto results = treeamps::run_builtin_checks();
              for (size_t i = 0; i < refs.size(); ++i) {
                  out.append(nb::make_tuple(refs[i].label, results[i]));
              }
              return out;
          },
          "Run 4-point reference checks; returns [(label, CheckResult)].");

    m.def("cross_check", &treeamps::cross_check, "cfg"_a, "deg"_a, "ee"_a,
          "Compare pruned search against the unpruned reference.");

    m.def("resolve_gluon_degrees",
          [](int n_legs, int deg, int ee) {
              const auto d = treeamps::resolve_gluon_degrees(n_legs, deg, ee);
              return nb::make_tuple(d.degree, d.ee);
          },
          "n_legs"_a, "deg"_a = 0, "ee"_a = 0,
          "Apply deg + ee = n; zero means infer. Returns (deg, ee).");
}
