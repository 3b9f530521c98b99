// Copyright 2025 The TreeAmps Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file errors.hpp
 * @brief Exception taxonomy of the generation engine.
 *
 *   ConfigError        - invalid caller input, detected before any search
 *   InvariantViolation - documented invariant contradicted at runtime (bug)
 */

#pragma once

#include <stdexcept>
#include <string>

namespace treeamps {

/// Invalid configuration (n_legs, degree, ee count). Recoverable.
class ConfigError : public std::invalid_argument {
public:
    using std::invalid_argument::invalid_argument;
};

/// Internal contradiction of an engine invariant. Never corrected.
class InvariantViolation : public std::logic_error {
public:
    using std::logic_error::logic_error;
};

} // namespace treeamps
