// Copyright 2025 The TreeAmps Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

#include <treeamps/tensor/gen_config.hpp>
#include <treeamps/utils/constants.hpp>
#include <treeamps/utils/errors.hpp>

#include <string>

namespace treeamps {

void GenConfig::validate() const {
    if (n_legs <= 0 || n_legs > MAX_LEGS) {
        throw ConfigError(
            "GenConfig: n_legs=" + std::to_string(n_legs) +
            " out of range [1," + std::to_string(MAX_LEGS) + "]");
    }
}

} // namespace treeamps
