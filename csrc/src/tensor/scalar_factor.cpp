// Copyright 2025 The TreeAmps Authors - All rights reserved.
// SPDX-License-Identifier: Apache-2.0

/**
 * @file scalar_factor.cpp
 * @brief Textual rendering of scalar factors.
 */

#include <treeamps/tensor/scalar_factor.hpp>

namespace treeamps {

std::string ScalarFactor::to_string() const {
    const std::string sa = std::to_string(static_cast<int>(a));
    const std::string sb = std::to_string(static_cast<int>(b));
    switch (kind) {
        case ScalarKind::PP: return "(p" + sa + "·p" + sb + ")";
        case ScalarKind::PE: return "(p" + sa + "·e" + sb + ")";
        case ScalarKind::EE: return "(e" + sa + "·e" + sb + ")";
    }
    return {};
}

const char* to_string(ScalarKind k) noexcept {
    switch (k) {
        case ScalarKind::PP: return "PP";
        case ScalarKind::PE: return "PE";
        case ScalarKind::EE: return "EE";
    }
    return "?";
}

} // namespace treeamps
