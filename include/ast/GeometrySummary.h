/**
 * @file
 * @brief AST geometry summary declarations.
 */
#pragma once

#include <cstdint>
#include "ast/Node.h"

namespace rbparse::ast {
    // Node count and maximum depth of a tree; the root sits at depth 1 and gaps are not counted.
    struct GeometrySummary {
        uint64_t nodes{0};
        uint64_t maxDepth{0};
    };

    GeometrySummary ComputeGeometry(const Node& root);

} // namespace rbparse::ast
