#pragma once

#include <cstddef>
#include "ast/NodeKindList.h"

namespace rbparse::ast {

    enum class NodeKind {
#define RBPARSE_AST_KIND_ENUM(Name) Name,
        RBPARSE_AST_NODE_LIST(RBPARSE_AST_KIND_ENUM)
#undef RBPARSE_AST_KIND_ENUM
    };

#define RBPARSE_AST_KIND_COUNT(Name) +1
    inline constexpr std::size_t kNodeKindCount = 0 RBPARSE_AST_NODE_LIST(RBPARSE_AST_KIND_COUNT);
#undef RBPARSE_AST_KIND_COUNT

    const char* to_string(NodeKind kind);

} // namespace rbparse::ast
