/***
 * Name: rbparse::SourceRange
 * Purpose: Half-open byte range (start, length) into a source buffer.
 * Theory of Operation:
 *   Positions are byte offsets; line and column are derived on demand from
 *   the owning SourceBuffer. cover() computes the smallest range containing
 *   two ranges and is what parent nodes use to span their children.
 */
#pragma once

#include <algorithm>
#include <cstdint>

namespace rbparse {

struct SourceRange {
    std::uint32_t start{0};
    std::uint32_t length{0};

    constexpr std::uint32_t end() const { return start + length; }
    constexpr bool empty() const { return length == 0; }

    constexpr bool contains(const SourceRange& other) const {
        return other.start >= start && other.end() <= end();
    }

    static constexpr SourceRange fromBounds(std::uint32_t begin, std::uint32_t endExclusive) {
        return SourceRange{begin, endExclusive >= begin ? endExclusive - begin : 0};
    }

    // Empty ranges act as the identity so epsilon reductions never widen a span.
    static constexpr SourceRange cover(const SourceRange& a, const SourceRange& b) {
        if (a.empty() && a.start == 0) { return b; }
        if (b.empty() && b.start == 0) { return a; }
        return fromBounds(std::min(a.start, b.start), std::max(a.end(), b.end()));
    }

    friend constexpr bool operator==(const SourceRange&, const SourceRange&) = default;
};

} // namespace rbparse
