#pragma once

#include "blockplan/z3/constraint_tracker.hpp"
#include "blockplan/z3/context.hpp"
#include "blockplan/z3/geometry_vars.hpp"

#include <z3++.h>
#include <cstdint>
#include <map>
#include <string>
#include <utility>

namespace blockplan::z3 {

/// Manhattan gap between rectangles as the sum of four positive-part
/// components:
///
///   right_of = max(0, x2 - (x1 + w1))    left_of = max(0, x1 - (x2 + w2))
///   above    = max(0, y2 - (y1 + h1))    below   = max(0, y1 - (y2 + h2))
///
/// Each component g satisfies g >= 0, g >= diff and (g == 0 or g == diff),
/// so the value is exact in both directions. The gap is 0 when the
/// rectangles touch or overlap on both axes.
class DistanceEncoder {
public:
    DistanceEncoder(Z3Context& ctx, ConstraintTracker& tracker, ::z3::optimize& opt);

    /// Gap between two instances; cached per unordered pair
    [[nodiscard]] ::z3::expr gap(const InstanceVars& a, const InstanceVars& b);

    /// Gap between two arbitrary rectangles (not cached)
    [[nodiscard]] ::z3::expr rect_gap(const RectVars& a, const RectVars& b, const std::string& name);

    /// Manhattan distance between two points (x1, y1) and (x2, y2).
    /// Uses the same components on degenerate rectangles.
    [[nodiscard]] ::z3::expr point_distance(const ::z3::expr& x1, const ::z3::expr& y1,
                                            const ::z3::expr& x2, const ::z3::expr& y2,
                                            const std::string& name);

    /// a and b share a boundary segment of at least min_shared
    [[nodiscard]] ::z3::expr shares_boundary(const RectVars& a, const RectVars& b,
                                             std::int64_t min_shared) const;

    /// Exact max(0, diff) as a fresh variable
    [[nodiscard]] ::z3::expr positive_part(const ::z3::expr& diff, const std::string& name);

    [[nodiscard]] size_t cached_pairs() const noexcept { return cache_.size(); }

private:
    Z3Context& ctx_;
    ConstraintTracker& tracker_;
    ::z3::optimize& opt_;

    std::map<std::pair<size_t, size_t>, ::z3::expr> cache_;
};

} // namespace blockplan::z3
