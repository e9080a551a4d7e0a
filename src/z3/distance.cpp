#include "blockplan/z3/distance.hpp"

#include <algorithm>

namespace blockplan::z3 {

DistanceEncoder::DistanceEncoder(Z3Context& ctx, ConstraintTracker& tracker, ::z3::optimize& opt)
    : ctx_(ctx)
    , tracker_(tracker)
    , opt_(opt) {}

::z3::expr DistanceEncoder::positive_part(const ::z3::expr& diff, const std::string& name) {
    ::z3::expr g = ctx_.make_int_var(name);
    tracker_.add_definition(opt_, g >= 0);
    tracker_.add_definition(opt_, g >= diff);
    tracker_.add_definition(opt_, g == 0 || g == diff);
    return g;
}

::z3::expr DistanceEncoder::rect_gap(const RectVars& a, const RectVars& b, const std::string& name) {
    ::z3::expr right_of = positive_part(b.x - a.right(), name + "_r");
    ::z3::expr left_of  = positive_part(a.x - b.right(), name + "_l");
    ::z3::expr above    = positive_part(b.y - a.top(), name + "_a");
    ::z3::expr below    = positive_part(a.y - b.top(), name + "_b");
    return right_of + left_of + above + below;
}

::z3::expr DistanceEncoder::gap(const InstanceVars& a, const InstanceVars& b) {
    auto key = std::minmax(a.instance, b.instance);
    auto it = cache_.find({key.first, key.second});
    if (it != cache_.end()) {
        return it->second;
    }

    const InstanceVars& first = a.instance <= b.instance ? a : b;
    const InstanceVars& second = a.instance <= b.instance ? b : a;

    ::z3::expr g = rect_gap(first.rect, second.rect, "gap_" + first.label + "_" + second.label);
    cache_.emplace(std::make_pair(key.first, key.second), g);
    return g;
}

::z3::expr DistanceEncoder::point_distance(const ::z3::expr& x1, const ::z3::expr& y1,
                                           const ::z3::expr& x2, const ::z3::expr& y2,
                                           const std::string& name) {
    ::z3::expr zero = ctx_.int_val(0);
    RectVars p1(x1, y1, zero, zero);
    RectVars p2(x2, y2, zero, zero);
    return rect_gap(p1, p2, name);
}

::z3::expr DistanceEncoder::shares_boundary(const RectVars& a, const RectVars& b,
                                            std::int64_t min_shared) const {
    // Perpendicular span overlap: min(end) - max(start) >= min_shared,
    // written without min/max as four inequalities
    ::z3::expr m = ctx_.int_val(min_shared);
    auto overlap = [&m](const ::z3::expr& s1, const ::z3::expr& e1,
                        const ::z3::expr& s2, const ::z3::expr& e2) {
        return e1 - s1 >= m && e1 - s2 >= m && e2 - s1 >= m && e2 - s2 >= m;
    };

    ::z3::expr y_overlap = overlap(a.y, a.top(), b.y, b.top());
    ::z3::expr x_overlap = overlap(a.x, a.right(), b.x, b.right());

    return (a.right() == b.x && y_overlap) ||
           (b.right() == a.x && y_overlap) ||
           (a.top() == b.y && x_overlap) ||
           (b.top() == a.y && x_overlap);
}

} // namespace blockplan::z3
