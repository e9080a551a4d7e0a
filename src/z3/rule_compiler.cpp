#include "blockplan/z3/rule_compiler.hpp"
#include "blockplan/log.hpp"
#include "blockplan/rule_resolution.hpp"

#include <algorithm>

namespace blockplan::z3 {

using Kind = ConstraintProvenance::Kind;

RuleCompiler::RuleCompiler(const CompileContext& cc)
    : cc_(cc) {}

void RuleCompiler::compile() {
    add_base_constraints();

    for (size_t i = 0; i < cc_.vars.size(); ++i) {
        compile_instance(i);
    }

    stats_.penalty_terms = static_cast<unsigned>(cc_.objective.terms().size());
    log_msg(LogLevel::Debug,
            "[Z3] Compiled %u rules (%u skipped): %u hard constraints, %u penalty terms, %u connects",
            stats_.rules_compiled, stats_.rules_skipped, stats_.hard_constraints,
            stats_.penalty_terms, stats_.connects_vars);
}

// ============================================================================
// Base constraints
// ============================================================================

void RuleCompiler::add_base_constraints() {
    auto& vars = cc_.vars;

    // Pairwise non-overlap: one of four separating relations
    for (size_t i = 0; i < vars.size(); ++i) {
        for (size_t j = i + 1; j < vars.size(); ++j) {
            const RectVars& a = vars[i].rect;
            const RectVars& b = vars[j].rect;
            require(a.right() <= b.x || b.right() <= a.x ||
                    a.top() <= b.y || b.top() <= a.y,
                    Kind::NonOverlap, i, vars[j].label,
                    vars[i].label + " does not overlap " + vars[j].label);
        }
    }

    for (size_t i = 0; i < vars.size(); ++i) {
        InstanceVars& iv = vars[i];

        // Active doors lie on the owner's perimeter
        for (const auto& door : iv.doors) {
            require(::z3::implies(door.active, door_on_perimeter(iv, door)),
                    Kind::DoorPerimeter, i, {},
                    iv.label + " door " + std::to_string(door.slot) + " on perimeter");
        }

        // Slots are interchangeable: activate them in order
        for (size_t s = 1; s < iv.doors.size(); ++s) {
            cc_.tracker.add_definition(cc_.opt,
                ::z3::implies(iv.doors[s].active, iv.doors[s - 1].active));
        }

        if (!iv.rule || iv.doors.empty()) {
            continue;
        }

        ::z3::expr_vector flags(cc_.ctx.ctx());
        for (const auto& door : iv.doors) {
            flags.push_back(::z3::ite(door.active, cc_.ctx.int_val(1), cc_.ctx.int_val(0)));
        }
        ::z3::expr count = cc_.ctx.sum(flags);

        if (iv.entries.min_entries > 0) {
            require(count >= cc_.ctx.int_val(iv.entries.min_entries), Kind::EntryCount, i, {},
                    iv.label + " has at least " + std::to_string(iv.entries.min_entries) +
                    " entries");
        }
        if (iv.entries.max_entries) {
            require(count <= cc_.ctx.int_val(*iv.entries.max_entries), Kind::EntryCount, i, {},
                    iv.label + " has at most " + std::to_string(*iv.entries.max_entries) +
                    " entries");
        }
    }

    // Same-type instances are interchangeable: order them by x
    if (cc_.options.break_symmetry) {
        for (const auto& type : cc_.instances.room_types()) {
            const auto& members = cc_.instances.of_type(type);
            for (size_t k = 1; k < members.size(); ++k) {
                cc_.tracker.add_definition(cc_.opt,
                    vars[members[k - 1]].rect.x <= vars[members[k]].rect.x);
            }
        }
    }
}

::z3::expr RuleCompiler::door_on_perimeter(const InstanceVars& owner,
                                           const DoorSlotVars& door) const {
    const RectVars& r = owner.rect;
    ::z3::expr k = cc_.ctx.int_val(owner.door_inset);

    ::z3::expr on_vertical = (door.x == r.x || door.x == r.right()) &&
                             door.y >= r.y + k && door.y <= r.top() - k;
    ::z3::expr on_horizontal = (door.y == r.y || door.y == r.top()) &&
                               door.x >= r.x + k && door.x <= r.right() - k;
    return on_vertical || on_horizontal;
}

::z3::expr RuleCompiler::door_on_shared_boundary(const InstanceVars& owner,
                                                 const DoorSlotVars& door,
                                                 const InstanceVars& target) const {
    const RectVars& o = owner.rect;
    const RectVars& t = target.rect;

    // Strictly inside both spans, so the walls share a segment of positive length
    ::z3::expr y_inside = door.y > o.y && door.y < o.top() && door.y > t.y && door.y < t.top();
    ::z3::expr x_inside = door.x > o.x && door.x < o.right() && door.x > t.x && door.x < t.right();

    return (door.x == o.right() && o.right() == t.x && y_inside) ||
           (door.x == o.x && o.x == t.right() && y_inside) ||
           (door.y == o.top() && o.top() == t.y && x_inside) ||
           (door.y == o.y && o.y == t.top() && x_inside);
}

::z3::expr RuleCompiler::connects(size_t owner, size_t slot, size_t target) {
    auto key = std::make_tuple(owner, slot, target);
    auto it = connects_.find(key);
    if (it != connects_.end()) {
        return it->second;
    }

    const InstanceVars& o = cc_.vars[owner];
    const InstanceVars& t = cc_.vars[target];
    const DoorSlotVars& door = o.doors[slot];

    ::z3::expr c = cc_.ctx.make_bool_var("conn_" + o.label + "_d" + std::to_string(slot) +
                                         "_" + t.label);
    cc_.tracker.add_definition(cc_.opt, c == (door.active && door_on_shared_boundary(o, door, t)));

    connects_.emplace(key, c);
    ++stats_.connects_vars;
    return c;
}

// ============================================================================
// Per-instance rules
// ============================================================================

void RuleCompiler::compile_instance(size_t owner) {
    const RoomTypeRule* rule = cc_.vars[owner].rule;
    if (!rule) {
        return;
    }

    compile_ideal_size(owner);
    compile_orientation(owner);

    for (const SpatialRule* r : rule->all_rules()) {
        compile_rule(owner, *r);
    }
}

void RuleCompiler::compile_rule(size_t owner, const SpatialRule& rule) {
    const RuleBase& base = rule_base(rule);
    if (base.unresolved) {
        skip(owner, rule, base.unresolved_reason.empty() ? "parameter is TBD"
                                                         : base.unresolved_reason);
        return;
    }

    unsigned skipped_before = stats_.rules_skipped;

    switch (rule_kind(rule)) {
        case RuleKind::EntryFrom:
            compile_entry_from(owner, rule);
            break;
        case RuleKind::EntryNotFrom: {
            auto targets = targets_of(owner, rule);
            if (!targets.empty()) {
                compile_entry_not_from(owner, base, targets, "entry not from");
            }
            break;
        }
        case RuleKind::EntryNotFromRoomInterior: {
            std::vector<size_t> targets;
            for (size_t t = 0; t < cc_.vars.size(); ++t) {
                const RoomTypeRule* tr = cc_.vars[t].rule;
                if (t != owner && tr && tr->role == CirculationRole::Destination) {
                    targets.push_back(t);
                }
            }
            compile_entry_not_from(owner, base, targets, "entry not from room interior");
            break;
        }
        case RuleKind::EntryWithinDistance:
            compile_entry_within(owner, rule);
            break;
        case RuleKind::DirectAdjacency:
            compile_direct_adjacency(owner, rule);
            break;
        case RuleKind::PreferredAdjacency:
            compile_preferred_adjacency(owner, rule);
            break;
        case RuleKind::Separation:
            compile_separation(owner, rule);
            break;
        case RuleKind::NearSpace:
            compile_near_space(owner, rule);
            break;
        case RuleKind::NotWithinDistance:
            compile_not_within(owner, rule);
            break;
        case RuleKind::PreferNearCenter:
            compile_near_center(owner, rule);
            break;
        case RuleKind::Visibility:
            compile_visibility(owner, rule);
            break;
    }

    if (stats_.rules_skipped == skipped_before) {
        ++stats_.rules_compiled;
    }
}

void RuleCompiler::compile_entry_from(size_t owner, const SpatialRule& wrapped) {
    const auto& rule = std::get<EntryFromRule>(wrapped);
    auto targets = targets_of(owner, wrapped);
    if (targets.empty()) {
        return;
    }

    InstanceVars& o = cc_.vars[owner];
    if (o.doors.empty()) {
        skip(owner, wrapped, "no door slots");
        return;
    }

    auto any_connection = [&](const std::vector<size_t>& to) {
        ::z3::expr_vector options(cc_.ctx.ctx());
        for (size_t t : to) {
            for (size_t s = 0; s < o.doors.size(); ++s) {
                options.push_back(connects(owner, s, t));
            }
        }
        return ::z3::mk_or(options);
    };

    std::string from = targets_display(rule);
    if (effective_match(wrapped) == TargetMatch::Any) {
        ::z3::expr ok = any_connection(targets);
        std::string desc = o.label + " entered from " + from;
        if (rule.hard) {
            require(ok, Kind::EntryConnection, owner, from, desc);
        } else {
            cc_.objective.add_flag_penalty(!ok, rule.weight, desc);
        }
        return;
    }

    for (size_t t : targets) {
        ::z3::expr ok = any_connection({t});
        std::string desc = o.label + " entered from " + cc_.vars[t].label;
        if (rule.hard) {
            require(ok, Kind::EntryConnection, owner, cc_.vars[t].label, desc);
        } else {
            cc_.objective.add_flag_penalty(!ok, rule.weight, desc);
        }
    }
}

void RuleCompiler::compile_entry_not_from(size_t owner, const RuleBase& rule,
                                          const std::vector<size_t>& targets, const char* kind) {
    InstanceVars& o = cc_.vars[owner];
    ::z3::expr_vector flags(cc_.ctx.ctx());

    for (size_t t : targets) {
        for (size_t s = 0; s < o.doors.size(); ++s) {
            ::z3::expr c = connects(owner, s, t);
            if (rule.hard) {
                require(!c, Kind::EntryConnection, owner, cc_.vars[t].label,
                        o.label + " door " + std::to_string(s) + " " + kind + " " +
                        cc_.vars[t].label);
            } else {
                flags.push_back(::z3::ite(c, cc_.ctx.int_val(1), cc_.ctx.int_val(0)));
            }
        }
    }

    if (!rule.hard && !flags.empty()) {
        cc_.objective.add_penalty(cc_.ctx.sum(flags), rule.weight,
                                  o.label + " " + kind + " " + targets_display(rule));
    }
}

void RuleCompiler::compile_entry_within(size_t owner, const SpatialRule& wrapped) {
    const auto& rule = std::get<EntryWithinDistanceRule>(wrapped);
    if (!rule.max_distance) {
        skip(owner, wrapped, "no distance given");
        return;
    }
    auto targets = targets_of(owner, wrapped);
    if (targets.empty()) {
        return;
    }
    gap_at_most(owner, rule, effective_match(wrapped), targets, *rule.max_distance,
                Kind::Distance, "entry within");
}

void RuleCompiler::compile_direct_adjacency(size_t owner, const SpatialRule& wrapped) {
    const auto& rule = std::get<DirectAdjacencyRule>(wrapped);
    auto targets = targets_of(owner, wrapped);
    if (targets.empty()) {
        return;
    }

    InstanceVars& o = cc_.vars[owner];
    std::int64_t min_shared = std::max<std::int64_t>(1, cc_.options.min_shared_wall);

    auto touching = [&](size_t t) {
        ::z3::expr g = cc_.distance.gap(o, cc_.vars[t]);
        return g == 0 && cc_.distance.shares_boundary(o.rect, cc_.vars[t].rect, min_shared);
    };

    if (effective_match(wrapped) == TargetMatch::Any) {
        ::z3::expr_vector options(cc_.ctx.ctx());
        for (size_t t : targets) options.push_back(touching(t));
        ::z3::expr ok = ::z3::mk_or(options);
        std::string desc = o.label + " directly adjacent to one of " + targets_display(rule);
        if (rule.hard) {
            require(ok, Kind::Adjacency, owner, targets_display(rule), desc);
        } else {
            cc_.objective.add_flag_penalty(!ok, rule.weight, desc);
        }
        return;
    }

    // A hard pair listed from both sides is asserted once; soft rules
    // always contribute their own weight
    for (size_t t : targets) {
        std::string desc = o.label + " directly adjacent to " + cc_.vars[t].label;
        if (!rule.hard) {
            cc_.objective.add_flag_penalty(!touching(t), rule.weight, desc);
            continue;
        }
        auto pair = std::minmax(owner, t);
        if (hard_adjacency_pairs_.insert({pair.first, pair.second}).second) {
            require(touching(t), Kind::Adjacency, owner, cc_.vars[t].label, desc);
        }
    }
}

void RuleCompiler::compile_preferred_adjacency(size_t owner, const SpatialRule& wrapped) {
    const auto& rule = std::get<PreferredAdjacencyRule>(wrapped);
    auto targets = targets_of(owner, wrapped);
    if (targets.empty()) {
        return;
    }

    InstanceVars& o = cc_.vars[owner];
    TargetMatch match = effective_match(wrapped);

    std::vector<::z3::expr> gaps;
    for (size_t t : targets) {
        gaps.push_back(cc_.distance.gap(o, cc_.vars[t]));
    }

    if (match == TargetMatch::Any) {
        cc_.objective.add_penalty_any(gaps, rule.weight,
                                      o.label + " near " + targets_display(rule));
    } else {
        for (size_t k = 0; k < targets.size(); ++k) {
            cc_.objective.add_penalty(gaps[k], rule.weight,
                                      o.label + " near " + cc_.vars[targets[k]].label);
        }
    }

    if (rule.max_distance) {
        RuleBase capped = rule;
        capped.hard = true;
        gap_at_most(owner, capped, match, targets, *rule.max_distance,
                    Kind::Distance, "preferred adjacency within");
    }
}

void RuleCompiler::compile_separation(size_t owner, const SpatialRule& wrapped) {
    const auto& rule = std::get<SeparationRule>(wrapped);
    auto targets = targets_of(owner, wrapped);
    if (targets.empty()) {
        return;
    }
    std::int64_t distance = rule.min_distance.value_or(cc_.options.default_separation);
    gap_at_least(owner, rule, effective_match(wrapped), targets, distance,
                 Kind::Separation, "separated by at least");
}

void RuleCompiler::compile_near_space(size_t owner, const SpatialRule& wrapped) {
    const auto& rule = std::get<NearSpaceRule>(wrapped);
    auto targets = targets_of(owner, wrapped);
    if (targets.empty()) {
        return;
    }
    gap_at_most(owner, rule, effective_match(wrapped), targets, rule.max_distance,
                Kind::Distance, "within");
}

void RuleCompiler::compile_not_within(size_t owner, const SpatialRule& wrapped) {
    const auto& rule = std::get<NotWithinDistanceRule>(wrapped);
    auto targets = targets_of(owner, wrapped);
    if (targets.empty()) {
        return;
    }
    gap_at_least(owner, rule, effective_match(wrapped), targets, rule.min_distance,
                 Kind::Distance, "not within");
}

void RuleCompiler::compile_near_center(size_t owner, const SpatialRule& wrapped) {
    const auto& rule = std::get<PreferNearCenterRule>(wrapped);
    InstanceVars& o = cc_.vars[owner];

    auto others = [&](const std::string& type) {
        std::vector<size_t> out;
        if (type.empty()) return out;
        for (size_t i : cc_.instances.of_type(type)) {
            if (i != owner) out.push_back(i);
        }
        return out;
    };

    std::vector<size_t> refs = others(rule.reference_type);
    std::string used = rule.reference_type;
    if (refs.empty()) {
        refs = others(rule.fallback_type);
        used = rule.fallback_type;
        if (!refs.empty()) {
            note("room type '" + room_of(owner) + "': no '" + rule.reference_type +
                 "' instances, centering on '" + rule.fallback_type + "' instead");
        }
    }
    if (refs.empty()) {
        skip(owner, wrapped, "no reference or fallback instances");
        return;
    }
    if (rule.hard) {
        note("room type '" + room_of(owner) + "': preferNearCenter is always soft");
    }

    // N * own doubled center against the sum of N reference doubled centers
    std::int64_t n = static_cast<std::int64_t>(refs.size());
    ::z3::expr_vector sx(cc_.ctx.ctx());
    ::z3::expr_vector sy(cc_.ctx.ctx());
    for (size_t r : refs) {
        sx.push_back(cc_.vars[r].rect.center2x());
        sy.push_back(cc_.vars[r].rect.center2y());
    }
    ::z3::expr nx = cc_.ctx.int_val(n) * o.rect.center2x();
    ::z3::expr ny = cc_.ctx.int_val(n) * o.rect.center2y();

    std::string name = "center_" + o.label;
    ::z3::expr scaled = cc_.distance.point_distance(nx, ny, cc_.ctx.sum(sx), cc_.ctx.sum(sy), name);

    // Back to inches: 2N * d >= scaled distance
    ::z3::expr d = cc_.ctx.make_int_var(name + "_in");
    cc_.tracker.add_definition(cc_.opt, d >= 0);
    cc_.tracker.add_definition(cc_.opt, cc_.ctx.int_val(2 * n) * d >= scaled);

    cc_.objective.add_penalty(d, rule.weight, o.label + " near the center of " + used);
}

void RuleCompiler::compile_visibility(size_t owner, const SpatialRule& wrapped) {
    const auto& rule = std::get<VisibilityRule>(wrapped);
    auto targets = targets_of(owner, wrapped);
    if (targets.empty()) {
        return;
    }
    if (rule.hard) {
        note("room type '" + room_of(owner) + "': " + rule_kind_name(wrapped) +
             " has no sightline geometry, applied as a preference");
    }

    InstanceVars& o = cc_.vars[owner];
    ::z3::expr clearance = cc_.ctx.int_val(cc_.options.hidden_clearance);

    std::vector<::z3::expr> violations;
    for (size_t t : targets) {
        ::z3::expr g = cc_.distance.gap(o, cc_.vars[t]);
        violations.push_back(rule.required ? g : clearance - g);
    }

    const char* what = rule.required ? " visible from " : " hidden from ";
    if (effective_match(wrapped) == TargetMatch::Any) {
        cc_.objective.add_penalty_any(violations, rule.weight,
                                      o.label + what + targets_display(rule));
    } else {
        for (size_t k = 0; k < targets.size(); ++k) {
            cc_.objective.add_penalty(violations[k], rule.weight,
                                      o.label + what + cc_.vars[targets[k]].label);
        }
    }
}

void RuleCompiler::compile_orientation(size_t owner) {
    InstanceVars& o = cc_.vars[owner];
    const RoomTypeRule& rule = *o.rule;

    if (rule.orientation.unresolved) {
        note("room type '" + rule.id + "': orientation is TBD, skipped");
        return;
    }

    auto orientation = resolve_orientation(rule, cc_.layout);
    if (!orientation || !orientation->relation) {
        return;
    }

    bool parallel = *orientation->relation == AxisRelation::Parallel;
    const std::string& ref = orientation->reference;
    ::z3::expr landscape = o.rect.w >= o.rect.h;

    if (is_edge_reference(ref)) {
        bool horizontal_edge = ref == "north" || ref == "south";
        ::z3::expr c = (parallel == horizontal_edge) ? (o.rect.w >= o.rect.h)
                                                     : (o.rect.h >= o.rect.w);
        require(c, Kind::Orientation, owner, ref,
                o.label + (parallel ? " parallel to " : " perpendicular to ") + ref + " edge");
        return;
    }

    std::vector<size_t> refs;
    for (size_t i : cc_.instances.of_type(ref)) {
        if (i != owner) refs.push_back(i);
    }
    if (refs.empty()) {
        note("room type '" + rule.id + "': orientation reference '" + ref +
             "' has no instances, skipped");
        return;
    }

    for (size_t r : refs) {
        const RectVars& rr = cc_.vars[r].rect;
        ::z3::expr ref_landscape = rr.w >= rr.h;
        ::z3::expr c = parallel ? (landscape == ref_landscape) : (landscape != ref_landscape);
        require(c, Kind::Orientation, owner, cc_.vars[r].label,
                o.label + (parallel ? " parallel to " : " perpendicular to ") + cc_.vars[r].label);
    }
}

void RuleCompiler::compile_ideal_size(size_t owner) {
    InstanceVars& o = cc_.vars[owner];
    int weight = cc_.options.ideal_size_weight;
    if (weight <= 0) {
        return;
    }
    if (o.size.ideal_width) {
        cc_.objective.add_abs_penalty(o.rect.w - cc_.ctx.int_val(*o.size.ideal_width), weight,
                                      o.label + " ideal width " +
                                      std::to_string(*o.size.ideal_width));
    }
    if (o.size.ideal_height) {
        cc_.objective.add_abs_penalty(o.rect.h - cc_.ctx.int_val(*o.size.ideal_height), weight,
                                      o.label + " ideal length " +
                                      std::to_string(*o.size.ideal_height));
    }
}

// ============================================================================
// Shared encodings
// ============================================================================

void RuleCompiler::gap_at_most(size_t owner, const RuleBase& rule, TargetMatch match,
                               const std::vector<size_t>& targets, std::int64_t limit,
                               Kind kind, const char* what) {
    InstanceVars& o = cc_.vars[owner];
    ::z3::expr d = cc_.ctx.int_val(limit);
    std::string suffix = std::string(" ") + what + " " + std::to_string(limit) + " of ";

    std::vector<::z3::expr> gaps;
    for (size_t t : targets) {
        gaps.push_back(cc_.distance.gap(o, cc_.vars[t]));
    }

    if (match == TargetMatch::Any) {
        std::string desc = o.label + suffix + "one of " + targets_display(rule);
        if (rule.hard) {
            ::z3::expr_vector options(cc_.ctx.ctx());
            for (const auto& g : gaps) options.push_back(g <= d);
            require(::z3::mk_or(options), kind, owner, targets_display(rule), desc);
        } else {
            std::vector<::z3::expr> excess;
            for (const auto& g : gaps) excess.push_back(g - d);
            cc_.objective.add_penalty_any(excess, rule.weight, desc);
        }
        return;
    }

    for (size_t k = 0; k < targets.size(); ++k) {
        const std::string& tl = cc_.vars[targets[k]].label;
        if (rule.hard) {
            require(gaps[k] <= d, kind, owner, tl, o.label + suffix + tl);
        } else {
            cc_.objective.add_penalty(gaps[k] - d, rule.weight, o.label + suffix + tl);
        }
    }
}

void RuleCompiler::gap_at_least(size_t owner, const RuleBase& rule, TargetMatch match,
                                const std::vector<size_t>& targets, std::int64_t limit,
                                Kind kind, const char* what) {
    InstanceVars& o = cc_.vars[owner];
    ::z3::expr d = cc_.ctx.int_val(limit);
    std::string suffix = std::string(" ") + what + " " + std::to_string(limit) + " from ";

    std::vector<::z3::expr> gaps;
    for (size_t t : targets) {
        gaps.push_back(cc_.distance.gap(o, cc_.vars[t]));
    }

    if (match == TargetMatch::Any) {
        std::string desc = o.label + suffix + "one of " + targets_display(rule);
        if (rule.hard) {
            ::z3::expr_vector options(cc_.ctx.ctx());
            for (const auto& g : gaps) options.push_back(g >= d);
            require(::z3::mk_or(options), kind, owner, targets_display(rule), desc);
        } else {
            std::vector<::z3::expr> shortfall;
            for (const auto& g : gaps) shortfall.push_back(d - g);
            cc_.objective.add_penalty_any(shortfall, rule.weight, desc);
        }
        return;
    }

    for (size_t k = 0; k < targets.size(); ++k) {
        const std::string& tl = cc_.vars[targets[k]].label;
        if (rule.hard) {
            require(gaps[k] >= d, kind, owner, tl, o.label + suffix + tl);
        } else {
            cc_.objective.add_penalty(d - gaps[k], rule.weight, o.label + suffix + tl);
        }
    }
}

void RuleCompiler::require(const ::z3::expr& constraint, Kind kind,
                           size_t owner, const std::string& target,
                           const std::string& description) {
    cc_.tracker.add_hard(cc_.opt, constraint,
        ConstraintProvenance::make(kind, cc_.vars[owner].label, description, target));
    ++stats_.hard_constraints;
}

std::vector<size_t> RuleCompiler::targets_of(size_t owner, const SpatialRule& rule) {
    const RuleBase& base = rule_base(rule);
    if (base.targets.empty()) {
        skip(owner, rule, "no targets");
        return {};
    }
    auto targets = cc_.instances.resolve_targets(base.targets, owner);
    if (targets.empty()) {
        skip(owner, rule, "targets " + targets_display(base) + " have no instances");
    }
    return targets;
}

std::string RuleCompiler::room_of(size_t owner) const {
    return cc_.instances[owner].room_type;
}

std::string RuleCompiler::targets_display(const RuleBase& rule) const {
    std::string out;
    for (const auto& t : rule.targets) {
        if (!out.empty()) out += ", ";
        out += t.display();
    }
    return out.empty() ? "(none)" : out;
}

void RuleCompiler::note(const std::string& message) {
    if (!noted_.insert(message).second) {
        return;
    }
    log_msg(LogLevel::Info, "%s", message.c_str());
    cc_.notes.push_back(message);
}

void RuleCompiler::skip(size_t owner, const SpatialRule& rule, const std::string& reason) {
    ++stats_.rules_skipped;
    note("room type '" + room_of(owner) + "': " + rule_kind_name(rule) +
         " rule skipped, " + reason);
}

} // namespace blockplan::z3
