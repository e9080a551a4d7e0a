#include "blockplan/z3/geometry_vars.hpp"
#include "blockplan/log.hpp"

#include <algorithm>
#include <map>

namespace blockplan::z3 {

using Kind = ConstraintProvenance::Kind;

GeometryAllocator::GeometryAllocator(Z3Context& ctx,
                                     ConstraintTracker& tracker,
                                     ::z3::optimize& opt,
                                     const FloorPlate& floor,
                                     const LayoutOptions& options)
    : ctx_(ctx)
    , tracker_(tracker)
    , opt_(opt)
    , floor_(floor)
    , options_(options) {}

std::vector<InstanceVars> GeometryAllocator::allocate(const InstanceSet& instances,
                                                      const LayoutContext& context,
                                                      std::vector<std::string>& notes) {
    std::vector<InstanceVars> result;
    result.reserve(instances.size());

    // Bounds are resolved once per room type so notes are not repeated
    std::map<std::string, InstanceVars> resolved;

    for (size_t i = 0; i < instances.size(); ++i) {
        const RoomInstance& inst = instances[i];

        InstanceVars vars(ctx_.ctx());
        vars.instance = i;
        vars.label = inst.label();
        vars.rule = instances.rule_of(i);

        auto it = resolved.find(inst.room_type);
        if (it == resolved.end()) {
            InstanceVars bounds(ctx_.ctx());
            bounds.rule = vars.rule;
            bounds.label = inst.room_type;
            resolve_bounds(bounds, context, notes);
            it = resolved.emplace(inst.room_type, std::move(bounds)).first;
        }
        vars.size = it->second.size;
        vars.entries = it->second.entries;
        vars.door_inset = it->second.door_inset;
        vars.min_width = it->second.min_width;
        vars.min_height = it->second.min_height;
        vars.max_width = it->second.max_width;
        vars.max_height = it->second.max_height;

        create_rect(vars);
        create_doors(vars);
        result.push_back(std::move(vars));
    }

    log_msg(LogLevel::Debug, "[Z3] Allocated %zu rectangles with %d door slots each",
            result.size(), options_.door_slots);
    return result;
}

void GeometryAllocator::resolve_bounds(InstanceVars& vars,
                                       const LayoutContext& context,
                                       std::vector<std::string>& notes) const {
    vars.min_width = 1;
    vars.min_height = 1;
    vars.max_width = floor_.width;
    vars.max_height = floor_.height;

    if (!vars.rule) {
        return;
    }
    const RoomTypeRule& rule = *vars.rule;

    vars.size = resolve_size(rule, context, notes);
    vars.entries = resolve_entries(rule, context, notes);

    if (vars.size.min_width) vars.min_width = std::max<std::int64_t>(1, *vars.size.min_width);
    if (vars.size.min_height) vars.min_height = std::max<std::int64_t>(1, *vars.size.min_height);
    if (vars.size.max_width) vars.max_width = std::min(floor_.width, *vars.size.max_width);
    if (vars.size.max_height) vars.max_height = std::min(floor_.height, *vars.size.max_height);

    if (vars.min_width > floor_.width || vars.min_height > floor_.height) {
        throw ConfigurationError("room type '" + rule.id + "': minimum size " +
                                 std::to_string(vars.min_width) + "x" +
                                 std::to_string(vars.min_height) +
                                 " exceeds the floor plate " +
                                 std::to_string(floor_.width) + "x" +
                                 std::to_string(floor_.height));
    }
    if (vars.min_width > vars.max_width || vars.min_height > vars.max_height) {
        throw ConfigurationError("room type '" + rule.id + "': minimum size " +
                                 std::to_string(vars.min_width) + "x" +
                                 std::to_string(vars.min_height) +
                                 " exceeds maximum " +
                                 std::to_string(vars.max_width) + "x" +
                                 std::to_string(vars.max_height));
    }
    if (vars.entries.min_entries > options_.door_slots) {
        throw ConfigurationError("room type '" + rule.id + "': requires " +
                                 std::to_string(vars.entries.min_entries) +
                                 " entries but only " + std::to_string(options_.door_slots) +
                                 " door slots are available");
    }

    if (rule.ada.min_clear_width) {
        vars.door_inset = *rule.ada.min_clear_width / 2;
    }
}

void GeometryAllocator::create_rect(InstanceVars& vars) {
    const std::string& p = vars.label;
    RectVars& r = vars.rect;
    r.x = ctx_.make_int_var(p + "_x");
    r.y = ctx_.make_int_var(p + "_y");
    r.w = ctx_.make_int_var(p + "_w");
    r.h = ctx_.make_int_var(p + "_h");

    // Domains
    tracker_.add_definition(opt_, r.x >= 0 && r.x <= ctx_.int_val(floor_.width));
    tracker_.add_definition(opt_, r.y >= 0 && r.y <= ctx_.int_val(floor_.height));
    tracker_.add_definition(opt_, r.w >= 1 && r.w <= ctx_.int_val(floor_.width));
    tracker_.add_definition(opt_, r.h >= 1 && r.h <= ctx_.int_val(floor_.height));

    tracker_.add_hard(opt_, r.right() <= ctx_.int_val(floor_.width),
        ConstraintProvenance::make(Kind::FloorBounds, p, p + " within floor width"));
    tracker_.add_hard(opt_, r.top() <= ctx_.int_val(floor_.height),
        ConstraintProvenance::make(Kind::FloorBounds, p, p + " within floor height"));

    if (vars.min_width > 1 || vars.max_width < floor_.width) {
        tracker_.add_hard(opt_,
            r.w >= ctx_.int_val(vars.min_width) && r.w <= ctx_.int_val(vars.max_width),
            ConstraintProvenance::make(Kind::Size, p,
                p + " width in [" + std::to_string(vars.min_width) + ", " +
                std::to_string(vars.max_width) + "]"));
    }
    if (vars.min_height > 1 || vars.max_height < floor_.height) {
        tracker_.add_hard(opt_,
            r.h >= ctx_.int_val(vars.min_height) && r.h <= ctx_.int_val(vars.max_height),
            ConstraintProvenance::make(Kind::Size, p,
                p + " height in [" + std::to_string(vars.min_height) + ", " +
                std::to_string(vars.max_height) + "]"));
    }
}

void GeometryAllocator::create_doors(InstanceVars& vars) {
    auto& ctx = ctx_.ctx();
    for (int s = 0; s < options_.door_slots; ++s) {
        std::string prefix = vars.label + "_door" + std::to_string(s);

        DoorSlotVars door(ctx);
        door.slot = s;
        door.x = ctx_.make_int_var(prefix + "_x");
        door.y = ctx_.make_int_var(prefix + "_y");
        door.active = ctx_.make_bool_var(prefix + "_active");

        // Inactive slots stay bounded but otherwise free
        tracker_.add_definition(opt_, door.x >= 0 && door.x <= ctx_.int_val(floor_.width));
        tracker_.add_definition(opt_, door.y >= 0 && door.y <= ctx_.int_val(floor_.height));

        vars.doors.push_back(std::move(door));
    }
}

} // namespace blockplan::z3
