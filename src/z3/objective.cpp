#include "blockplan/z3/objective.hpp"
#include "blockplan/log.hpp"

#include <algorithm>

namespace blockplan::z3 {

ObjectiveAssembler::ObjectiveAssembler(Z3Context& ctx,
                                       ConstraintTracker& tracker,
                                       ::z3::optimize& opt,
                                       const LayoutOptions& options)
    : ctx_(ctx)
    , tracker_(tracker)
    , opt_(opt)
    , options_(options)
    , penalty_scale_(options.penalty_scale) {}

::z3::expr ObjectiveAssembler::make_slack() {
    ::z3::expr s = ctx_.make_int_var("penalty_" + std::to_string(terms_.size()));
    tracker_.add_definition(opt_, s >= 0);
    return s;
}

bool ObjectiveAssembler::add_penalty(const ::z3::expr& violation, int weight,
                                     const std::string& description) {
    if (weight <= 0) {
        return false;
    }
    ::z3::expr s = make_slack();
    tracker_.add_definition(opt_, s >= violation);
    terms_.emplace_back(s, weight, description);
    log_msg(LogLevel::Debug, "Penalty (w=%d): %s", weight, description.c_str());
    return true;
}

bool ObjectiveAssembler::add_penalty_any(const std::vector<::z3::expr>& violations,
                                         int weight,
                                         const std::string& description) {
    if (weight <= 0 || violations.empty()) {
        return false;
    }
    if (violations.size() == 1) {
        return add_penalty(violations.front(), weight, description);
    }

    ::z3::expr s = make_slack();
    ::z3::expr_vector choices(ctx_.ctx());
    for (const auto& v : violations) {
        choices.push_back(s >= v);
    }
    tracker_.add_definition(opt_, ::z3::mk_or(choices));
    terms_.emplace_back(s, weight, description);
    log_msg(LogLevel::Debug, "Penalty (w=%d, any of %zu): %s",
            weight, violations.size(), description.c_str());
    return true;
}

bool ObjectiveAssembler::add_abs_penalty(const ::z3::expr& diff, int weight,
                                         const std::string& description) {
    if (weight <= 0) {
        return false;
    }
    ::z3::expr s = make_slack();
    tracker_.add_definition(opt_, s >= diff);
    tracker_.add_definition(opt_, s >= -diff);
    terms_.emplace_back(s, weight, description);
    log_msg(LogLevel::Debug, "Penalty (w=%d, abs): %s", weight, description.c_str());
    return true;
}

bool ObjectiveAssembler::add_flag_penalty(const ::z3::expr& violated, int weight,
                                          const std::string& description) {
    return add_penalty(::z3::ite(violated, ctx_.int_val(1), ctx_.int_val(0)), weight, description);
}

std::int64_t ObjectiveAssembler::effective_penalty_scale(const LayoutOptions& options,
                                                         size_t room_count,
                                                         const FloorPlate& floor) noexcept {
    std::int64_t per_room = floor.width + floor.height + std::max(0, options.door_slots);
    std::int64_t max_tie_break = static_cast<std::int64_t>(room_count) * per_room;
    return std::max(options.penalty_scale, options.tie_break_scale * max_tie_break + 1);
}

void ObjectiveAssembler::assemble(const std::vector<InstanceVars>& instances,
                                  const FloorPlate& floor) {
    ::z3::expr_vector sizes(ctx_.ctx());
    ::z3::expr_vector doors(ctx_.ctx());
    for (const auto& inst : instances) {
        sizes.push_back(inst.rect.w + inst.rect.h);
        for (const auto& door : inst.doors) {
            doors.push_back(::z3::ite(door.active, ctx_.int_val(1), ctx_.int_val(0)));
        }
    }
    footprint_ = ctx_.sum(sizes);
    active_doors_ = ctx_.sum(doors);

    penalty_scale_ = effective_penalty_scale(options_, instances.size(), floor);

    objective_ = ctx_.int_val(penalty_scale_) * penalty_expr() +
                 ctx_.int_val(options_.tie_break_scale) * (*footprint_ + *active_doors_);
    opt_.minimize(*objective_);

    log_msg(LogLevel::Debug, "Objective: %zu penalty terms, penalty scale %lld, tie-break %lld",
            terms_.size(), static_cast<long long>(penalty_scale_),
            static_cast<long long>(options_.tie_break_scale));
}

::z3::expr ObjectiveAssembler::penalty_expr() const {
    ::z3::expr_vector weighted(ctx_.ctx());
    for (const auto& t : terms_) {
        weighted.push_back(ctx_.int_val(t.weight) * t.slack);
    }
    return ctx_.sum(weighted);
}

::z3::expr ObjectiveAssembler::footprint_expr() const {
    return footprint_ ? *footprint_ : ctx_.int_val(0);
}

::z3::expr ObjectiveAssembler::active_doors_expr() const {
    return active_doors_ ? *active_doors_ : ctx_.int_val(0);
}

::z3::expr ObjectiveAssembler::objective_expr() const {
    return objective_ ? *objective_ : ctx_.int_val(0);
}

} // namespace blockplan::z3
