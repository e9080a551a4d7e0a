#include "blockplan/z3/layout_model.hpp"
#include "blockplan/log.hpp"

#include <sstream>

namespace blockplan::z3 {

std::string ModelStatistics::summary() const {
    std::ostringstream out;
    out << "Model Statistics:\n";
    out << "  Instances: " << instances << " (" << door_slots << " door slots)\n";
    out << "  Rules: " << rules_compiled << " compiled, " << rules_skipped << " skipped\n";
    out << "  Constraints: " << tracked_constraints << " tracked, "
        << penalty_terms << " penalty terms\n";
    out << "  Build time: " << build_time.count() << "ms\n";
    out << "  Solve time: " << solve_time.count() << "ms\n";
    return out.str();
}

namespace {
    SolverConfig solver_config_from(const LayoutOptions& options) {
        SolverConfig config;
        config.timeout_ms = options.timeout_ms;
        config.produce_unsat_cores = options.track_conflicts;
        return config;
    }
}

LayoutModel::LayoutModel(const InstanceSet& instances,
                         const FloorPlate& floor,
                         const LayoutContext& context,
                         const LayoutOptions& options)
    : instances_(instances)
    , floor_(floor)
    , layout_(context)
    , options_(options)
    , ctx_(solver_config_from(options))
    , opt_(ctx_.make_optimizer())
    , tracker_(ctx_.ctx(), options.track_conflicts)
    , distance_(ctx_, tracker_, opt_)
    , objective_(ctx_, tracker_, opt_, options_) {}

void LayoutModel::build(std::vector<std::string>& notes) {
    SolveTimer timer;

    GeometryAllocator allocator(ctx_, tracker_, opt_, floor_, options_);
    vars_ = allocator.allocate(instances_, layout_, notes);

    CompileContext cc{ctx_, tracker_, opt_, distance_, objective_, instances_, vars_,
                      floor_, layout_, options_, notes};
    compiler_ = std::make_unique<RuleCompiler>(cc);
    compiler_->compile();

    objective_.assemble(vars_, floor_);

    const auto& cs = compiler_->statistics();
    stats_.instances = static_cast<unsigned>(vars_.size());
    stats_.door_slots = static_cast<unsigned>(vars_.size() * static_cast<size_t>(options_.door_slots));
    stats_.tracked_constraints = static_cast<unsigned>(tracker_.tracked_constraints());
    stats_.penalty_terms = static_cast<unsigned>(objective_.terms().size());
    stats_.rules_compiled = cs.rules_compiled;
    stats_.rules_skipped = cs.rules_skipped;
    stats_.build_time = timer.elapsed();
    built_ = true;

    if (options_.debug_mode) {
        log_msg(LogLevel::Debug, "%s", tracker_.generate_report().c_str());
    }
}

SolveOutcome LayoutModel::solve() {
    if (!built_) {
        return SolveOutcome::make_error("model solved before it was built");
    }

    SolveTimer timer;
    try {
        ::z3::expr_vector assumptions = tracker_.assumptions();
        ::z3::check_result result = assumptions.empty() ? opt_.check() : opt_.check(assumptions);
        stats_.solve_time = timer.elapsed();

        if (result == ::z3::sat) {
            ::z3::model model = opt_.get_model();
            return SolveOutcome::make_optimal(std::move(model), stats_.solve_time);
        }

        if (result == ::z3::unsat) {
            ::z3::expr_vector core = opt_.unsat_core();
            auto provenance = tracker_.analyze_unsat_core(core);
            log_msg(LogLevel::Info, "[Z3] Infeasible: %zu tracked constraints in the core",
                    provenance.size());
            return SolveOutcome::make_unsat(std::move(provenance), stats_.solve_time);
        }

        std::string reason = Z3Context::stop_reason(opt_);
        log_msg(LogLevel::Warn, "[Z3] Search stopped without proof: %s", reason.c_str());

        // The optimizer keeps its best model when interrupted; accept it only
        // if it satisfies every asserted constraint
        try {
            ::z3::model model = opt_.get_model();
            if (tracker_.all_hard_satisfied(model)) {
                return SolveOutcome::make_suboptimal(std::move(model), stats_.solve_time);
            }
        } catch (const ::z3::exception& e) {
            log_msg(LogLevel::Debug, "[Z3] No model after unknown result: %s", e.msg());
        }
        return SolveOutcome::make_unknown(reason, stats_.solve_time);
    } catch (const ::z3::exception& e) {
        stats_.solve_time = timer.elapsed();
        log_msg(LogLevel::Error, "[Z3] Solver error: %s", e.msg());
        return SolveOutcome::make_error(e.msg());
    }
}

LayoutSolution LayoutModel::extract(const ::z3::model& model) const {
    ModelExtractor ex(model);
    LayoutSolution solution;
    solution.floor = floor_;

    for (const auto& iv : vars_) {
        const RoomInstance& inst = instances_[iv.instance];

        PlacedRoom room;
        room.room_type = inst.room_type;
        room.instance_index = inst.index;
        room.x = ex.get_int_or(iv.rect.x, 0);
        room.y = ex.get_int_or(iv.rect.y, 0);
        room.width = ex.get_int_or(iv.rect.w, 0);
        room.height = ex.get_int_or(iv.rect.h, 0);

        for (const auto& door : iv.doors) {
            if (!ex.get_bool_or(door.active, false)) {
                continue;
            }
            DoorPlacement placement;
            placement.slot = door.slot;
            placement.x = ex.get_int_or(door.x, 0);
            placement.y = ex.get_int_or(door.y, 0);
            room.doors.push_back(placement);
        }

        solution.rooms.push_back(std::move(room));
    }

    for (auto& room : solution.rooms) {
        for (auto& door : room.doors) {
            door.connects_to = door_connects_to(room, door, solution.rooms);
        }
    }

    solution.penalty_total = ex.get_int_or(objective_.penalty_expr(), 0);
    solution.footprint = ex.get_int_or(objective_.footprint_expr(), 0);
    solution.objective_value = ex.get_int_or(objective_.objective_expr(), 0);
    return solution;
}

std::optional<std::string> door_connects_to(const PlacedRoom& owner,
                                            const DoorPlacement& door,
                                            const std::vector<PlacedRoom>& rooms) {
    auto inside = [](std::int64_t v, std::int64_t lo, std::int64_t hi) {
        return v > lo && v < hi;
    };

    for (const auto& other : rooms) {
        if (other.room_type == owner.room_type && other.instance_index == owner.instance_index) {
            continue;
        }
        bool y_inside = inside(door.y, owner.y, owner.top()) && inside(door.y, other.y, other.top());
        bool x_inside = inside(door.x, owner.x, owner.right()) && inside(door.x, other.x, other.right());

        if ((door.x == owner.right() && other.x == door.x && y_inside) ||
            (door.x == owner.x && other.right() == door.x && y_inside) ||
            (door.y == owner.top() && other.y == door.y && x_inside) ||
            (door.y == owner.y && other.top() == door.y && x_inside)) {
            return other.label();
        }
    }
    return std::nullopt;
}

} // namespace blockplan::z3
