#include "blockplan/layout_engine.hpp"
#include "blockplan/log.hpp"
#include "blockplan/z3/layout_model.hpp"

#include <set>

namespace blockplan {

void LayoutOptions::validate() const {
    if (door_slots < 0) {
        throw ConfigurationError("doorSlots must be non-negative");
    }
    if (penalty_scale < 1) {
        throw ConfigurationError("penaltyScale must be at least 1");
    }
    if (tie_break_scale < 0) {
        throw ConfigurationError("tieBreakScale must be non-negative");
    }
    if (default_separation < 0) {
        throw ConfigurationError("defaultSeparation must be non-negative");
    }
    if (min_shared_wall < 1) {
        throw ConfigurationError("minSharedWall must be at least 1");
    }
    if (hidden_clearance < 0) {
        throw ConfigurationError("hiddenClearance must be non-negative");
    }
    if (ideal_size_weight < 0) {
        throw ConfigurationError("idealSizeWeight must be non-negative");
    }
}

LayoutEngine::LayoutEngine(const RuleRegistry& registry, LayoutOptions options)
    : registry_(registry)
    , options_(options) {}

void LayoutEngine::validate_request(const ProjectRequest& request,
                                    const InstanceSet& instances) const {
    if (request.context.treatment_rooms && *request.context.treatment_rooms < 0) {
        throw ConfigurationError("treatmentRooms must be non-negative");
    }
    if (!request.context.layout_mode) {
        return;
    }

    LayoutMode mode = *request.context.layout_mode;
    for (const auto& type : instances.room_types()) {
        const RoomTypeRule* rule = registry_.find(type);
        if (!rule) continue;
        auto it = rule->orientation.by_layout.find(mode);
        if (it != rule->orientation.by_layout.end() && !it->second.allowed) {
            throw ConfigurationError("room type '" + type + "' is not allowed in the " +
                                     layout_mode_name(mode) + " layout");
        }
    }
}

LayoutResult LayoutEngine::solve(const ProjectRequest& request) const {
    std::vector<std::string> notes;

    auto with_notes = [&notes](LayoutResult result) {
        result.notes = std::move(notes);
        return result;
    };

    try {
        options_.validate();
        if (!request.floor.is_valid()) {
            throw ConfigurationError("floor plate must have positive width and height");
        }

        InstanceExpander expander(registry_);
        InstanceSet instances = expander.expand(request.room_counts, notes);
        validate_request(request, instances);

        if (instances.empty()) {
            notes.push_back("no room instances requested");
            log_msg(LogLevel::Info, "Nothing to place");
            LayoutSolution empty;
            empty.floor = request.floor;
            return with_notes(LayoutResult::make_solved(std::move(empty), true,
                                                        std::chrono::milliseconds(0)));
        }

        log_msg(LogLevel::Info, "Placing %zu rooms on a %lldx%lld floor plate",
                instances.size(),
                static_cast<long long>(request.floor.width),
                static_cast<long long>(request.floor.height));

        z3::LayoutModel model(instances, request.floor, request.context, options_);
        model.build(notes);

        z3::SolveOutcome outcome = model.solve();
        if (options_.debug_mode) {
            log_msg(LogLevel::Debug, "%s", model.statistics().summary().c_str());
        }

        switch (outcome.status) {
            case z3::SolveOutcome::Status::Optimal:
            case z3::SolveOutcome::Status::Suboptimal: {
                bool optimal = outcome.status == z3::SolveOutcome::Status::Optimal;
                LayoutSolution solution = model.extract(*outcome.model);
                log_msg(LogLevel::Info, "%s layout: penalty %lld, footprint %lld (%lldms)",
                        optimal ? "Optimal" : "Feasible",
                        static_cast<long long>(solution.penalty_total),
                        static_cast<long long>(solution.footprint),
                        static_cast<long long>(outcome.solve_time.count()));
                return with_notes(LayoutResult::make_solved(std::move(solution), optimal,
                                                            outcome.solve_time));
            }

            case z3::SolveOutcome::Status::Unsat: {
                std::vector<RuleConflict> conflicts;
                std::set<std::string> seen;
                for (const auto& p : outcome.unsat_core) {
                    std::string text = p.room.empty() ? p.description : p.room + ": " + p.description;
                    if (!seen.insert(text).second) continue;
                    conflicts.push_back(RuleConflict{z3::constraint_kind_name(p.kind), text});
                }
                if (conflicts.empty()) {
                    notes.push_back(options_.track_conflicts
                        ? "solver proved infeasibility without a tracked core"
                        : "conflict tracking disabled; no conflict set available");
                }
                log_msg(LogLevel::Warn, "Hard rules cannot all hold (%zu conflicts)",
                        conflicts.size());
                return with_notes(LayoutResult::make_infeasible(std::move(conflicts),
                                                                outcome.solve_time));
            }

            case z3::SolveOutcome::Status::Unknown: {
                LayoutResult result = LayoutResult::make_timeout(outcome.solve_time);
                if (!outcome.error_message.empty()) {
                    notes.push_back("solver stopped: " + outcome.error_message);
                }
                return with_notes(std::move(result));
            }

            case z3::SolveOutcome::Status::Error:
            default:
                return with_notes(LayoutResult::make_error(outcome.error_message));
        }
    } catch (const ConfigurationError& e) {
        log_msg(LogLevel::Error, "Configuration error: %s", e.what());
        return with_notes(LayoutResult::make_configuration_error(e.what()));
    } catch (const ::z3::exception& e) {
        log_msg(LogLevel::Error, "Z3 error: %s", e.msg());
        return with_notes(LayoutResult::make_error(e.msg()));
    }
}

} // namespace blockplan
