#pragma once

#include "blockplan/config.hpp"
#include "blockplan/instance_expander.hpp"
#include "blockplan/layout_types.hpp"
#include "blockplan/z3/constraint_tracker.hpp"
#include "blockplan/z3/context.hpp"
#include "blockplan/z3/distance.hpp"
#include "blockplan/z3/geometry_vars.hpp"
#include "blockplan/z3/objective.hpp"
#include "blockplan/z3/result.hpp"
#include "blockplan/z3/rule_compiler.hpp"

#include <z3++.h>
#include <chrono>
#include <memory>
#include <string>
#include <vector>

namespace blockplan::z3 {

/// Statistics about one model build and solve
struct ModelStatistics {
    unsigned instances = 0;
    unsigned door_slots = 0;
    unsigned tracked_constraints = 0;
    unsigned penalty_terms = 0;
    unsigned rules_compiled = 0;
    unsigned rules_skipped = 0;

    std::chrono::milliseconds build_time{0};
    std::chrono::milliseconds solve_time{0};

    [[nodiscard]] std::string summary() const;
};

/// One optimization problem: variables, hard constraints and objective
/// for a fixed instance set. Built once, solved once.
class LayoutModel {
public:
    LayoutModel(const InstanceSet& instances,
                const FloorPlate& floor,
                const LayoutContext& context,
                const LayoutOptions& options);

    LayoutModel(const LayoutModel&) = delete;
    LayoutModel& operator=(const LayoutModel&) = delete;

    /// Allocate variables, compile rules and assemble the objective.
    /// Throws ConfigurationError for unsatisfiable variable bounds.
    void build(std::vector<std::string>& notes);

    /// Run optimize::check once with the tracking literals as assumptions
    [[nodiscard]] SolveOutcome solve();

    /// Read rectangles and active doors out of a model
    [[nodiscard]] LayoutSolution extract(const ::z3::model& model) const;

    [[nodiscard]] const ModelStatistics& statistics() const noexcept { return stats_; }
    [[nodiscard]] const ConstraintTracker& tracker() const noexcept { return tracker_; }
    [[nodiscard]] const std::vector<InstanceVars>& vars() const noexcept { return vars_; }
    [[nodiscard]] const ObjectiveAssembler& objective() const noexcept { return objective_; }
    [[nodiscard]] Z3Context& context() noexcept { return ctx_; }

private:
    const InstanceSet& instances_;
    FloorPlate floor_;
    LayoutContext layout_;
    LayoutOptions options_;

    Z3Context ctx_;
    ::z3::optimize opt_;
    ConstraintTracker tracker_;
    DistanceEncoder distance_;
    ObjectiveAssembler objective_;
    std::vector<InstanceVars> vars_;
    std::unique_ptr<RuleCompiler> compiler_;

    ModelStatistics stats_;
    bool built_ = false;
};

/// The room on the other side of a door, if the door sits strictly inside a
/// wall segment shared with it
[[nodiscard]] std::optional<std::string> door_connects_to(const PlacedRoom& owner,
                                                          const DoorPlacement& door,
                                                          const std::vector<PlacedRoom>& rooms);

} // namespace blockplan::z3
