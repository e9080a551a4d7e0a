#pragma once

#include "blockplan/config.hpp"
#include "blockplan/instance_expander.hpp"
#include "blockplan/rule_registry.hpp"
#include "blockplan/z3/constraint_tracker.hpp"
#include "blockplan/z3/context.hpp"
#include "blockplan/z3/distance.hpp"
#include "blockplan/z3/geometry_vars.hpp"
#include "blockplan/z3/objective.hpp"

#include <z3++.h>
#include <cstdint>
#include <map>
#include <set>
#include <string>
#include <tuple>
#include <vector>

namespace blockplan::z3 {

/// Everything the compiler writes into or reads from during one build
struct CompileContext {
    Z3Context& ctx;
    ConstraintTracker& tracker;
    ::z3::optimize& opt;
    DistanceEncoder& distance;
    ObjectiveAssembler& objective;
    const InstanceSet& instances;
    std::vector<InstanceVars>& vars;
    const FloorPlate& floor;
    const LayoutContext& layout;
    const LayoutOptions& options;
    std::vector<std::string>& notes;
};

/// Counters reported after compilation
struct CompileStatistics {
    unsigned rules_compiled = 0;
    unsigned rules_skipped = 0;
    unsigned hard_constraints = 0;
    unsigned penalty_terms = 0;
    unsigned connects_vars = 0;
};

/// Compiles base geometry constraints and every spatial rule of every
/// instance into hard constraints and penalty terms.
class RuleCompiler {
public:
    explicit RuleCompiler(const CompileContext& cc);

    /// Base constraints, then each instance's rules in instance order
    void compile();

    /// Floor bounds are added by the allocator; this adds non-overlap,
    /// door perimeter, entry counts and symmetry breaking
    void add_base_constraints();

    /// Size preferences, orientation and spatial rules of one instance
    void compile_instance(size_t owner);

    /// One spatial rule owned by an instance
    void compile_rule(size_t owner, const SpatialRule& rule);

    [[nodiscard]] const CompileStatistics& statistics() const noexcept { return stats_; }

    /// connects(owner, slot, target): active door on a shared boundary
    [[nodiscard]] ::z3::expr connects(size_t owner, size_t slot, size_t target);

    /// Door coordinate on the owner's perimeter, inset from the wall ends
    [[nodiscard]] ::z3::expr door_on_perimeter(const InstanceVars& owner,
                                               const DoorSlotVars& door) const;

    /// Door on the boundary segment the owner shares with the target
    [[nodiscard]] ::z3::expr door_on_shared_boundary(const InstanceVars& owner,
                                                     const DoorSlotVars& door,
                                                     const InstanceVars& target) const;

private:
    CompileContext cc_;
    CompileStatistics stats_;

    std::map<std::tuple<size_t, size_t, size_t>, ::z3::expr> connects_;
    std::set<std::pair<size_t, size_t>> hard_adjacency_pairs_;
    std::set<std::string> noted_;

    // Rule kinds
    void compile_entry_from(size_t owner, const SpatialRule& rule);
    void compile_entry_not_from(size_t owner, const RuleBase& rule,
                                const std::vector<size_t>& targets, const char* kind);
    void compile_entry_within(size_t owner, const SpatialRule& rule);
    void compile_direct_adjacency(size_t owner, const SpatialRule& rule);
    void compile_preferred_adjacency(size_t owner, const SpatialRule& rule);
    void compile_separation(size_t owner, const SpatialRule& rule);
    void compile_near_space(size_t owner, const SpatialRule& rule);
    void compile_not_within(size_t owner, const SpatialRule& rule);
    void compile_near_center(size_t owner, const SpatialRule& rule);
    void compile_visibility(size_t owner, const SpatialRule& rule);

    void compile_orientation(size_t owner);
    void compile_ideal_size(size_t owner);

    // Shared encodings
    void gap_at_most(size_t owner, const RuleBase& rule, TargetMatch match,
                     const std::vector<size_t>& targets, std::int64_t limit,
                     ConstraintProvenance::Kind kind, const char* what);
    void gap_at_least(size_t owner, const RuleBase& rule, TargetMatch match,
                      const std::vector<size_t>& targets, std::int64_t limit,
                      ConstraintProvenance::Kind kind, const char* what);
    void require(const ::z3::expr& constraint, ConstraintProvenance::Kind kind,
                 size_t owner, const std::string& target, const std::string& description);

    /// Target instances of a rule; notes and returns empty when there are none
    [[nodiscard]] std::vector<size_t> targets_of(size_t owner, const SpatialRule& rule);

    [[nodiscard]] std::string room_of(size_t owner) const;
    [[nodiscard]] std::string targets_display(const RuleBase& rule) const;

    void note(const std::string& message);
    void skip(size_t owner, const SpatialRule& rule, const std::string& reason);
};

} // namespace blockplan::z3
