#pragma once

#include <z3++.h>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace blockplan::z3 {

/// Provenance information for a hard constraint
struct ConstraintProvenance {
    /// Rule family, used to group unsat-core conflicts
    enum class Kind {
        FloorBounds,      // Rectangle inside the floor plate
        NonOverlap,       // Rooms must not overlap
        Size,             // Resolved size bounds
        DoorPerimeter,    // Active door on the owner's perimeter
        EntryCount,       // Active door count within bounds
        EntryConnection,  // Entry-from / entry-not-from
        Adjacency,        // Direct adjacency
        Separation,       // Minimum gap
        Distance,         // Near-space, not-within, entry-within, adjacency cap
        Orientation,      // Aspect relation
        Other
    };

    std::string room;           // Instance label the constraint belongs to
    std::string target;         // Other instance or type, when any
    std::string description;    // Human-readable description
    Kind kind = Kind::Other;
    std::optional<::z3::expr> tracking_literal;

    static ConstraintProvenance make(Kind kind,
                                     std::string room,
                                     std::string description,
                                     std::string target = {}) {
        ConstraintProvenance p;
        p.kind = kind;
        p.room = std::move(room);
        p.target = std::move(target);
        p.description = std::move(description);
        return p;
    }
};

[[nodiscard]] const char* constraint_kind_name(ConstraintProvenance::Kind kind) noexcept;

/// Tracks hard constraints for unsat-core analysis.
///
/// Each tracked constraint is asserted as (lit => c); the literals are
/// passed as assumptions to optimize::check so the core names the
/// responsible rules. With tracking disabled constraints are asserted
/// directly.
class ConstraintTracker {
public:
    ConstraintTracker(::z3::context& ctx, bool tracking_enabled = true);

    /// Assert a hard constraint with provenance
    void add_hard(::z3::optimize& opt,
                  const ::z3::expr& constraint,
                  const ConstraintProvenance& provenance);

    /// Assert a defining constraint (auxiliary variable, domain bound).
    /// Never tracked, but included when a model is verified.
    void add_definition(::z3::optimize& opt, const ::z3::expr& constraint);

    /// Extract provenance from an unsat core
    [[nodiscard]] std::vector<ConstraintProvenance> analyze_unsat_core(
        const ::z3::expr_vector& core) const;

    /// Tracking literals to pass as assumptions
    [[nodiscard]] ::z3::expr_vector assumptions() const;

    /// True when the model satisfies every hard and defining constraint added so far
    [[nodiscard]] bool all_hard_satisfied(const ::z3::model& model) const;

    /// Get provenance for a tracking literal
    [[nodiscard]] const ConstraintProvenance* get_provenance(const ::z3::expr& tracking_lit) const;

    /// Get all constraints of a specific kind
    [[nodiscard]] std::vector<ConstraintProvenance> get_by_kind(ConstraintProvenance::Kind kind) const;

    [[nodiscard]] size_t total_constraints() const noexcept {
        return constraints_.size();
    }

    /// Constraints asserted behind a tracking literal
    [[nodiscard]] size_t tracked_constraints() const noexcept {
        return provenance_.size();
    }

    [[nodiscard]] bool tracking_enabled() const noexcept { return tracking_enabled_; }

    /// Clear all tracking state
    void clear();

    /// Diagnostic report of tracked constraints, grouped by kind
    [[nodiscard]] std::string generate_report() const;

private:
    ::z3::context& ctx_;
    bool tracking_enabled_;
    unsigned next_id_ = 0;

    std::vector<ConstraintProvenance> provenance_;
    std::vector<::z3::expr> constraints_;
    std::vector<::z3::expr> tracking_exprs_;

    // Tracking literal name -> index into provenance_
    std::unordered_map<std::string, size_t> name_to_index_;

    [[nodiscard]] std::string make_tracking_name(unsigned id) const;
};

} // namespace blockplan::z3
