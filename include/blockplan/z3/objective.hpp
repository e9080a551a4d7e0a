#pragma once

#include "blockplan/config.hpp"
#include "blockplan/z3/constraint_tracker.hpp"
#include "blockplan/z3/context.hpp"
#include "blockplan/z3/geometry_vars.hpp"

#include <z3++.h>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace blockplan::z3 {

/// Non-negative slack bound to a violation measure of one soft rule
struct PenaltyTerm {
    ::z3::expr slack;
    int weight = 1;
    std::string description;

    PenaltyTerm(::z3::expr s, int w, std::string desc)
        : slack(std::move(s)), weight(w), description(std::move(desc)) {}
};

/// Collects penalty terms and builds the scalar objective
///
///   S * sum(weight * slack) + T * (sum(width + height) + active doors)
///
/// with T = tie_break_scale and S = max(penalty_scale, T * N * (W + H + slots) + 1),
/// so the tie-break never outweighs one unit of penalty.
class ObjectiveAssembler {
public:
    ObjectiveAssembler(Z3Context& ctx,
                       ConstraintTracker& tracker,
                       ::z3::optimize& opt,
                       const LayoutOptions& options);

    /// slack >= max(0, violation). Returns false when nothing was added (weight 0).
    bool add_penalty(const ::z3::expr& violation, int weight,
                     const std::string& description);

    /// One slack satisfied by the smallest violation (any-one-of targets)
    bool add_penalty_any(const std::vector<::z3::expr>& violations, int weight,
                         const std::string& description);

    /// slack >= |diff|
    bool add_abs_penalty(const ::z3::expr& diff, int weight,
                         const std::string& description);

    /// Penalty 1 when the condition holds
    bool add_flag_penalty(const ::z3::expr& violated, int weight,
                          const std::string& description);

    /// Build the objective and hand it to the optimizer
    void assemble(const std::vector<InstanceVars>& instances, const FloorPlate& floor);

    [[nodiscard]] const std::vector<PenaltyTerm>& terms() const noexcept { return terms_; }

    /// sum(weight * slack), unscaled
    [[nodiscard]] ::z3::expr penalty_expr() const;

    /// sum(width + height)
    [[nodiscard]] ::z3::expr footprint_expr() const;

    /// Number of active door slots
    [[nodiscard]] ::z3::expr active_doors_expr() const;

    [[nodiscard]] ::z3::expr objective_expr() const;

    [[nodiscard]] std::int64_t penalty_scale() const noexcept { return penalty_scale_; }
    [[nodiscard]] std::int64_t tie_break_scale() const noexcept { return options_.tie_break_scale; }

    /// Penalty multiplier for N rooms on the given floor
    [[nodiscard]] static std::int64_t effective_penalty_scale(const LayoutOptions& options,
                                                              size_t room_count,
                                                              const FloorPlate& floor) noexcept;

private:
    Z3Context& ctx_;
    ConstraintTracker& tracker_;
    ::z3::optimize& opt_;
    const LayoutOptions& options_;

    std::vector<PenaltyTerm> terms_;
    std::optional<::z3::expr> footprint_;
    std::optional<::z3::expr> active_doors_;
    std::optional<::z3::expr> objective_;
    std::int64_t penalty_scale_ = 0;

    [[nodiscard]] ::z3::expr make_slack();
};

} // namespace blockplan::z3
