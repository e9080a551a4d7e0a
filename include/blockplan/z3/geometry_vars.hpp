#pragma once

#include "blockplan/config.hpp"
#include "blockplan/instance_expander.hpp"
#include "blockplan/rule_resolution.hpp"
#include "blockplan/z3/constraint_tracker.hpp"
#include "blockplan/z3/context.hpp"

#include <z3++.h>
#include <cstdint>
#include <string>
#include <vector>

namespace blockplan::z3 {

/// Integer rectangle variables of one instance
struct RectVars {
    ::z3::expr x;
    ::z3::expr y;
    ::z3::expr w;
    ::z3::expr h;

    explicit RectVars(::z3::context& ctx)
        : x(ctx), y(ctx), w(ctx), h(ctx) {}

    RectVars(::z3::expr x_, ::z3::expr y_, ::z3::expr w_, ::z3::expr h_)
        : x(std::move(x_)), y(std::move(y_)), w(std::move(w_)), h(std::move(h_)) {}

    [[nodiscard]] ::z3::expr right() const { return x + w; }
    [[nodiscard]] ::z3::expr top() const { return y + h; }

    /// Doubled center coordinates (2x + w, 2y + h), integral for any size
    [[nodiscard]] ::z3::expr center2x() const { return 2 * x + w; }
    [[nodiscard]] ::z3::expr center2y() const { return 2 * y + h; }
};

/// One door slot: position and active flag
struct DoorSlotVars {
    int slot = 0;
    ::z3::expr x;
    ::z3::expr y;
    ::z3::expr active;

    explicit DoorSlotVars(::z3::context& ctx)
        : x(ctx), y(ctx), active(ctx) {}
};

/// All variables of one room instance plus its resolved bounds
struct InstanceVars {
    size_t instance = 0;                  // position in the InstanceSet
    std::string label;
    const RoomTypeRule* rule = nullptr;   // nullptr for unknown types
    RectVars rect;
    std::vector<DoorSlotVars> doors;
    ResolvedSize size;
    ResolvedEntries entries;
    std::int64_t door_inset = 0;          // half the ADA clear width

    std::int64_t min_width = 1;
    std::int64_t min_height = 1;
    std::int64_t max_width = 1;
    std::int64_t max_height = 1;

    explicit InstanceVars(::z3::context& ctx) : rect(ctx) {}
};

/// Creates bounded rectangle and door variables for every instance.
///
/// Domains: x in [0, W], y in [0, H], w in [1, W], h in [1, H] as
/// definitions; resolved size bounds and x + w <= W, y + h <= H as tracked
/// hard constraints. Throws ConfigurationError when a minimum size exceeds
/// the floor or the maximum, or when an entry minimum exceeds the slot count.
class GeometryAllocator {
public:
    GeometryAllocator(Z3Context& ctx,
                      ConstraintTracker& tracker,
                      ::z3::optimize& opt,
                      const FloorPlate& floor,
                      const LayoutOptions& options);

    [[nodiscard]] std::vector<InstanceVars> allocate(const InstanceSet& instances,
                                                     const LayoutContext& context,
                                                     std::vector<std::string>& notes);

private:
    Z3Context& ctx_;
    ConstraintTracker& tracker_;
    ::z3::optimize& opt_;
    FloorPlate floor_;
    const LayoutOptions& options_;

    void resolve_bounds(InstanceVars& vars,
                        const LayoutContext& context,
                        std::vector<std::string>& notes) const;
    void create_rect(InstanceVars& vars);
    void create_doors(InstanceVars& vars);
};

} // namespace blockplan::z3
