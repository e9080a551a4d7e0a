#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

namespace blockplan {

/// Raised for malformed rules, inputs or unsatisfiable variable bounds.
/// Always reported before the solver is invoked.
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// Rectangular floor plate, inches
struct FloorPlate {
    std::int64_t width = 0;
    std::int64_t height = 0;

    [[nodiscard]] bool is_valid() const noexcept { return width > 0 && height > 0; }
};

/// Overall building layout scheme; selects per-layout orientation rules
enum class LayoutMode {
    Narrow,
    ThreeLayerCake,
    HLayout
};

[[nodiscard]] const char* layout_mode_name(LayoutMode mode) noexcept;
[[nodiscard]] std::optional<LayoutMode> parse_layout_mode(std::string_view name) noexcept;

/// Contextual parameters used to resolve tiered rules
struct LayoutContext {
    std::optional<int> treatment_rooms;
    std::optional<LayoutMode> layout_mode;
};

/// One requested copy of a room type
struct RoomInstance {
    std::string room_type;
    int index = 0;

    [[nodiscard]] std::string label() const {
        return room_type + "__" + std::to_string(index);
    }

    bool operator==(const RoomInstance& other) const noexcept {
        return room_type == other.room_type && index == other.index;
    }
};

/// Everything a single solve needs besides the rule registry
struct ProjectRequest {
    FloorPlate floor;
    std::map<std::string, int> room_counts;   // room type -> requested count
    LayoutContext context;
};

// ============================================================================
// Solution
// ============================================================================

struct DoorPlacement {
    int slot = 0;
    std::int64_t x = 0;
    std::int64_t y = 0;
    std::optional<std::string> connects_to;   // instance label of the room on the other side
};

struct PlacedRoom {
    std::string room_type;
    int instance_index = 0;
    std::int64_t x = 0;
    std::int64_t y = 0;
    std::int64_t width = 0;
    std::int64_t height = 0;
    std::vector<DoorPlacement> doors;

    [[nodiscard]] std::string label() const {
        return room_type + "__" + std::to_string(instance_index);
    }

    [[nodiscard]] std::int64_t right() const noexcept { return x + width; }
    [[nodiscard]] std::int64_t top() const noexcept { return y + height; }
};

/// Read-only geometry handed to the downstream renderer
struct LayoutSolution {
    FloorPlate floor;
    std::vector<PlacedRoom> rooms;
    std::int64_t objective_value = 0;
    std::int64_t penalty_total = 0;    // weighted, before scaling
    std::int64_t footprint = 0;        // sum of width + height

    [[nodiscard]] const PlacedRoom* find(std::string_view label) const;
    [[nodiscard]] std::vector<const PlacedRoom*> rooms_of_type(std::string_view room_type) const;
};

/// Manhattan gap between two placed rectangles (0 when touching or overlapping)
[[nodiscard]] std::int64_t manhattan_gap(const PlacedRoom& a, const PlacedRoom& b) noexcept;

/// Length of the boundary segment two rectangles share (0 when they only meet at a corner)
[[nodiscard]] std::int64_t shared_boundary_length(const PlacedRoom& a, const PlacedRoom& b) noexcept;

/// True when the interiors of two rectangles intersect
[[nodiscard]] bool rooms_overlap(const PlacedRoom& a, const PlacedRoom& b) noexcept;

// ============================================================================
// Result
// ============================================================================

enum class LayoutStatus {
    Optimal,              // proven optimal
    Feasible,             // time limit reached with a verified solution
    Infeasible,           // hard rules cannot all hold
    Timeout,              // time limit reached without any solution
    ConfigurationError,   // rejected before search
    Error                 // solver failure
};

[[nodiscard]] const char* layout_status_name(LayoutStatus status) noexcept;

/// Hard-rule family implicated in an infeasibility proof
struct RuleConflict {
    std::string family;
    std::string description;
};

struct LayoutResult {
    LayoutStatus status = LayoutStatus::Error;
    std::optional<LayoutSolution> solution;
    std::vector<RuleConflict> conflicts;
    std::vector<std::string> notes;         // skipped / unresolved rules
    std::string error_message;
    std::chrono::milliseconds solve_time{0};

    [[nodiscard]] bool has_solution() const noexcept { return solution.has_value(); }
    [[nodiscard]] bool is_optimal() const noexcept { return status == LayoutStatus::Optimal; }
    [[nodiscard]] bool is_infeasible() const noexcept { return status == LayoutStatus::Infeasible; }

    /// Distinct rule families in the conflict set, in first-seen order
    [[nodiscard]] std::vector<std::string> conflict_families() const;

    [[nodiscard]] std::string summary() const;

    static LayoutResult make_solved(LayoutSolution&& solution, bool optimal,
                                    std::chrono::milliseconds time);
    static LayoutResult make_infeasible(std::vector<RuleConflict>&& conflicts,
                                        std::chrono::milliseconds time);
    static LayoutResult make_timeout(std::chrono::milliseconds time);
    static LayoutResult make_configuration_error(const std::string& message);
    static LayoutResult make_error(const std::string& message);
};

} // namespace blockplan
