#include "blockplan/layout_types.hpp"

#include <algorithm>
#include <sstream>

namespace blockplan {

const char* layout_mode_name(LayoutMode mode) noexcept {
    switch (mode) {
        case LayoutMode::Narrow:         return "narrow";
        case LayoutMode::ThreeLayerCake: return "threeLayerCake";
        case LayoutMode::HLayout:        return "hLayout";
        default:                         return "?";
    }
}

std::optional<LayoutMode> parse_layout_mode(std::string_view name) noexcept {
    if (name == "narrow") return LayoutMode::Narrow;
    if (name == "threeLayerCake") return LayoutMode::ThreeLayerCake;
    if (name == "hLayout") return LayoutMode::HLayout;
    return std::nullopt;
}

const PlacedRoom* LayoutSolution::find(std::string_view label) const {
    for (const auto& room : rooms) {
        if (room.label() == label) return &room;
    }
    return nullptr;
}

std::vector<const PlacedRoom*> LayoutSolution::rooms_of_type(std::string_view room_type) const {
    std::vector<const PlacedRoom*> result;
    for (const auto& room : rooms) {
        if (room.room_type == room_type) result.push_back(&room);
    }
    return result;
}

std::int64_t manhattan_gap(const PlacedRoom& a, const PlacedRoom& b) noexcept {
    std::int64_t gap = 0;
    gap += std::max<std::int64_t>(0, b.x - a.right());
    gap += std::max<std::int64_t>(0, a.x - b.right());
    gap += std::max<std::int64_t>(0, b.y - a.top());
    gap += std::max<std::int64_t>(0, a.y - b.top());
    return gap;
}

std::int64_t shared_boundary_length(const PlacedRoom& a, const PlacedRoom& b) noexcept {
    if (a.right() == b.x || b.right() == a.x) {
        return std::max<std::int64_t>(0, std::min(a.top(), b.top()) - std::max(a.y, b.y));
    }
    if (a.top() == b.y || b.top() == a.y) {
        return std::max<std::int64_t>(0, std::min(a.right(), b.right()) - std::max(a.x, b.x));
    }
    return 0;
}

bool rooms_overlap(const PlacedRoom& a, const PlacedRoom& b) noexcept {
    return a.x < b.right() && b.x < a.right() && a.y < b.top() && b.y < a.top();
}

const char* layout_status_name(LayoutStatus status) noexcept {
    switch (status) {
        case LayoutStatus::Optimal:            return "optimal";
        case LayoutStatus::Feasible:           return "feasible";
        case LayoutStatus::Infeasible:         return "infeasible";
        case LayoutStatus::Timeout:            return "timeout";
        case LayoutStatus::ConfigurationError: return "configuration-error";
        case LayoutStatus::Error:              return "error";
        default:                               return "invalid";
    }
}

std::vector<std::string> LayoutResult::conflict_families() const {
    std::vector<std::string> families;
    for (const auto& c : conflicts) {
        if (std::find(families.begin(), families.end(), c.family) == families.end()) {
            families.push_back(c.family);
        }
    }
    return families;
}

std::string LayoutResult::summary() const {
    std::ostringstream out;
    out << "Layout result: " << layout_status_name(status) << "\n";
    out << "Solve time: " << solve_time.count() << "ms\n";

    if (solution) {
        out << "Rooms: " << solution->rooms.size()
            << ", objective " << solution->objective_value
            << " (penalty " << solution->penalty_total
            << ", footprint " << solution->footprint << ")\n";
    }

    if (!conflicts.empty()) {
        out << "Conflicting hard rules (" << conflicts.size() << "):\n";
        for (const auto& c : conflicts) {
            out << "  - [" << c.family << "] " << c.description << "\n";
        }
    }

    if (!notes.empty()) {
        out << "Notes (" << notes.size() << "):\n";
        for (const auto& n : notes) {
            out << "  - " << n << "\n";
        }
    }

    if (!error_message.empty()) {
        out << "Error: " << error_message << "\n";
    }

    return out.str();
}

LayoutResult LayoutResult::make_solved(LayoutSolution&& solution, bool optimal,
                                       std::chrono::milliseconds time) {
    LayoutResult r;
    r.status = optimal ? LayoutStatus::Optimal : LayoutStatus::Feasible;
    r.solution = std::move(solution);
    r.solve_time = time;
    return r;
}

LayoutResult LayoutResult::make_infeasible(std::vector<RuleConflict>&& conflicts,
                                           std::chrono::milliseconds time) {
    LayoutResult r;
    r.status = LayoutStatus::Infeasible;
    r.conflicts = std::move(conflicts);
    r.solve_time = time;
    return r;
}

LayoutResult LayoutResult::make_timeout(std::chrono::milliseconds time) {
    LayoutResult r;
    r.status = LayoutStatus::Timeout;
    r.error_message = "time limit reached before any feasible layout was found";
    r.solve_time = time;
    return r;
}

LayoutResult LayoutResult::make_configuration_error(const std::string& message) {
    LayoutResult r;
    r.status = LayoutStatus::ConfigurationError;
    r.error_message = message;
    return r;
}

LayoutResult LayoutResult::make_error(const std::string& message) {
    LayoutResult r;
    r.status = LayoutStatus::Error;
    r.error_message = message;
    return r;
}

} // namespace blockplan
