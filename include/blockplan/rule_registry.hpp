#pragma once

#include "blockplan/layout_types.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <variant>
#include <vector>

namespace blockplan {

enum class RoomCategory {
    Clinical,
    Public,
    Private,
    Support
};

enum class CirculationRole {
    Spine,
    Connector,
    Destination
};

[[nodiscard]] const char* room_category_name(RoomCategory category) noexcept;
[[nodiscard]] std::optional<RoomCategory> parse_room_category(std::string_view name) noexcept;
[[nodiscard]] const char* circulation_role_name(CirculationRole role) noexcept;
[[nodiscard]] std::optional<CirculationRole> parse_circulation_role(std::string_view name) noexcept;

// ============================================================================
// Dimensions
// ============================================================================

/// (width, length) in inches; either side may be unspecified
struct DimensionPair {
    std::optional<std::int64_t> width;
    std::optional<std::int64_t> length;

    [[nodiscard]] bool is_complete() const noexcept { return width && length; }
    [[nodiscard]] bool is_empty() const noexcept { return !width && !length; }
};

/// Size that applies to a treatment-room range (inclusive; open ends allowed)
struct DimensionTier {
    std::string label;
    std::optional<int> treatment_rooms_min;
    std::optional<int> treatment_rooms_max;
    DimensionPair size;

    [[nodiscard]] bool matches(int treatment_rooms) const noexcept {
        if (treatment_rooms_min && treatment_rooms < *treatment_rooms_min) return false;
        if (treatment_rooms_max && treatment_rooms > *treatment_rooms_max) return false;
        return true;
    }
};

struct DimensionRules {
    DimensionPair ideal;
    DimensionPair minimum;
    DimensionPair maximum;
    std::vector<DimensionPair> variants;
    std::vector<DimensionTier> tiers;
    bool unresolved = false;   // a size was written as TBD
};

// ============================================================================
// Orientation
// ============================================================================

enum class AxisRelation {
    Parallel,
    Perpendicular
};

/// Long axis relative to a floor edge (north/south/east/west) or another room type
struct OrientationRule {
    bool allowed = true;
    std::optional<AxisRelation> relation;
    std::string reference;
};

struct OrientationRules {
    std::optional<OrientationRule> fallback;
    std::map<LayoutMode, OrientationRule> by_layout;
    bool unresolved = false;
};

// ============================================================================
// Entries and clearances
// ============================================================================

struct EntryTier {
    std::optional<int> treatment_rooms_min;
    std::optional<int> treatment_rooms_max;
    int min_entries = 0;
    std::optional<int> max_entries;

    [[nodiscard]] bool matches(int treatment_rooms) const noexcept {
        if (treatment_rooms_min && treatment_rooms < *treatment_rooms_min) return false;
        if (treatment_rooms_max && treatment_rooms > *treatment_rooms_max) return false;
        return true;
    }
};

struct EntryCountRule {
    std::optional<int> min_entries;
    std::optional<int> max_entries;
    std::vector<EntryTier> tiers;
    bool unresolved = false;
};

struct AdaClearance {
    std::optional<std::int64_t> min_clear_width;
    std::optional<int> required_entries;
};

// ============================================================================
// Spatial rules
// ============================================================================

/// Rule target: a room type id or a named group of room types
struct RuleTarget {
    enum class Kind {
        RoomType,
        Group
    };
    Kind kind = Kind::RoomType;
    std::string name;

    static RuleTarget room(std::string id) { return {Kind::RoomType, std::move(id)}; }
    static RuleTarget group(std::string id) { return {Kind::Group, std::move(id)}; }

    [[nodiscard]] bool is_group() const noexcept { return kind == Kind::Group; }
    [[nodiscard]] std::string display() const {
        return is_group() ? "group:" + name : name;
    }
};

/// Recognized group names
[[nodiscard]] bool is_known_group(std::string_view name) noexcept;

/// Whether a rule needs every target instance or any one of them
enum class TargetMatch {
    Any,
    All
};

struct RuleBase {
    std::vector<RuleTarget> targets;
    bool hard = true;
    int weight = 1;
    std::optional<TargetMatch> match;   // kind default when absent
    bool unresolved = false;
    std::string unresolved_reason;
};

struct EntryFromRule : RuleBase {};
struct EntryNotFromRule : RuleBase {};

/// No door into any destination room (targets unused)
struct EntryNotFromRoomInteriorRule : RuleBase {};

struct EntryWithinDistanceRule : RuleBase {
    std::optional<std::int64_t> max_distance;
};

struct DirectAdjacencyRule : RuleBase {};

struct PreferredAdjacencyRule : RuleBase {
    std::optional<std::int64_t> max_distance;   // optional hard cap
};

struct SeparationRule : RuleBase {
    std::optional<std::int64_t> min_distance;   // default clearance when absent
};

struct NearSpaceRule : RuleBase {
    std::int64_t max_distance = 0;
};

struct NotWithinDistanceRule : RuleBase {
    std::int64_t min_distance = 0;
};

struct PreferNearCenterRule : RuleBase {
    std::string reference_type;
    std::string fallback_type;
};

struct VisibilityRule : RuleBase {
    bool required = true;   // false: must not be visible
};

using SpatialRule = std::variant<
    EntryFromRule,
    EntryNotFromRule,
    EntryNotFromRoomInteriorRule,
    EntryWithinDistanceRule,
    DirectAdjacencyRule,
    PreferredAdjacencyRule,
    SeparationRule,
    NearSpaceRule,
    NotWithinDistanceRule,
    PreferNearCenterRule,
    VisibilityRule
>;

/// Kind tag matching the variant index of SpatialRule
enum class RuleKind {
    EntryFrom = 0,
    EntryNotFrom,
    EntryNotFromRoomInterior,
    EntryWithinDistance,
    DirectAdjacency,
    PreferredAdjacency,
    Separation,
    NearSpace,
    NotWithinDistance,
    PreferNearCenter,
    Visibility
};

[[nodiscard]] RuleKind rule_kind(const SpatialRule& rule) noexcept;
[[nodiscard]] const char* rule_kind_name(RuleKind kind) noexcept;
[[nodiscard]] const char* rule_kind_name(const SpatialRule& rule) noexcept;

/// Quantifier a rule kind uses when the rule does not override it
[[nodiscard]] TargetMatch default_match(RuleKind kind) noexcept;

/// Explicit quantifier, else the kind default (require-visibility: any)
[[nodiscard]] TargetMatch effective_match(const SpatialRule& rule) noexcept;

/// Common fields of any rule
[[nodiscard]] const RuleBase& rule_base(const SpatialRule& rule) noexcept;
[[nodiscard]] RuleBase& rule_base(SpatialRule& rule) noexcept;

// ============================================================================
// Room type rules
// ============================================================================

struct AdjacencyRules {
    std::vector<SpatialRule> direct;
    std::vector<SpatialRule> preferred;
    std::vector<SpatialRule> separation;
};

/// Complete rule set for one room type
struct RoomTypeRule {
    std::string id;
    RoomCategory category = RoomCategory::Support;
    CirculationRole role = CirculationRole::Destination;
    std::string description;

    DimensionRules dimensions;
    OrientationRules orientation;
    EntryCountRule entries;
    std::vector<SpatialRule> entry_rules;
    AdaClearance ada;
    std::vector<SpatialRule> ideal_clearances;
    AdjacencyRules adjacency;
    std::vector<SpatialRule> proximity;
    std::vector<SpatialRule> visibility;
    std::string scalability;   // metadata only

    [[nodiscard]] bool is_corridor() const noexcept {
        return role == CirculationRole::Spine || role == CirculationRole::Connector;
    }

    /// Every spatial rule of this type, in compile order
    [[nodiscard]] std::vector<const SpatialRule*> all_rules() const;
};

/// Immutable lookup of room type rules by id
class RuleRegistry {
public:
    RuleRegistry() = default;

    /// Validates ids and rule sections; throws ConfigurationError
    explicit RuleRegistry(std::vector<RoomTypeRule> rules);

    [[nodiscard]] const RoomTypeRule* find(std::string_view id) const;
    [[nodiscard]] bool contains(std::string_view id) const { return find(id) != nullptr; }

    [[nodiscard]] const std::vector<RoomTypeRule>& rules() const noexcept { return rules_; }
    [[nodiscard]] size_t size() const noexcept { return rules_.size(); }
    [[nodiscard]] bool empty() const noexcept { return rules_.empty(); }

    /// Ids in registry order
    [[nodiscard]] std::vector<std::string> ids() const;

private:
    std::vector<RoomTypeRule> rules_;
    std::unordered_map<std::string, size_t> index_;

    void validate_rule(const RoomTypeRule& rule) const;
};

} // namespace blockplan
