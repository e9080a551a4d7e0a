#pragma once

#include "blockplan/layout_types.hpp"
#include "blockplan/rule_registry.hpp"

#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace blockplan {

/// Flat, ordered set of room instances with a type -> instances index.
/// Instances are ordered by room type id, then index.
class InstanceSet {
public:
    InstanceSet() = default;

    [[nodiscard]] const std::vector<RoomInstance>& instances() const noexcept { return instances_; }
    [[nodiscard]] size_t size() const noexcept { return instances_.size(); }
    [[nodiscard]] bool empty() const noexcept { return instances_.empty(); }
    [[nodiscard]] const RoomInstance& operator[](size_t i) const { return instances_[i]; }

    /// Positions (into instances()) of every instance of a type; empty when none
    [[nodiscard]] const std::vector<size_t>& of_type(std::string_view room_type) const;

    /// Rule of the instance's type; nullptr for types absent from the registry
    [[nodiscard]] const RoomTypeRule* rule_of(size_t i) const { return rules_[i]; }

    /// Positions of every instance in a group (clinical, public, private, support, corridors)
    [[nodiscard]] std::vector<size_t> of_group(std::string_view group) const;

    /// Positions matching any of the targets, excluding `self`, deduplicated, ascending
    [[nodiscard]] std::vector<size_t> resolve_targets(const std::vector<RuleTarget>& targets,
                                                      size_t self) const;

    /// Room types with a positive count, in order
    [[nodiscard]] std::vector<std::string> room_types() const;

private:
    friend class InstanceExpander;

    std::vector<RoomInstance> instances_;
    std::vector<const RoomTypeRule*> rules_;
    std::map<std::string, std::vector<size_t>, std::less<>> by_type_;
};

/// Expands (room type -> count) into room instances
class InstanceExpander {
public:
    explicit InstanceExpander(const RuleRegistry& registry);

    /// Throws ConfigurationError on a negative count or an empty type id.
    /// Zero counts and unknown types append notes.
    [[nodiscard]] InstanceSet expand(const std::map<std::string, int>& room_counts,
                                     std::vector<std::string>& notes) const;

private:
    const RuleRegistry& registry_;
};

} // namespace blockplan
