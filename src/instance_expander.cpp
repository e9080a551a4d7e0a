#include "blockplan/instance_expander.hpp"
#include "blockplan/log.hpp"

#include <algorithm>

namespace blockplan {

namespace {
    const std::vector<size_t> kNoInstances;

    bool in_group(const RoomTypeRule& rule, std::string_view group) {
        if (group == "corridors") return rule.is_corridor();
        auto category = parse_room_category(group);
        return category && rule.category == *category;
    }
}

const std::vector<size_t>& InstanceSet::of_type(std::string_view room_type) const {
    auto it = by_type_.find(room_type);
    return it == by_type_.end() ? kNoInstances : it->second;
}

std::vector<size_t> InstanceSet::of_group(std::string_view group) const {
    std::vector<size_t> out;
    for (size_t i = 0; i < instances_.size(); ++i) {
        if (rules_[i] && in_group(*rules_[i], group)) out.push_back(i);
    }
    return out;
}

std::vector<size_t> InstanceSet::resolve_targets(const std::vector<RuleTarget>& targets,
                                                 size_t self) const {
    std::vector<size_t> out;
    for (const auto& target : targets) {
        if (target.is_group()) {
            auto members = of_group(target.name);
            out.insert(out.end(), members.begin(), members.end());
        } else {
            const auto& members = of_type(target.name);
            out.insert(out.end(), members.begin(), members.end());
        }
    }
    std::sort(out.begin(), out.end());
    out.erase(std::unique(out.begin(), out.end()), out.end());
    out.erase(std::remove(out.begin(), out.end(), self), out.end());
    return out;
}

std::vector<std::string> InstanceSet::room_types() const {
    std::vector<std::string> out;
    out.reserve(by_type_.size());
    for (const auto& [type, members] : by_type_) out.push_back(type);
    return out;
}

InstanceExpander::InstanceExpander(const RuleRegistry& registry)
    : registry_(registry) {}

InstanceSet InstanceExpander::expand(const std::map<std::string, int>& room_counts,
                                     std::vector<std::string>& notes) const {
    InstanceSet set;

    // std::map iterates in type-id order, which fixes the instance order
    for (const auto& [type, count] : room_counts) {
        if (type.empty()) {
            throw ConfigurationError("room count with empty room type");
        }
        if (count < 0) {
            throw ConfigurationError("negative count " + std::to_string(count) +
                                     " for room type '" + type + "'");
        }
        if (count == 0) {
            std::string note = "room type '" + type + "' requested with count 0, no instances";
            log_msg(LogLevel::Info, "%s", note.c_str());
            notes.push_back(std::move(note));
            continue;
        }

        const RoomTypeRule* rule = registry_.find(type);
        if (!rule) {
            std::string note = "room type '" + type +
                               "' has no rules, placing with generic constraints only";
            log_msg(LogLevel::Warn, "%s", note.c_str());
            notes.push_back(std::move(note));
        }

        auto& members = set.by_type_[type];
        for (int i = 0; i < count; ++i) {
            members.push_back(set.instances_.size());
            set.instances_.push_back(RoomInstance{type, i});
            set.rules_.push_back(rule);
        }
    }

    log_msg(LogLevel::Debug, "Expanded %zu room types into %zu instances",
            set.by_type_.size(), set.instances_.size());
    return set;
}

} // namespace blockplan
