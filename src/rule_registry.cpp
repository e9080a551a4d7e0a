#include "blockplan/rule_registry.hpp"

#include <algorithm>
#include <initializer_list>

namespace blockplan {

const char* room_category_name(RoomCategory category) noexcept {
    switch (category) {
        case RoomCategory::Clinical: return "clinical";
        case RoomCategory::Public:   return "public";
        case RoomCategory::Private:  return "private";
        case RoomCategory::Support:  return "support";
        default:                     return "?";
    }
}

std::optional<RoomCategory> parse_room_category(std::string_view name) noexcept {
    if (name == "clinical") return RoomCategory::Clinical;
    if (name == "public") return RoomCategory::Public;
    if (name == "private") return RoomCategory::Private;
    if (name == "support") return RoomCategory::Support;
    return std::nullopt;
}

const char* circulation_role_name(CirculationRole role) noexcept {
    switch (role) {
        case CirculationRole::Spine:       return "spine";
        case CirculationRole::Connector:   return "connector";
        case CirculationRole::Destination: return "destination";
        default:                           return "?";
    }
}

std::optional<CirculationRole> parse_circulation_role(std::string_view name) noexcept {
    if (name == "spine") return CirculationRole::Spine;
    if (name == "connector") return CirculationRole::Connector;
    if (name == "destination") return CirculationRole::Destination;
    return std::nullopt;
}

bool is_known_group(std::string_view name) noexcept {
    return name == "clinical" || name == "public" || name == "private" ||
           name == "support" || name == "corridors";
}

RuleKind rule_kind(const SpatialRule& rule) noexcept {
    return static_cast<RuleKind>(rule.index());
}

const char* rule_kind_name(RuleKind kind) noexcept {
    switch (kind) {
        case RuleKind::EntryFrom:                return "entryFrom";
        case RuleKind::EntryNotFrom:             return "entryNotFrom";
        case RuleKind::EntryNotFromRoomInterior: return "entryNotFromRoomInterior";
        case RuleKind::EntryWithinDistance:      return "entryWithinDistance";
        case RuleKind::DirectAdjacency:          return "directAdjacency";
        case RuleKind::PreferredAdjacency:       return "preferredAdjacency";
        case RuleKind::Separation:               return "separation";
        case RuleKind::NearSpace:                return "nearSpace";
        case RuleKind::NotWithinDistance:        return "notWithinDistance";
        case RuleKind::PreferNearCenter:         return "preferNearCenter";
        case RuleKind::Visibility:               return "visibility";
        default:                                 return "?";
    }
}

const char* rule_kind_name(const SpatialRule& rule) noexcept {
    if (const auto* vis = std::get_if<VisibilityRule>(&rule)) {
        return vis->required ? "requireVisibility" : "avoidVisibility";
    }
    return rule_kind_name(rule_kind(rule));
}

TargetMatch default_match(RuleKind kind) noexcept {
    switch (kind) {
        case RuleKind::EntryFrom:
        case RuleKind::EntryWithinDistance:
        case RuleKind::PreferredAdjacency:
        case RuleKind::NearSpace:
            return TargetMatch::Any;
        default:
            return TargetMatch::All;
    }
}

TargetMatch effective_match(const SpatialRule& rule) noexcept {
    const RuleBase& base = rule_base(rule);
    if (base.match) return *base.match;
    if (const auto* vis = std::get_if<VisibilityRule>(&rule)) {
        return vis->required ? TargetMatch::Any : TargetMatch::All;
    }
    return default_match(rule_kind(rule));
}

const RuleBase& rule_base(const SpatialRule& rule) noexcept {
    return std::visit([](const auto& r) -> const RuleBase& { return r; }, rule);
}

RuleBase& rule_base(SpatialRule& rule) noexcept {
    return std::visit([](auto& r) -> RuleBase& { return r; }, rule);
}

std::vector<const SpatialRule*> RoomTypeRule::all_rules() const {
    std::vector<const SpatialRule*> out;
    auto append = [&out](const std::vector<SpatialRule>& rules) {
        for (const auto& r : rules) out.push_back(&r);
    };
    append(entry_rules);
    append(ideal_clearances);
    append(adjacency.direct);
    append(adjacency.preferred);
    append(adjacency.separation);
    append(proximity);
    append(visibility);
    return out;
}

// ============================================================================
// RuleRegistry
// ============================================================================

namespace {

bool kind_in(RuleKind kind, std::initializer_list<RuleKind> allowed) {
    return std::find(allowed.begin(), allowed.end(), kind) != allowed.end();
}

void check_section(const std::string& room,
                   const char* section,
                   const std::vector<SpatialRule>& rules,
                   std::initializer_list<RuleKind> allowed) {
    for (const auto& rule : rules) {
        RuleKind kind = rule_kind(rule);
        if (!kind_in(kind, allowed)) {
            throw ConfigurationError("room type '" + room + "': rule kind '" +
                                     rule_kind_name(rule) + "' is not valid in section '" +
                                     section + "'");
        }
    }
}

bool needs_targets(RuleKind kind) noexcept {
    return kind != RuleKind::EntryNotFromRoomInterior && kind != RuleKind::PreferNearCenter;
}

} // namespace

RuleRegistry::RuleRegistry(std::vector<RoomTypeRule> rules)
    : rules_(std::move(rules)) {
    for (size_t i = 0; i < rules_.size(); ++i) {
        const auto& rule = rules_[i];
        if (rule.id.empty()) {
            throw ConfigurationError("room type with empty id");
        }
        if (!index_.emplace(rule.id, i).second) {
            throw ConfigurationError("duplicate room type id '" + rule.id + "'");
        }
        validate_rule(rule);
    }
}

void RuleRegistry::validate_rule(const RoomTypeRule& rule) const {
    check_section(rule.id, "entryRules", rule.entry_rules,
                  {RuleKind::EntryFrom, RuleKind::EntryNotFrom,
                   RuleKind::EntryNotFromRoomInterior, RuleKind::EntryWithinDistance});
    check_section(rule.id, "clearances.ideal", rule.ideal_clearances,
                  {RuleKind::Separation, RuleKind::NotWithinDistance, RuleKind::NearSpace});
    check_section(rule.id, "adjacency.direct", rule.adjacency.direct,
                  {RuleKind::DirectAdjacency});
    check_section(rule.id, "adjacency.preferred", rule.adjacency.preferred,
                  {RuleKind::PreferredAdjacency});
    check_section(rule.id, "adjacency.separation", rule.adjacency.separation,
                  {RuleKind::Separation});
    check_section(rule.id, "proximity", rule.proximity,
                  {RuleKind::NearSpace, RuleKind::NotWithinDistance,
                   RuleKind::PreferNearCenter, RuleKind::EntryWithinDistance,
                   RuleKind::PreferredAdjacency});
    check_section(rule.id, "visibility", rule.visibility, {RuleKind::Visibility});

    for (const SpatialRule* r : rule.all_rules()) {
        const RuleBase& base = rule_base(*r);
        if (base.weight < 0) {
            throw ConfigurationError("room type '" + rule.id + "': negative weight on " +
                                     rule_kind_name(*r));
        }
        if (needs_targets(rule_kind(*r)) && base.targets.empty() && !base.unresolved) {
            throw ConfigurationError("room type '" + rule.id + "': rule " +
                                     rule_kind_name(*r) + " has no targets");
        }
        for (const auto& t : base.targets) {
            if (t.is_group() && !is_known_group(t.name)) {
                throw ConfigurationError("room type '" + rule.id + "': unknown group '" +
                                         t.name + "'");
            }
        }
        if (const auto* sep = std::get_if<SeparationRule>(r)) {
            if (sep->min_distance && *sep->min_distance < 0) {
                throw ConfigurationError("room type '" + rule.id + "': negative separation");
            }
        }
        if (const auto* near = std::get_if<NearSpaceRule>(r)) {
            if (near->max_distance < 0) {
                throw ConfigurationError("room type '" + rule.id + "': negative near-space distance");
            }
        }
        if (const auto* nw = std::get_if<NotWithinDistanceRule>(r)) {
            if (nw->min_distance < 0) {
                throw ConfigurationError("room type '" + rule.id + "': negative not-within distance");
            }
        }
        if (const auto* center = std::get_if<PreferNearCenterRule>(r)) {
            if (center->reference_type.empty() && !center->unresolved) {
                throw ConfigurationError("room type '" + rule.id +
                                         "': preferNearCenter needs a reference type");
            }
        }
    }

    const auto& dims = rule.dimensions;
    auto check_pair = [&rule](const DimensionPair& p, const char* what) {
        if ((p.width && *p.width <= 0) || (p.length && *p.length <= 0)) {
            throw ConfigurationError("room type '" + rule.id + "': non-positive " + what + " size");
        }
    };
    check_pair(dims.minimum, "minimum");
    check_pair(dims.maximum, "maximum");
    check_pair(dims.ideal, "ideal");
    for (const auto& v : dims.variants) check_pair(v, "variant");
    for (const auto& t : dims.tiers) check_pair(t.size, "tier");

    if (rule.entries.min_entries && rule.entries.max_entries &&
        *rule.entries.min_entries > *rule.entries.max_entries) {
        throw ConfigurationError("room type '" + rule.id + "': entry minimum exceeds maximum");
    }
}

const RoomTypeRule* RuleRegistry::find(std::string_view id) const {
    auto it = index_.find(std::string(id));
    if (it == index_.end()) return nullptr;
    return &rules_[it->second];
}

std::vector<std::string> RuleRegistry::ids() const {
    std::vector<std::string> out;
    out.reserve(rules_.size());
    for (const auto& r : rules_) out.push_back(r.id);
    return out;
}

} // namespace blockplan
