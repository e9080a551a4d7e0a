#include "blockplan/rule_loader.hpp"
#include "blockplan/log.hpp"

#include <nlohmann/json.hpp>

#include <fstream>
#include <sstream>

namespace blockplan {

using nlohmann::json;

namespace {

constexpr const char* kTbd = "TBD";

[[noreturn]] void fail(const std::string& where, const std::string& what) {
    throw ConfigurationError(where + ": " + what);
}

bool is_tbd(const json& j) {
    return j.is_string() && j.get<std::string>() == kTbd;
}

const json* member(const json& obj, const char* key) {
    auto it = obj.find(key);
    if (it == obj.end() || it->is_null()) return nullptr;
    return &*it;
}

void require_object(const json& j, const std::string& where) {
    if (!j.is_object()) fail(where, "expected an object");
}

std::string read_string(const json& obj, const char* key, const std::string& where,
                        const std::string& fallback = {}) {
    const json* j = member(obj, key);
    if (!j) return fallback;
    if (!j->is_string()) fail(where + "." + key, "expected a string");
    return j->get<std::string>();
}

bool read_bool(const json& obj, const char* key, const std::string& where, bool fallback) {
    const json* j = member(obj, key);
    if (!j) return fallback;
    if (!j->is_boolean()) fail(where + "." + key, "expected true or false");
    return j->get<bool>();
}

/// Integer value; "TBD" sets `tbd` and yields nothing
std::optional<std::int64_t> read_int(const json& obj, const char* key,
                                     const std::string& where, bool& tbd) {
    const json* j = member(obj, key);
    if (!j) return std::nullopt;
    if (is_tbd(*j)) {
        tbd = true;
        return std::nullopt;
    }
    if (!j->is_number_integer()) {
        fail(where + "." + key, "expected an integer or \"TBD\"");
    }
    return j->get<std::int64_t>();
}

std::optional<int> read_small_int(const json& obj, const char* key,
                                  const std::string& where, bool& tbd) {
    auto v = read_int(obj, key, where, tbd);
    if (!v) return std::nullopt;
    return static_cast<int>(*v);
}

// ----------------------------------------------------------------------------
// Dimensions
// ----------------------------------------------------------------------------

DimensionPair read_pair(const json& j, const std::string& where, bool& tbd) {
    DimensionPair pair;
    if (is_tbd(j)) {
        tbd = true;
        return pair;
    }
    require_object(j, where);
    pair.width = read_int(j, "width", where, tbd);
    pair.length = read_int(j, "length", where, tbd);
    return pair;
}

DimensionRules read_dimensions(const json& j, const std::string& where) {
    DimensionRules dims;
    if (is_tbd(j)) {
        dims.unresolved = true;
        return dims;
    }
    require_object(j, where);

    if (const json* v = member(j, "ideal")) dims.ideal = read_pair(*v, where + ".ideal", dims.unresolved);
    if (const json* v = member(j, "minimum")) dims.minimum = read_pair(*v, where + ".minimum", dims.unresolved);
    if (const json* v = member(j, "maximum")) dims.maximum = read_pair(*v, where + ".maximum", dims.unresolved);

    if (const json* v = member(j, "variants")) {
        if (!v->is_array()) fail(where + ".variants", "expected an array");
        for (size_t i = 0; i < v->size(); ++i) {
            dims.variants.push_back(read_pair((*v)[i], where + ".variants[" + std::to_string(i) + "]",
                                              dims.unresolved));
        }
    }

    if (const json* v = member(j, "tiers")) {
        if (!v->is_array()) fail(where + ".tiers", "expected an array");
        for (size_t i = 0; i < v->size(); ++i) {
            std::string at = where + ".tiers[" + std::to_string(i) + "]";
            const json& t = (*v)[i];
            require_object(t, at);
            DimensionTier tier;
            tier.label = read_string(t, "label", at);
            tier.treatment_rooms_min = read_small_int(t, "treatmentRoomsMin", at, dims.unresolved);
            tier.treatment_rooms_max = read_small_int(t, "treatmentRoomsMax", at, dims.unresolved);
            tier.size.width = read_int(t, "width", at, dims.unresolved);
            tier.size.length = read_int(t, "length", at, dims.unresolved);
            dims.tiers.push_back(std::move(tier));
        }
    }
    return dims;
}

// ----------------------------------------------------------------------------
// Orientation
// ----------------------------------------------------------------------------

OrientationRule read_orientation_rule(const json& j, const std::string& where) {
    require_object(j, where);
    OrientationRule rule;
    rule.allowed = read_bool(j, "allowed", where, true);
    rule.reference = read_string(j, "reference", where);

    std::string relation = read_string(j, "relation", where);
    if (relation == "parallel") {
        rule.relation = AxisRelation::Parallel;
    } else if (relation == "perpendicular") {
        rule.relation = AxisRelation::Perpendicular;
    } else if (!relation.empty()) {
        fail(where + ".relation", "unknown axis relation '" + relation + "'");
    }

    if (rule.relation && rule.reference.empty()) {
        fail(where, "axis relation without a reference");
    }
    return rule;
}

OrientationRules read_orientation(const json& j, const std::string& where) {
    OrientationRules rules;
    if (is_tbd(j)) {
        rules.unresolved = true;
        return rules;
    }
    require_object(j, where);
    for (const auto& [key, value] : j.items()) {
        std::string at = where + "." + key;
        if (is_tbd(value)) {
            rules.unresolved = true;
            continue;
        }
        if (key == "default") {
            rules.fallback = read_orientation_rule(value, at);
        } else if (auto mode = parse_layout_mode(key)) {
            rules.by_layout[*mode] = read_orientation_rule(value, at);
        } else {
            fail(at, "unknown layout mode '" + key + "'");
        }
    }
    return rules;
}

// ----------------------------------------------------------------------------
// Entries and clearances
// ----------------------------------------------------------------------------

EntryCountRule read_entries(const json& j, const std::string& where) {
    EntryCountRule entries;
    if (is_tbd(j)) {
        entries.unresolved = true;
        return entries;
    }
    require_object(j, where);
    entries.min_entries = read_small_int(j, "min", where, entries.unresolved);
    entries.max_entries = read_small_int(j, "max", where, entries.unresolved);

    if (const json* v = member(j, "tiers")) {
        if (!v->is_array()) fail(where + ".tiers", "expected an array");
        for (size_t i = 0; i < v->size(); ++i) {
            std::string at = where + ".tiers[" + std::to_string(i) + "]";
            const json& t = (*v)[i];
            require_object(t, at);
            EntryTier tier;
            tier.treatment_rooms_min = read_small_int(t, "treatmentRoomsMin", at, entries.unresolved);
            tier.treatment_rooms_max = read_small_int(t, "treatmentRoomsMax", at, entries.unresolved);
            tier.min_entries = read_small_int(t, "minEntries", at, entries.unresolved).value_or(0);
            tier.max_entries = read_small_int(t, "maxEntries", at, entries.unresolved);
            entries.tiers.push_back(tier);
        }
    }
    return entries;
}

AdaClearance read_ada(const json& j, const std::string& where) {
    AdaClearance ada;
    if (is_tbd(j)) return ada;
    require_object(j, where);
    bool tbd = false;
    ada.min_clear_width = read_int(j, "minClearWidth", where, tbd);
    ada.required_entries = read_small_int(j, "requiredEntries", where, tbd);
    return ada;
}

// ----------------------------------------------------------------------------
// Spatial rules
// ----------------------------------------------------------------------------

RuleTarget parse_target(const std::string& text) {
    static const std::string prefix = "group:";
    if (text.compare(0, prefix.size(), prefix) == 0) {
        return RuleTarget::group(text.substr(prefix.size()));
    }
    return RuleTarget::room(text);
}

void mark_unresolved(RuleBase& base, const std::string& reason) {
    if (!base.unresolved) {
        base.unresolved = true;
        base.unresolved_reason = reason;
    }
}

void read_targets(const json& j, RuleBase& base, const std::string& where) {
    const json* targets = member(j, "targets");
    const char* key = "targets";
    if (!targets) {
        targets = member(j, "target");
        key = "target";
    }
    if (!targets) return;

    if (is_tbd(*targets)) {
        mark_unresolved(base, std::string(key) + " is TBD");
        return;
    }
    if (targets->is_string()) {
        base.targets.push_back(parse_target(targets->get<std::string>()));
        return;
    }
    if (!targets->is_array()) fail(where + "." + key, "expected a string or an array");
    for (const auto& t : *targets) {
        if (!t.is_string()) fail(where + "." + key, "expected room type ids");
        base.targets.push_back(parse_target(t.get<std::string>()));
    }
}

/// Distance parameter; "TBD" marks the rule unresolved
std::optional<std::int64_t> read_distance(const json& j, const char* key, RuleBase& base,
                                          const std::string& where) {
    bool tbd = false;
    auto v = read_int(j, key, where, tbd);
    if (tbd) mark_unresolved(base, std::string(key) + " is TBD");
    return v;
}

template <typename Rule>
Rule read_base(const json& j, const std::string& where, bool default_hard) {
    Rule rule;
    rule.hard = read_bool(j, "hard", where, default_hard);

    bool tbd = false;
    if (auto w = read_int(j, "weight", where, tbd)) rule.weight = static_cast<int>(*w);
    if (tbd) mark_unresolved(rule, "weight is TBD");

    std::string match = read_string(j, "match", where);
    if (match == "any") {
        rule.match = TargetMatch::Any;
    } else if (match == "all") {
        rule.match = TargetMatch::All;
    } else if (!match.empty()) {
        fail(where + ".match", "expected \"any\" or \"all\"");
    }

    read_targets(j, rule, where);
    return rule;
}

SpatialRule read_rule(const json& j, const std::string& where) {
    require_object(j, where);
    std::string kind = read_string(j, "kind", where);
    if (kind.empty()) fail(where, "rule without a kind");

    if (kind == "entryFrom") {
        return read_base<EntryFromRule>(j, where, true);
    }
    if (kind == "entryNotFrom") {
        return read_base<EntryNotFromRule>(j, where, true);
    }
    if (kind == "entryNotFromRoomInterior") {
        return read_base<EntryNotFromRoomInteriorRule>(j, where, true);
    }
    if (kind == "entryWithinDistance") {
        auto rule = read_base<EntryWithinDistanceRule>(j, where, true);
        rule.max_distance = read_distance(j, "maxDistance", rule, where);
        return rule;
    }
    if (kind == "directAdjacency") {
        return read_base<DirectAdjacencyRule>(j, where, true);
    }
    if (kind == "preferredAdjacency") {
        auto rule = read_base<PreferredAdjacencyRule>(j, where, false);
        rule.max_distance = read_distance(j, "maxDistance", rule, where);
        return rule;
    }
    if (kind == "separation") {
        auto rule = read_base<SeparationRule>(j, where, true);
        rule.min_distance = read_distance(j, "minDistance", rule, where);
        return rule;
    }
    if (kind == "nearSpace") {
        auto rule = read_base<NearSpaceRule>(j, where, true);
        auto d = read_distance(j, "maxDistance", rule, where);
        if (d) {
            rule.max_distance = *d;
        } else if (!rule.unresolved) {
            fail(where, "nearSpace needs maxDistance");
        }
        return rule;
    }
    if (kind == "notWithinDistance") {
        auto rule = read_base<NotWithinDistanceRule>(j, where, true);
        auto d = read_distance(j, "minDistance", rule, where);
        if (d) {
            rule.min_distance = *d;
        } else if (!rule.unresolved) {
            fail(where, "notWithinDistance needs minDistance");
        }
        return rule;
    }
    if (kind == "preferNearCenter") {
        auto rule = read_base<PreferNearCenterRule>(j, where, false);
        rule.reference_type = read_string(j, "reference", where);
        rule.fallback_type = read_string(j, "fallback", where);
        return rule;
    }
    if (kind == "requireVisibility" || kind == "avoidVisibility") {
        auto rule = read_base<VisibilityRule>(j, where, false);
        rule.required = kind == "requireVisibility";
        return rule;
    }

    fail(where + ".kind", "unknown rule kind '" + kind + "'");
}

std::vector<SpatialRule> read_rule_list(const json& obj, const char* key, const std::string& where) {
    std::vector<SpatialRule> rules;
    const json* list = member(obj, key);
    if (!list) return rules;

    std::string at = where + "." + key;
    if (!list->is_array()) fail(at, "expected an array of rules");
    for (size_t i = 0; i < list->size(); ++i) {
        rules.push_back(read_rule((*list)[i], at + "[" + std::to_string(i) + "]"));
    }
    return rules;
}

// ----------------------------------------------------------------------------
// Room types
// ----------------------------------------------------------------------------

RoomTypeRule read_room_type(const std::string& id, const json& j, const std::string& where) {
    require_object(j, where);

    RoomTypeRule rule;
    rule.id = id;
    rule.description = read_string(j, "description", where);
    rule.scalability = read_string(j, "scalability", where);

    std::string category = read_string(j, "category", where, "support");
    auto parsed_category = parse_room_category(category);
    if (!parsed_category) fail(where + ".category", "unknown category '" + category + "'");
    rule.category = *parsed_category;

    std::string role = read_string(j, "role", where, "destination");
    auto parsed_role = parse_circulation_role(role);
    if (!parsed_role) fail(where + ".role", "unknown circulation role '" + role + "'");
    rule.role = *parsed_role;

    if (const json* v = member(j, "dimensions")) rule.dimensions = read_dimensions(*v, where + ".dimensions");
    if (const json* v = member(j, "orientation")) rule.orientation = read_orientation(*v, where + ".orientation");
    if (const json* v = member(j, "entries")) rule.entries = read_entries(*v, where + ".entries");

    rule.entry_rules = read_rule_list(j, "entryRules", where);

    if (const json* clearances = member(j, "clearances")) {
        std::string at = where + ".clearances";
        require_object(*clearances, at);
        if (const json* ada = member(*clearances, "ada")) rule.ada = read_ada(*ada, at + ".ada");
        rule.ideal_clearances = read_rule_list(*clearances, "ideal", at);
    }

    if (const json* adjacency = member(j, "adjacency")) {
        std::string at = where + ".adjacency";
        require_object(*adjacency, at);
        rule.adjacency.direct = read_rule_list(*adjacency, "direct", at);
        rule.adjacency.preferred = read_rule_list(*adjacency, "preferred", at);
        rule.adjacency.separation = read_rule_list(*adjacency, "separation", at);
    }

    rule.proximity = read_rule_list(j, "proximity", where);
    rule.visibility = read_rule_list(j, "visibility", where);
    return rule;
}

json parse_document(const std::string& text, const std::string& source) {
    try {
        return json::parse(text);
    } catch (const json::parse_error& e) {
        throw ConfigurationError(source + ": " + e.what());
    }
}

RuleRegistry read_registry(const json& doc, const std::string& source) {
    require_object(doc, source);

    int version = doc.value("version", RuleLoader::kVersion);
    if (version < 1 || version > RuleLoader::kVersion) {
        fail(source, "unsupported version " + std::to_string(version));
    }

    const json* room_types = member(doc, "roomTypes");
    if (!room_types) fail(source, "missing roomTypes");
    require_object(*room_types, source + ".roomTypes");

    std::vector<RoomTypeRule> rules;
    for (const auto& [id, value] : room_types->items()) {
        rules.push_back(read_room_type(id, value, source + ".roomTypes." + id));
    }

    RuleRegistry registry(std::move(rules));
    log_msg(LogLevel::Info, "Loaded %zu room types from %s", registry.size(), source.c_str());
    return registry;
}

} // namespace

RuleRegistry RuleLoader::load_file(const std::string& path) {
    std::ifstream in(path);
    if (!in) {
        throw ConfigurationError("cannot open rule file " + path);
    }
    std::stringstream buffer;
    buffer << in.rdbuf();
    return load_string(buffer.str(), path);
}

RuleRegistry RuleLoader::load_string(const std::string& text, const std::string& source) {
    json doc = parse_document(text, source);
    try {
        return read_registry(doc, source);
    } catch (const json::exception& e) {
        throw ConfigurationError(source + ": " + e.what());
    }
}

SpatialRule RuleLoader::parse_rule(const std::string& text) {
    json doc = parse_document(text, "<rule>");
    try {
        return read_rule(doc, "rule");
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("rule: ") + e.what());
    }
}

} // namespace blockplan
