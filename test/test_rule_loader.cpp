/// @file test_rule_loader.cpp
/// @brief Unit tests for the JSON rule set loader

#include <gtest/gtest.h>

#include <blockplan/rule_loader.hpp>

#include <string>

namespace blockplan {
namespace test {

class RuleLoaderTest : public ::testing::Test {
protected:
    static RuleRegistry load(const std::string& room_types) {
        return RuleLoader::load_string(R"({"version": 1, "roomTypes": )" + room_types + "}");
    }
};

// ============================================================================
// Room Type Tests
// ============================================================================

TEST_F(RuleLoaderTest, LoadsIdentity) {
    RuleRegistry registry = load(R"({
        "clinicalCorridor": {"category": "clinical", "role": "spine", "description": "spine"},
        "lab": {"category": "clinical"}
    })");

    ASSERT_EQ(registry.size(), 2u);
    const RoomTypeRule* corridor = registry.find("clinicalCorridor");
    ASSERT_NE(corridor, nullptr);
    EXPECT_EQ(corridor->role, CirculationRole::Spine);
    EXPECT_TRUE(corridor->is_corridor());
    EXPECT_EQ(corridor->description, "spine");
    EXPECT_EQ(registry.find("lab")->role, CirculationRole::Destination);
}

TEST_F(RuleLoaderTest, LoadsDimensionsAndTiers) {
    RuleRegistry registry = load(R"({
        "sterilization": {
            "dimensions": {
                "ideal": {"width": 110, "length": 152},
                "tiers": [
                    {"label": "compact", "treatmentRoomsMin": 5, "treatmentRoomsMax": 8,
                     "width": 110, "length": 152},
                    {"label": "elite", "treatmentRoomsMin": 15, "width": 110, "length": 268}
                ],
                "variants": [{"width": 96, "length": 96}]
            }
        }
    })");

    const auto& dims = registry.find("sterilization")->dimensions;
    EXPECT_EQ(dims.ideal.width, 110);
    ASSERT_EQ(dims.tiers.size(), 2u);
    EXPECT_EQ(dims.tiers[0].label, "compact");
    EXPECT_EQ(dims.tiers[0].treatment_rooms_max, 8);
    EXPECT_FALSE(dims.tiers[1].treatment_rooms_max.has_value());
    EXPECT_EQ(dims.tiers[1].size.length, 268);
    ASSERT_EQ(dims.variants.size(), 1u);
    EXPECT_FALSE(dims.unresolved);
}

TEST_F(RuleLoaderTest, TbdDimensionsMarkedUnresolved) {
    RuleRegistry registry = load(R"({
        "lab": {"dimensions": {"ideal": {"width": 96, "length": 72},
                               "minimum": {"width": "TBD", "length": "TBD"}}},
        "consult": {"dimensions": "TBD"}
    })");

    const auto& lab = registry.find("lab")->dimensions;
    EXPECT_TRUE(lab.unresolved);
    EXPECT_EQ(lab.ideal.width, 96);
    EXPECT_FALSE(lab.minimum.width.has_value());
    EXPECT_TRUE(registry.find("consult")->dimensions.unresolved);
}

TEST_F(RuleLoaderTest, LoadsOrientation) {
    RuleRegistry registry = load(R"({
        "sterilization": {"orientation": {
            "default": {"relation": "parallel", "reference": "north"},
            "narrow": {"relation": "perpendicular", "reference": "clinicalCorridor"},
            "hLayout": {"allowed": false}
        }}
    })");

    const auto& o = registry.find("sterilization")->orientation;
    ASSERT_TRUE(o.fallback.has_value());
    EXPECT_EQ(o.fallback->relation, AxisRelation::Parallel);
    EXPECT_EQ(o.by_layout.at(LayoutMode::Narrow).reference, "clinicalCorridor");
    EXPECT_FALSE(o.by_layout.at(LayoutMode::HLayout).allowed);
}

TEST_F(RuleLoaderTest, RejectsUnknownLayoutMode) {
    EXPECT_THROW(load(R"({"lab": {"orientation": {"wide": {"relation": "parallel", "reference": "north"}}}})"),
                 ConfigurationError);
}

TEST_F(RuleLoaderTest, LoadsEntriesAndAda) {
    RuleRegistry registry = load(R"({
        "sterilization": {
            "entries": {"tiers": [
                {"treatmentRoomsMin": 5, "treatmentRoomsMax": 8, "minEntries": 1, "maxEntries": 1},
                {"treatmentRoomsMin": 9, "minEntries": 2, "maxEntries": 2}
            ]},
            "clearances": {"ada": {"minClearWidth": 34, "requiredEntries": 1}}
        },
        "clinicalCorridor": {"entries": "TBD"}
    })");

    const RoomTypeRule* s = registry.find("sterilization");
    ASSERT_EQ(s->entries.tiers.size(), 2u);
    EXPECT_EQ(s->entries.tiers[1].min_entries, 2);
    EXPECT_EQ(s->ada.min_clear_width, 34);
    EXPECT_EQ(s->ada.required_entries, 1);
    EXPECT_TRUE(registry.find("clinicalCorridor")->entries.unresolved);
}

// ============================================================================
// Rule Tests
// ============================================================================

TEST_F(RuleLoaderTest, ParsesEveryRuleKind) {
    struct Case {
        const char* json;
        RuleKind kind;
    };
    const Case cases[] = {
        {R"({"kind": "entryFrom", "targets": ["clinicalCorridor"]})", RuleKind::EntryFrom},
        {R"({"kind": "entryNotFrom", "target": "group:private"})", RuleKind::EntryNotFrom},
        {R"({"kind": "entryNotFromRoomInterior"})", RuleKind::EntryNotFromRoomInterior},
        {R"({"kind": "entryWithinDistance", "targets": ["checkOut"], "maxDistance": 60})", RuleKind::EntryWithinDistance},
        {R"({"kind": "directAdjacency", "targets": ["lab"]})", RuleKind::DirectAdjacency},
        {R"({"kind": "preferredAdjacency", "targets": ["consult"]})", RuleKind::PreferredAdjacency},
        {R"({"kind": "separation", "targets": ["doctorsOffice"], "minDistance": 24})", RuleKind::Separation},
        {R"({"kind": "nearSpace", "targets": ["checkOut"], "maxDistance": 120})", RuleKind::NearSpace},
        {R"({"kind": "notWithinDistance", "targets": ["crossoverHallway"], "minDistance": 36})", RuleKind::NotWithinDistance},
        {R"({"kind": "preferNearCenter", "reference": "treatmentRoom"})", RuleKind::PreferNearCenter},
        {R"({"kind": "requireVisibility", "targets": ["checkOut"]})", RuleKind::Visibility},
        {R"({"kind": "avoidVisibility", "targets": ["group:public"]})", RuleKind::Visibility},
    };

    for (const auto& c : cases) {
        SpatialRule rule = RuleLoader::parse_rule(c.json);
        EXPECT_EQ(rule_kind(rule), c.kind) << c.json;
    }
}

TEST_F(RuleLoaderTest, RejectsUnknownRuleKind) {
    EXPECT_THROW(RuleLoader::parse_rule(R"({"kind": "entryOppositeEnds"})"), ConfigurationError);
    EXPECT_THROW(RuleLoader::parse_rule(R"({"targets": ["lab"]})"), ConfigurationError);
}

TEST_F(RuleLoaderTest, UnknownKindInRoomTypeNamesPath) {
    try {
        (void)load(R"({"lab": {"entryRules": [{"kind": "teleport", "targets": ["x"]}]}})");
        FAIL() << "expected ConfigurationError";
    } catch (const ConfigurationError& e) {
        std::string msg = e.what();
        EXPECT_NE(msg.find("roomTypes.lab.entryRules[0]"), std::string::npos) << msg;
        EXPECT_NE(msg.find("teleport"), std::string::npos) << msg;
    }
}

TEST_F(RuleLoaderTest, HardnessDefaults) {
    auto sep = RuleLoader::parse_rule(R"({"kind": "separation", "targets": ["a"]})");
    auto pref = RuleLoader::parse_rule(R"({"kind": "preferredAdjacency", "targets": ["a"]})");
    auto vis = RuleLoader::parse_rule(R"({"kind": "requireVisibility", "targets": ["a"]})");
    auto center = RuleLoader::parse_rule(R"({"kind": "preferNearCenter", "reference": "a"})");

    EXPECT_TRUE(rule_base(sep).hard);
    EXPECT_FALSE(rule_base(pref).hard);
    EXPECT_FALSE(rule_base(vis).hard);
    EXPECT_FALSE(rule_base(center).hard);
}

TEST_F(RuleLoaderTest, ReadsCommonFields) {
    auto rule = RuleLoader::parse_rule(
        R"({"kind": "separation", "targets": ["group:public", "mechanical"],
            "hard": false, "weight": 3, "match": "any", "minDistance": 36})");

    const auto& sep = std::get<SeparationRule>(rule);
    EXPECT_FALSE(sep.hard);
    EXPECT_EQ(sep.weight, 3);
    EXPECT_EQ(sep.match, TargetMatch::Any);
    EXPECT_EQ(sep.min_distance, 36);
    ASSERT_EQ(sep.targets.size(), 2u);
    EXPECT_TRUE(sep.targets[0].is_group());
    EXPECT_EQ(sep.targets[0].name, "public");
    EXPECT_EQ(sep.targets[1].name, "mechanical");
}

TEST_F(RuleLoaderTest, TbdParameterMarksRuleUnresolved) {
    auto within = RuleLoader::parse_rule(
        R"({"kind": "entryWithinDistance", "targets": ["checkOut"], "maxDistance": "TBD"})");
    EXPECT_TRUE(rule_base(within).unresolved);
    EXPECT_EQ(rule_base(within).unresolved_reason, "maxDistance is TBD");

    auto near = RuleLoader::parse_rule(R"({"kind": "nearSpace", "targets": "TBD", "maxDistance": 10})");
    EXPECT_TRUE(rule_base(near).unresolved);
}

TEST_F(RuleLoaderTest, NearSpaceNeedsDistance) {
    EXPECT_THROW(RuleLoader::parse_rule(R"({"kind": "nearSpace", "targets": ["a"]})"),
                 ConfigurationError);
    EXPECT_THROW(RuleLoader::parse_rule(R"({"kind": "notWithinDistance", "targets": ["a"]})"),
                 ConfigurationError);
}

TEST_F(RuleLoaderTest, RejectsBadFieldTypes) {
    EXPECT_THROW(RuleLoader::parse_rule(R"({"kind": "separation", "targets": ["a"], "minDistance": 1.5})"),
                 ConfigurationError);
    EXPECT_THROW(RuleLoader::parse_rule(R"({"kind": "separation", "targets": ["a"], "hard": "yes"})"),
                 ConfigurationError);
    EXPECT_THROW(RuleLoader::parse_rule(R"({"kind": "separation", "targets": ["a"], "match": "most"})"),
                 ConfigurationError);
}

TEST_F(RuleLoaderTest, SectionsRoutedToRegistryValidation) {
    // Separation is not an entry rule
    EXPECT_THROW(load(R"({"lab": {"entryRules": [{"kind": "separation", "targets": ["a"]}]}})"),
                 ConfigurationError);
    // Unknown group
    EXPECT_THROW(load(R"({"lab": {"visibility": [{"kind": "avoidVisibility", "targets": ["group:vip"]}]}})"),
                 ConfigurationError);
}

TEST_F(RuleLoaderTest, LoadsAllSections) {
    RuleRegistry registry = load(R"({
        "lab": {
            "entryRules": [{"kind": "entryFrom", "targets": ["group:clinical"]}],
            "clearances": {"ideal": [{"kind": "separation", "targets": ["mechanical"]}]},
            "adjacency": {
                "direct": [{"kind": "directAdjacency", "targets": ["sterilization"]}],
                "preferred": [{"kind": "preferredAdjacency", "targets": ["consult"]}],
                "separation": [{"kind": "separation", "targets": ["group:public"]}]
            },
            "proximity": [{"kind": "nearSpace", "targets": ["sterilization"], "maxDistance": 60}],
            "visibility": [{"kind": "avoidVisibility", "targets": ["group:public"]}],
            "scalability": "fixed"
        }
    })");

    const RoomTypeRule* lab = registry.find("lab");
    EXPECT_EQ(lab->all_rules().size(), 7u);
    EXPECT_EQ(lab->scalability, "fixed");
}

// ============================================================================
// Document Tests
// ============================================================================

TEST_F(RuleLoaderTest, RejectsMalformedDocument) {
    EXPECT_THROW(RuleLoader::load_string("{ nope"), ConfigurationError);
    EXPECT_THROW(RuleLoader::load_string(R"({"version": 1})"), ConfigurationError);
    EXPECT_THROW(RuleLoader::load_string(R"({"version": 2, "roomTypes": {}})"), ConfigurationError);
    EXPECT_THROW(RuleLoader::load_string(R"({"roomTypes": {"lab": {"category": "lounge"}}})"),
                 ConfigurationError);
}

TEST_F(RuleLoaderTest, MissingFileThrows) {
    EXPECT_THROW(RuleLoader::load_file("/nonexistent/rules.json"), ConfigurationError);
}

TEST_F(RuleLoaderTest, LoadsSampleRuleSet) {
    RuleRegistry registry = RuleLoader::load_file(std::string(BLOCKPLAN_TEST_DATA_DIR) +
                                                  "/rules/clinic_rules.json");
    EXPECT_GE(registry.size(), 10u);
    EXPECT_TRUE(registry.contains("sterilization"));
    EXPECT_TRUE(registry.contains("clinicalCorridor"));
}

} // namespace test
} // namespace blockplan
