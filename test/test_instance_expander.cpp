/// @file test_instance_expander.cpp
/// @brief Unit tests for room count expansion and target lookup

#include <gtest/gtest.h>

#include <blockplan/instance_expander.hpp>
#include <blockplan/log.hpp>

namespace blockplan {
namespace test {

class InstanceExpanderTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::vector<RoomTypeRule> rules;
        rules.push_back(room("clinicalCorridor", RoomCategory::Clinical, CirculationRole::Spine));
        rules.push_back(room("lab", RoomCategory::Clinical));
        rules.push_back(room("sterilization", RoomCategory::Clinical));
        rules.push_back(room("waitingRoom", RoomCategory::Public));
        rules.push_back(room("checkOut", RoomCategory::Public));
        registry = RuleRegistry(std::move(rules));
    }

    static RoomTypeRule room(const std::string& id, RoomCategory category,
                             CirculationRole role = CirculationRole::Destination) {
        RoomTypeRule r;
        r.id = id;
        r.category = category;
        r.role = role;
        return r;
    }

    InstanceSet expand(const std::map<std::string, int>& counts) {
        InstanceExpander expander(registry);
        return expander.expand(counts, notes);
    }

    RuleRegistry registry;
    std::vector<std::string> notes;
};

// ============================================================================
// Expansion
// ============================================================================

TEST_F(InstanceExpanderTest, ExpandsCountsInTypeOrder) {
    InstanceSet set = expand({{"sterilization", 1}, {"lab", 2}});

    ASSERT_EQ(set.size(), 3u);
    EXPECT_EQ(set[0], (RoomInstance{"lab", 0}));
    EXPECT_EQ(set[1], (RoomInstance{"lab", 1}));
    EXPECT_EQ(set[2], (RoomInstance{"sterilization", 0}));
    EXPECT_EQ(set[1].label(), "lab__1");
    EXPECT_TRUE(notes.empty());
}

TEST_F(InstanceExpanderTest, ZeroCountProducesNoInstancesAndANote) {
    InstanceSet set = expand({{"lab", 0}, {"sterilization", 1}});

    ASSERT_EQ(set.size(), 1u);
    EXPECT_TRUE(set.of_type("lab").empty());
    ASSERT_EQ(notes.size(), 1u);
    EXPECT_NE(notes[0].find("'lab'"), std::string::npos);
}

TEST_F(InstanceExpanderTest, EmptyRequest) {
    InstanceSet set = expand({});
    EXPECT_TRUE(set.empty());
    EXPECT_TRUE(set.room_types().empty());
}

TEST_F(InstanceExpanderTest, NegativeCountRejected) {
    EXPECT_THROW(expand({{"lab", -1}}), ConfigurationError);
}

TEST_F(InstanceExpanderTest, EmptyTypeRejected) {
    EXPECT_THROW(expand({{"", 1}}), ConfigurationError);
}

TEST_F(InstanceExpanderTest, UnknownTypeKeptWithWarning) {
    std::vector<std::string> logged;
    ScopedLogSink sink([&logged](LogLevel level, const std::string& msg) {
        if (level == LogLevel::Warn) logged.push_back(msg);
    });

    InstanceSet set = expand({{"vault", 1}});
    ASSERT_EQ(set.size(), 1u);
    EXPECT_EQ(set.rule_of(0), nullptr);
    ASSERT_EQ(notes.size(), 1u);
    EXPECT_NE(notes[0].find("no rules"), std::string::npos);
    EXPECT_EQ(logged.size(), 1u);
}

TEST_F(InstanceExpanderTest, RuleOfKnownType) {
    InstanceSet set = expand({{"lab", 1}});
    ASSERT_NE(set.rule_of(0), nullptr);
    EXPECT_EQ(set.rule_of(0)->id, "lab");
}

// ============================================================================
// Lookups
// ============================================================================

TEST_F(InstanceExpanderTest, OfTypeIndexesPositions) {
    InstanceSet set = expand({{"lab", 2}, {"checkOut", 1}});
    EXPECT_EQ(set.of_type("lab"), (std::vector<size_t>{1, 2}));
    EXPECT_EQ(set.of_type("checkOut"), (std::vector<size_t>{0}));
    EXPECT_TRUE(set.of_type("mechanical").empty());
    EXPECT_EQ(set.room_types(), (std::vector<std::string>{"checkOut", "lab"}));
}

TEST_F(InstanceExpanderTest, GroupsByCategoryAndRole) {
    InstanceSet set = expand({{"clinicalCorridor", 1}, {"lab", 1}, {"waitingRoom", 1}});
    // Order: clinicalCorridor(0), lab(1), waitingRoom(2)
    EXPECT_EQ(set.of_group("clinical"), (std::vector<size_t>{0, 1}));
    EXPECT_EQ(set.of_group("public"), (std::vector<size_t>{2}));
    EXPECT_EQ(set.of_group("corridors"), (std::vector<size_t>{0}));
    EXPECT_TRUE(set.of_group("private").empty());
}

TEST_F(InstanceExpanderTest, ResolveTargetsExcludesSelf) {
    InstanceSet set = expand({{"lab", 2}, {"sterilization", 1}});
    // lab__0 = 0, lab__1 = 1, sterilization__0 = 2
    std::vector<RuleTarget> targets = {RuleTarget::room("lab"), RuleTarget::group("clinical")};
    EXPECT_EQ(set.resolve_targets(targets, 0), (std::vector<size_t>{1, 2}));
    EXPECT_EQ(set.resolve_targets({RuleTarget::room("lab")}, 2), (std::vector<size_t>{0, 1}));
    EXPECT_TRUE(set.resolve_targets({RuleTarget::room("consult")}, 0).empty());
}

} // namespace test
} // namespace blockplan
