/// @file test_rule_resolution.cpp
/// @brief Unit tests for size, entry and orientation resolution

#include <gtest/gtest.h>

#include <blockplan/rule_resolution.hpp>

namespace blockplan {
namespace test {

class RuleResolutionTest : public ::testing::Test {
protected:
    void SetUp() override {
        sterilization.id = "sterilization";
        sterilization.dimensions.tiers = {
            tier("compact", 5, 8, 110, 152),
            tier("enhanced", 9, 14, 110, 184),
            tier("elite", 15, 22, 110, 268),
        };

        EntryTier small;
        small.treatment_rooms_min = 5;
        small.treatment_rooms_max = 8;
        small.min_entries = 1;
        small.max_entries = 1;
        EntryTier large;
        large.treatment_rooms_min = 9;
        large.min_entries = 2;
        large.max_entries = 2;
        sterilization.entries.tiers = {small, large};
    }

    static DimensionTier tier(const char* label, int lo, int hi, std::int64_t w, std::int64_t l) {
        DimensionTier t;
        t.label = label;
        t.treatment_rooms_min = lo;
        t.treatment_rooms_max = hi;
        t.size.width = w;
        t.size.length = l;
        return t;
    }

    static LayoutContext with_rooms(int treatment_rooms) {
        LayoutContext ctx;
        ctx.treatment_rooms = treatment_rooms;
        return ctx;
    }

    RoomTypeRule sterilization;
    std::vector<std::string> notes;
};

// ============================================================================
// Size
// ============================================================================

TEST_F(RuleResolutionTest, ExplicitBoundsWin) {
    RoomTypeRule office;
    office.id = "doctorsOffice";
    office.dimensions.minimum = {96, 96};
    office.dimensions.maximum = {156, 120};
    office.dimensions.ideal = {120, 108};

    ResolvedSize size = resolve_size(office, {}, notes);
    EXPECT_EQ(size.min_width, 96);
    EXPECT_EQ(size.min_height, 96);
    EXPECT_EQ(size.max_width, 156);
    EXPECT_EQ(size.max_height, 120);
    EXPECT_EQ(size.ideal_width, 120);
    EXPECT_EQ(size.ideal_height, 108);
    EXPECT_TRUE(notes.empty());
}

TEST_F(RuleResolutionTest, TierSelectedByTreatmentRooms) {
    ResolvedSize size = resolve_size(sterilization, with_rooms(10), notes);
    EXPECT_EQ(size.min_width, 110);
    EXPECT_EQ(size.min_height, 184);
    EXPECT_EQ(size.max_height, 184);
}

TEST_F(RuleResolutionTest, TierBoundariesInclusive) {
    EXPECT_EQ(resolve_size(sterilization, with_rooms(8), notes).min_height, 152);
    EXPECT_EQ(resolve_size(sterilization, with_rooms(15), notes).min_height, 268);
}

TEST_F(RuleResolutionTest, NoContextSpansAllTiers) {
    ResolvedSize size = resolve_size(sterilization, {}, notes);
    EXPECT_EQ(size.min_height, 152);
    EXPECT_EQ(size.max_height, 268);
}

TEST_F(RuleResolutionTest, UnmatchedCountSpansAllTiers) {
    ResolvedSize size = resolve_size(sterilization, with_rooms(40), notes);
    EXPECT_EQ(size.min_height, 152);
    EXPECT_EQ(size.max_height, 268);
}

TEST_F(RuleResolutionTest, VariantsBoundSize) {
    RoomTypeRule consult;
    consult.id = "consult";
    consult.dimensions.variants = {{96, 96}, {156, 120}};

    ResolvedSize size = resolve_size(consult, {}, notes);
    EXPECT_EQ(size.min_width, 96);
    EXPECT_EQ(size.max_width, 156);
    EXPECT_EQ(size.min_height, 96);
    EXPECT_EQ(size.max_height, 120);
}

TEST_F(RuleResolutionTest, CandidateMaxBelowExplicitMinimumDropped) {
    RoomTypeRule room;
    room.id = "waitingRoom";
    room.dimensions.minimum = {200, 200};
    room.dimensions.variants = {{120, 120}};

    ResolvedSize size = resolve_size(room, {}, notes);
    EXPECT_EQ(size.min_width, 200);
    EXPECT_FALSE(size.max_width.has_value());
}

TEST_F(RuleResolutionTest, TbdSizeAddsNote) {
    RoomTypeRule lab;
    lab.id = "lab";
    lab.dimensions.ideal = {96, 72};
    lab.dimensions.unresolved = true;

    ResolvedSize size = resolve_size(lab, {}, notes);
    EXPECT_FALSE(size.min_width.has_value());
    EXPECT_EQ(size.ideal_width, 96);
    ASSERT_EQ(notes.size(), 1u);
    EXPECT_NE(notes[0].find("'lab'"), std::string::npos);
    EXPECT_NE(notes[0].find("TBD"), std::string::npos);
}

// ============================================================================
// Entries
// ============================================================================

TEST_F(RuleResolutionTest, EntryTierSelection) {
    ResolvedEntries small = resolve_entries(sterilization, with_rooms(6), notes);
    EXPECT_EQ(small.min_entries, 1);
    EXPECT_EQ(small.max_entries, 1);

    ResolvedEntries large = resolve_entries(sterilization, with_rooms(20), notes);
    EXPECT_EQ(large.min_entries, 2);
    EXPECT_EQ(large.max_entries, 2);
    EXPECT_TRUE(notes.empty());
}

TEST_F(RuleResolutionTest, EntryTiersWithoutContextNoted) {
    ResolvedEntries e = resolve_entries(sterilization, {}, notes);
    EXPECT_EQ(e.min_entries, 0);
    EXPECT_FALSE(e.max_entries.has_value());
    ASSERT_EQ(notes.size(), 1u);
    EXPECT_NE(notes[0].find("treatment-room count"), std::string::npos);
}

TEST_F(RuleResolutionTest, EntryTierNoMatchNoted) {
    resolve_entries(sterilization, with_rooms(2), notes);
    ASSERT_EQ(notes.size(), 1u);
    EXPECT_NE(notes[0].find("no entry tier matches 2"), std::string::npos);
}

TEST_F(RuleResolutionTest, AdaRaisesMinimum) {
    RoomTypeRule restroom;
    restroom.id = "patientRestroom";
    restroom.entries.max_entries = 3;
    restroom.ada.required_entries = 2;

    ResolvedEntries e = resolve_entries(restroom, {}, notes);
    EXPECT_EQ(e.min_entries, 2);
    EXPECT_EQ(e.max_entries, 3);
    EXPECT_TRUE(notes.empty());
}

TEST_F(RuleResolutionTest, AdaAboveMaximumKeepsBothBounds) {
    RoomTypeRule restroom;
    restroom.id = "patientRestroom";
    restroom.entries.max_entries = 1;
    restroom.ada.required_entries = 2;

    ResolvedEntries e = resolve_entries(restroom, {}, notes);
    EXPECT_EQ(e.min_entries, 2);
    EXPECT_EQ(e.max_entries, 1);
    ASSERT_EQ(notes.size(), 1u);
    EXPECT_NE(notes[0].find("ADA requires 2 entries but at most 1"), std::string::npos);
}

TEST_F(RuleResolutionTest, TbdEntriesNoted) {
    RoomTypeRule corridor;
    corridor.id = "clinicalCorridor";
    corridor.entries.unresolved = true;

    ResolvedEntries e = resolve_entries(corridor, {}, notes);
    EXPECT_EQ(e.min_entries, 0);
    ASSERT_EQ(notes.size(), 1u);
    EXPECT_NE(notes[0].find("entry count is TBD"), std::string::npos);
}

// ============================================================================
// Orientation
// ============================================================================

TEST_F(RuleResolutionTest, OrientationByLayoutMode) {
    RoomTypeRule room;
    room.id = "sterilization";
    OrientationRule narrow;
    narrow.relation = AxisRelation::Perpendicular;
    narrow.reference = "clinicalCorridor";
    OrientationRule fallback;
    fallback.relation = AxisRelation::Parallel;
    fallback.reference = "north";
    room.orientation.by_layout[LayoutMode::Narrow] = narrow;
    room.orientation.fallback = fallback;

    LayoutContext ctx;
    ctx.layout_mode = LayoutMode::Narrow;
    auto picked = resolve_orientation(room, ctx);
    ASSERT_TRUE(picked.has_value());
    EXPECT_EQ(picked->reference, "clinicalCorridor");

    ctx.layout_mode = LayoutMode::HLayout;
    picked = resolve_orientation(room, ctx);
    ASSERT_TRUE(picked.has_value());
    EXPECT_EQ(picked->reference, "north");

    EXPECT_EQ(resolve_orientation(room, {})->reference, "north");
}

TEST_F(RuleResolutionTest, NoOrientation) {
    RoomTypeRule room;
    room.id = "lab";
    EXPECT_FALSE(resolve_orientation(room, {}).has_value());
}

TEST_F(RuleResolutionTest, EdgeReferences) {
    EXPECT_TRUE(is_edge_reference("north"));
    EXPECT_TRUE(is_edge_reference("west"));
    EXPECT_FALSE(is_edge_reference("clinicalCorridor"));
}

} // namespace test
} // namespace blockplan
