/**
 * @file test_group_selector.cpp
 * @brief Unit tests for choosing among alternative unit groups
 */

#include <gtest/gtest.h>
#include "GroupSelector.hpp"

using namespace QWRAP;

class GroupSelectorTest : public ::testing::Test {
protected:
    void SetUp() override {
        groups = classifyGroups(groupArguments({"J | K", "s"}, "J / s | K / s"),
                                FormatValues(), units);
    }

    UnitSystem units;
    std::vector<AlternativeGroup> groups;
};

TEST_F(GroupSelectorTest, SelectsByFirstConstant) {
    GroupSelection energy = selectGroup(groups, {Quantity(1.0, "kJ"), Quantity(1.0, "s")},
                                        FormatValues(), units);
    EXPECT_EQ(energy.index, 0u);
    EXPECT_TRUE(energy.matched);

    GroupSelection temperature = selectGroup(groups, {Quantity(1.0, "degC"), 2.0},
                                             FormatValues(), units);
    EXPECT_EQ(temperature.index, 1u);
    EXPECT_TRUE(temperature.matched);
}

TEST_F(GroupSelectorTest, UnitlessArgumentsMatchFirstGroup) {
    GroupSelection selection = selectGroup(groups, {1.0, 1.0}, FormatValues(), units);
    EXPECT_EQ(selection.index, 0u);
    EXPECT_TRUE(selection.matched);
}

TEST_F(GroupSelectorTest, SelectionIsOrderStable) {
    std::vector<AlternativeGroup> lengths =
        classifyGroups(groupArguments("m | ft", nullptr), FormatValues(), units);
    GroupSelection selection = selectGroup(lengths, {Quantity(1.0, "km")}, FormatValues(), units);
    EXPECT_EQ(selection.index, 0u);
}

TEST_F(GroupSelectorTest, FallsBackToLastGroup) {
    GroupSelection selection = selectGroup(groups, {Quantity(1.0, "m"), 1.0},
                                           FormatValues(), units);
    EXPECT_EQ(selection.index, 1u);
    EXPECT_FALSE(selection.matched);
}

TEST_F(GroupSelectorTest, ArrayAttributeUnitsParticipate) {
    LabelledArray temperature("T", {280.0, 290.0}, {{"units", "K"}});
    GroupSelection selection = selectGroup(groups, {temperature, 1.0}, FormatValues(), units);
    EXPECT_EQ(selection.index, 1u);
}

TEST_F(GroupSelectorTest, PlaceholdersResolvedAtCallTime) {
    FormatValues defaults{{"n", 1}};
    std::vector<AlternativeGroup> powers =
        classifyGroups(groupArguments("m^{n}", nullptr), defaults, units);

    GroupSelection squared = selectGroup(powers, {Quantity(1.0, "m^2")},
                                         FormatValues{{"n", 2}}, units);
    EXPECT_TRUE(squared.matched);

    GroupSelection linear = selectGroup(powers, {Quantity(1.0, "m^2")}, defaults, units);
    EXPECT_FALSE(linear.matched);
    EXPECT_EQ(linear.index, 0u);
}
