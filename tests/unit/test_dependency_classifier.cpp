/**
 * @file test_dependency_classifier.cpp
 * @brief Unit tests for independent / dependent / constant argument roles
 */

#include <gtest/gtest.h>
#include "DependencyClassifier.hpp"
#include "UnitErrors.hpp"

using namespace QWRAP;

class DependencyClassifierTest : public ::testing::Test {
protected:
    UnitSystem units;
};

TEST_F(DependencyClassifierTest, SymbolsDefinedByInputs) {
    AlternativeGroup group = classifyGroup({"=x", "=y"}, {"=y / x"}, FormatValues(), units);

    ASSERT_EQ(group.independent.size(), 2u);
    EXPECT_EQ(group.independent.at("x"), 0u);
    EXPECT_EQ(group.independent.at("y"), 1u);
    EXPECT_TRUE(group.dependent.empty());
    EXPECT_TRUE(group.constant.empty());
    EXPECT_EQ(group.symbols(), (std::set<std::string>{"x", "y"}));
    EXPECT_TRUE(group.outputs[0].is_reference);
}

TEST_F(DependencyClassifierTest, MixedRoles) {
    AlternativeGroup group =
        classifyGroup({"=x", "=x^2", "m", UnitSpec()}, {}, FormatValues(), units);

    EXPECT_EQ(group.independent.at("x"), 0u);
    EXPECT_EQ(group.dependent, (std::set<size_t>{1}));
    EXPECT_EQ(group.constant, (std::set<size_t>{2}));
    EXPECT_TRUE(group.inputs[3].is_none);
}

TEST_F(DependencyClassifierTest, RepeatedSymbolIsDependent) {
    AlternativeGroup group = classifyGroup({"=x", "=x"}, {}, FormatValues(), units);
    EXPECT_EQ(group.independent.at("x"), 0u);
    EXPECT_EQ(group.dependent, (std::set<size_t>{1}));
}

TEST_F(DependencyClassifierTest, SymbolDefinedLaterInArguments) {
    AlternativeGroup group = classifyGroup({"=y / x", "=x", "=y"}, {}, FormatValues(), units);
    EXPECT_EQ(group.dependent, (std::set<size_t>{0}));
    EXPECT_EQ(group.independent.size(), 2u);
}

TEST_F(DependencyClassifierTest, UndefinedSymbolInInput) {
    try {
        classifyGroup({"=x", "=x / z"}, {}, FormatValues(), units);
        FAIL() << "Expected DeclarationError";
    } catch (const DeclarationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UNDEFINED_SYMBOL);
        EXPECT_NE(std::string(e.what()).find("'z'"), std::string::npos);
    }
}

TEST_F(DependencyClassifierTest, UndefinedSymbolInOutput) {
    try {
        classifyGroup({"=x"}, {"=z"}, FormatValues(), units);
        FAIL() << "Expected DeclarationError";
    } catch (const DeclarationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UNDEFINED_SYMBOL);
    }
}

TEST_F(DependencyClassifierTest, PlaceholdersUseDefaults) {
    AlternativeGroup group = classifyGroup({"=x", "=y"}, {"=y / x^{order}"},
                                           FormatValues{{"order", 3}}, units);
    EXPECT_TRUE(group.outputs[0].has_placeholders);
    EXPECT_EQ(group.outputs[0].container,
              CompoundUnit(CompoundUnit::Terms{{"x", -3.0}, {"y", 1.0}}));

    EXPECT_THROW(classifyGroup({"=x"}, {"=x^{order}"}, FormatValues(), units),
                 DeclarationError);
}

TEST_F(DependencyClassifierTest, ClassifyEveryGroup) {
    GroupedSpecs grouped = groupArguments({"J | K", "s"}, "J / s | K / s");
    std::vector<AlternativeGroup> groups = classifyGroups(grouped, FormatValues(), units);
    ASSERT_EQ(groups.size(), 2u);
    EXPECT_EQ(groups[0].constant, (std::set<size_t>{0, 1}));
    EXPECT_EQ(groups[1].inputs[0].container, CompoundUnit("K"));
}
