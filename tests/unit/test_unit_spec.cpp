/**
 * @file test_unit_spec.cpp
 * @brief Unit tests for placeholder formatting and unit specification parsing
 */

#include <gtest/gtest.h>
#include "UnitSpec.hpp"
#include "UnitErrors.hpp"

using namespace QWRAP;

class UnitSpecTest : public ::testing::Test {
protected:
    UnitSystem units;
};

TEST_F(UnitSpecTest, FormatValueToString) {
    EXPECT_EQ(formatValueToString(FormatValue(2)), "2");
    EXPECT_EQ(formatValueToString(FormatValue(2.5)), "2.5");
    EXPECT_EQ(formatValueToString(FormatValue(std::string("m"))), "m");
}

TEST_F(UnitSpecTest, MergeUsesCallValueOverDefault) {
    FormatValues defaults{{"order", 1}, {"unit", std::string("m")}};
    FormatValues keywords{{"order", 3}, {"unrelated", 7}};

    FormatValues merged = mergeFormatValues(defaults, keywords);
    EXPECT_EQ(merged.size(), 2u);
    EXPECT_EQ(std::get<int>(merged.at("order")), 3);
    EXPECT_EQ(std::get<std::string>(merged.at("unit")), "m");
    EXPECT_EQ(merged.count("unrelated"), 0u);
}

TEST_F(UnitSpecTest, FormatPlaceholders) {
    FormatValues values{{"order", 2}, {"base", std::string("m")}};
    EXPECT_EQ(formatPlaceholders("=y / x^{order}", values), "=y / x^2");
    EXPECT_EQ(formatPlaceholders("{base} / s", values), "m / s");
    EXPECT_EQ(formatPlaceholders("no placeholders", values), "no placeholders");
    EXPECT_EQ(formatPlaceholders("{{order}}", values), "{order}");
}

TEST_F(UnitSpecTest, MissingPlaceholderValueThrows) {
    try {
        formatPlaceholders("=y / x^{order}", FormatValues());
        FAIL() << "Expected DeclarationError";
    } catch (const DeclarationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::UNRESOLVED_PLACEHOLDER);
        EXPECT_NE(std::string(e.what()).find("{order}"), std::string::npos);
    }
}

TEST_F(UnitSpecTest, DetectPlaceholders) {
    EXPECT_TRUE(hasPlaceholders("x^{order}"));
    EXPECT_FALSE(hasPlaceholders("m / s"));
    EXPECT_FALSE(hasPlaceholders("{{escaped}}"));
    EXPECT_FALSE(hasPlaceholders("{1}"));
}

TEST_F(UnitSpecTest, SpecKinds) {
    EXPECT_EQ(UnitSpec().kind(), UnitSpec::Kind::NONE);
    EXPECT_EQ(UnitSpec(nullptr).kind(), UnitSpec::Kind::NONE);
    EXPECT_EQ(UnitSpec("m").kind(), UnitSpec::Kind::STRING);
    EXPECT_EQ(UnitSpec(CompoundUnit("m")).kind(), UnitSpec::Kind::UNIT);
    EXPECT_EQ(UnitSpec(5).kind(), UnitSpec::Kind::NUMBER);

    EXPECT_EQ(UnitSpec().toString(), "none");
    EXPECT_EQ(UnitSpec("=x").toString(), "'=x'");
    EXPECT_EQ(UnitSpec(CompoundUnit("m")).toString(), "unit(m)");
}

TEST_F(UnitSpecTest, ParseNoneDescriptor) {
    UnitDescriptor descriptor = parseDescriptor(UnitSpec(), FormatValues(), units);
    EXPECT_TRUE(descriptor.is_none);
    EXPECT_FALSE(descriptor.is_reference);
}

TEST_F(UnitSpecTest, ParseAbsoluteDescriptor) {
    UnitDescriptor descriptor = parseDescriptor(UnitSpec("km / hr"), FormatValues(), units);
    EXPECT_FALSE(descriptor.is_none);
    EXPECT_FALSE(descriptor.is_reference);
    EXPECT_EQ(descriptor.container, units.parseUnit("km / hr"));

    UnitDescriptor unit = parseDescriptor(UnitSpec(CompoundUnit("s")), FormatValues(), units);
    EXPECT_FALSE(unit.is_reference);
    EXPECT_EQ(unit.container, CompoundUnit("s"));

    // An empty string is dimensionless, not "no declaration"
    UnitDescriptor empty = parseDescriptor(UnitSpec(""), FormatValues(), units);
    EXPECT_FALSE(empty.is_none);
    EXPECT_TRUE(empty.container.isDimensionless());
}

TEST_F(UnitSpecTest, ParseReferenceDescriptor) {
    UnitDescriptor descriptor =
        parseDescriptor(UnitSpec("=y / x^{order}"), FormatValues{{"order", 2}}, units);
    EXPECT_TRUE(descriptor.is_reference);
    EXPECT_TRUE(descriptor.has_placeholders);
    EXPECT_EQ(descriptor.container,
              CompoundUnit(CompoundUnit::Terms{{"x", -2.0}, {"y", 1.0}}));
}

TEST_F(UnitSpecTest, ReferenceSymbolsNeedNotBeUnits) {
    UnitDescriptor descriptor = parseDescriptor(UnitSpec("=pressure * volume"), FormatValues(), units);
    EXPECT_TRUE(descriptor.is_reference);
    EXPECT_EQ(descriptor.container.terms().size(), 2u);
}

TEST_F(UnitSpecTest, NumericSpecIsRejected) {
    try {
        parseDescriptor(UnitSpec(3.0), FormatValues(), units);
        FAIL() << "Expected DeclarationError";
    } catch (const DeclarationError& e) {
        EXPECT_EQ(e.kind(), ErrorKind::INVALID_SPEC_KIND);
    }
}

TEST_F(UnitSpecTest, UnknownAbsoluteUnitThrows) {
    EXPECT_THROW(parseDescriptor(UnitSpec("furlong"), FormatValues(), units), std::runtime_error);
}
