/**
 * @file test_value.cpp
 * @brief Unit tests for the raw / quantity / labelled array value variant
 */

#include <gtest/gtest.h>
#include "Value.hpp"
#include <stdexcept>

using namespace QWRAP;

class ValueTest : public ::testing::Test {
protected:
    UnitSystem units;
};

TEST_F(ValueTest, KindsAndAccessors) {
    Value raw(2.5);
    Value integer(3);
    Value quantity(Quantity(1.0, "m"));
    Value array(LabelledArray("x", {1.0}));

    EXPECT_TRUE(raw.isRaw());
    EXPECT_DOUBLE_EQ(integer.asRaw(), 3.0);
    EXPECT_TRUE(quantity.isQuantity());
    EXPECT_TRUE(array.isLabelledArray());

    EXPECT_THROW(raw.asQuantity(), std::runtime_error);
    EXPECT_THROW(quantity.asLabelledArray(), std::runtime_error);
    EXPECT_THROW(array.asRaw(), std::runtime_error);
}

TEST_F(ValueTest, ExplicitUnits) {
    EXPECT_FALSE(Value(1.0).hasExplicitUnits());
    EXPECT_TRUE(Value(Quantity(1.0, "m")).hasExplicitUnits());

    LabelledArray attributed("x", {1.0}, {{"units", "m"}});
    EXPECT_FALSE(Value(attributed).hasExplicitUnits());
    EXPECT_TRUE(Value(attributed.quantify(units)).hasExplicitUnits());
}

TEST_F(ValueTest, OwnUnits) {
    EXPECT_FALSE(Value(1.0).ownUnits(units).has_value());
    EXPECT_EQ(*Value(Quantity(1.0, "km")).ownUnits(units), CompoundUnit("km"));

    LabelledArray attributed("x", {1.0}, {{"units", "hr"}});
    EXPECT_EQ(*Value(attributed).ownUnits(units), CompoundUnit("hr"));
}

TEST_F(ValueTest, WithAndWithoutUnits) {
    Value quantity = Value(4.0).withUnits(CompoundUnit("m"));
    ASSERT_TRUE(quantity.isQuantity());
    EXPECT_DOUBLE_EQ(quantity.magnitude(), 4.0);

    Value stripped = quantity.withoutUnits();
    ASSERT_TRUE(stripped.isRaw());
    EXPECT_DOUBLE_EQ(stripped.asRaw(), 4.0);

    // Reassigning units keeps the magnitude
    Value relabelled = Value(Quantity(4.0, "km")).withUnits(CompoundUnit("s"));
    EXPECT_DOUBLE_EQ(relabelled.magnitude(), 4.0);
    EXPECT_EQ(relabelled.asQuantity().units(), CompoundUnit("s"));

    Value array = Value(LabelledArray("x", {1.0})).withUnits(CompoundUnit("m")).withoutUnits();
    ASSERT_TRUE(array.isLabelledArray());
    EXPECT_EQ(array.asLabelledArray().attrs().at("units"), "m");
}

TEST_F(ValueTest, ConvertedTo) {
    Value converted = Value(Quantity(2.0, "km")).convertedTo(CompoundUnit("m"), units);
    EXPECT_NEAR(converted.magnitude(), 2000.0, 1e-9);

    EXPECT_THROW(Value(2.0).convertedTo(CompoundUnit("m"), units), std::runtime_error);
}

TEST_F(ValueTest, ArrayHasNoScalarMagnitude) {
    EXPECT_THROW(Value(LabelledArray("x", {1.0, 2.0})).magnitude(), std::runtime_error);
}

TEST_F(ValueTest, ParseQuantityText) {
    Value pressure = Value::parse("100 psi", units);
    ASSERT_TRUE(pressure.isQuantity());
    EXPECT_DOUBLE_EQ(pressure.magnitude(), 100.0);
    EXPECT_EQ(pressure.asQuantity().units(), CompoundUnit("psi"));

    Value plain = Value::parse("7", units);
    EXPECT_TRUE(plain.asQuantity().units().isDimensionless());

    EXPECT_THROW(Value::parse("psi", units), std::runtime_error);
}

TEST_F(ValueTest, ToString) {
    EXPECT_EQ(Value(1.5).toString(), "1.5");
    EXPECT_EQ(Value(Quantity(2.0, "m")).toString(), "2 m");
    EXPECT_EQ(Value(LabelledArray("x", {1.0, 2.0})).toString(), "<LabelledArray 'x' size=2>");
}
