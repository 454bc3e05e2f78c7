/**
 * @file test_quantity.cpp
 * @brief Unit tests for scalar quantities
 */

#include <gtest/gtest.h>
#include "Quantity.hpp"
#include <sstream>
#include <stdexcept>

using namespace QWRAP;

TEST(QuantityTest, ConstructFromExpression) {
    Quantity q(9.81, "m / s^2");
    EXPECT_DOUBLE_EQ(q.magnitude(), 9.81);
    EXPECT_EQ(q.units(), CompoundUnit(CompoundUnit::Terms{{"m", 1.0}, {"s", -2.0}}));
}

TEST(QuantityTest, ConvertToCompatibleUnit) {
    Quantity speed(36.0, "km / hr");
    Quantity converted = speed.to(parseUnit("m / s"));
    EXPECT_NEAR(converted.magnitude(), 10.0, 1e-12);
    EXPECT_EQ(converted.units(), parseUnit("m / s"));
}

TEST(QuantityTest, ConvertToIncompatibleUnitThrows) {
    Quantity length(1.0, "m");
    EXPECT_FALSE(length.isCompatibleWith(parseUnit("s"), UnitSystemManager::getInstance()));
    EXPECT_THROW(length.to(parseUnit("s")), std::runtime_error);
}

TEST(QuantityTest, MultiplyAndDivide) {
    Quantity distance(150.0, "km");
    Quantity time(2.0, "hr");

    Quantity speed = distance / time;
    EXPECT_DOUBLE_EQ(speed.magnitude(), 75.0);
    EXPECT_EQ(speed.units(), parseUnit("km / hr"));

    Quantity back = speed * time;
    EXPECT_DOUBLE_EQ(back.magnitude(), 150.0);
    EXPECT_EQ(back.units(), CompoundUnit("km"));

    Quantity inverse = 1.0 / time;
    EXPECT_DOUBLE_EQ(inverse.magnitude(), 0.5);
    EXPECT_EQ(inverse.units(), CompoundUnit("hr", -1.0));
}

TEST(QuantityTest, ScalarFactors) {
    Quantity q(4.0, "m");
    EXPECT_DOUBLE_EQ((q * 2.0).magnitude(), 8.0);
    EXPECT_DOUBLE_EQ((2.0 * q).magnitude(), 8.0);
    EXPECT_DOUBLE_EQ((q / 4.0).magnitude(), 1.0);
    EXPECT_DOUBLE_EQ((-q).magnitude(), -4.0);
    EXPECT_EQ((q * 2.0).units(), CompoundUnit("m"));
}

TEST(QuantityTest, PowerScalesExponents) {
    Quantity area = pow(Quantity(3.0, "m"), 2.0);
    EXPECT_DOUBLE_EQ(area.magnitude(), 9.0);
    EXPECT_EQ(area.units(), CompoundUnit("m", 2.0));
}

TEST(QuantityTest, AdditionRequiresEqualUnits) {
    Quantity a(1.0, "m");
    Quantity b(2.0, "m");
    EXPECT_DOUBLE_EQ((a + b).magnitude(), 3.0);
    EXPECT_DOUBLE_EQ((b - a).magnitude(), 1.0);
    EXPECT_THROW(a + Quantity(1.0, "km"), std::runtime_error);
    EXPECT_THROW(a - Quantity(1.0, "s"), std::runtime_error);
}

TEST(QuantityTest, Formatting) {
    Quantity q(2.0, "m / s");
    EXPECT_EQ(q.toString(), "2 m / s");

    std::ostringstream os;
    os << Quantity(1.0, "s / m^2");
    EXPECT_EQ(os.str(), "1 s / m^2");
}
