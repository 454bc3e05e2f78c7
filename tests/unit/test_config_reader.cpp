/**
 * @file test_config_reader.cpp
 * @brief Unit tests for ConfigReader class
 */

#include <gtest/gtest.h>
#include "ConfigReader.hpp"
#include "UnitErrors.hpp"
#include <mpi.h>
#include <petsc.h>
#include <fstream>
#include <cstdio>

using namespace QWRAP;

class ConfigReaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        MPI_Comm_rank(PETSC_COMM_WORLD, &rank);
        test_config_file = "test_config_unit.config";

        if (rank == 0) {
            std::ofstream config(test_config_file);
            config << "# Unit enforcement settings\n";
            config << "[enforcement]\n";
            config << "convert = yes\n";
            config << "strict = false\n";
            config << "quantify = on\n";
            config << "\n[format]\n";
            config << "order = 2\n";
            config << "scale = 0.5\n";
            config << "base = m   # inline comment\n";
            config << "\n[units]\n";
            config << "furlong = furlong, 201.168, 1 0 0 0\n";
            config << "degRe = reaumur, 1.25, 0 0 0 1, 218.52\n";
            config << "broken = bad\n";
            config << "\n[aliases]\n";
            config << "fur = furlong\n";
            config << "ghost = not_a_unit\n";
            config << "\n[declaration.deriv]\n";
            config << "units_in = =x, =y\n";
            config << "units_out = =y / x^{order}\n";
            config << "\n[declaration.rates]\n";
            config << "units_in = J | K\n";
            config << "units_out = [J / s | K / s]\n";
            config << "\n[declaration.passthrough]\n";
            config << "units_in = none, m\n";
            config.close();
        }
        MPI_Barrier(PETSC_COMM_WORLD);
    }

    void TearDown() override {
        MPI_Barrier(PETSC_COMM_WORLD);
        if (rank == 0) {
            std::remove(test_config_file.c_str());
        }
    }

    std::string test_config_file;
    int rank;
};

TEST_F(ConfigReaderTest, LoadConfigFile) {
    ConfigReader reader;
    EXPECT_TRUE(reader.loadFile(test_config_file)) << "Should load config file successfully";
    EXPECT_FALSE(reader.loadFile("does_not_exist.config"));
}

TEST_F(ConfigReaderTest, ReadValues) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EXPECT_EQ(reader.getInt("format", "order", 0), 2);
    EXPECT_DOUBLE_EQ(reader.getDouble("format", "scale", 0.0), 0.5);
    EXPECT_EQ(reader.getString("format", "base"), "m");
    EXPECT_TRUE(reader.getBool("enforcement", "convert", false));
    EXPECT_EQ(reader.getString("declaration.deriv", "units_in"), "=x, =y");
}

TEST_F(ConfigReaderTest, DefaultValues) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EXPECT_EQ(reader.getInt("nonexistent", "key", 42), 42);
    EXPECT_DOUBLE_EQ(reader.getDouble("nonexistent", "key", 3.14), 3.14);
    EXPECT_EQ(reader.getInt("format", "base", 7), 7);
    EXPECT_TRUE(reader.getBool("format", "base", true));
}

TEST_F(ConfigReaderTest, SectionsAndKeys) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EXPECT_TRUE(reader.hasSection("enforcement"));
    EXPECT_TRUE(reader.hasSection("declaration.deriv"));
    EXPECT_FALSE(reader.hasSection("nonexistent"));
    EXPECT_TRUE(reader.hasKey("units", "furlong"));
    EXPECT_FALSE(reader.hasKey("units", "nonexistent"));
    EXPECT_EQ(reader.getKeys("format").size(), 3u);
}

TEST_F(ConfigReaderTest, EnforcementOptions) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    EnforcementOptions options = reader.getEnforcementOptions();
    EXPECT_TRUE(options.convert);
    EXPECT_FALSE(options.strict);
    EXPECT_TRUE(options.quantify);
    EXPECT_FALSE(options.verbose);
}

TEST_F(ConfigReaderTest, FormatDefaultsAreTyped) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    FormatValues defaults = reader.getFormatDefaults();
    ASSERT_EQ(defaults.size(), 3u);
    EXPECT_EQ(std::get<int>(defaults.at("order")), 2);
    EXPECT_DOUBLE_EQ(std::get<double>(defaults.at("scale")), 0.5);
    EXPECT_EQ(std::get<std::string>(defaults.at("base")), "m");
}

TEST_F(ConfigReaderTest, UnitDefinitions) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    UnitSystem units;
    EXPECT_EQ(reader.applyUnitDefinitions(units), 3);

    EXPECT_NEAR(units.convert(1.0, "furlong", "m"), 201.168, 1e-9);
    EXPECT_NEAR(units.convert(2.0, "fur", "m"), 402.336, 1e-9);
    EXPECT_NEAR(units.convert(80.0, "degRe", "degC"), 100.0, 1e-9);
    EXPECT_FALSE(units.hasUnit("broken"));
    EXPECT_FALSE(units.hasUnit("ghost"));
}

TEST_F(ConfigReaderTest, Declarations) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    auto deriv = reader.getDeclaration("deriv");
    EXPECT_FALSE(deriv.first.is_scalar);
    ASSERT_EQ(deriv.first.specs.size(), 2u);
    EXPECT_EQ(deriv.first.specs[1].text(), "=y");
    EXPECT_TRUE(deriv.second.is_scalar);
    EXPECT_EQ(deriv.second.specs[0].text(), "=y / x^{order}");

    auto rates = reader.getDeclaration("rates");
    EXPECT_TRUE(rates.first.is_scalar);
    EXPECT_FALSE(rates.second.is_scalar);
    EXPECT_EQ(rates.second.specs[0].text(), "J / s | K / s");

    auto passthrough = reader.getDeclaration("passthrough");
    ASSERT_EQ(passthrough.first.specs.size(), 2u);
    EXPECT_TRUE(passthrough.first.specs[0].isNone());
    EXPECT_TRUE(passthrough.second.specs.empty());
}

TEST_F(ConfigReaderTest, MakeEnforcer) {
    ConfigReader reader;
    reader.loadFile(test_config_file);

    UnitSystem units;
    reader.applyUnitDefinitions(units);

    EnforcedFunction deriv = reader.makeEnforcer("deriv", units)
        .wrap([](const std::vector<Value>& args, const Keywords&) {
            // Quantified: y / x^2 on quantities
            Quantity x = args[0].asQuantity();
            return CallResult(args[1].asQuantity() / (x * x));
        });

    CallResult result = deriv({Quantity(2.0, units.parseUnit("furlong")), Quantity(8.0, "s")});
    EXPECT_DOUBLE_EQ(result.value().magnitude(), 2.0);
    EXPECT_EQ(result.value().asQuantity().units(),
              CompoundUnit(CompoundUnit::Terms{{"furlong", -2.0}, {"s", 1.0}}));

    EXPECT_THROW(reader.makeEnforcer("missing", units), std::runtime_error);
}

TEST(ConfigReaderStringTest, LoadFromString) {
    ConfigReader reader;
    EXPECT_TRUE(reader.loadString("[enforcement]\nstrict = true\nverbose = 1\n"
                                  "orphan line\n"));
    EnforcementOptions options = reader.getEnforcementOptions();
    EXPECT_TRUE(options.strict);
    EXPECT_TRUE(options.verbose);
    EXPECT_TRUE(options.convert);
}

TEST(ConfigReaderStringTest, BadDeclarationFailsAtCompile) {
    ConfigReader reader;
    reader.loadString("[declaration.bad]\nunits_in = =x\nunits_out = =z\n");
    EXPECT_THROW(reader.makeEnforcer("bad"), DeclarationError);
}
