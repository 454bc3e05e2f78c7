/**
 * @file unit_converter.cpp
 * @brief Command-line unit converter built on the QWRAP unit registry
 *
 * Usage:
 *   ./unit_converter <value> <from_unit> <to_unit>
 *   ./unit_converter --list [category]
 *   ./unit_converter --all
 *   ./unit_converter --help
 *
 * Examples:
 *   ./unit_converter 5000 psi MPa
 *   ./unit_converter 150 mD m^2
 *   ./unit_converter 100 degC degF
 *   ./unit_converter 3 "km / hr" "m / s"
 */

#include "UnitSystem.hpp"
#include "Quantity.hpp"
#include <iostream>
#include <iomanip>
#include <string>
#include <cstring>

using namespace QWRAP;

void printHelp() {
    std::cout << "\n";
    std::cout << "QWRAP Unit Converter\n";
    std::cout << "====================\n\n";
    std::cout << "Usage:\n";
    std::cout << "  unit_converter <value> <from_unit> <to_unit>\n";
    std::cout << "  unit_converter --list [category]\n";
    std::cout << "  unit_converter --all\n";
    std::cout << "  unit_converter --help\n\n";
    std::cout << "Unit expressions combine registry symbols with '*', '/', '^' and\n";
    std::cout << "parentheses, e.g. \"kg m / s^2\", \"m^(1/2)\", \"Pa-s\".\n\n";
    std::cout << "Examples:\n";
    std::cout << "  unit_converter 5000 psi MPa\n";
    std::cout << "  unit_converter 150 mD m^2\n";
    std::cout << "  unit_converter 100 degC degF\n";
    std::cout << "  unit_converter 3 \"km / hr\" \"m / s\"\n";
    std::cout << "  unit_converter --list\n";
    std::cout << "  unit_converter --list pressure\n\n";
}

void listUnits(UnitSystem& units, const std::string& category = "") {
    std::cout << "\n";

    if (category.empty()) {
        std::cout << "Available Unit Categories:\n";
        std::cout << "==========================\n\n";

        auto categories = units.getCategories();
        for (const auto& cat : categories) {
            auto cat_units = units.getUnitsInCategory(cat);
            std::cout << std::setw(25) << std::left << cat
                      << " (" << cat_units.size() << " units)\n";
        }
        std::cout << "\nUse: unit_converter --list <category> to see units in a category\n\n";
        return;
    }

    auto cat_units = units.getUnitsInCategory(category);
    if (cat_units.empty()) {
        std::cout << "Category '" << category << "' not found.\n";
        std::cout << "Use: unit_converter --list to see available categories\n\n";
        return;
    }

    std::cout << "Units in category: " << category << "\n";
    std::cout << std::string(60, '=') << "\n\n";
    std::cout << std::setw(25) << std::left << "Name"
              << std::setw(12) << "Symbol"
              << std::setw(12) << "Dimension"
              << "To SI Base\n";
    std::cout << std::string(60, '-') << "\n";

    for (const auto* unit : cat_units) {
        std::cout << std::setw(25) << std::left << unit->name
                  << std::setw(12) << unit->symbol
                  << std::setw(12) << unit->dimension.toString()
                  << std::scientific << std::setprecision(6) << unit->to_base;
        if (unit->offset != 0.0) {
            std::cout << " (offset: " << unit->offset << ")";
        }
        std::cout << "\n";
    }
    std::cout << "\n";
}

int performConversion(UnitSystem& units, double value,
                      const std::string& from_unit,
                      const std::string& to_unit) {
    try {
        CompoundUnit from = units.parseUnit(from_unit);
        CompoundUnit to = units.parseUnit(to_unit);

        if (!units.areCompatible(from, to)) {
            std::cerr << "Error: Incompatible units\n";
            std::cerr << "  " << from_unit << " has dimension: "
                      << units.dimensionOf(from).toString() << "\n";
            std::cerr << "  " << to_unit << " has dimension: "
                      << units.dimensionOf(to).toString() << "\n";
            return 1;
        }

        Quantity input(value, from);
        Quantity result = input.to(to, units);

        CompoundUnit si_unit = units.parseUnit(units.getBaseUnit(units.dimensionOf(from)));
        Quantity si_value = input.to(si_unit, units);

        std::cout << "\n";
        std::cout << "Conversion Result:\n";
        std::cout << "==================\n\n";
        std::cout << std::fixed << std::setprecision(6);
        std::cout << "  Input:   " << input.magnitude() << " " << from << "\n";
        std::cout << "  Output:  " << result.magnitude() << " " << to << "\n";
        std::cout << "\n";
        std::cout << std::scientific << std::setprecision(6);
        std::cout << "  SI Base: " << si_value.magnitude() << " " << si_unit << "\n";
        std::cout << "\n";

        double scale = 1.0;
        double shift = 0.0;
        units.conversionCoefficients(from, to, scale, shift);
        std::cout << "Conversion: x [" << from << "] = "
                  << std::setprecision(9) << scale << " * x";
        if (shift != 0.0) {
            std::cout << " + " << shift;
        }
        std::cout << " [" << to << "]\n\n";
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        std::cerr << "Use --list to see available units\n";
        return 1;
    }
    return 0;
}

int main(int argc, char* argv[]) {
    UnitSystem& units = UnitSystemManager::getInstance();

    if (argc == 1 || (argc == 2 && strcmp(argv[1], "--help") == 0)) {
        printHelp();
        return 0;
    }

    if (argc == 2 && strcmp(argv[1], "--all") == 0) {
        units.printDatabase(std::cout);
        return 0;
    }

    if (argc >= 2 && strcmp(argv[1], "--list") == 0) {
        if (argc == 2) {
            listUnits(units);
        } else {
            listUnits(units, argv[2]);
        }
        return 0;
    }

    if (argc != 4) {
        std::cerr << "Error: Invalid number of arguments\n";
        printHelp();
        return 1;
    }

    double value = 0.0;
    try {
        value = std::stod(argv[1]);
    } catch (const std::invalid_argument&) {
        std::cerr << "Error: Invalid value '" << argv[1] << "'\n";
        return 1;
    } catch (const std::out_of_range&) {
        std::cerr << "Error: Value out of range\n";
        return 1;
    }

    return performConversion(units, value, argv[2], argv[3]);
}
