/*
 * Example: Unit-Enforced Finite Differences
 *
 * Demonstrates:
 * - Declaring reference units ("=x", "=y / x^{order}") on a numerical kernel
 * - Placeholder defaults overridden by call-time keywords
 * - Labelled arrays whose "units" attribute drives the enforcement
 * - Alternative unit groups selected by the argument units
 *
 * Usage:
 *   mpirun -np 1 ./enforced_derivative [-order 2] [-n 11]
 */

#include "QWRAP.hpp"
#include <petsc.h>
#include <iostream>
#include <vector>

using namespace QWRAP;

static char help[] = "Unit-enforced finite differences on labelled arrays\n"
                     "Usage: ./enforced_derivative [-order N] [-n points]\n\n";

namespace {

// Central differences in the interior, one-sided at the ends
std::vector<double> difference(const std::vector<double>& x, const std::vector<double>& y) {
    size_t n = y.size();
    std::vector<double> dy(n, 0.0);
    if (n < 2) return dy;

    dy[0] = (y[1] - y[0]) / (x[1] - x[0]);
    dy[n - 1] = (y[n - 1] - y[n - 2]) / (x[n - 1] - x[n - 2]);
    for (size_t i = 1; i + 1 < n; ++i) {
        dy[i] = (y[i + 1] - y[i - 1]) / (x[i + 1] - x[i - 1]);
    }
    return dy;
}

int orderOf(const Keywords& kwargs) {
    auto it = kwargs.find("order");
    if (it == kwargs.end()) return 1;
    if (std::holds_alternative<int>(it->second)) return std::get<int>(it->second);
    return static_cast<int>(std::get<double>(it->second));
}

CallResult derivative(const std::vector<Value>& args, const Keywords& kwargs) {
    const LabelledArray& x = args[0].asLabelledArray();
    const LabelledArray& y = args[1].asLabelledArray();

    std::vector<double> xs = x.values();
    std::vector<double> ys = y.values();
    for (int k = 0; k < orderOf(kwargs); ++k) {
        ys = difference(xs, ys);
    }
    return LabelledArray("d" + y.name() + "/d" + x.name(), ys);
}

void printArray(const LabelledArray& array) {
    std::vector<double> values = array.values();
    std::string units = array.hasAttr("units") ? array.attrs().at("units") : "(none)";
    PetscPrintf(PETSC_COMM_WORLD, "  %s [%s]:", array.name().c_str(), units.c_str());
    for (double v : values) {
        PetscPrintf(PETSC_COMM_WORLD, " %.4g", v);
    }
    PetscPrintf(PETSC_COMM_WORLD, "\n");
}

} // namespace

int main(int argc, char** argv) {
    PetscErrorCode ierr = PetscInitialize(&argc, &argv, nullptr, help);
    if (ierr) return ierr;

    PetscInt order = 1;
    PetscInt n = 11;
    PetscOptionsGetInt(nullptr, nullptr, "-order", &order, nullptr);
    PetscOptionsGetInt(nullptr, nullptr, "-n", &n, nullptr);

    PetscPrintf(PETSC_COMM_WORLD, "================================================\n");
    PetscPrintf(PETSC_COMM_WORLD, "  Unit-Enforced Finite Differences\n");
    PetscPrintf(PETSC_COMM_WORLD, "================================================\n\n");

    try {
        // Inputs define x and y; the result carries y / x^order
        UnitEnforcer enforcer = whileDequantified({"=x", "=y"}, "=y / x^{order}",
                                                  EnforcementOptions(), {{"order", 1}});
        EnforcedFunction deriv = enforcer.wrap(derivative);

        // Altitude in km, temperature in K: a lapse rate
        std::vector<double> z(n), t(n);
        for (PetscInt i = 0; i < n; ++i) {
            z[i] = static_cast<double>(i);
            t[i] = 288.15 - 6.5 * z[i] + 0.1 * z[i] * z[i];
        }
        LabelledArray altitude("z", z, {{"units", "km"}});
        LabelledArray temperature("T", t, {{"units", "K"}});

        PetscPrintf(PETSC_COMM_WORLD, "Inputs:\n");
        printArray(altitude);
        printArray(temperature);

        CallResult result = deriv({altitude, temperature}, {{"order", static_cast<int>(order)}});
        PetscPrintf(PETSC_COMM_WORLD, "\nDerivative of order %d:\n", static_cast<int>(order));
        printArray(result.value().asLabelledArray());

        // Quantities in, quantity out
        UnitEnforcer rate = whileQuantified({"=x", "=y"}, "=y / x");
        EnforcedFunction slope = rate.wrap([](const std::vector<Value>& args, const Keywords&) {
            return CallResult(args[1].asQuantity() / args[0].asQuantity());
        });
        CallResult speed = slope({Quantity(2.0, "hr"), Quantity(150.0, "km")});
        PetscPrintf(PETSC_COMM_WORLD, "\nAverage speed: %s\n",
                    speed.value().toString().c_str());

        // Alternative groups: energy or temperature fluxes
        UnitEnforcer flux = whileDequantified({"J | K", "s"}, "J / s | K / s");
        EnforcedFunction per_second = flux.wrap([](const std::vector<Value>& args, const Keywords&) {
            return CallResult(args[0].asRaw() / args[1].asRaw());
        });
        CallResult heating = per_second({Quantity(3.6, "kJ"), Quantity(1.0, "min")});
        CallResult warming = per_second({Quantity(6.0, "K"), Quantity(1.0, "hr")});
        PetscPrintf(PETSC_COMM_WORLD, "Heating rate: %g (J / s)\n", heating.value().magnitude());
        PetscPrintf(PETSC_COMM_WORLD, "Warming rate: %g (K / s)\n\n", warming.value().magnitude());
    } catch (const UnitError& e) {
        PetscPrintf(PETSC_COMM_WORLD, "Unit error [%s]: %s\n",
                    errorKindName(e.kind()), e.what());
        PetscFinalize();
        return 1;
    } catch (const std::exception& e) {
        PetscPrintf(PETSC_COMM_WORLD, "Error: %s\n", e.what());
        PetscFinalize();
        return 1;
    }

    ierr = PetscFinalize();
    return ierr;
}
