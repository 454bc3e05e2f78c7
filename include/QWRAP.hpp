#ifndef QWRAP_HPP
#define QWRAP_HPP

/**
 * @brief Umbrella header for the QWRAP unit enforcement library
 *
 * All computations that reach the wrapped functions are expressed in the
 * units a declaration names; the registry itself stores SI base factors.
 */

#include "UnitSystem.hpp"
#include "UnitExpression.hpp"
#include "Quantity.hpp"
#include "LabelledArray.hpp"
#include "Value.hpp"
#include "UnitErrors.hpp"
#include "UnitSpec.hpp"
#include "ArgumentGrouper.hpp"
#include "DependencyClassifier.hpp"
#include "GroupSelector.hpp"
#include "Standardizer.hpp"
#include "UnitEnforcer.hpp"
#include "ConfigReader.hpp"

#endif // QWRAP_HPP
