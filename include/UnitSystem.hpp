#ifndef UNIT_SYSTEM_HPP
#define UNIT_SYSTEM_HPP

#include <string>
#include <map>
#include <vector>
#include <memory>
#include <stdexcept>
#include <cmath>
#include <ostream>

namespace QWRAP {

/**
 * @brief Unit dimension in terms of Length, Mass, Time, Temperature (L M T Θ)
 *
 * Every physical quantity handled here can be expressed as a combination
 * of fundamental dimensions: Length^a * Mass^b * Time^c * Temperature^d
 */
struct Dimension {
    double L;      // Length exponent
    double M;      // Mass exponent
    double T;      // Time exponent
    double Theta;  // Temperature exponent

    Dimension(double length = 0, double mass = 0, double time = 0, double temperature = 0)
        : L(length), M(mass), T(time), Theta(temperature) {}

    bool operator==(const Dimension& other) const {
        return (std::abs(L - other.L) < 1e-10 &&
                std::abs(M - other.M) < 1e-10 &&
                std::abs(T - other.T) < 1e-10 &&
                std::abs(Theta - other.Theta) < 1e-10);
    }

    bool operator!=(const Dimension& other) const {
        return !(*this == other);
    }

    Dimension operator*(const Dimension& other) const {
        return Dimension(L + other.L, M + other.M, T + other.T, Theta + other.Theta);
    }

    Dimension operator/(const Dimension& other) const {
        return Dimension(L - other.L, M - other.M, T - other.T, Theta - other.Theta);
    }

    Dimension pow(double exponent) const {
        return Dimension(L * exponent, M * exponent, T * exponent, Theta * exponent);
    }

    bool isDimensionless() const { return *this == Dimension(); }

    // Get human-readable dimension string
    std::string toString() const;
};

/**
 * @brief Unit definition with conversion factor to base SI units
 *
 * Base SI units are:
 * - Length: meter (m)
 * - Mass: kilogram (kg)
 * - Time: second (s)
 * - Temperature: kelvin (K)
 */
struct Unit {
    std::string name;           // Full name (e.g., "meter")
    std::string symbol;         // Short symbol (e.g., "m")
    Dimension dimension;        // Dimensional formula
    double to_base;            // Conversion factor to base SI units
    double offset;             // Affine offset: base = (value + offset) * to_base
    std::string category;      // Category for organization
    std::vector<std::string> aliases;  // Alternative names/symbols

    Unit() : to_base(1.0), offset(0.0) {}

    Unit(const std::string& n, const std::string& s,
         const Dimension& d, double factor, const std::string& cat = "")
        : name(n), symbol(s), dimension(d), to_base(factor), offset(0.0), category(cat) {}
};

/**
 * @brief Product of registry symbols raised to real exponents
 *
 * This is the unit object attached to quantities, e.g. {"s": 1, "m": -2}
 * for "s / m^2". Terms with a zero exponent are never stored, so two
 * CompoundUnits compare equal exactly when they are written the same way.
 * Dimensional information lives in the UnitSystem that resolves the symbols.
 */
class CompoundUnit {
public:
    using Terms = std::map<std::string, double>;

    CompoundUnit() = default;
    explicit CompoundUnit(const std::string& symbol, double exponent = 1.0);
    explicit CompoundUnit(const Terms& terms);

    static CompoundUnit dimensionless() { return CompoundUnit(); }

    const Terms& terms() const { return terms_; }
    bool isDimensionless() const { return terms_.empty(); }

    CompoundUnit operator*(const CompoundUnit& other) const;
    CompoundUnit operator/(const CompoundUnit& other) const;
    CompoundUnit pow(double exponent) const;

    bool operator==(const CompoundUnit& other) const;
    bool operator!=(const CompoundUnit& other) const { return !(*this == other); }

    // Render as "J / s", "s / m^2" or "dimensionless"
    std::string toString() const;

private:
    Terms terms_;

    void accumulate(const std::string& symbol, double exponent);
};

std::ostream& operator<<(std::ostream& os, const CompoundUnit& unit);

/**
 * @brief Comprehensive unit system with database and conversion utilities
 *
 * This class provides:
 * - Database of common units across all physical quantities
 * - Parsing of unit expressions (e.g., "J / s", "kg m^-3", "m**2")
 * - Conversion between any compatible units
 * - Dimensional analysis and validation
 * - Parsing of quantity strings (e.g., "100 psi", "5cm")
 */
class UnitSystem {
public:
    UnitSystem();
    ~UnitSystem() = default;

    // =========================================================================
    // Database Access
    // =========================================================================

    /**
     * @brief Get unit by name or symbol
     * @param name_or_symbol Unit name or symbol (exact match first, then a
     *        case-insensitive match on names and aliases; symbols are case-sensitive)
     * @return Pointer to Unit, or nullptr if not found
     */
    const Unit* getUnit(const std::string& name_or_symbol) const;

    /**
     * @brief Check if unit exists in database
     */
    bool hasUnit(const std::string& name_or_symbol) const;

    /**
     * @brief Get all units in a category
     * @param category Category name (e.g., "length", "pressure")
     * @return Vector of unit pointers
     */
    std::vector<const Unit*> getUnitsInCategory(const std::string& category) const;

    /**
     * @brief Get all available categories
     */
    std::vector<std::string> getCategories() const;

    /**
     * @brief Get dimension for a registry unit
     */
    Dimension getDimension(const std::string& unit_name) const;

    /**
     * @brief Get dimension of a compound unit
     * @throws std::runtime_error if any symbol is not registered
     */
    Dimension dimensionOf(const CompoundUnit& unit) const;

    // =========================================================================
    // Parsing Functions
    // =========================================================================

    /**
     * @brief Parse a unit expression into a compound unit
     *
     * Accepts registry symbols and names combined with '*', '/', whitespace,
     * parentheses and exponents ('^2', '**-1', '^(1/2)').
     *
     * @throws std::runtime_error on unknown units or malformed expressions
     */
    CompoundUnit parseUnit(const std::string& expression) const;

    /**
     * @brief Parse value with unit string (e.g., "100 psi", "50.5 mD")
     * @param value_with_unit String containing value and unit
     * @param[out] value Parsed numeric value (not converted)
     * @param[out] unit Unit string
     * @return true if parsing successful
     */
    bool parseValueWithUnit(const std::string& value_with_unit,
                           double& value, std::string& unit) const;

    // =========================================================================
    // Conversion Functions
    // =========================================================================

    /**
     * @brief Convert value between two units
     * @throws std::runtime_error if units are unknown or incompatible
     */
    double convert(double value, const std::string& from_unit,
                   const std::string& to_unit) const;

    /**
     * @brief Convert value between two compound units
     *
     * Affine offsets (degC, degF) are honoured only when both sides are a
     * single registry unit with exponent one; otherwise offsets are ignored
     * and the conversion is treated as a difference.
     *
     * @throws std::runtime_error if units are incompatible
     */
    double convert(double value, const CompoundUnit& from,
                   const CompoundUnit& to) const;

    /**
     * @brief Linear coefficients such that to = from * scale + shift
     */
    void conversionCoefficients(const CompoundUnit& from, const CompoundUnit& to,
                                double& scale, double& shift) const;

    // =========================================================================
    // Dimensional Analysis
    // =========================================================================

    /**
     * @brief Check if two units have compatible dimensions
     */
    bool areCompatible(const std::string& unit1, const std::string& unit2) const;

    bool areCompatible(const CompoundUnit& unit1, const CompoundUnit& unit2) const;

    /**
     * @brief Get base SI unit for a given dimension
     */
    std::string getBaseUnit(const Dimension& dim) const;

    // =========================================================================
    // Custom Unit Registration
    // =========================================================================

    /**
     * @brief Add custom unit to database
     */
    void addUnit(const Unit& unit);

    /**
     * @brief Add unit alias
     * @return false if the unit does not exist
     */
    bool addAlias(const std::string& unit_name, const std::string& alias);

    // =========================================================================
    // Utility Functions
    // =========================================================================

    /**
     * @brief Print unit database to stream (for documentation)
     */
    void printDatabase(std::ostream& os) const;

private:
    // Unit database: maps name/symbol/alias -> Unit
    std::map<std::string, Unit> units_;

    // Case-insensitive fallback for names and aliases: lowercase key -> key
    // in units_, or empty when two units share the lowercase form
    std::map<std::string, std::string> lowercase_index_;

    // Category index: category -> list of unit names
    std::map<std::string, std::vector<std::string>> categories_;

    // Initialize the unit database
    void initializeDatabase();

    // Add units for each category
    void addDimensionlessUnits();
    void addLengthUnits();
    void addMassUnits();
    void addTimeUnits();
    void addAreaUnits();
    void addVolumeUnits();
    void addAngleUnits();
    void addVelocityUnits();
    void addAccelerationUnits();
    void addForceUnits();
    void addPressureUnits();
    void addEnergyUnits();
    void addPowerUnits();
    void addViscosityUnits();
    void addTemperatureUnits();
    void addFrequencyUnits();

    // Helper to add unit with all variations
    void registerUnit(const Unit& unit);

    // Resolve one identifier of a unit expression into registry terms
    CompoundUnit resolveIdentifier(const std::string& identifier) const;

    // String utilities
    std::string toLowerCase(const std::string& str) const;
    std::string trim(const std::string& str) const;
};

/**
 * @brief Global unit system instance (singleton pattern)
 */
class UnitSystemManager {
public:
    static UnitSystem& getInstance() {
        static UnitSystem instance;
        return instance;
    }

private:
    UnitSystemManager() = default;
};

// Convenience functions for quick access
inline double convertUnits(double value, const std::string& from, const std::string& to) {
    return UnitSystemManager::getInstance().convert(value, from, to);
}

inline CompoundUnit parseUnit(const std::string& expression) {
    return UnitSystemManager::getInstance().parseUnit(expression);
}

} // namespace QWRAP

#endif // UNIT_SYSTEM_HPP
