#include "UnitSystem.hpp"
#include "UnitExpression.hpp"
#include <sstream>
#include <iomanip>
#include <algorithm>
#include <cctype>

namespace QWRAP {

// =============================================================================
// Dimension Implementation
// =============================================================================

std::string Dimension::toString() const {
    std::stringstream ss;
    bool first = true;

    const double exps[4] = {L, M, T, Theta};
    const char* names[4] = {"L", "M", "T", "Theta"};

    for (int i = 0; i < 4; ++i) {
        if (std::abs(exps[i]) > 1e-10) {
            if (!first) ss << " ";
            ss << names[i];
            if (std::abs(exps[i] - 1.0) > 1e-10) ss << "^" << exps[i];
            first = false;
        }
    }

    return ss.str().empty() ? "dimensionless" : ss.str();
}

// =============================================================================
// CompoundUnit Implementation
// =============================================================================

CompoundUnit::CompoundUnit(const std::string& symbol, double exponent) {
    accumulate(symbol, exponent);
}

CompoundUnit::CompoundUnit(const Terms& terms) {
    for (const auto& term : terms) {
        accumulate(term.first, term.second);
    }
}

void CompoundUnit::accumulate(const std::string& symbol, double exponent) {
    double& value = terms_[symbol];
    value += exponent;
    if (std::abs(value) < 1e-12) {
        terms_.erase(symbol);
    }
}

CompoundUnit CompoundUnit::operator*(const CompoundUnit& other) const {
    CompoundUnit result(*this);
    for (const auto& term : other.terms_) {
        result.accumulate(term.first, term.second);
    }
    return result;
}

CompoundUnit CompoundUnit::operator/(const CompoundUnit& other) const {
    CompoundUnit result(*this);
    for (const auto& term : other.terms_) {
        result.accumulate(term.first, -term.second);
    }
    return result;
}

CompoundUnit CompoundUnit::pow(double exponent) const {
    CompoundUnit result;
    for (const auto& term : terms_) {
        result.accumulate(term.first, term.second * exponent);
    }
    return result;
}

bool CompoundUnit::operator==(const CompoundUnit& other) const {
    if (terms_.size() != other.terms_.size()) return false;
    auto it = other.terms_.begin();
    for (const auto& term : terms_) {
        if (term.first != it->first) return false;
        if (std::abs(term.second - it->second) > 1e-10) return false;
        ++it;
    }
    return true;
}

std::string CompoundUnit::toString() const {
    if (terms_.empty()) return "dimensionless";

    auto format = [](std::stringstream& ss, const std::string& symbol, double exponent) {
        ss << symbol;
        if (std::abs(exponent - 1.0) > 1e-10) ss << "^" << std::setprecision(15) << exponent;
    };

    std::stringstream num;
    std::stringstream den;
    bool has_num = false;
    bool has_den = false;

    for (const auto& term : terms_) {
        if (term.second > 0) {
            if (has_num) num << " * ";
            format(num, term.first, term.second);
            has_num = true;
        } else {
            if (has_den) den << " * ";
            format(den, term.first, -term.second);
            has_den = true;
        }
    }

    std::string result = has_num ? num.str() : "1";
    if (has_den) result += " / " + den.str();
    return result;
}

std::ostream& operator<<(std::ostream& os, const CompoundUnit& unit) {
    return os << unit.toString();
}

// =============================================================================
// UnitSystem Implementation
// =============================================================================

UnitSystem::UnitSystem() {
    initializeDatabase();
}

void UnitSystem::initializeDatabase() {
    addDimensionlessUnits();
    addLengthUnits();
    addMassUnits();
    addTimeUnits();
    addAreaUnits();
    addVolumeUnits();
    addAngleUnits();
    addVelocityUnits();
    addAccelerationUnits();
    addForceUnits();
    addPressureUnits();
    addEnergyUnits();
    addPowerUnits();
    addViscosityUnits();
    addTemperatureUnits();
    addFrequencyUnits();
}

// =============================================================================
// Dimensionless Units
// =============================================================================

void UnitSystem::addDimensionlessUnits() {
    Dimension none;

    registerUnit(Unit("dimensionless", "dimensionless", none, 1.0, "dimensionless"));

    Unit percent("percent", "percent", none, 0.01, "dimensionless");
    percent.aliases = {"%"};
    registerUnit(percent);

    registerUnit(Unit("parts per million", "ppm", none, 1e-6, "dimensionless"));
}

// =============================================================================
// Length Units
// =============================================================================

void UnitSystem::addLengthUnits() {
    Dimension length(1, 0, 0);

    // Metric
    Unit meter("meter", "m", length, 1.0, "length");
    meter.aliases = {"meters", "metre", "metres"};
    registerUnit(meter);
    registerUnit(Unit("centimeter", "cm", length, 0.01, "length"));
    registerUnit(Unit("millimeter", "mm", length, 0.001, "length"));
    registerUnit(Unit("kilometer", "km", length, 1000.0, "length"));
    registerUnit(Unit("micrometer", "um", length, 1e-6, "length"));
    registerUnit(Unit("nanometer", "nm", length, 1e-9, "length"));
    registerUnit(Unit("angstrom", "angstrom", length, 1e-10, "length"));

    // Imperial/US
    Unit foot("foot", "ft", length, 0.3048, "length");
    foot.aliases = {"feet"};
    registerUnit(foot);
    registerUnit(Unit("inch", "in", length, 0.0254, "length"));
    registerUnit(Unit("yard", "yd", length, 0.9144, "length"));
    registerUnit(Unit("mile", "mi", length, 1609.344, "length"));
    registerUnit(Unit("nautical mile", "nmi", length, 1852.0, "length"));
}

// =============================================================================
// Mass Units
// =============================================================================

void UnitSystem::addMassUnits() {
    Dimension mass(0, 1, 0);

    registerUnit(Unit("kilogram", "kg", mass, 1.0, "mass"));
    registerUnit(Unit("gram", "g", mass, 0.001, "mass"));
    registerUnit(Unit("milligram", "mg", mass, 1e-6, "mass"));
    registerUnit(Unit("tonne", "t", mass, 1000.0, "mass"));

    registerUnit(Unit("pound mass", "lbm", mass, 0.45359237, "mass"));
    registerUnit(Unit("ounce", "oz", mass, 0.028349523125, "mass"));
    registerUnit(Unit("slug", "slug", mass, 14.5939029, "mass"));
}

// =============================================================================
// Time Units
// =============================================================================

void UnitSystem::addTimeUnits() {
    Dimension time(0, 0, 1);

    Unit second("second", "s", time, 1.0, "time");
    second.aliases = {"seconds", "sec"};
    registerUnit(second);
    registerUnit(Unit("millisecond", "ms", time, 0.001, "time"));
    registerUnit(Unit("microsecond", "us", time, 1e-6, "time"));
    registerUnit(Unit("minute", "min", time, 60.0, "time"));

    Unit hour("hour", "hr", time, 3600.0, "time");
    hour.aliases = {"h", "hours"};
    registerUnit(hour);

    Unit day("day", "day", time, 86400.0, "time");
    day.aliases = {"d", "days"};
    registerUnit(day);

    registerUnit(Unit("week", "week", time, 604800.0, "time"));

    Unit year("year", "year", time, 31536000.0, "time");
    year.aliases = {"yr", "years"};
    registerUnit(year);
}

// =============================================================================
// Area Units
// =============================================================================

void UnitSystem::addAreaUnits() {
    Dimension area(2, 0, 0);

    registerUnit(Unit("hectare", "ha", area, 1e4, "area"));
    registerUnit(Unit("acre", "acre", area, 4046.8564224, "area"));
    registerUnit(Unit("darcy", "D", area, 9.869233e-13, "area"));
    registerUnit(Unit("millidarcy", "mD", area, 9.869233e-16, "area"));
}

// =============================================================================
// Volume Units
// =============================================================================

void UnitSystem::addVolumeUnits() {
    Dimension volume(3, 0, 0);

    Unit liter("liter", "L", volume, 0.001, "volume");
    liter.aliases = {"litre", "liters"};
    registerUnit(liter);
    registerUnit(Unit("milliliter", "mL", volume, 1e-6, "volume"));

    registerUnit(Unit("gallon US", "gal", volume, 0.003785411784, "volume"));
    registerUnit(Unit("barrel", "bbl", volume, 0.158987294928, "volume"));
}

// =============================================================================
// Angle Units
// =============================================================================

void UnitSystem::addAngleUnits() {
    Dimension angle(0, 0, 0);  // Dimensionless

    registerUnit(Unit("radian", "rad", angle, 1.0, "angle"));

    Unit degree("degree", "deg", angle, M_PI/180.0, "angle");
    degree.aliases = {"degrees"};
    registerUnit(degree);
}

// =============================================================================
// Velocity Units
// =============================================================================

void UnitSystem::addVelocityUnits() {
    Dimension velocity(1, 0, -1);

    registerUnit(Unit("mile per hour", "mph", velocity, 0.44704, "velocity"));
    registerUnit(Unit("knot", "kt", velocity, 1852.0/3600.0, "velocity"));
}

// =============================================================================
// Acceleration Units
// =============================================================================

void UnitSystem::addAccelerationUnits() {
    Dimension acceleration(1, 0, -2);

    registerUnit(Unit("galileo", "Gal", acceleration, 0.01, "acceleration"));
    registerUnit(Unit("standard gravity", "g0", acceleration, 9.80665, "acceleration"));
}

// =============================================================================
// Force Units
// =============================================================================

void UnitSystem::addForceUnits() {
    Dimension force(1, 1, -2);

    registerUnit(Unit("newton", "N", force, 1.0, "force"));
    registerUnit(Unit("kilonewton", "kN", force, 1000.0, "force"));
    registerUnit(Unit("dyne", "dyn", force, 1e-5, "force"));
    registerUnit(Unit("pound force", "lbf", force, 4.4482216152605, "force"));
}

// =============================================================================
// Pressure Units
// =============================================================================

void UnitSystem::addPressureUnits() {
    Dimension pressure(-1, 1, -2);

    // SI
    registerUnit(Unit("pascal", "Pa", pressure, 1.0, "pressure"));
    registerUnit(Unit("hectopascal", "hPa", pressure, 100.0, "pressure"));
    registerUnit(Unit("kilopascal", "kPa", pressure, 1000.0, "pressure"));
    registerUnit(Unit("megapascal", "MPa", pressure, 1e6, "pressure"));
    registerUnit(Unit("gigapascal", "GPa", pressure, 1e9, "pressure"));

    // Other metric
    registerUnit(Unit("bar", "bar", pressure, 1e5, "pressure"));
    registerUnit(Unit("millibar", "mbar", pressure, 100.0, "pressure"));
    registerUnit(Unit("atmosphere", "atm", pressure, 101325.0, "pressure"));

    // Imperial/US
    registerUnit(Unit("pounds per square inch", "psi", pressure, 6894.757293168, "pressure"));

    // Other
    registerUnit(Unit("torr", "torr", pressure, 133.322368421, "pressure"));
    registerUnit(Unit("millimeter mercury", "mmHg", pressure, 133.322368421, "pressure"));
}

// =============================================================================
// Energy Units
// =============================================================================

void UnitSystem::addEnergyUnits() {
    Dimension energy(2, 1, -2);

    // SI
    Unit joule("joule", "J", energy, 1.0, "energy");
    joule.aliases = {"joules"};
    registerUnit(joule);
    registerUnit(Unit("kilojoule", "kJ", energy, 1000.0, "energy"));
    registerUnit(Unit("megajoule", "MJ", energy, 1e6, "energy"));

    // Other metric
    registerUnit(Unit("erg", "erg", energy, 1e-7, "energy"));
    registerUnit(Unit("calorie", "cal", energy, 4.184, "energy"));
    registerUnit(Unit("kilocalorie", "kcal", energy, 4184.0, "energy"));

    // Imperial/US
    registerUnit(Unit("british thermal unit", "BTU", energy, 1055.05585262, "energy"));

    // Electrical
    registerUnit(Unit("watt hour", "Wh", energy, 3600.0, "energy"));
    registerUnit(Unit("kilowatt hour", "kWh", energy, 3.6e6, "energy"));
    registerUnit(Unit("electron volt", "eV", energy, 1.602176634e-19, "energy"));
}

// =============================================================================
// Power Units
// =============================================================================

void UnitSystem::addPowerUnits() {
    Dimension power(2, 1, -3);

    registerUnit(Unit("watt", "W", power, 1.0, "power"));
    registerUnit(Unit("kilowatt", "kW", power, 1000.0, "power"));
    registerUnit(Unit("megawatt", "MW", power, 1e6, "power"));
    registerUnit(Unit("horsepower", "hp", power, 745.69987158227, "power"));
}

// =============================================================================
// Viscosity Units
// =============================================================================

void UnitSystem::addViscosityUnits() {
    Dimension viscosity(-1, 1, -1);

    registerUnit(Unit("poise", "P", viscosity, 0.1, "viscosity"));
    registerUnit(Unit("centipoise", "cP", viscosity, 0.001, "viscosity"));

    // Kinematic viscosity (area/time, L^2 T^-1)
    Dimension kin_viscosity(2, 0, -1);
    registerUnit(Unit("stokes", "St", kin_viscosity, 1e-4, "kinematic_viscosity"));
    registerUnit(Unit("centistokes", "cSt", kin_viscosity, 1e-6, "kinematic_viscosity"));
}

// =============================================================================
// Temperature Units
// =============================================================================

void UnitSystem::addTemperatureUnits() {
    Dimension temperature(0, 0, 0, 1);

    // Absolute temperatures
    registerUnit(Unit("kelvin", "K", temperature, 1.0, "temperature"));
    registerUnit(Unit("rankine", "degR", temperature, 5.0/9.0, "temperature"));

    // Relative temperatures (with offset): base = (value + offset) * to_base
    Unit celsius("celsius", "degC", temperature, 1.0, "temperature");
    celsius.offset = 273.15;
    celsius.aliases = {"degree_Celsius"};
    registerUnit(celsius);

    Unit fahrenheit("fahrenheit", "degF", temperature, 5.0/9.0, "temperature");
    fahrenheit.offset = 459.67;
    fahrenheit.aliases = {"degree_Fahrenheit"};
    registerUnit(fahrenheit);
}

// =============================================================================
// Frequency Units
// =============================================================================

void UnitSystem::addFrequencyUnits() {
    Dimension frequency(0, 0, -1);

    registerUnit(Unit("hertz", "Hz", frequency, 1.0, "frequency"));
    registerUnit(Unit("kilohertz", "kHz", frequency, 1000.0, "frequency"));
}

// =============================================================================
// Helper Functions
// =============================================================================

void UnitSystem::registerUnit(const Unit& unit) {
    std::vector<std::string> keys;
    keys.push_back(unit.symbol);
    keys.push_back(unit.name);
    keys.insert(keys.end(), unit.aliases.begin(), unit.aliases.end());

    for (size_t i = 0; i < keys.size(); ++i) {
        const std::string& key = keys[i];
        if (key.empty()) continue;
        units_[key] = unit;

        // Symbols are case-sensitive ("Mm" is not "mm"); only names and
        // aliases get a case-insensitive slot, and a slot claimed by two
        // different units is left empty
        if (i == 0 || key.size() < 3) continue;
        std::string lower = toLowerCase(key);
        auto slot = lowercase_index_.find(lower);
        if (slot == lowercase_index_.end()) {
            lowercase_index_[lower] = key;
        } else if (!slot->second.empty()) {
            auto owner = units_.find(slot->second);
            if (owner != units_.end() && owner->second.symbol != unit.symbol) {
                slot->second.clear();
            }
        }
    }

    // Add to category index
    if (!unit.category.empty()) {
        auto& names = categories_[unit.category];
        if (std::find(names.begin(), names.end(), unit.symbol) == names.end()) {
            names.push_back(unit.symbol);
        }
    }
}

std::string UnitSystem::toLowerCase(const std::string& str) const {
    std::string result = str;
    std::transform(result.begin(), result.end(), result.begin(), ::tolower);
    return result;
}

std::string UnitSystem::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

// =============================================================================
// Database Access
// =============================================================================

const Unit* UnitSystem::getUnit(const std::string& name_or_symbol) const {
    // Try exact match first
    auto it = units_.find(name_or_symbol);
    if (it != units_.end()) {
        return &(it->second);
    }

    // Try lowercase
    auto lower_it = lowercase_index_.find(toLowerCase(name_or_symbol));
    if (lower_it != lowercase_index_.end() && !lower_it->second.empty()) {
        it = units_.find(lower_it->second);
        if (it != units_.end()) {
            return &(it->second);
        }
    }

    return nullptr;
}

bool UnitSystem::hasUnit(const std::string& name_or_symbol) const {
    return getUnit(name_or_symbol) != nullptr;
}

std::vector<const Unit*> UnitSystem::getUnitsInCategory(const std::string& category) const {
    std::vector<const Unit*> result;
    auto it = categories_.find(category);
    if (it != categories_.end()) {
        for (const auto& unit_name : it->second) {
            auto unit_it = units_.find(unit_name);
            if (unit_it != units_.end()) {
                result.push_back(&(unit_it->second));
            }
        }
    }
    return result;
}

std::vector<std::string> UnitSystem::getCategories() const {
    std::vector<std::string> result;
    for (const auto& pair : categories_) {
        result.push_back(pair.first);
    }
    return result;
}

Dimension UnitSystem::getDimension(const std::string& unit_name) const {
    const Unit* unit = getUnit(unit_name);
    if (unit) {
        return unit->dimension;
    }
    throw std::runtime_error("Unit not found: " + unit_name);
}

Dimension UnitSystem::dimensionOf(const CompoundUnit& unit) const {
    Dimension result;
    for (const auto& term : unit.terms()) {
        result = result * getDimension(term.first).pow(term.second);
    }
    return result;
}

// =============================================================================
// Parsing Functions
// =============================================================================

CompoundUnit UnitSystem::resolveIdentifier(const std::string& identifier) const {
    const Unit* unit = getUnit(identifier);
    if (unit) {
        if (unit->symbol == "dimensionless") return CompoundUnit::dimensionless();
        return CompoundUnit(unit->symbol);
    }

    // Hyphen joins factors: "Pa-s", "m-K"
    size_t dash = identifier.find('-');
    if (dash != std::string::npos) {
        return resolveIdentifier(identifier.substr(0, dash)) *
               resolveIdentifier(identifier.substr(dash + 1));
    }

    // Trailing digits are an exponent: "m2", "m3", "s2"
    size_t digits = identifier.find_last_not_of("0123456789");
    if (digits != std::string::npos && digits + 1 < identifier.size()) {
        const Unit* base = getUnit(identifier.substr(0, digits + 1));
        if (base) {
            double exponent = std::stod(identifier.substr(digits + 1));
            if (base->symbol == "dimensionless") return CompoundUnit::dimensionless();
            return CompoundUnit(base->symbol, exponent);
        }
    }

    throw std::runtime_error("Unknown unit: " + identifier);
}

CompoundUnit UnitSystem::parseUnit(const std::string& expression) const {
    std::string trimmed = trim(expression);
    if (trimmed.empty()) {
        return CompoundUnit::dimensionless();
    }

    // Names with spaces ("pound mass") resolve directly
    if (getUnit(trimmed)) {
        return resolveIdentifier(trimmed);
    }

    UnitExpressionParser parser(trimmed);
    UnitExpressionParser::Terms terms = parser.parse();

    CompoundUnit result;
    for (const auto& term : terms) {
        result = result * resolveIdentifier(term.first).pow(term.second);
    }
    return result;
}

bool UnitSystem::parseValueWithUnit(const std::string& value_with_unit,
                                    double& value, std::string& unit) const {
    std::string trimmed = trim(value_with_unit);
    if (trimmed.empty()) return false;

    // Find where the number ends and unit begins
    size_t i = 0;

    // Skip sign
    if (trimmed[i] == '+' || trimmed[i] == '-') i++;

    // Skip digits and decimal point
    bool has_digits = false;
    bool has_decimal = false;
    while (i < trimmed.length()) {
        if (std::isdigit(static_cast<unsigned char>(trimmed[i]))) {
            has_digits = true;
            i++;
        } else if (trimmed[i] == '.' && !has_decimal) {
            has_decimal = true;
            i++;
        } else if ((trimmed[i] == 'e' || trimmed[i] == 'E') && has_digits &&
                   i + 1 < trimmed.length() &&
                   (std::isdigit(static_cast<unsigned char>(trimmed[i + 1])) ||
                    ((trimmed[i + 1] == '+' || trimmed[i + 1] == '-') &&
                     i + 2 < trimmed.length() &&
                     std::isdigit(static_cast<unsigned char>(trimmed[i + 2]))))) {
            // Scientific notation; "5 erg" must not lose its 'e'
            i++;
            if (trimmed[i] == '+' || trimmed[i] == '-') {
                i++;
            }
        } else {
            break;
        }
    }

    if (!has_digits) return false;

    // Extract number and unit parts
    std::string num_str = trim(trimmed.substr(0, i));
    std::string unit_str = trim(trimmed.substr(i));

    try {
        value = std::stod(num_str);
    } catch (const std::exception&) {
        return false;
    }
    unit = unit_str;
    return true;
}

// =============================================================================
// Conversion Functions
// =============================================================================

double UnitSystem::convert(double value, const std::string& from_unit,
                           const std::string& to_unit) const {
    return convert(value, parseUnit(from_unit), parseUnit(to_unit));
}

void UnitSystem::conversionCoefficients(const CompoundUnit& from, const CompoundUnit& to,
                                        double& scale, double& shift) const {
    Dimension from_dim = dimensionOf(from);
    Dimension to_dim = dimensionOf(to);
    if (from_dim != to_dim) {
        throw std::runtime_error("Incompatible dimensions: " +
                                from.toString() + " [" + from_dim.toString() + "] vs " +
                                to.toString() + " [" + to_dim.toString() + "]");
    }

    auto single = [this](const CompoundUnit& unit) -> const Unit* {
        if (unit.terms().size() != 1) return nullptr;
        const auto& term = *unit.terms().begin();
        if (std::abs(term.second - 1.0) > 1e-10) return nullptr;
        return getUnit(term.first);
    };

    const Unit* from_single = single(from);
    const Unit* to_single = single(to);
    if (from_single && to_single) {
        // Affine: to = ((v + o1) * f1) / f2 - o2
        scale = from_single->to_base / to_single->to_base;
        shift = from_single->offset * scale - to_single->offset;
        return;
    }

    double from_factor = 1.0;
    for (const auto& term : from.terms()) {
        from_factor *= std::pow(getUnit(term.first)->to_base, term.second);
    }
    double to_factor = 1.0;
    for (const auto& term : to.terms()) {
        to_factor *= std::pow(getUnit(term.first)->to_base, term.second);
    }
    scale = from_factor / to_factor;
    shift = 0.0;
}

double UnitSystem::convert(double value, const CompoundUnit& from,
                           const CompoundUnit& to) const {
    double scale = 1.0;
    double shift = 0.0;
    conversionCoefficients(from, to, scale, shift);
    return value * scale + shift;
}

// =============================================================================
// Dimensional Analysis
// =============================================================================

bool UnitSystem::areCompatible(const std::string& unit1, const std::string& unit2) const {
    try {
        return areCompatible(parseUnit(unit1), parseUnit(unit2));
    } catch (const std::runtime_error&) {
        return false;
    }
}

bool UnitSystem::areCompatible(const CompoundUnit& unit1, const CompoundUnit& unit2) const {
    return dimensionOf(unit1) == dimensionOf(unit2);
}

std::string UnitSystem::getBaseUnit(const Dimension& dim) const {
    CompoundUnit base = CompoundUnit("m", dim.L) * CompoundUnit("kg", dim.M) *
                        CompoundUnit("s", dim.T) * CompoundUnit("K", dim.Theta);
    return base.toString();
}

// =============================================================================
// Custom Units
// =============================================================================

void UnitSystem::addUnit(const Unit& unit) {
    registerUnit(unit);
}

bool UnitSystem::addAlias(const std::string& unit_name, const std::string& alias) {
    const Unit* unit = getUnit(unit_name);
    if (!unit) {
        return false;
    }
    Unit modified = *unit;
    modified.aliases.push_back(alias);
    registerUnit(modified);
    return true;
}

// =============================================================================
// Utility Functions
// =============================================================================

void UnitSystem::printDatabase(std::ostream& os) const {
    os << "Unit System Database\n";
    os << "====================\n\n";

    for (const auto& cat_pair : categories_) {
        os << "Category: " << cat_pair.first << "\n";
        os << std::string(40, '-') << "\n";

        for (const auto& unit_name : cat_pair.second) {
            auto it = units_.find(unit_name);
            if (it != units_.end()) {
                const Unit& u = it->second;
                os << std::setw(25) << std::left << u.name
                   << " [" << std::setw(10) << u.symbol << "] "
                   << " = " << u.to_base << " * base SI"
                   << " (" << u.dimension.toString() << ")\n";
            }
        }
        os << "\n";
    }
}

} // namespace QWRAP
