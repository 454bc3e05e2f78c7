#ifndef CONFIG_READER_HPP
#define CONFIG_READER_HPP

#include "UnitEnforcer.hpp"
#include "UnitSystem.hpp"
#include <string>
#include <map>
#include <vector>
#include <fstream>
#include <sstream>

namespace QWRAP {

/**
 * @brief INI-style configuration reader for unit enforcement
 *
 * Recognised sections:
 * @code
 *   [enforcement]
 *   convert = true
 *   strict = false
 *   quantify = false
 *   verbose = false
 *
 *   [format]
 *   order = 1
 *
 *   [units]
 *   furlong = furlong, 201.168, 1 0 0 0
 *
 *   [aliases]
 *   metres = m
 *
 *   [declaration.deriv]
 *   units_in = =x, =y
 *   units_out = =y / x^{order}
 * @endcode
 */
class ConfigReader {
public:
    ConfigReader();

    bool loadFile(const std::string& filename);

    /**
     * @brief Parse configuration text; same syntax as loadFile
     */
    bool loadString(const std::string& content);

    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key, int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                     double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                 bool default_val = false) const;

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    /**
     * @brief Options from [enforcement], defaulting to EnforcementOptions()
     */
    EnforcementOptions getEnforcementOptions() const;

    /**
     * @brief Placeholder defaults from [format]
     *
     * Integers become int, other numbers double, everything else a string.
     */
    FormatValues getFormatDefaults() const;

    /**
     * @brief Register [units] and [aliases] entries with a unit system
     * @return Number of units and aliases added; bad entries are skipped with a warning
     */
    int applyUnitDefinitions(UnitSystem& units) const;

    /**
     * @brief Units declaration of [declaration.<name>]
     *
     * A comma separated value, or one wrapped in [...], declares a sequence;
     * a single value a scalar; "none" (or a missing key) nothing.
     */
    std::pair<UnitsDeclaration, UnitsDeclaration> getDeclaration(const std::string& name) const;

    /**
     * @brief Compile [declaration.<name>] with the file's options and format defaults
     * @throws std::runtime_error if the declaration section is missing
     */
    UnitEnforcer makeEnforcer(const std::string& name,
                              const UnitSystem& units = UnitSystemManager::getInstance()) const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;

    bool parseStream(std::istream& stream);
    UnitsDeclaration parseDeclaration(const std::string& value) const;
    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;
};

} // namespace QWRAP

#endif // CONFIG_READER_HPP
