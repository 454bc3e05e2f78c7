#include "ConfigReader.hpp"
#include <iostream>
#include <algorithm>
#include <cctype>
#include <stdexcept>

namespace QWRAP {

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }
    return parseStream(file);
}

bool ConfigReader::loadString(const std::string& content) {
    std::istringstream stream(content);
    return parseStream(stream);
}

bool ConfigReader::parseStream(std::istream& stream) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(stream, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header [SECTION]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        // Split on the first '=' only; declarations may start with '='
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos || eq_pos == 0) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments
        size_t comment_pos = value.find('#');
        if (comment_pos != std::string::npos) {
            value = trim(value.substr(0, comment_pos));
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) const {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                         int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as integer" << std::endl;
        return default_val;
    }
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as double" << std::endl;
        return default_val;
    }
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                           bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(), ::tolower);

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto sec_it = data.find(section);
    if (sec_it != data.end()) {
        for (const auto& pair : sec_it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

// =============================================================================
// Enforcement Settings
// =============================================================================

EnforcementOptions ConfigReader::getEnforcementOptions() const {
    EnforcementOptions options;
    options.convert = getBool("enforcement", "convert", options.convert);
    options.strict = getBool("enforcement", "strict", options.strict);
    options.quantify = getBool("enforcement", "quantify", options.quantify);
    options.verbose = getBool("enforcement", "verbose", options.verbose);

    for (const auto& key : getKeys("enforcement")) {
        if (key != "convert" && key != "strict" && key != "quantify" && key != "verbose") {
            std::cerr << "Warning: Unknown key [enforcement]:" << key << std::endl;
        }
    }
    return options;
}

FormatValues ConfigReader::getFormatDefaults() const {
    FormatValues defaults;
    auto sec_it = data.find("format");
    if (sec_it == data.end()) return defaults;

    for (const auto& pair : sec_it->second) {
        const std::string& val = pair.second;
        size_t pos = 0;
        try {
            int as_int = std::stoi(val, &pos);
            if (pos == val.size()) {
                defaults[pair.first] = as_int;
                continue;
            }
            double as_double = std::stod(val, &pos);
            if (pos == val.size()) {
                defaults[pair.first] = as_double;
                continue;
            }
        } catch (const std::exception&) {
            // Not numeric
        }
        defaults[pair.first] = val;
    }
    return defaults;
}

int ConfigReader::applyUnitDefinitions(UnitSystem& units) const {
    int added = 0;

    auto units_it = data.find("units");
    if (units_it != data.end()) {
        for (const auto& pair : units_it->second) {
            // symbol = name, factor, L M T Theta[, offset]
            std::vector<std::string> fields = split(pair.second, ',');
            if (fields.size() < 3 || fields.size() > 4) {
                std::cerr << "Warning: Invalid unit definition [units]:" << pair.first
                          << " = " << pair.second << std::endl;
                continue;
            }

            try {
                double factor = std::stod(fields[1]);
                std::istringstream dims(fields[2]);
                double l = 0, m = 0, t = 0, theta = 0;
                if (!(dims >> l >> m >> t)) {
                    throw std::runtime_error("expected 'L M T [Theta]' exponents");
                }
                if (!(dims >> theta)) {
                    theta = 0;
                }

                Unit unit(fields[0], pair.first, Dimension(l, m, t, theta), factor, "custom");
                if (fields.size() == 4) {
                    unit.offset = std::stod(fields[3]);
                }
                units.addUnit(unit);
                added++;
            } catch (const std::exception& e) {
                std::cerr << "Warning: Invalid unit definition [units]:" << pair.first
                          << " - " << e.what() << std::endl;
            }
        }
    }

    auto alias_it = data.find("aliases");
    if (alias_it != data.end()) {
        for (const auto& pair : alias_it->second) {
            if (units.addAlias(pair.second, pair.first)) {
                added++;
            } else {
                std::cerr << "Warning: Cannot alias '" << pair.first
                          << "' to unknown unit '" << pair.second << "'" << std::endl;
            }
        }
    }

    return added;
}

UnitsDeclaration ConfigReader::parseDeclaration(const std::string& value) const {
    std::string text = trim(value);
    if (text.empty() || text == "none" || text == "None") {
        return UnitsDeclaration();
    }

    bool sequence = false;
    if (text.front() == '(' && text.back() == ')' && text.find(',') != std::string::npos) {
        text = text.substr(1, text.size() - 2);
        sequence = true;
    } else if (text.front() == '[' && text.back() == ']') {
        text = text.substr(1, text.size() - 2);
        sequence = true;
    }
    if (text.find(',') != std::string::npos) {
        sequence = true;
    }

    if (!sequence) {
        return UnitsDeclaration(text);
    }

    std::vector<UnitSpec> specs;
    std::stringstream ss(text);
    std::string item;
    while (std::getline(ss, item, ',')) {
        item = trim(item);
        if (item.empty()) continue;
        if (item == "none" || item == "None") {
            specs.push_back(UnitSpec());
        } else {
            specs.push_back(UnitSpec(item));
        }
    }
    return UnitsDeclaration(specs);
}

std::pair<UnitsDeclaration, UnitsDeclaration>
ConfigReader::getDeclaration(const std::string& name) const {
    const std::string section = "declaration." + name;
    return std::make_pair(parseDeclaration(getString(section, "units_in")),
                          parseDeclaration(getString(section, "units_out")));
}

UnitEnforcer ConfigReader::makeEnforcer(const std::string& name, const UnitSystem& units) const {
    if (!hasSection("declaration." + name)) {
        throw std::runtime_error("No [declaration." + name + "] section in configuration");
    }
    std::pair<UnitsDeclaration, UnitsDeclaration> decl = getDeclaration(name);
    return UnitEnforcer(decl.first, decl.second, getEnforcementOptions(),
                        getFormatDefaults(), units);
}

} // namespace QWRAP
