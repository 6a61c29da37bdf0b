/*
 * Sectioned key/value configuration file
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#ifndef INI_CONFIG_HPP
#define INI_CONFIG_HPP

#include <istream>
#include <map>
#include <string>

class IniConfig {
public:
    bool load(const std::string& filename);
    void parse(std::istream& input);
    bool save(const std::string& filename) const;

    std::string getValue(const std::string& section, const std::string& key,
                         const std::string& default_value = "") const;
    void setValue(const std::string& section, const std::string& key, const std::string& value);
    bool hasValue(const std::string& section, const std::string& key) const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;
};

#endif // INI_CONFIG_HPP
