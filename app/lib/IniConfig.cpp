/*
 * Sectioned key/value configuration file
 * Part of Switchboard - one interface over many language model backends
 *
 * SPDX-License-Identifier: AGPL-3.0-or-later
 */

#include "IniConfig.hpp"
#include "Logger.hpp"

#include <fstream>
#include <optional>
#include <utility>

namespace {

std::string trim(const std::string& input)
{
    const auto begin = input.find_first_not_of(" \t\r");
    if (begin == std::string::npos) {
        return {};
    }
    const auto end = input.find_last_not_of(" \t\r");
    return input.substr(begin, end - begin + 1);
}

bool is_comment_or_blank(const std::string& line)
{
    return line.empty() || line.front() == ';' || line.front() == '#';
}

std::optional<std::string> section_name(const std::string& line)
{
    if (line.size() >= 2 && line.front() == '[' && line.back() == ']') {
        return trim(line.substr(1, line.size() - 2));
    }
    return std::nullopt;
}

std::optional<std::pair<std::string, std::string>> key_value(const std::string& line)
{
    const auto delimiter = line.find('=');
    if (delimiter == std::string::npos) {
        return std::nullopt;
    }
    std::string key = trim(line.substr(0, delimiter));
    if (key.empty()) {
        return std::nullopt;
    }
    return std::make_pair(std::move(key), trim(line.substr(delimiter + 1)));
}

} // namespace

bool IniConfig::load(const std::string& filename)
{
    std::ifstream file(filename);
    if (!file.is_open()) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->warn("Failed to open config file: {}", filename);
        }
        return false;
    }
    parse(file);
    return true;
}

void IniConfig::parse(std::istream& input)
{
    std::string raw_line;
    std::string section;
    while (std::getline(input, raw_line)) {
        const std::string line = trim(raw_line);
        if (is_comment_or_blank(line)) {
            continue;
        }
        if (auto name = section_name(line)) {
            section = *name;
            continue;
        }
        if (auto entry = key_value(line)) {
            data[section][entry->first] = entry->second;
        }
    }
}

bool IniConfig::save(const std::string& filename) const
{
    std::ofstream file(filename);
    if (!file.is_open()) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->error("Failed to write config file: {}", filename);
        }
        return false;
    }

    for (const auto& [section, entries] : data) {
        file << "[" << section << "]\n";
        for (const auto& [key, value] : entries) {
            file << key << " = " << value << "\n";
        }
        file << "\n";
    }
    return static_cast<bool>(file);
}

std::string IniConfig::getValue(const std::string& section, const std::string& key,
                                const std::string& default_value) const
{
    auto sec_it = data.find(section);
    if (sec_it == data.end()) {
        return default_value;
    }
    auto key_it = sec_it->second.find(key);
    return key_it == sec_it->second.end() ? default_value : key_it->second;
}

void IniConfig::setValue(const std::string& section, const std::string& key, const std::string& value)
{
    data[section][key] = value;
}

bool IniConfig::hasValue(const std::string& section, const std::string& key) const
{
    auto sec_it = data.find(section);
    return sec_it != data.end() && sec_it->second.count(key) > 0;
}
