/**
 * \file config/Config.cpp
 * \brief Typed access and merge logic for the key/value configuration.
 */
#include "Config.hpp"
#include "common/Errors.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>

namespace takclient::config {

namespace {

std::string trim(const std::string& s) {
    auto begin = std::find_if_not(s.begin(), s.end(), [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(), [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string{};
}

std::string lower(std::string s) {
    for (auto& c : s) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return s;
}

} // namespace

bool parse_bool(const std::string& value) {
    const auto v = lower(trim(value));
    return v == "true" || v == "yes" || v == "y" || v == "on" || v == "1";
}

bool Config::contains(const std::string& key) const {
    return values_.find(key) != values_.end();
}

std::optional<std::string> Config::get(const std::string& key) const {
    auto it = values_.find(key);
    if (it == values_.end()) return std::nullopt;
    return it->second;
}

std::string Config::get_or(const std::string& key, const std::string& fallback) const {
    auto it = values_.find(key);
    if (it == values_.end() || it->second.empty()) return fallback;
    return it->second;
}

bool Config::get_bool(const std::string& key, bool fallback) const {
    auto it = values_.find(key);
    if (it == values_.end() || trim(it->second).empty()) return fallback;
    return parse_bool(it->second);
}

std::int64_t Config::get_int(const std::string& key, std::int64_t fallback) const {
    auto it = values_.find(key);
    if (it == values_.end() || trim(it->second).empty()) return fallback;
    try {
        size_t pos = 0;
        const auto text = trim(it->second);
        auto v = std::stoll(text, &pos);
        if (pos != text.size()) throw std::invalid_argument("trailing characters");
        return v;
    } catch (const std::exception&) {
        throw ConfigError("Invalid integer for " + key + ": '" + it->second + "'");
    }
}

double Config::get_double(const std::string& key, double fallback) const {
    auto it = values_.find(key);
    if (it == values_.end() || trim(it->second).empty()) return fallback;
    try {
        return std::stod(trim(it->second));
    } catch (const std::exception&) {
        throw ConfigError("Invalid number for " + key + ": '" + it->second + "'");
    }
}

void Config::set(const std::string& key, std::string value) {
    values_[key] = std::move(value);
}

std::size_t Config::merge_missing(const Config& other) {
    std::size_t filled = 0;
    for (const auto& [key, value] : other.values_) {
        if (contains(key)) continue;
        values_.emplace(key, value);
        ++filled;
    }
    return filled;
}

Config Config::from_ini(const std::string& text) {
    Config cfg;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        auto t = trim(line);
        if (t.empty() || t[0] == '#' || t[0] == ';' || t[0] == '[') continue;
        auto eq = t.find('=');
        if (eq == std::string::npos) continue;
        auto key = trim(t.substr(0, eq));
        if (key.empty()) continue;
        cfg.set(key, trim(t.substr(eq + 1)));
    }
    return cfg;
}

} // namespace takclient::config
