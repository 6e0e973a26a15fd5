// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>
#include <sortie/core/types.h>

namespace sortie::config {

// Section name -> (key -> raw value). The unnamed top-level section is "".
using ConfigMap = std::map<std::string, std::map<std::string, std::string>>;

// String trimming utilities
inline void ltrim(std::string& s) {
    s.erase(s.begin(),
            std::find_if(s.begin(), s.end(), [](unsigned char ch) { return !std::isspace(ch); }));
}

inline void rtrim(std::string& s) {
    s.erase(std::find_if(s.rbegin(), s.rend(), [](unsigned char ch) { return !std::isspace(ch); })
                .base(),
            s.end());
}

inline void trim(std::string& s) {
    ltrim(s);
    rtrim(s);
}

// Quote handling
inline std::string unquote(std::string val) {
    trim(val);
    if (val.size() >= 2 && ((val.front() == '"' && val.back() == '"') ||
                            (val.front() == '\'' && val.back() == '\''))) {
        return val.substr(1, val.size() - 2);
    }
    return val;
}

// Tilde expansion
inline std::filesystem::path expand_tilde(const std::string& path) {
    if (!path.empty() && path[0] == '~') {
        const char* home = std::getenv("HOME");
        if (home) {
            return std::filesystem::path(home) / path.substr(path.size() > 1 ? 2 : 1);
        }
    }
    return path;
}

inline bool parse_bool(std::string_view s, bool fallback) {
    std::string v(s);
    for (auto& c : v)
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    if (v == "true" || v == "1" || v == "yes" || v == "on")
        return true;
    if (v == "false" || v == "0" || v == "no" || v == "off")
        return false;
    return fallback;
}

// Parse a TOML-style config file into sections. Comments (#), quotes and blank lines are
// handled; arrays are kept verbatim as strings.
Result<ConfigMap> parseConfigFile(const std::filesystem::path& path);

// Same as parseConfigFile but over an in-memory document.
ConfigMap parseConfigText(std::string_view text);

// Resolve the config file path: override, then $XDG_CONFIG_HOME/sortie/config.toml,
// then ~/.config/sortie/config.toml.
std::filesystem::path get_config_path(const std::string& override_path = "");

// Lookup helper returning an empty string when the section or key is absent.
std::string lookup(const ConfigMap& config, const std::string& section, const std::string& key);

} // namespace sortie::config
