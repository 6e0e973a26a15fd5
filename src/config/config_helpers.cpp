// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <fstream>
#include <sstream>
#include <sortie/config/config_helpers.h>

namespace sortie::config {

ConfigMap parseConfigText(std::string_view text) {
    ConfigMap config;
    std::istringstream in{std::string(text)};
    std::string line;
    std::string currentSection;

    while (std::getline(in, line)) {
        trim(line);

        // Skip comments and empty lines
        if (line.empty() || line[0] == '#') {
            continue;
        }

        // Check for section headers [section]
        if (line[0] == '[') {
            size_t end = line.find(']');
            if (end != std::string::npos) {
                currentSection = line.substr(1, end - 1);
                trim(currentSection);
            }
            continue;
        }

        size_t eq = line.find('=');
        if (eq == std::string::npos) {
            continue;
        }
        std::string k = line.substr(0, eq);
        std::string v = line.substr(eq + 1);
        trim(k);
        trim(v);

        // Remove inline comments outside of quoted values
        if (!v.empty() && v.front() != '"' && v.front() != '\'') {
            size_t comment = v.find('#');
            if (comment != std::string::npos) {
                v = v.substr(0, comment);
                trim(v);
            }
        } else if (!v.empty()) {
            const char quote = v.front();
            size_t close = v.find(quote, 1);
            if (close != std::string::npos) {
                v = v.substr(0, close + 1);
            }
        }

        config[currentSection][k] = unquote(v);
    }

    return config;
}

Result<ConfigMap> parseConfigFile(const std::filesystem::path& path) {
    std::ifstream file(path);
    if (!file) {
        return Error{ErrorCode::NotFound, "Cannot open config file: " + path.string()};
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return parseConfigText(buffer.str());
}

std::filesystem::path get_config_path(const std::string& override_path) {
    if (!override_path.empty()) {
        return expand_tilde(override_path);
    }

    const char* xdgConfigHome = std::getenv("XDG_CONFIG_HOME");
    const char* homeEnv = std::getenv("HOME");

    std::filesystem::path configHome;
    if (xdgConfigHome) {
        configHome = std::filesystem::path(xdgConfigHome);
    } else if (homeEnv) {
        configHome = std::filesystem::path(homeEnv) / ".config";
    } else {
        return std::filesystem::path("~/.config") / "sortie" / "config.toml";
    }

    return configHome / "sortie" / "config.toml";
}

std::string lookup(const ConfigMap& config, const std::string& section, const std::string& key) {
    auto sit = config.find(section);
    if (sit == config.end()) {
        return "";
    }
    auto kit = sit->second.find(key);
    return kit == sit->second.end() ? std::string{} : kit->second;
}

} // namespace sortie::config
