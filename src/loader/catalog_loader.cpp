// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/loader/catalog_loader.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <fstream>
#include <set>
#include <sstream>

namespace sortie::loader {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {

Error invalid(const std::string& origin, const std::string& what) {
    return Error{ErrorCode::InvalidData, origin + ": " + what};
}

Result<std::string> requireString(const json& j, const char* field, const std::string& where) {
    auto it = j.find(field);
    if (it == j.end() || !it->is_string() || it->get<std::string>().empty())
        return invalid(where, std::string("missing or empty string field '") + field + "'");
    return it->get<std::string>();
}

std::string optionalString(const json& j, const char* field) {
    auto it = j.find(field);
    if (it == j.end() || !it->is_string())
        return {};
    return it->get<std::string>();
}

// Accepts a single string or an array of strings.
Result<std::vector<std::string>> stringList(const json& j, const char* field,
                                            const std::string& where) {
    std::vector<std::string> out;
    auto it = j.find(field);
    if (it == j.end() || it->is_null())
        return out;
    if (it->is_string()) {
        out.push_back(it->get<std::string>());
        return out;
    }
    if (!it->is_array())
        return invalid(where, std::string("field '") + field + "' must be a string or an array");
    for (const auto& el : *it) {
        if (!el.is_string())
            return invalid(where, std::string("field '") + field + "' must hold strings");
        out.push_back(el.get<std::string>());
    }
    return out;
}

Result<engine::ParserRule> parseRule(const json& j, const std::string& where) {
    if (!j.is_object())
        return invalid(where, "parser entry must be an object");
    engine::ParserRule rule;
    auto type = optionalString(j, "type");
    if (type.empty())
        type = "line";
    auto kind = engine::parseParserKind(type);
    if (!kind)
        return invalid(where, "unknown parser type '" + type + "'");
    rule.kind = *kind;
    rule.key = optionalString(j, "key");
    rule.pattern = optionalString(j, "pattern");
    rule.path = optionalString(j, "path");
    if (auto valid = engine::validateParserRule(rule); !valid)
        return invalid(where, valid.error().message);
    return rule;
}

Result<engine::Ability> parseAbility(const json& j, const std::string& origin) {
    if (!j.is_object())
        return invalid(origin, "ability entry must be an object");

    auto id = requireString(j, "id", origin);
    if (!id)
        return id.error();
    std::string where = origin + " ability '" + id.value() + "'";

    engine::Ability ability;
    ability.id = id.value();
    ability.name = optionalString(j, "name");
    if (ability.name.empty())
        ability.name = ability.id;
    ability.tactic = optionalString(j, "tactic");

    auto executor = requireString(j, "executor", where);
    if (!executor)
        return executor.error();
    ability.executor = executor.value();
    if (!engine::ExecutorRegistry::isKnown(ability.executor))
        return invalid(where, "unknown executor '" + ability.executor + "'");

    auto command = requireString(j, "command", where);
    if (!command)
        return command.error();
    ability.command = command.value();

    auto platforms = stringList(j, "platforms", where);
    if (!platforms)
        return platforms.error();
    ability.platforms.insert(platforms.value().begin(), platforms.value().end());

    auto requirements = stringList(j, "requirements", where);
    if (!requirements)
        return requirements.error();
    ability.requirements.insert(requirements.value().begin(), requirements.value().end());

    if (auto it = j.find("parsers"); it != j.end() && !it->is_null()) {
        if (!it->is_array())
            return invalid(where, "'parsers' must be an array");
        for (const auto& entry : *it) {
            auto rule = parseRule(entry, where);
            if (!rule)
                return rule.error();
            ability.parsers.push_back(std::move(rule).value());
        }
    }

    if (auto it = j.find("retry"); it != j.end() && it->is_object()) {
        auto attempts = it->value("max_attempts", 1);
        if (attempts < 1)
            return invalid(where, "retry.max_attempts must be at least 1");
        ability.retry.maxAttempts = static_cast<uint32_t>(attempts);
    }

    if (auto it = j.find("timeout_seconds"); it != j.end() && !it->is_null()) {
        if (!it->is_number_integer() || it->get<long long>() <= 0)
            return invalid(where, "timeout_seconds must be a positive integer");
        ability.timeout = std::chrono::seconds{it->get<long long>()};
    }
    return ability;
}

Result<engine::AdversaryProfile> parseProfile(const json& j, const std::string& origin) {
    if (!j.is_object())
        return invalid(origin, "profile entry must be an object");

    auto id = requireString(j, "id", origin);
    if (!id)
        return id.error();
    std::string where = origin + " profile '" + id.value() + "'";

    engine::AdversaryProfile profile;
    profile.id = id.value();
    profile.name = optionalString(j, "name");
    if (profile.name.empty())
        profile.name = profile.id;
    profile.description = optionalString(j, "description");

    if (auto it = j.find("phases"); it != j.end()) {
        if (!it->is_array())
            return invalid(where, "'phases' must be an array");
        std::size_t index = 0;
        for (const auto& entry : *it) {
            if (!entry.is_object())
                return invalid(where, "phase entry must be an object");
            engine::TacticPhase phase;
            phase.name = optionalString(entry, "name");
            if (phase.name.empty())
                phase.name = "phase-" + std::to_string(index);
            phase.optional = entry.value("optional", false);
            auto abilities = stringList(entry, "abilities", where);
            if (!abilities)
                return abilities.error();
            phase.abilities = std::move(abilities).value();
            profile.phases.push_back(std::move(phase));
            ++index;
        }
    } else {
        auto abilities = stringList(j, "abilities", where);
        if (!abilities)
            return abilities.error();
        engine::TacticPhase phase;
        phase.name = "default";
        phase.abilities = std::move(abilities).value();
        profile.phases.push_back(std::move(phase));
    }
    return profile;
}

// Collects the *.json files of a directory in name order, or the path itself.
Result<std::vector<fs::path>> documentPaths(const fs::path& path) {
    std::error_code ec;
    if (!fs::exists(path, ec))
        return Error{ErrorCode::NotFound, "Path does not exist: " + path.string()};
    std::vector<fs::path> files;
    if (fs::is_directory(path, ec)) {
        for (const auto& entry : fs::directory_iterator(path, ec)) {
            if (entry.is_regular_file() && entry.path().extension() == ".json")
                files.push_back(entry.path());
        }
        if (ec)
            return Error{ErrorCode::IOError, "Cannot list " + path.string() + ": " + ec.message()};
        std::sort(files.begin(), files.end());
    } else {
        files.push_back(path);
    }
    return files;
}

Result<std::string> readFile(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in)
        return Error{ErrorCode::IOError, "Cannot open " + path.string()};
    std::ostringstream ss;
    ss << in.rdbuf();
    return ss.str();
}

template <typename T, typename Parse>
Result<std::vector<T>> loadAll(const fs::path& path, Parse parse) {
    auto files = documentPaths(path);
    if (!files)
        return files.error();
    std::vector<T> out;
    for (const auto& file : files.value()) {
        auto text = readFile(file);
        if (!text)
            return text.error();
        auto parsed = parse(text.value(), file.string());
        if (!parsed)
            return parsed.error();
        for (auto& item : std::move(parsed).value())
            out.push_back(std::move(item));
    }
    return out;
}

} // namespace

Result<std::vector<engine::Ability>> parseAbilities(std::string_view text,
                                                    const std::string& origin) {
    auto j = json::parse(text.begin(), text.end(), nullptr, false);
    if (j.is_discarded())
        return invalid(origin, "not a valid JSON document");

    std::vector<engine::Ability> out;
    try {
        if (j.is_object() && j.contains("abilities")) {
            const auto& list = j["abilities"];
            if (!list.is_array())
                return invalid(origin, "'abilities' must be an array");
            for (const auto& entry : list) {
                auto ability = parseAbility(entry, origin);
                if (!ability)
                    return ability.error();
                out.push_back(std::move(ability).value());
            }
        } else if (j.is_array()) {
            for (const auto& entry : j) {
                auto ability = parseAbility(entry, origin);
                if (!ability)
                    return ability.error();
                out.push_back(std::move(ability).value());
            }
        } else {
            auto ability = parseAbility(j, origin);
            if (!ability)
                return ability.error();
            out.push_back(std::move(ability).value());
        }
    } catch (const json::exception& e) {
        return invalid(origin, e.what());
    }
    return out;
}

Result<std::vector<engine::AdversaryProfile>> parseProfiles(std::string_view text,
                                                            const std::string& origin) {
    auto j = json::parse(text.begin(), text.end(), nullptr, false);
    if (j.is_discarded())
        return invalid(origin, "not a valid JSON document");

    std::vector<engine::AdversaryProfile> out;
    try {
        if (j.is_object() && j.contains("profiles")) {
            const auto& list = j["profiles"];
            if (!list.is_array())
                return invalid(origin, "'profiles' must be an array");
            for (const auto& entry : list) {
                auto profile = parseProfile(entry, origin);
                if (!profile)
                    return profile.error();
                out.push_back(std::move(profile).value());
            }
        } else {
            auto profile = parseProfile(j, origin);
            if (!profile)
                return profile.error();
            out.push_back(std::move(profile).value());
        }
    } catch (const json::exception& e) {
        return invalid(origin, e.what());
    }
    return out;
}

Result<std::vector<engine::Ability>> loadAbilities(const fs::path& path) {
    auto abilities = loadAll<engine::Ability>(
        path, [](std::string_view text, const std::string& origin) {
            return parseAbilities(text, origin);
        });
    if (abilities)
        spdlog::info("[CatalogLoader] loaded {} abilities from {}", abilities.value().size(),
                     path.string());
    return abilities;
}

Result<std::vector<engine::AdversaryProfile>> loadProfiles(const fs::path& path) {
    auto profiles = loadAll<engine::AdversaryProfile>(
        path, [](std::string_view text, const std::string& origin) {
            return parseProfiles(text, origin);
        });
    if (profiles)
        spdlog::info("[CatalogLoader] loaded {} profiles from {}", profiles.value().size(),
                     path.string());
    return profiles;
}

Result<std::shared_ptr<const engine::AbilityCatalog>> loadCatalog(const fs::path& path) {
    auto abilities = loadAbilities(path);
    if (!abilities)
        return abilities.error();
    auto catalog = engine::AbilityCatalog::create(std::move(abilities).value());
    if (!catalog)
        return Error{ErrorCode::InvalidData, catalog.error().message};
    return std::shared_ptr<const engine::AbilityCatalog>(
        std::make_shared<engine::AbilityCatalog>(std::move(catalog).value()));
}

Result<void> validateProfiles(const engine::AbilityCatalog& catalog,
                              const std::vector<engine::AdversaryProfile>& profiles) {
    std::set<std::string> ids;
    for (const auto& profile : profiles) {
        if (!ids.insert(profile.id).second)
            return Error{ErrorCode::InvalidData, "Duplicate profile id '" + profile.id + "'"};
        if (auto valid = catalog.validateProfile(profile); !valid)
            return valid;
    }
    return {};
}

} // namespace sortie::loader
