// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/engine/ability_catalog.h>

#include <spdlog/spdlog.h>

namespace sortie::engine {

Result<AbilityCatalog> AbilityCatalog::create(std::vector<Ability> abilities) {
    AbilityCatalog catalog;
    catalog.abilities_.reserve(abilities.size());

    for (auto& ability : abilities) {
        if (ability.id.empty()) {
            return Error{ErrorCode::InvalidData, "Ability with empty id"};
        }
        if (catalog.index_.count(ability.id)) {
            return Error{ErrorCode::InvalidData, "Duplicate ability id '" + ability.id + "'"};
        }
        if (!ExecutorRegistry::isKnown(ability.executor)) {
            return Error{ErrorCode::NotSupported, "Ability '" + ability.id +
                                                      "' uses unknown executor '" +
                                                      ability.executor + "'"};
        }
        if (ability.retry.maxAttempts == 0) {
            return Error{ErrorCode::InvalidData,
                         "Ability '" + ability.id + "' must allow at least one attempt"};
        }
        for (const auto& rule : ability.parsers) {
            auto valid = validateParserRule(rule);
            if (!valid) {
                return Error{ErrorCode::InvalidData,
                             "Ability '" + ability.id + "': " + valid.error().message};
            }
        }

        std::set<std::string> required = ability.requirements;
        for (auto& key : placeholdersOf(ability.command))
            required.insert(std::move(key));

        catalog.index_.emplace(ability.id, catalog.abilities_.size());
        catalog.required_.emplace(ability.id, std::move(required));
        catalog.abilities_.push_back(std::move(ability));
    }

    spdlog::debug("[AbilityCatalog] built with {} abilities", catalog.abilities_.size());
    return catalog;
}

const Ability* AbilityCatalog::find(const AbilityId& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &abilities_[it->second];
}

std::vector<const Ability*> AbilityCatalog::abilitiesFor(const AdversaryProfile& profile) const {
    std::vector<const Ability*> out;
    out.reserve(profile.abilityCount());
    for (const auto& phase : profile.phases) {
        for (const auto& id : phase.abilities) {
            if (const auto* ability = find(id))
                out.push_back(ability);
        }
    }
    return out;
}

Result<std::set<std::string>> AbilityCatalog::requiredFacts(const AbilityId& id) const {
    auto it = required_.find(id);
    if (it == required_.end()) {
        return Error{ErrorCode::NotFound, "Unknown ability '" + id + "'"};
    }
    return it->second;
}

Result<std::string> AbilityCatalog::render(const AbilityId& id, const FactValues& facts) const {
    const auto* ability = find(id);
    if (!ability) {
        return Error{ErrorCode::NotFound, "Unknown ability '" + id + "'"};
    }
    const auto* capability = ExecutorRegistry::forKind(ability->executor);
    if (!capability) {
        return Error{ErrorCode::NotSupported, "Unknown executor '" + ability->executor + "'"};
    }
    return capability->render(ability->command, facts);
}

Result<std::vector<ParsedFact>> AbilityCatalog::parseOutput(const AbilityId& id,
                                                            std::string_view output) const {
    const auto* ability = find(id);
    if (!ability) {
        return Error{ErrorCode::NotFound, "Unknown ability '" + id + "'"};
    }
    const auto* capability = ExecutorRegistry::forKind(ability->executor);
    if (!capability) {
        return Error{ErrorCode::NotSupported, "Unknown executor '" + ability->executor + "'"};
    }
    return capability->parse(output, ability->parsers);
}

std::optional<std::size_t> AbilityCatalog::catalogOrder(const AbilityId& id) const {
    auto it = index_.find(id);
    if (it == index_.end())
        return std::nullopt;
    return it->second;
}

Result<void> AbilityCatalog::validateProfile(const AdversaryProfile& profile) const {
    if (profile.id.empty()) {
        return Error{ErrorCode::InvalidData, "Profile with empty id"};
    }
    std::set<AbilityId> seen;
    for (const auto& phase : profile.phases) {
        for (const auto& id : phase.abilities) {
            if (!find(id)) {
                return Error{ErrorCode::InvalidData, "Profile '" + profile.id +
                                                         "' references unknown ability '" + id +
                                                         "'"};
            }
            if (!seen.insert(id).second) {
                return Error{ErrorCode::InvalidData, "Profile '" + profile.id + "' lists ability '" +
                                                         id + "' more than once"};
            }
        }
    }
    return {};
}

} // namespace sortie::engine
