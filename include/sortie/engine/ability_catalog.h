// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/core/types.h>
#include <sortie/engine/ability.h>
#include <sortie/engine/executor_capability.h>

#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sortie::engine {

/**
 * @brief Immutable, in-memory view of ability definitions.
 *
 * Built once by the catalog loader and shared read-only (via shared_ptr<const>) across every
 * operation and thread; no method mutates state after create().
 */
class AbilityCatalog {
public:
    // Validates ids, executors, parser rules and placeholder syntax.
    static Result<AbilityCatalog> create(std::vector<Ability> abilities);

    AbilityCatalog() = default;

    const Ability* find(const AbilityId& id) const;

    // Abilities of `profile` in tactic-phase order, then in profile order within a phase.
    // Ids the catalog does not know are skipped.
    std::vector<const Ability*> abilitiesFor(const AdversaryProfile& profile) const;

    // Explicit requirements plus every #{placeholder} of the command template.
    Result<std::set<std::string>> requiredFacts(const AbilityId& id) const;

    // Render the command with already-resolved facts. ErrorCode::MissingFact means the caller
    // skipped resolution; the scheduler always resolves first.
    Result<std::string> render(const AbilityId& id, const FactValues& facts) const;

    // Run the ability's parser rules through its executor capability.
    Result<std::vector<ParsedFact>> parseOutput(const AbilityId& id,
                                                std::string_view output) const;

    // Position of the ability in load order; used as the second dispatch tie-break.
    std::optional<std::size_t> catalogOrder(const AbilityId& id) const;

    // Every ability referenced by the profile must exist.
    Result<void> validateProfile(const AdversaryProfile& profile) const;

    std::size_t size() const noexcept { return abilities_.size(); }
    const std::vector<Ability>& abilities() const noexcept { return abilities_; }

private:
    std::vector<Ability> abilities_;
    std::unordered_map<AbilityId, std::size_t> index_;
    std::unordered_map<AbilityId, std::set<std::string>> required_;
};

} // namespace sortie::engine
