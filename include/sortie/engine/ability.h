// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/core/types.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace sortie::engine {

enum class ParserKind { Line, Regex, KeyValue, Json };

const char* parserKindName(ParserKind kind) noexcept;
std::optional<ParserKind> parseParserKind(const std::string& name);

/**
 * @brief Rule that extracts facts from a link's raw output.
 *
 * - Line: every non-empty trimmed line becomes a value of `key`.
 * - Regex: every match of `pattern` (capture group 1 if present) becomes a value of `key`.
 * - KeyValue: `k=v` / `k: v` lines; restricted to `key` when set.
 * - Json: dotted `path` into a JSON document; arrays yield one value per element.
 */
struct ParserRule {
    ParserKind kind{ParserKind::Line};
    std::string key;
    std::string pattern;
    std::string path;
};

struct RetryPolicy {
    // Total number of attempts, including the first. 1 means no retry.
    uint32_t maxAttempts{1};
};

/**
 * @brief Immutable technique/procedure definition.
 *
 * An empty platform set applies to every platform. Placeholders in `command` use the
 * `#{fact.key}` syntax and are implicitly required in addition to `requirements`.
 */
struct Ability {
    AbilityId id;
    std::string name;
    std::string tactic;
    std::set<std::string> platforms;
    std::string executor;
    std::string command;
    std::set<std::string> requirements;
    std::vector<ParserRule> parsers;
    RetryPolicy retry;
    std::optional<std::chrono::seconds> timeout;

    bool appliesTo(const std::string& platform) const {
        return platforms.empty() || platforms.count(platform) > 0 || platforms.count("any") > 0;
    }
};

struct TacticPhase {
    std::string name;
    // Optional phases never gate later phases.
    bool optional{false};
    std::vector<AbilityId> abilities;
};

/**
 * @brief Ordered, phase-grouped selection of abilities. Immutable for an operation's lifetime.
 */
struct AdversaryProfile {
    std::string id;
    std::string name;
    std::string description;
    std::vector<TacticPhase> phases;

    // Index of the phase holding `abilityId`, if any.
    std::optional<std::size_t> phaseOf(const AbilityId& abilityId) const;
    bool contains(const AbilityId& abilityId) const { return phaseOf(abilityId).has_value(); }
    std::size_t abilityCount() const;
};

} // namespace sortie::engine
