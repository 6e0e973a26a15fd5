// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/engine/ability.h>

#include <algorithm>

namespace sortie::engine {

const char* parserKindName(ParserKind kind) noexcept {
    switch (kind) {
        case ParserKind::Line: return "line";
        case ParserKind::Regex: return "regex";
        case ParserKind::KeyValue: return "kv";
        case ParserKind::Json: return "json";
    }
    return "line";
}

std::optional<ParserKind> parseParserKind(const std::string& name) {
    if (name == "line" || name == "lines")
        return ParserKind::Line;
    if (name == "regex")
        return ParserKind::Regex;
    if (name == "kv" || name == "key_value")
        return ParserKind::KeyValue;
    if (name == "json")
        return ParserKind::Json;
    return std::nullopt;
}

std::optional<std::size_t> AdversaryProfile::phaseOf(const AbilityId& abilityId) const {
    for (std::size_t i = 0; i < phases.size(); ++i) {
        const auto& ids = phases[i].abilities;
        if (std::find(ids.begin(), ids.end(), abilityId) != ids.end())
            return i;
    }
    return std::nullopt;
}

std::size_t AdversaryProfile::abilityCount() const {
    std::size_t n = 0;
    for (const auto& p : phases)
        n += p.abilities.size();
    return n;
}

} // namespace sortie::engine
