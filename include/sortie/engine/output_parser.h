// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/core/types.h>
#include <sortie/engine/ability.h>

#include <string>
#include <string_view>
#include <vector>

namespace sortie::engine {

struct ParsedFact {
    std::string key;
    std::string value;

    bool operator==(const ParsedFact& other) const {
        return key == other.key && value == other.value;
    }
};

// Reject rules that can never produce a fact (missing key, bad regex, empty json path).
Result<void> validateParserRule(const ParserRule& rule);

// Apply a single rule to raw output. Duplicate (key, value) pairs are collapsed.
Result<std::vector<ParsedFact>> applyParser(const ParserRule& rule, std::string_view output);

// Apply every rule in order, concatenating results and dropping duplicates across rules.
Result<std::vector<ParsedFact>> applyParsers(const std::vector<ParserRule>& rules,
                                             std::string_view output);

} // namespace sortie::engine
