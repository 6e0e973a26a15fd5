// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/core/types.h>
#include <sortie/engine/output_parser.h>

#include <map>
#include <memory>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace sortie::engine {

using FactValues = std::map<std::string, std::string>;

// Extract the distinct `#{key}` placeholder names of a command template, in first-seen order.
std::vector<std::string> placeholdersOf(std::string_view commandTemplate);

// True when `value` contains the `#{` opener. Such values are never stored as facts.
bool containsPlaceholder(std::string_view value);

// Textual `#{key}` substitution. Fails with ErrorCode::MissingFact naming the first key that
// has no value.
Result<std::string> substitutePlaceholders(std::string_view commandTemplate,
                                           const FactValues& facts);

/**
 * @brief Capability interface for one executor kind.
 *
 * The set of implementations is closed: ExecutorRegistry maps executor-kind tags (and their
 * aliases) onto one of the built-in capabilities. The engine never executes anything; a
 * capability only renders the command handed to the agent and turns its output into facts.
 */
class ExecutorCapability {
public:
    virtual ~ExecutorCapability() = default;

    virtual std::string_view kind() const noexcept = 0;

    virtual Result<std::string> render(std::string_view commandTemplate,
                                       const FactValues& facts) const;

    Result<std::vector<ParsedFact>> parse(std::string_view output,
                                          const std::vector<ParserRule>& rules) const;

protected:
    // Per-executor output clean-up applied before parsing.
    virtual std::string normalizeOutput(std::string_view output) const;
};

class ShellCapability final : public ExecutorCapability {
public:
    std::string_view kind() const noexcept override { return "shell"; }
};

class PowerShellCapability final : public ExecutorCapability {
public:
    std::string_view kind() const noexcept override { return "powershell"; }

protected:
    // Strips a UTF-8 BOM and folds CRLF line endings.
    std::string normalizeOutput(std::string_view output) const override;
};

class ScriptCapability final : public ExecutorCapability {
public:
    std::string_view kind() const noexcept override { return "script"; }

protected:
    std::string normalizeOutput(std::string_view output) const override {
        return std::string(output);
    }
};

class ExecutorRegistry {
public:
    // Returns nullptr for unknown executor tags.
    static const ExecutorCapability* forKind(std::string_view executorKind);
    static bool isKnown(std::string_view executorKind) { return forKind(executorKind) != nullptr; }
    static std::set<std::string> knownKinds();
};

} // namespace sortie::engine
