// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/engine/executor_capability.h>

#include <algorithm>
#include <array>
#include <utility>

namespace sortie::engine {

namespace {

constexpr std::string_view kOpen = "#{";

const ShellCapability kShell{};
const PowerShellCapability kPowerShell{};
const ScriptCapability kScript{};

constexpr std::array<std::pair<std::string_view, const ExecutorCapability*>, 10> kAliases{{
    {"shell", &kShell},
    {"sh", &kShell},
    {"bash", &kShell},
    {"zsh", &kShell},
    {"powershell", &kPowerShell},
    {"psh", &kPowerShell},
    {"pwsh", &kPowerShell},
    {"cmd", &kPowerShell},
    {"script", &kScript},
    {"python", &kScript},
}};

} // namespace

bool containsPlaceholder(std::string_view value) {
    return value.find(kOpen) != std::string_view::npos;
}

std::vector<std::string> placeholdersOf(std::string_view commandTemplate) {
    std::vector<std::string> keys;
    std::size_t pos = 0;
    while ((pos = commandTemplate.find(kOpen, pos)) != std::string_view::npos) {
        auto close = commandTemplate.find('}', pos + kOpen.size());
        if (close == std::string_view::npos)
            break;
        std::string key(commandTemplate.substr(pos + kOpen.size(), close - pos - kOpen.size()));
        if (!key.empty() && std::find(keys.begin(), keys.end(), key) == keys.end())
            keys.push_back(std::move(key));
        pos = close + 1;
    }
    return keys;
}

Result<std::string> substitutePlaceholders(std::string_view commandTemplate,
                                           const FactValues& facts) {
    std::string out;
    out.reserve(commandTemplate.size());
    std::size_t pos = 0;
    while (pos < commandTemplate.size()) {
        auto open = commandTemplate.find(kOpen, pos);
        if (open == std::string_view::npos) {
            out.append(commandTemplate.substr(pos));
            break;
        }
        auto close = commandTemplate.find('}', open + kOpen.size());
        if (close == std::string_view::npos) {
            out.append(commandTemplate.substr(pos));
            break;
        }
        out.append(commandTemplate.substr(pos, open - pos));
        std::string key(commandTemplate.substr(open + kOpen.size(), close - open - kOpen.size()));
        auto it = facts.find(key);
        if (it == facts.end()) {
            return Error{ErrorCode::MissingFact, key};
        }
        out.append(it->second);
        pos = close + 1;
    }
    return out;
}

Result<std::string> ExecutorCapability::render(std::string_view commandTemplate,
                                               const FactValues& facts) const {
    return substitutePlaceholders(commandTemplate, facts);
}

Result<std::vector<ParsedFact>>
ExecutorCapability::parse(std::string_view output, const std::vector<ParserRule>& rules) const {
    auto normalized = normalizeOutput(output);
    return applyParsers(rules, normalized);
}

std::string ExecutorCapability::normalizeOutput(std::string_view output) const {
    auto end = output.find_last_not_of(" \t\r\n");
    if (end == std::string_view::npos)
        return {};
    return std::string(output.substr(0, end + 1));
}

std::string PowerShellCapability::normalizeOutput(std::string_view output) const {
    if (output.size() >= 3 && static_cast<unsigned char>(output[0]) == 0xEF &&
        static_cast<unsigned char>(output[1]) == 0xBB &&
        static_cast<unsigned char>(output[2]) == 0xBF) {
        output.remove_prefix(3);
    }
    std::string out;
    out.reserve(output.size());
    for (std::size_t i = 0; i < output.size(); ++i) {
        if (output[i] == '\r' && i + 1 < output.size() && output[i + 1] == '\n')
            continue;
        out.push_back(output[i]);
    }
    return ExecutorCapability::normalizeOutput(out);
}

const ExecutorCapability* ExecutorRegistry::forKind(std::string_view executorKind) {
    for (const auto& [alias, cap] : kAliases) {
        if (alias == executorKind)
            return cap;
    }
    return nullptr;
}

std::set<std::string> ExecutorRegistry::knownKinds() {
    std::set<std::string> kinds;
    for (const auto& entry : kAliases)
        kinds.emplace(entry.first);
    return kinds;
}

} // namespace sortie::engine
