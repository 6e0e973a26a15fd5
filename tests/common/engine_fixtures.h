// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/engine/ability.h>
#include <sortie/engine/ability_catalog.h>
#include <sortie/engine/agent.h>
#include <sortie/engine/operation_journal.h>

#include <chrono>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace sortie::test {

inline TimePoint t0() {
    return TimePoint{std::chrono::seconds{1700000000}};
}

inline TimePoint at(std::chrono::seconds offset) {
    return t0() + offset;
}

inline engine::Ability makeAbility(std::string id, std::string command,
                                   std::vector<engine::ParserRule> parsers = {},
                                   std::set<std::string> requirements = {}) {
    engine::Ability a;
    a.id = id;
    a.name = id;
    a.tactic = "discovery";
    a.executor = "sh";
    a.command = std::move(command);
    a.parsers = std::move(parsers);
    a.requirements = std::move(requirements);
    return a;
}

inline engine::ParserRule kvRule(std::string key = {}) {
    engine::ParserRule r;
    r.kind = engine::ParserKind::KeyValue;
    r.key = std::move(key);
    return r;
}

inline engine::TacticPhase phase(std::string name, std::vector<AbilityId> ids,
                                 bool optional = false) {
    engine::TacticPhase p;
    p.name = std::move(name);
    p.optional = optional;
    p.abilities = std::move(ids);
    return p;
}

inline engine::AdversaryProfile profile(std::string id, std::vector<engine::TacticPhase> phases) {
    engine::AdversaryProfile p;
    p.id = id;
    p.name = std::move(id);
    p.phases = std::move(phases);
    return p;
}

inline std::shared_ptr<const engine::AbilityCatalog>
makeCatalog(std::vector<engine::Ability> abilities) {
    auto c = engine::AbilityCatalog::create(std::move(abilities));
    if (!c)
        throw std::runtime_error("fixture catalog rejected: " + c.error().message);
    return std::make_shared<const engine::AbilityCatalog>(std::move(c).value());
}

inline engine::AgentInfo agent(std::string id, std::string platform = "linux") {
    engine::AgentInfo a;
    a.id = std::move(id);
    a.platform = std::move(platform);
    a.hostname = a.id + ".lab";
    a.beaconInterval = std::chrono::seconds{10};
    a.jitter = std::chrono::seconds{0};
    a.firstSeen = t0();
    a.lastSeen = t0();
    return a;
}

// Journal whose writes can be switched to fail, for persistence-failure paths.
class FlakyJournal : public engine::OperationJournal {
public:
    bool failWrites = false;
    int linkWrites = 0;
    int factWrites = 0;
    int operationWrites = 0;

    Result<void> saveOperation(const engine::OperationRecord&) override {
        ++operationWrites;
        return outcome();
    }
    Result<void> saveLink(const engine::Link&) override {
        ++linkWrites;
        return outcome();
    }
    Result<void> appendFact(const OperationId&, const engine::Fact&) override {
        ++factWrites;
        return outcome();
    }
    Result<void> saveAgent(const engine::AgentInfo&) override { return outcome(); }
    Result<void> saveParticipant(const OperationId&, const AgentId&, engine::AgentState) override {
        return outcome();
    }
    Result<void> archiveOperation(const OperationId&) override { return outcome(); }

private:
    Result<void> outcome() const {
        if (failWrites)
            return Error{ErrorCode::DatabaseError, "disk full"};
        return {};
    }
};

} // namespace sortie::test
