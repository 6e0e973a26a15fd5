// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/engine/link_scheduler.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <tuple>

namespace sortie::engine {

LinkScheduler::LinkScheduler(const AbilityCatalog& catalog, AdversaryProfile profile,
                             OperationId operationId, std::chrono::seconds defaultTimeout)
    : catalog_(catalog), profile_(std::move(profile)), operationId_(std::move(operationId)),
      defaultTimeout_(defaultTimeout) {
    indexProfile();
}

void LinkScheduler::indexProfile() {
    positions_.clear();
    for (std::size_t p = 0; p < profile_.phases.size(); ++p) {
        for (const auto& id : profile_.phases[p].abilities) {
            auto order = catalog_.catalogOrder(id);
            positions_[id] = Position{p, order.value_or(0)};
        }
    }
}

bool LinkScheduler::canRun(const Ability& ability, const AgentInfo& agent) const {
    return ability.appliesTo(agent.platform) && agent.acceptsExecutor(ability.executor);
}

bool LinkScheduler::addPair(const Ability& ability, const AgentInfo& agent,
                            const LinkTable& links) {
    Pair pair{ability.id, agent.id};
    if (!canRun(ability, agent)) {
        skipped_.insert(pair);
        return false;
    }
    if (links.activeFor(ability.id, agent.id))
        return false;
    // A pair whose pending retry was discarded re-enters with the attempts it has left.
    if (const auto* last = links.lastOutcome(ability.id, agent.id)) {
        if (last->status == LinkStatus::Success || last->attempt + 1 >= ability.retry.maxAttempts)
            return false;
    }
    return frontier_.insert(std::move(pair)).second;
}

std::size_t LinkScheduler::addAgent(const AgentInfo& agent, const LinkTable& links) {
    agents_[agent.id] = agent;
    std::size_t added = 0;
    for (const auto* ability : catalog_.abilitiesFor(profile_)) {
        if (addPair(*ability, agent, links))
            ++added;
    }
    dirty_ = true;
    spdlog::debug("[LinkScheduler] {} agent {} joined: {} pair(s) added, frontier={}",
                  operationId_, agent.id, added, frontier_.size());
    return added;
}

void LinkScheduler::removeAgent(const AgentId& agentId) {
    agents_.erase(agentId);
    for (auto it = frontier_.begin(); it != frontier_.end();) {
        if (it->second == agentId)
            it = frontier_.erase(it);
        else
            ++it;
    }
    dirty_ = true;
}

std::vector<AbilityId> LinkScheduler::setProfile(AdversaryProfile profile, const LinkTable& links) {
    std::set<AbilityId> before;
    for (const auto& phase : profile_.phases)
        before.insert(phase.abilities.begin(), phase.abilities.end());
    std::set<AbilityId> after;
    for (const auto& phase : profile.phases)
        after.insert(phase.abilities.begin(), phase.abilities.end());

    std::vector<AbilityId> removed;
    std::set_difference(before.begin(), before.end(), after.begin(), after.end(),
                        std::back_inserter(removed));
    std::vector<AbilityId> added;
    std::set_difference(after.begin(), after.end(), before.begin(), before.end(),
                        std::back_inserter(added));

    for (auto it = frontier_.begin(); it != frontier_.end();) {
        if (!after.count(it->first))
            it = frontier_.erase(it);
        else
            ++it;
    }

    profile_ = std::move(profile);
    indexProfile();

    for (const auto& id : added) {
        const auto* ability = catalog_.find(id);
        if (!ability)
            continue;
        for (const auto& [agentId, agent] : agents_)
            addPair(*ability, agent, links);
    }
    dirty_ = true;
    spdlog::info("[LinkScheduler] {} profile updated: {} added, {} removed", operationId_,
                 added.size(), removed.size());
    return removed;
}

std::optional<std::string> LinkScheduler::unmetPhase(std::size_t phase,
                                                     const LinkTable& links) const {
    for (std::size_t q = 0; q < phase && q < profile_.phases.size(); ++q) {
        const auto& earlier = profile_.phases[q];
        if (earlier.optional)
            continue;
        for (const auto& id : earlier.abilities) {
            const auto* ability = catalog_.find(id);
            if (!ability)
                continue;
            bool runnable = std::any_of(agents_.begin(), agents_.end(), [&](const auto& entry) {
                return canRun(*ability, entry.second);
            });
            if (runnable && !links.hasSuccess(id))
                return earlier.name;
        }
    }
    return std::nullopt;
}

std::vector<LinkScheduler::Pair> LinkScheduler::orderedFrontier() const {
    std::vector<Pair> pairs(frontier_.begin(), frontier_.end());
    auto key = [this](const Pair& p) {
        auto it = positions_.find(p.first);
        Position pos = it == positions_.end() ? Position{} : it->second;
        return std::make_tuple(pos.phase, pos.order, p.second);
    };
    std::stable_sort(pairs.begin(), pairs.end(),
                     [&](const Pair& a, const Pair& b) { return key(a) < key(b); });
    return pairs;
}

Result<std::vector<LinkId>> LinkScheduler::evaluate(const FactStore& facts, const LinkTable& links,
                                                    LinkStateMachine& stateMachine,
                                                    TimePoint now) {
    std::vector<LinkId> created;
    if (!dirty_ && facts.snapshotVersion() == lastVersion_)
        return created;
    dirty_ = false;
    lastVersion_ = facts.snapshotVersion();

    std::map<std::size_t, bool> gateOpen;
    for (const auto& pair : orderedFrontier()) {
        const auto& [abilityId, agentId] = pair;
        const auto* ability = catalog_.find(abilityId);
        auto pos = positions_.find(abilityId);
        if (!ability || pos == positions_.end())
            continue;

        auto gate = gateOpen.find(pos->second.phase);
        if (gate == gateOpen.end())
            gate = gateOpen.emplace(pos->second.phase, !unmetPhase(pos->second.phase, links)).first;
        if (!gate->second)
            continue;

        if (links.activeFor(abilityId, agentId)) {
            frontier_.erase(pair);
            continue;
        }

        auto required = catalog_.requiredFacts(abilityId);
        if (!required)
            return required.error();
        auto resolution = facts.resolve(required.value());
        if (!resolution.complete())
            continue;

        auto command = catalog_.render(abilityId, resolution.values);
        if (!command)
            return command.error();

        Link link;
        link.operationId = operationId_;
        link.abilityId = abilityId;
        link.agentId = agentId;
        link.executor = ability->executor;
        link.command = std::move(command).value();
        link.timeout = ability->timeout.value_or(defaultTimeout_);
        link.phaseIndex = pos->second.phase;
        link.abilityOrder = pos->second.order;
        if (const auto* last = links.lastOutcome(abilityId, agentId)) {
            link.attempt = last->attempt + 1;
            link.retryOf = last->id;
        }

        auto queued = stateMachine.queue(std::move(link), now);
        if (!queued)
            return queued.error();
        created.push_back(queued.value()->id);
        frontier_.erase(pair);
    }

    if (!created.empty()) {
        spdlog::debug("[LinkScheduler] {} created {} link(s) at fact version {}, frontier={}",
                      operationId_, created.size(), lastVersion_, frontier_.size());
    }
    return created;
}

std::vector<BlockedPair> LinkScheduler::blocked(const FactStore& facts,
                                                const LinkTable& links) const {
    std::vector<BlockedPair> out;
    for (const auto& [abilityId, agentId] : orderedFrontier()) {
        auto pos = positions_.find(abilityId);
        if (pos == positions_.end())
            continue;
        BlockedPair entry;
        entry.abilityId = abilityId;
        entry.agentId = agentId;
        if (auto phase = unmetPhase(pos->second.phase, links)) {
            entry.waitingOnPhase = *phase;
        } else {
            auto required = catalog_.requiredFacts(abilityId);
            if (!required)
                continue;
            entry.missingFacts = facts.resolve(required.value()).missing;
            if (entry.missingFacts.empty())
                continue;
        }
        out.push_back(std::move(entry));
    }
    return out;
}

void LinkScheduler::clear() {
    frontier_.clear();
    dirty_ = true;
}

} // namespace sortie::engine
