// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/core/uuid.h>
#include <sortie/engine/executor_capability.h>
#include <sortie/engine/operation_manager.h>

#include <spdlog/spdlog.h>

#include <algorithm>
#include <iterator>
#include <mutex>

namespace sortie::engine {

OperationManager::OperationManager(std::shared_ptr<const AbilityCatalog> catalog,
                                   std::vector<AdversaryProfile> profiles,
                                   OperationJournal& journal, ManagerOptions options)
    : catalog_(std::move(catalog)), journal_(journal), options_(options),
      registry_(options.defaultBeaconInterval, options.defaultJitter) {
    for (auto& profile : profiles) {
        auto id = profile.id;
        profiles_[id] = std::move(profile);
    }
}

Result<OperationId> OperationManager::create(const CreateOperationRequest& request,
                                             TimePoint now) {
    auto it = profiles_.find(request.profileId);
    if (it == profiles_.end()) {
        return Error{ErrorCode::NotFound, "Unknown profile '" + request.profileId + "'"};
    }
    for (const auto& [key, value] : request.seeds) {
        if (key.empty())
            return Error{ErrorCode::InvalidArgument, "Seed fact with empty key"};
        if (containsPlaceholder(value))
            return Error{ErrorCode::InvalidArgument,
                         "Seed fact '" + key + "' must not contain placeholder syntax"};
    }

    OperationOptions options;
    options.group = request.group;
    options.linkTimeout = request.linkTimeout.value_or(options_.linkTimeout);
    options.deadAfterMissedBeacons = options_.deadAfterMissedBeacons;

    auto id = core::generateId("op");
    auto name = request.name.empty() ? id : request.name;
    auto operation =
        std::make_shared<Operation>(id, name, catalog_, it->second, options, journal_, now);

    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        operations_.emplace(id, operation);
        order_.push_back(id);
    }

    auto started = operation->start(request.seeds, registry_.all(), now);
    if (!started && operation->state() != OperationState::Errored)
        return started.error();
    return id;
}

Result<BeaconReply> OperationManager::beacon(const BeaconInfo& beacon, TimePoint now) {
    auto agent = registry_.checkIn(beacon, now);
    if (!agent)
        return agent.error();
    const auto& info = agent.value();
    if (auto r = journal_.saveAgent(info); !r) {
        spdlog::error("[OperationManager] could not persist agent {}: {}", info.id,
                      r.error().message);
    }

    BeaconReply reply;
    reply.agentId = info.id;
    reply.sleep = info.beaconInterval;
    for (const auto& operation : operationsInOrder()) {
        auto instructions = operation->beacon(info, now);
        std::move(instructions.begin(), instructions.end(),
                  std::back_inserter(reply.instructions));
    }
    return reply;
}

ResultAck OperationManager::report(const AgentId& agentId, const LinkId& linkId,
                                   std::string output, bool success, std::optional<int> exitCode,
                                   TimePoint now) {
    for (const auto& operation : operationsInOrder()) {
        if (operation->ownsLink(linkId))
            return operation->report(agentId, linkId, std::move(output), success, exitCode, now);
    }
    spdlog::warn("[OperationManager] rejected result for unknown link {} from {}", linkId, agentId);
    return ResultAck::rejected("unknown link");
}

Result<void> OperationManager::cancel(const OperationId& id, TimePoint now) {
    auto operation = find(id);
    if (!operation)
        return Error{ErrorCode::NotFound, "Unknown operation '" + id + "'"};
    return operation->cancel(now);
}

Result<void> OperationManager::resume(const OperationId& id, TimePoint now) {
    auto operation = find(id);
    if (!operation)
        return Error{ErrorCode::NotFound, "Unknown operation '" + id + "'"};
    return operation->resume(now);
}

Result<void> OperationManager::updateProfile(const OperationId& id, AdversaryProfile profile,
                                             TimePoint now) {
    auto operation = find(id);
    if (!operation)
        return Error{ErrorCode::NotFound, "Unknown operation '" + id + "'"};
    return operation->updateProfile(std::move(profile), now);
}

Result<void> OperationManager::archive(const OperationId& id) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    auto it = operations_.find(id);
    if (it == operations_.end())
        return Error{ErrorCode::NotFound, "Unknown operation '" + id + "'"};
    auto state = it->second->state();
    if (!isTerminal(state)) {
        return Error{ErrorCode::InvalidState, std::string("Operation ") + id + " is " +
                                                  operationStateName(state) +
                                                  "; only finished or cancelled operations can "
                                                  "be archived"};
    }
    if (auto r = journal_.archiveOperation(id); !r)
        return r;
    operations_.erase(it);
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    spdlog::info("[OperationManager] archived operation {}", id);
    return {};
}

Result<std::shared_ptr<const OperationStatus>>
OperationManager::status(const OperationId& id) const {
    auto operation = find(id);
    if (!operation)
        return Error{ErrorCode::NotFound, "Unknown operation '" + id + "'"};
    return operation->status();
}

std::vector<std::shared_ptr<const OperationStatus>> OperationManager::list() const {
    std::vector<std::shared_ptr<const OperationStatus>> out;
    for (const auto& operation : operationsInOrder())
        out.push_back(operation->status());
    return out;
}

void OperationManager::sweep(TimePoint now) {
    for (const auto& operation : operationsInOrder())
        operation->sweep(now);
}

void OperationManager::restoreAgents(std::vector<AgentInfo> agents) {
    auto count = agents.size();
    for (auto& agent : agents)
        registry_.restore(std::move(agent));
    spdlog::info("[OperationManager] restored {} agents from the journal", count);
}

std::shared_ptr<Operation> OperationManager::find(const OperationId& id) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    auto it = operations_.find(id);
    return it == operations_.end() ? nullptr : it->second;
}

std::optional<AdversaryProfile> OperationManager::profile(const std::string& id) const {
    auto it = profiles_.find(id);
    if (it == profiles_.end())
        return std::nullopt;
    return it->second;
}

std::vector<std::string> OperationManager::profileIds() const {
    std::vector<std::string> out;
    out.reserve(profiles_.size());
    for (const auto& [id, profile] : profiles_)
        out.push_back(id);
    return out;
}

std::size_t OperationManager::size() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return operations_.size();
}

std::vector<std::shared_ptr<Operation>> OperationManager::operationsInOrder() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::shared_ptr<Operation>> out;
    out.reserve(order_.size());
    for (const auto& id : order_) {
        auto it = operations_.find(id);
        if (it != operations_.end())
            out.push_back(it->second);
    }
    return out;
}

} // namespace sortie::engine
