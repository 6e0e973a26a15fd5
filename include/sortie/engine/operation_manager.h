// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/core/types.h>
#include <sortie/engine/ability_catalog.h>
#include <sortie/engine/agent.h>
#include <sortie/engine/dispatch_queue.h>
#include <sortie/engine/operation.h>
#include <sortie/engine/operation_journal.h>
#include <sortie/engine/operation_status.h>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace sortie::engine {

struct ManagerOptions {
    std::chrono::seconds linkTimeout{300};
    uint32_t deadAfterMissedBeacons{3};
    std::chrono::seconds defaultBeaconInterval{60};
    std::chrono::seconds defaultJitter{0};
};

struct CreateOperationRequest {
    std::string name;
    std::string profileId;
    std::string group;
    SeedFacts seeds;
    std::optional<std::chrono::seconds> linkTimeout;
};

struct BeaconReply {
    AgentId agentId;
    std::vector<Instruction> instructions;
    std::chrono::seconds sleep{0};
};

/**
 * @brief Owns every live operation, the agent registry, the catalog and the profiles.
 *
 * The operation map is guarded by a shared mutex: routing takes it shared, create/archive take
 * it exclusively. All per-operation work then runs under that operation's own lock, so
 * operations proceed in parallel.
 */
class OperationManager {
public:
    OperationManager(std::shared_ptr<const AbilityCatalog> catalog,
                     std::vector<AdversaryProfile> profiles, OperationJournal& journal,
                     ManagerOptions options = {});

    Result<OperationId> create(const CreateOperationRequest& request, TimePoint now);

    // Registers or refreshes the agent, then collects work from every non-terminal operation
    // it participates in, in operation creation order.
    Result<BeaconReply> beacon(const BeaconInfo& beacon, TimePoint now);

    ResultAck report(const AgentId& agentId, const LinkId& linkId, std::string output,
                     bool success, std::optional<int> exitCode, TimePoint now);

    Result<void> cancel(const OperationId& id, TimePoint now);
    Result<void> resume(const OperationId& id, TimePoint now);
    Result<void> updateProfile(const OperationId& id, AdversaryProfile profile, TimePoint now);

    // Only FINISHED or CANCELLED operations; the record stays in the journal, marked archived.
    Result<void> archive(const OperationId& id);

    Result<std::shared_ptr<const OperationStatus>> status(const OperationId& id) const;
    std::vector<std::shared_ptr<const OperationStatus>> list() const;

    void sweep(TimePoint now);

    // Reinstates journaled agent identities at startup so returning agents keep their ids.
    void restoreAgents(std::vector<AgentInfo> agents);

    std::shared_ptr<Operation> find(const OperationId& id) const;
    std::optional<AdversaryProfile> profile(const std::string& id) const;
    std::vector<std::string> profileIds() const;
    const AgentRegistry& agents() const noexcept { return registry_; }
    const AbilityCatalog& catalog() const noexcept { return *catalog_; }
    std::size_t size() const;

private:
    std::vector<std::shared_ptr<Operation>> operationsInOrder() const;

    std::shared_ptr<const AbilityCatalog> catalog_;
    std::map<std::string, AdversaryProfile> profiles_;
    OperationJournal& journal_;
    const ManagerOptions options_;
    AgentRegistry registry_;

    mutable std::shared_mutex mutex_;
    std::map<OperationId, std::shared_ptr<Operation>> operations_;
    std::vector<OperationId> order_;
};

} // namespace sortie::engine
