// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/core/types.h>

#include <chrono>
#include <cstdint>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace sortie::engine {

enum class LinkStatus { Created, Queued, Dispatched, Success, Failure, Timeout, Discarded };

const char* linkStatusName(LinkStatus status) noexcept;
std::optional<LinkStatus> parseLinkStatus(std::string_view name);

constexpr bool isTerminal(LinkStatus s) noexcept {
    return s == LinkStatus::Success || s == LinkStatus::Failure || s == LinkStatus::Timeout ||
           s == LinkStatus::Discarded;
}

// SUCCESS, FAILURE or TIMEOUT: the pair was actually attempted. DISCARDED is not an outcome.
constexpr bool isOutcome(LinkStatus s) noexcept {
    return s == LinkStatus::Success || s == LinkStatus::Failure || s == LinkStatus::Timeout;
}

/**
 * @brief One scheduled instance of an ability bound to one agent within one operation.
 *
 * Created only by the LinkScheduler (or by the state machine for a retry), transitioned only
 * by the LinkStateMachine. Once terminal only the audit fields change.
 */
struct Link {
    LinkId id;
    OperationId operationId;
    AbilityId abilityId;
    AgentId agentId;
    std::string executor;
    // Fully resolved; never contains a #{placeholder}.
    std::string command;

    LinkStatus status{LinkStatus::Created};
    TimePoint created{};
    std::optional<TimePoint> dispatched;
    std::optional<TimePoint> completed;

    std::string output;
    std::optional<int> exitCode;

    // 0 for the first attempt.
    uint32_t attempt{0};
    LinkId retryOf;
    std::chrono::seconds timeout{0};

    // Dispatch tie-break keys.
    std::size_t phaseIndex{0};
    std::size_t abilityOrder{0};
    uint64_t sequence{0};

    std::string discardReason;
};

/**
 * @brief All links of one operation, every generation, in creation order.
 *
 * Links are never removed. Addresses returned by find() stay valid for the table's lifetime.
 */
class LinkTable {
public:
    // Assigns the creation sequence. Fails if the id is already present.
    Result<Link*> insert(Link link);

    Link* find(const LinkId& id);
    const Link* find(const LinkId& id) const;

    std::vector<Link*> byAgent(const AgentId& agentId, LinkStatus status);
    std::vector<Link*> withStatus(LinkStatus status);
    std::vector<Link*> nonTerminal();

    // The single non-terminal link of the pair, if any.
    const Link* activeFor(const AbilityId& abilityId, const AgentId& agentId) const;
    // Newest SUCCESS, FAILURE or TIMEOUT link of the pair.
    const Link* lastOutcome(const AbilityId& abilityId, const AgentId& agentId) const;
    bool hasSuccess(const AbilityId& abilityId) const;

    std::size_t count(LinkStatus status) const;
    std::map<LinkStatus, std::size_t> counts() const;
    std::size_t size() const noexcept { return links_.size(); }
    const std::deque<Link>& all() const noexcept { return links_; }

private:
    std::deque<Link> links_;
    std::unordered_map<LinkId, std::size_t> index_;
    uint64_t nextSequence_{1};
};

} // namespace sortie::engine
