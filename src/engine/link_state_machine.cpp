// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/core/uuid.h>
#include <sortie/engine/link_state_machine.h>

#include <spdlog/spdlog.h>

namespace sortie::engine {

namespace {

Error illegalTransition(const Link& link, LinkStatus to) {
    return Error{ErrorCode::InvalidState, std::string("Link ") + link.id + ": illegal transition " +
                                              linkStatusName(link.status) + " -> " +
                                              linkStatusName(to)};
}

} // namespace

Result<Link*> LinkStateMachine::queue(Link link, TimePoint now) {
    if (link.status != LinkStatus::Created) {
        return illegalTransition(link, LinkStatus::Queued);
    }
    if (link.id.empty())
        link.id = core::generateId("link");
    if (link.created == TimePoint{})
        link.created = now;
    link.status = LinkStatus::Queued;

    auto inserted = links_.insert(std::move(link));
    if (!inserted)
        return inserted.error();
    Link* stored = inserted.value();

    spdlog::debug("[LinkStateMachine] {} queued ability={} agent={} attempt={}", stored->id,
                  stored->abilityId, stored->agentId, stored->attempt);
    if (auto r = journal_.saveLink(*stored); !r)
        return r.error();
    return stored;
}

Result<void> LinkStateMachine::markDispatched(Link& link, TimePoint now) {
    if (link.status != LinkStatus::Queued) {
        return illegalTransition(link, LinkStatus::Dispatched);
    }
    link.status = LinkStatus::Dispatched;
    link.dispatched = now;
    spdlog::debug("[LinkStateMachine] {} dispatched to {}", link.id, link.agentId);
    return journal_.saveLink(link);
}

Result<CompletionOutcome> LinkStateMachine::complete(Link& link, std::string output, bool success,
                                                     std::optional<int> exitCode, TimePoint now) {
    auto target = success ? LinkStatus::Success : LinkStatus::Failure;
    if (link.status != LinkStatus::Dispatched) {
        return illegalTransition(link, target);
    }

    link.output = std::move(output);
    link.exitCode = exitCode;

    if (!success)
        return failWithRetry(link, LinkStatus::Failure, now);

    std::vector<ParsedFact> parsed;
    auto parsedResult = catalog_.parseOutput(link.abilityId, link.output);
    if (parsedResult) {
        parsed = std::move(parsedResult).value();
    } else {
        spdlog::warn("[LinkStateMachine] {} output could not be parsed: {}", link.id,
                     parsedResult.error().message);
    }

    link.status = LinkStatus::Success;
    link.completed = now;
    if (auto r = journal_.saveLink(link); !r)
        return r.error();

    CompletionOutcome outcome;
    outcome.status = LinkStatus::Success;
    for (auto& pf : parsed) {
        auto fact = facts_.put(std::move(pf.key), std::move(pf.value), Provenance::link(link.id),
                               now);
        if (!fact)
            return fact.error();
        if (auto r = journal_.appendFact(link.operationId, fact.value()); !r)
            return r.error();
        ++outcome.factsCommitted;
    }

    spdlog::debug("[LinkStateMachine] {} SUCCESS, {} fact(s) committed", link.id,
                  outcome.factsCommitted);
    return outcome;
}

Result<CompletionOutcome> LinkStateMachine::expire(Link& link, TimePoint now) {
    if (link.status != LinkStatus::Dispatched) {
        return illegalTransition(link, LinkStatus::Timeout);
    }
    return failWithRetry(link, LinkStatus::Timeout, now);
}

Result<void> LinkStateMachine::discard(Link& link, std::string reason, TimePoint now) {
    if (isTerminal(link.status)) {
        return illegalTransition(link, LinkStatus::Discarded);
    }
    link.status = LinkStatus::Discarded;
    link.completed = now;
    link.discardReason = std::move(reason);
    spdlog::debug("[LinkStateMachine] {} discarded: {}", link.id, link.discardReason);
    return journal_.saveLink(link);
}

Result<CompletionOutcome> LinkStateMachine::failWithRetry(Link& link, LinkStatus terminal,
                                                          TimePoint now) {
    link.status = terminal;
    link.completed = now;
    if (auto r = journal_.saveLink(link); !r)
        return r.error();

    CompletionOutcome outcome;
    outcome.status = terminal;

    const auto* ability = catalog_.find(link.abilityId);
    uint32_t maxAttempts = ability ? ability->retry.maxAttempts : 1;
    if (link.attempt + 1 >= maxAttempts) {
        spdlog::debug("[LinkStateMachine] {} {} after {} attempt(s), no retry", link.id,
                      linkStatusName(terminal), link.attempt + 1);
        return outcome;
    }

    Link retry;
    retry.operationId = link.operationId;
    retry.abilityId = link.abilityId;
    retry.agentId = link.agentId;
    retry.executor = link.executor;
    retry.command = link.command;
    retry.attempt = link.attempt + 1;
    retry.retryOf = link.id;
    retry.timeout = link.timeout;
    retry.phaseIndex = link.phaseIndex;
    retry.abilityOrder = link.abilityOrder;

    LinkId previous = link.id;
    auto queued = queue(std::move(retry), now);
    if (!queued)
        return queued.error();
    outcome.retryLink = queued.value()->id;
    spdlog::debug("[LinkStateMachine] {} {}; retry {} queued as {}", previous,
                  linkStatusName(terminal), queued.value()->attempt, *outcome.retryLink);
    return outcome;
}

} // namespace sortie::engine
