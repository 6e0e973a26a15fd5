// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/engine/dispatch_queue.h>

#include <algorithm>
#include <tuple>

namespace sortie::engine {

const char* resultDispositionName(ResultDisposition disposition) noexcept {
    switch (disposition) {
        case ResultDisposition::Accepted:
            return "accepted";
        case ResultDisposition::Duplicate:
            return "duplicate";
        case ResultDisposition::Rejected:
            return "rejected";
    }
    return "unknown";
}

Result<std::vector<Instruction>> DispatchQueue::pickup(const AgentId& agentId, TimePoint now) {
    auto queued = links_.byAgent(agentId, LinkStatus::Queued);
    std::sort(queued.begin(), queued.end(), [](const Link* a, const Link* b) {
        return std::tie(a->phaseIndex, a->abilityOrder, a->created, a->sequence) <
               std::tie(b->phaseIndex, b->abilityOrder, b->created, b->sequence);
    });

    std::vector<Instruction> out;
    out.reserve(queued.size());
    for (Link* link : queued) {
        if (auto r = stateMachine_.markDispatched(*link, now); !r)
            return r.error();
        out.push_back(Instruction{link->id, link->operationId, link->abilityId, link->command,
                                  link->executor, link->timeout});
    }
    return out;
}

Result<ResultAck> DispatchQueue::accept(const AgentId& agentId, const LinkId& linkId,
                                        std::string output, bool success,
                                        std::optional<int> exitCode, TimePoint now) {
    Link* link = links_.find(linkId);
    if (!link)
        return ResultAck::rejected("unknown link");
    if (link->agentId != agentId)
        return ResultAck::rejected("link not owned by reporting agent");

    switch (link->status) {
        case LinkStatus::Success:
        case LinkStatus::Failure:
        case LinkStatus::Timeout:
            return ResultAck::duplicate();
        case LinkStatus::Discarded:
            return ResultAck::rejected("link discarded");
        case LinkStatus::Created:
        case LinkStatus::Queued:
            return ResultAck::rejected("link not dispatched");
        case LinkStatus::Dispatched:
            break;
    }

    auto outcome = stateMachine_.complete(*link, std::move(output), success, exitCode, now);
    if (!outcome)
        return outcome.error();
    return ResultAck::accepted(std::move(outcome).value());
}

} // namespace sortie::engine
