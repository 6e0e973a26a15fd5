// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/engine/link.h>

namespace sortie::engine {

const char* linkStatusName(LinkStatus status) noexcept {
    switch (status) {
        case LinkStatus::Created:
            return "CREATED";
        case LinkStatus::Queued:
            return "QUEUED";
        case LinkStatus::Dispatched:
            return "DISPATCHED";
        case LinkStatus::Success:
            return "SUCCESS";
        case LinkStatus::Failure:
            return "FAILURE";
        case LinkStatus::Timeout:
            return "TIMEOUT";
        case LinkStatus::Discarded:
            return "DISCARDED";
    }
    return "UNKNOWN";
}

std::optional<LinkStatus> parseLinkStatus(std::string_view name) {
    for (auto s : {LinkStatus::Created, LinkStatus::Queued, LinkStatus::Dispatched,
                   LinkStatus::Success, LinkStatus::Failure, LinkStatus::Timeout,
                   LinkStatus::Discarded}) {
        if (name == linkStatusName(s))
            return s;
    }
    return std::nullopt;
}

Result<Link*> LinkTable::insert(Link link) {
    if (link.id.empty()) {
        return Error{ErrorCode::InvalidArgument, "Link id must not be empty"};
    }
    if (index_.count(link.id)) {
        return Error{ErrorCode::AlreadyExists, "Link '" + link.id + "' already exists"};
    }
    link.sequence = nextSequence_++;
    index_.emplace(link.id, links_.size());
    links_.push_back(std::move(link));
    return &links_.back();
}

Link* LinkTable::find(const LinkId& id) {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &links_[it->second];
}

const Link* LinkTable::find(const LinkId& id) const {
    auto it = index_.find(id);
    return it == index_.end() ? nullptr : &links_[it->second];
}

std::vector<Link*> LinkTable::byAgent(const AgentId& agentId, LinkStatus status) {
    std::vector<Link*> out;
    for (auto& link : links_) {
        if (link.agentId == agentId && link.status == status)
            out.push_back(&link);
    }
    return out;
}

std::vector<Link*> LinkTable::withStatus(LinkStatus status) {
    std::vector<Link*> out;
    for (auto& link : links_) {
        if (link.status == status)
            out.push_back(&link);
    }
    return out;
}

std::vector<Link*> LinkTable::nonTerminal() {
    std::vector<Link*> out;
    for (auto& link : links_) {
        if (!isTerminal(link.status))
            out.push_back(&link);
    }
    return out;
}

const Link* LinkTable::activeFor(const AbilityId& abilityId, const AgentId& agentId) const {
    for (const auto& link : links_) {
        if (link.abilityId == abilityId && link.agentId == agentId && !isTerminal(link.status))
            return &link;
    }
    return nullptr;
}

const Link* LinkTable::lastOutcome(const AbilityId& abilityId, const AgentId& agentId) const {
    for (auto it = links_.rbegin(); it != links_.rend(); ++it) {
        if (it->abilityId == abilityId && it->agentId == agentId && isOutcome(it->status))
            return &*it;
    }
    return nullptr;
}

bool LinkTable::hasSuccess(const AbilityId& abilityId) const {
    for (const auto& link : links_) {
        if (link.abilityId == abilityId && link.status == LinkStatus::Success)
            return true;
    }
    return false;
}

std::size_t LinkTable::count(LinkStatus status) const {
    std::size_t n = 0;
    for (const auto& link : links_) {
        if (link.status == status)
            ++n;
    }
    return n;
}

std::map<LinkStatus, std::size_t> LinkTable::counts() const {
    std::map<LinkStatus, std::size_t> out;
    for (const auto& link : links_)
        ++out[link.status];
    return out;
}

} // namespace sortie::engine
