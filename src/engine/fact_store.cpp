// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <sortie/engine/executor_capability.h>
#include <sortie/engine/fact_store.h>

#include <spdlog/spdlog.h>

namespace sortie::engine {

Result<Fact> FactStore::put(std::string key, std::string value, Provenance provenance,
                            TimePoint observedAt) {
    if (key.empty()) {
        return Error{ErrorCode::InvalidArgument, "Fact key must not be empty"};
    }
    if (containsPlaceholder(value)) {
        return Error{ErrorCode::InvalidArgument,
                     "Fact '" + key + "' value must not contain placeholder syntax"};
    }
    if (!provenance.isSeed() && provenance.linkId.empty()) {
        return Error{ErrorCode::InvalidArgument,
                     "Fact '" + key + "' has link provenance without a link id"};
    }

    Fact fact;
    fact.sequence = ++version_;
    fact.key = std::move(key);
    fact.value = std::move(value);
    fact.provenance = std::move(provenance);
    fact.observedAt = observedAt;

    index_[fact.key].push_back(facts_.size());
    facts_.push_back(fact);
    spdlog::trace("[FactStore] put {}={} from {} (v{})", fact.key, fact.value,
                  fact.provenance.toString(), fact.sequence);
    return fact;
}

Resolution FactStore::resolve(const std::set<std::string>& requiredKeys) const {
    Resolution out;
    for (const auto& key : requiredKeys) {
        auto it = index_.find(key);
        if (it == index_.end() || it->second.empty()) {
            out.missing.push_back(key);
            continue;
        }
        // Positions are appended in sequence order, so the last one is the newest.
        out.values.emplace(key, facts_[it->second.back()].value);
    }
    return out;
}

std::optional<std::string> FactStore::latest(const std::string& key) const {
    auto it = index_.find(key);
    if (it == index_.end() || it->second.empty())
        return std::nullopt;
    return facts_[it->second.back()].value;
}

std::vector<Fact> FactStore::valuesOf(const std::string& key) const {
    std::vector<Fact> out;
    auto it = index_.find(key);
    if (it == index_.end())
        return out;
    out.reserve(it->second.size());
    for (auto pos : it->second)
        out.push_back(facts_[pos]);
    return out;
}

std::size_t FactStore::countFromLink(const LinkId& linkId) const {
    std::size_t n = 0;
    for (const auto& f : facts_) {
        if (!f.provenance.isSeed() && f.provenance.linkId == linkId)
            ++n;
    }
    return n;
}

} // namespace sortie::engine
