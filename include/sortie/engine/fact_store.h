// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/core/types.h>

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <unordered_map>
#include <vector>

namespace sortie::engine {

// Where a fact came from: operator seed input or exactly one successful link.
struct Provenance {
    enum class Source { Seed, Link };

    Source source{Source::Seed};
    LinkId linkId;

    static Provenance seed() { return Provenance{}; }
    static Provenance link(LinkId id) { return Provenance{Source::Link, std::move(id)}; }

    bool isSeed() const noexcept { return source == Source::Seed; }
    std::string toString() const { return isSeed() ? std::string{"seed"} : linkId; }
};

struct Fact {
    uint64_t sequence{0};
    std::string key;
    std::string value;
    Provenance provenance;
    TimePoint observedAt{};
};

// Outcome of resolving a set of required keys against the store.
struct Resolution {
    std::map<std::string, std::string> values;
    std::vector<std::string> missing;

    bool complete() const noexcept { return missing.empty(); }
};

/**
 * @brief Operation-scoped, append-only, multi-valued fact store.
 *
 * `put` never overwrites: each call appends a new version and bumps the snapshot version.
 * `resolve` selects the most recent value per key. The store has no knowledge of scheduling;
 * callers compare snapshotVersion() to decide whether eligibility must be re-evaluated.
 *
 * Not internally synchronized; the owning Operation serializes access.
 */
class FactStore {
public:
    FactStore() = default;

    Result<Fact> put(std::string key, std::string value, Provenance provenance,
                     TimePoint observedAt = {});

    Resolution resolve(const std::set<std::string>& requiredKeys) const;

    uint64_t snapshotVersion() const noexcept { return version_; }

    std::optional<std::string> latest(const std::string& key) const;
    std::vector<Fact> valuesOf(const std::string& key) const;
    bool hasKey(const std::string& key) const { return index_.count(key) > 0; }
    std::size_t countFromLink(const LinkId& linkId) const;

    const std::vector<Fact>& all() const noexcept { return facts_; }
    std::size_t size() const noexcept { return facts_.size(); }

private:
    std::vector<Fact> facts_;
    std::unordered_map<std::string, std::vector<std::size_t>> index_;
    uint64_t version_{0};
};

} // namespace sortie::engine
