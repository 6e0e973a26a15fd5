// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#pragma once

#include <sortie/core/types.h>
#include <sortie/engine/ability_catalog.h>
#include <sortie/engine/fact_store.h>
#include <sortie/engine/link.h>
#include <sortie/engine/operation_journal.h>

#include <optional>
#include <string>

namespace sortie::engine {

// Result of moving a DISPATCHED link to SUCCESS, FAILURE or TIMEOUT.
struct CompletionOutcome {
    LinkStatus status{LinkStatus::Success};
    std::size_t factsCommitted{0};
    // The fresh QUEUED link created under the retry policy, if any.
    std::optional<LinkId> retryLink;
};

/**
 * @brief Governs the link lifecycle.
 *
 *   CREATED -> QUEUED -> DISPATCHED -> {SUCCESS, FAILURE, TIMEOUT}
 *   any non-terminal -> DISCARDED
 *
 * Illegal transitions return ErrorCode::InvalidState and leave the link untouched. Journal
 * failures are returned as-is; the caller decides that they are fatal.
 *
 * Not internally synchronized; used under the owning operation's lock.
 */
class LinkStateMachine {
public:
    LinkStateMachine(const AbilityCatalog& catalog, LinkTable& links, FactStore& facts,
                     OperationJournal& journal)
        : catalog_(catalog), links_(links), facts_(facts), journal_(journal) {}

    // CREATED -> QUEUED. Inserts the link into the table.
    Result<Link*> queue(Link link, TimePoint now);

    // QUEUED -> DISPATCHED.
    Result<void> markDispatched(Link& link, TimePoint now);

    // DISPATCHED -> SUCCESS (facts committed with this link as provenance) or FAILURE.
    Result<CompletionOutcome> complete(Link& link, std::string output, bool success,
                                       std::optional<int> exitCode, TimePoint now);

    // DISPATCHED -> TIMEOUT. Retried exactly like FAILURE.
    Result<CompletionOutcome> expire(Link& link, TimePoint now);

    // Any non-terminal -> DISCARDED. No facts, no retry.
    Result<void> discard(Link& link, std::string reason, TimePoint now);

private:
    Result<CompletionOutcome> failWithRetry(Link& link, LinkStatus terminal, TimePoint now);

    const AbilityCatalog& catalog_;
    LinkTable& links_;
    FactStore& facts_;
    OperationJournal& journal_;
};

} // namespace sortie::engine
