// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <sortie/engine/dispatch_queue.h>
#include <sortie/engine/link_state_machine.h>

#include "engine_fixtures.h"

using namespace sortie;
using namespace sortie::engine;
using namespace std::chrono_literals;
using sortie::test::at;
using sortie::test::makeAbility;
using sortie::test::t0;

namespace {

class LinkStateMachineTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto retrying = makeAbility("retry", "flaky");
        retrying.retry.maxAttempts = 2;
        catalog_ = test::makeCatalog(
            {makeAbility("whoami", "whoami", {test::kvRule()}), retrying});
        sm_ = std::make_unique<LinkStateMachine>(*catalog_, links_, facts_, journal_);
        queue_ = std::make_unique<DispatchQueue>(links_, *sm_);
    }

    Link* enqueue(const AbilityId& ability, const AgentId& agent, std::size_t phase = 0,
                  std::size_t order = 0) {
        Link link;
        link.operationId = "op-1";
        link.abilityId = ability;
        link.agentId = agent;
        link.executor = "sh";
        link.command = ability;
        link.timeout = 30s;
        link.phaseIndex = phase;
        link.abilityOrder = order;
        auto r = sm_->queue(std::move(link), t0());
        EXPECT_TRUE(r);
        return r ? r.value() : nullptr;
    }

    std::shared_ptr<const AbilityCatalog> catalog_;
    LinkTable links_;
    FactStore facts_;
    test::FlakyJournal journal_;
    std::unique_ptr<LinkStateMachine> sm_;
    std::unique_ptr<DispatchQueue> queue_;
};

} // namespace

TEST_F(LinkStateMachineTest, HappyPathCommitsFactsWithLinkProvenance) {
    Link* link = enqueue("whoami", "a1");
    ASSERT_NE(link, nullptr);
    EXPECT_EQ(link->status, LinkStatus::Queued);
    ASSERT_TRUE(sm_->markDispatched(*link, at(1s)));
    EXPECT_EQ(link->status, LinkStatus::Dispatched);

    auto outcome = sm_->complete(*link, "user=admin\n", true, 0, at(2s));
    ASSERT_TRUE(outcome);
    EXPECT_EQ(outcome.value().status, LinkStatus::Success);
    EXPECT_EQ(outcome.value().factsCommitted, 1u);
    EXPECT_FALSE(outcome.value().retryLink.has_value());
    EXPECT_EQ(facts_.countFromLink(link->id), 1u);
    EXPECT_EQ(facts_.latest("user").value(), "admin");
    EXPECT_EQ(journal_.factWrites, 1);
}

TEST_F(LinkStateMachineTest, IllegalTransitionsLeaveLinkUntouched) {
    Link* link = enqueue("whoami", "a1");
    ASSERT_NE(link, nullptr);

    auto early = sm_->complete(*link, "x", true, 0, at(1s));
    ASSERT_FALSE(early);
    EXPECT_EQ(early.error().code, ErrorCode::InvalidState);
    EXPECT_EQ(link->status, LinkStatus::Queued);
    EXPECT_FALSE(sm_->expire(*link, at(1s)));

    ASSERT_TRUE(sm_->discard(*link, "operator", at(2s)));
    EXPECT_EQ(link->status, LinkStatus::Discarded);
    EXPECT_EQ(link->discardReason, "operator");
    EXPECT_FALSE(sm_->discard(*link, "again", at(3s)));
    EXPECT_FALSE(sm_->markDispatched(*link, at(3s)));
}

TEST_F(LinkStateMachineTest, FailureRetriesUpToMaxAttempts) {
    Link* first = enqueue("retry", "a1");
    ASSERT_NE(first, nullptr);
    ASSERT_TRUE(sm_->markDispatched(*first, at(1s)));
    auto r1 = sm_->complete(*first, "boom", false, 1, at(2s));
    ASSERT_TRUE(r1);
    EXPECT_EQ(first->status, LinkStatus::Failure);
    ASSERT_TRUE(r1.value().retryLink.has_value());

    Link* second = links_.find(*r1.value().retryLink);
    ASSERT_NE(second, nullptr);
    EXPECT_EQ(second->status, LinkStatus::Queued);
    EXPECT_EQ(second->attempt, 1u);
    EXPECT_EQ(second->retryOf, first->id);

    ASSERT_TRUE(sm_->markDispatched(*second, at(3s)));
    auto r2 = sm_->expire(*second, at(40s));
    ASSERT_TRUE(r2);
    EXPECT_EQ(second->status, LinkStatus::Timeout);
    EXPECT_FALSE(r2.value().retryLink.has_value());
    EXPECT_EQ(links_.size(), 2u);
}

TEST_F(LinkStateMachineTest, FailedLinkCommitsNoFacts) {
    Link* link = enqueue("whoami", "a1");
    ASSERT_TRUE(sm_->markDispatched(*link, at(1s)));
    auto r = sm_->complete(*link, "user=admin", false, 2, at(2s));
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().factsCommitted, 0u);
    EXPECT_EQ(facts_.size(), 0u);
    EXPECT_EQ(link->exitCode.value(), 2);
}

TEST_F(LinkStateMachineTest, JournalFailureIsReturned) {
    Link* link = enqueue("whoami", "a1");
    journal_.failWrites = true;
    auto r = sm_->markDispatched(*link, at(1s));
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::DatabaseError);
}

TEST_F(LinkStateMachineTest, PickupOrdersByPhaseThenCatalogOrder) {
    Link* late = enqueue("whoami", "a1", 1, 0);
    Link* early = enqueue("retry", "a1", 0, 1);
    enqueue("whoami", "a2", 0, 0);

    auto picked = queue_->pickup("a1", at(1s));
    ASSERT_TRUE(picked);
    ASSERT_EQ(picked.value().size(), 2u);
    EXPECT_EQ(picked.value()[0].linkId, early->id);
    EXPECT_EQ(picked.value()[1].linkId, late->id);
    EXPECT_EQ(picked.value()[0].timeout, 30s);
    EXPECT_EQ(late->status, LinkStatus::Dispatched);

    auto again = queue_->pickup("a1", at(2s));
    ASSERT_TRUE(again);
    EXPECT_TRUE(again.value().empty());
}

TEST_F(LinkStateMachineTest, AcceptRejectsProtocolViolationsWithoutMutation) {
    Link* link = enqueue("whoami", "a1");

    auto notDispatched = queue_->accept("a1", link->id, "user=x", true, 0, at(1s));
    ASSERT_TRUE(notDispatched);
    EXPECT_EQ(notDispatched.value().disposition, ResultDisposition::Rejected);

    ASSERT_TRUE(queue_->pickup("a1", at(1s)));

    auto unknown = queue_->accept("a1", "link-nope", "", true, 0, at(2s));
    ASSERT_TRUE(unknown);
    EXPECT_EQ(unknown.value().disposition, ResultDisposition::Rejected);

    auto wrongAgent = queue_->accept("a2", link->id, "user=x", true, 0, at(2s));
    ASSERT_TRUE(wrongAgent);
    EXPECT_EQ(wrongAgent.value().disposition, ResultDisposition::Rejected);
    EXPECT_EQ(link->status, LinkStatus::Dispatched);
    EXPECT_EQ(facts_.size(), 0u);
}

TEST_F(LinkStateMachineTest, RepeatedResultIsIdempotent) {
    Link* link = enqueue("whoami", "a1");
    ASSERT_TRUE(queue_->pickup("a1", at(1s)));

    auto first = queue_->accept("a1", link->id, "user=admin", true, 0, at(2s));
    ASSERT_TRUE(first);
    EXPECT_EQ(first.value().disposition, ResultDisposition::Accepted);

    auto second = queue_->accept("a1", link->id, "user=root", true, 0, at(3s));
    ASSERT_TRUE(second);
    EXPECT_EQ(second.value().disposition, ResultDisposition::Duplicate);
    EXPECT_EQ(facts_.size(), 1u);
    EXPECT_EQ(link->output, "user=admin");
}

TEST_F(LinkStateMachineTest, ResultForDiscardedLinkIsRejected) {
    Link* link = enqueue("whoami", "a1");
    ASSERT_TRUE(queue_->pickup("a1", at(1s)));
    ASSERT_TRUE(sm_->discard(*link, "agent dead", at(2s)));

    auto r = queue_->accept("a1", link->id, "user=admin", true, 0, at(3s));
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value().disposition, ResultDisposition::Rejected);
    EXPECT_EQ(facts_.size(), 0u);
}
