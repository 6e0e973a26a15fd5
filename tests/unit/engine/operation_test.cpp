// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <sortie/engine/operation.h>

#include "engine_fixtures.h"

#include <set>
#include <thread>

using namespace sortie;
using namespace sortie::engine;
using namespace std::chrono_literals;
using sortie::test::at;
using sortie::test::makeAbility;
using sortie::test::t0;

namespace {

class OperationTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto flaky = makeAbility("flaky", "exploit");
        flaky.retry.maxAttempts = 2;
        auto slow = makeAbility("slow", "find / -name id_rsa", {test::kvRule("user")});
        slow.retry.maxAttempts = 2;
        ParserRule userPattern;
        userPattern.kind = ParserKind::Regex;
        userPattern.key = "user";
        userPattern.pattern = R"(user=(\w+))";
        auto grab = makeAbility("grab", "cat /etc/passwd", {userPattern});
        catalog_ = test::makeCatalog({
            makeAbility("A", "whoami", {test::kvRule("user")}),
            makeAbility("B", "sudo -u #{user} true", {test::kvRule("escalated")}),
            makeAbility("C", "use #{token}"),
            flaky,
            slow,
            grab,
        });
    }

    std::unique_ptr<Operation> makeOperation(AdversaryProfile profile,
                                             OperationOptions options = {}) {
        return std::make_unique<Operation>("op-1", "test", catalog_, std::move(profile),
                                           options, journal_, t0());
    }

    static AdversaryProfile single(std::vector<AbilityId> ids) {
        return test::profile("p", {test::phase("main", std::move(ids))});
    }

    std::shared_ptr<const AbilityCatalog> catalog_;
    test::FlakyJournal journal_;
};

} // namespace

TEST_F(OperationTest, FactsFlowFromOneAbilityIntoTheNext) {
    auto op = makeOperation(single({"A", "B"}));
    auto a1 = test::agent("a1");
    ASSERT_TRUE(op->start({}, {a1}, t0()));

    auto first = op->beacon(a1, at(1s));
    ASSERT_EQ(first.size(), 1u);
    EXPECT_EQ(first[0].abilityId, "A");
    EXPECT_EQ(first[0].command, "whoami");

    auto ack = op->report("a1", first[0].linkId, "user=admin\n", true, 0, at(2s));
    EXPECT_EQ(ack.disposition, ResultDisposition::Accepted);

    auto second = op->beacon(a1, at(3s));
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].abilityId, "B");
    EXPECT_EQ(second[0].command, "sudo -u admin true");

    ack = op->report("a1", second[0].linkId, "escalated=true\n", true, 0, at(4s));
    EXPECT_EQ(ack.disposition, ResultDisposition::Accepted);

    auto facts = op->facts();
    ASSERT_EQ(facts.size(), 2u);
    EXPECT_EQ(facts[0].key, "user");
    EXPECT_EQ(facts[0].provenance.linkId, first[0].linkId);
    EXPECT_EQ(facts[1].key, "escalated");
    EXPECT_EQ(facts[1].value, "true");

    EXPECT_TRUE(op->beacon(a1, at(5s)).empty());
    EXPECT_EQ(op->state(), OperationState::Finished);
    auto status = op->status();
    EXPECT_EQ(status->stateReason, "all abilities exhausted");
    EXPECT_EQ(status->count(LinkStatus::Success), 2u);
}

TEST_F(OperationTest, UnresolvableAbilityStaysBlockedUntilCancelled) {
    auto op = makeOperation(single({"A", "C"}));
    auto a1 = test::agent("a1");
    ASSERT_TRUE(op->start({}, {a1}, t0()));

    auto work = op->beacon(a1, at(1s));
    ASSERT_EQ(work.size(), 1u);
    op->report("a1", work[0].linkId, "user=admin", true, 0, at(2s));
    for (int i = 0; i < 5; ++i) {
        EXPECT_TRUE(op->beacon(a1, at(std::chrono::seconds(3 + i))).empty());
        op->step(at(std::chrono::seconds(3 + i)));
    }

    EXPECT_EQ(op->state(), OperationState::Running);
    auto status = op->status();
    ASSERT_EQ(status->blocked.size(), 1u);
    EXPECT_EQ(status->blocked[0].abilityId, "C");
    EXPECT_EQ(status->blocked[0].missingFacts, std::vector<std::string>{"token"});

    ASSERT_TRUE(op->cancel(at(10s)));
    EXPECT_EQ(op->state(), OperationState::Cancelled);
    EXPECT_TRUE(op->status()->blocked.empty());
    EXPECT_FALSE(op->cancel(at(11s)));
}

TEST_F(OperationTest, SeedFactsSatisfyRequirements) {
    auto op = makeOperation(single({"B"}));
    auto a1 = test::agent("a1");
    ASSERT_TRUE(op->start({{"user", "svc"}}, {a1}, t0()));
    auto work = op->beacon(a1, at(1s));
    ASSERT_EQ(work.size(), 1u);
    EXPECT_EQ(work[0].command, "sudo -u svc true");
    EXPECT_TRUE(op->facts()[0].provenance.isSeed());

    EXPECT_FALSE(op->start({}, {a1}, at(2s)));
}

TEST_F(OperationTest, DeadAgentLosesItsLinksOthersContinue) {
    auto op = makeOperation(single({"A"}));
    auto a1 = test::agent("a1");
    auto a2 = test::agent("a2");
    ASSERT_TRUE(op->start({}, {a1, a2}, t0()));

    auto w1 = op->beacon(a1, t0());
    ASSERT_EQ(w1.size(), 1u);

    // a2 keeps beaconing; a1 goes silent for three 10s windows.
    auto a2Later = a2;
    a2Later.lastSeen = at(25s);
    op->beacon(a2Later, at(25s));
    op->sweep(at(30s));

    auto link = op->findLink(w1[0].linkId);
    ASSERT_TRUE(link.has_value());
    EXPECT_EQ(link->status, LinkStatus::Discarded);
    EXPECT_EQ(link->discardReason, "agent dead");
    EXPECT_EQ(op->state(), OperationState::Running);

    auto status = op->status();
    ASSERT_EQ(status->agents.size(), 2u);
    EXPECT_EQ(status->agents[0].state, AgentState::Dead);
    EXPECT_EQ(status->agents[1].state, AgentState::Active);

    // A late result from the dead agent is rejected.
    auto ack = op->report("a1", w1[0].linkId, "user=x", true, 0, at(31s));
    EXPECT_EQ(ack.disposition, ResultDisposition::Rejected);
}

TEST_F(OperationTest, DeadAgentRejoinsOnBeacon) {
    auto op = makeOperation(single({"A", "C"}));
    auto a1 = test::agent("a1");
    ASSERT_TRUE(op->start({}, {a1}, t0()));
    op->sweep(at(60s));
    EXPECT_EQ(op->status()->agents[0].state, AgentState::Dead);
    EXPECT_EQ(op->status()->frontierSize, 0u);

    auto back = a1;
    back.lastSeen = at(61s);
    auto work = op->beacon(back, at(61s));
    EXPECT_EQ(op->status()->agents[0].state, AgentState::Active);
    ASSERT_EQ(work.size(), 1u);
    EXPECT_EQ(work[0].abilityId, "A");
}

TEST_F(OperationTest, RetryIsBoundedByPolicy) {
    auto op = makeOperation(single({"flaky"}));
    auto a1 = test::agent("a1");
    ASSERT_TRUE(op->start({}, {a1}, t0()));

    auto first = op->beacon(a1, at(1s));
    ASSERT_EQ(first.size(), 1u);
    op->report("a1", first[0].linkId, "denied", false, 1, at(2s));

    auto second = op->beacon(a1, at(3s));
    ASSERT_EQ(second.size(), 1u);
    EXPECT_NE(second[0].linkId, first[0].linkId);
    op->report("a1", second[0].linkId, "denied", false, 1, at(4s));

    EXPECT_TRUE(op->beacon(a1, at(5s)).empty());
    op->step(at(6s));
    EXPECT_EQ(op->links().size(), 2u);
    EXPECT_EQ(op->status()->count(LinkStatus::Failure), 2u);
    EXPECT_EQ(op->state(), OperationState::Finished);
}

TEST_F(OperationTest, DispatchedLinkTimesOutAndRetries) {
    OperationOptions options;
    options.linkTimeout = 20s;
    auto op = makeOperation(single({"flaky"}), options);
    auto a1 = test::agent("a1");
    a1.beaconInterval = 600s;
    ASSERT_TRUE(op->start({}, {a1}, t0()));
    auto work = op->beacon(a1, t0());
    ASSERT_EQ(work.size(), 1u);

    op->sweep(at(19s));
    EXPECT_EQ(op->findLink(work[0].linkId)->status, LinkStatus::Dispatched);
    op->sweep(at(20s));
    EXPECT_EQ(op->findLink(work[0].linkId)->status, LinkStatus::Timeout);
    EXPECT_EQ(op->status()->count(LinkStatus::Queued), 1u);
}

TEST_F(OperationTest, RetryLostToDeadAgentResumesOnRejoin) {
    auto op = makeOperation(single({"flaky"}));
    auto a1 = test::agent("a1");
    ASSERT_TRUE(op->start({}, {a1}, t0()));

    auto first = op->beacon(a1, at(1s));
    ASSERT_EQ(first.size(), 1u);
    op->report("a1", first[0].linkId, "denied", false, 1, at(2s));
    ASSERT_EQ(op->status()->count(LinkStatus::Queued), 1u);

    op->sweep(at(200s));
    EXPECT_EQ(op->status()->agents[0].state, AgentState::Dead);
    EXPECT_EQ(op->status()->count(LinkStatus::Queued), 0u);
    EXPECT_EQ(op->status()->count(LinkStatus::Discarded), 1u);

    auto back = a1;
    back.lastSeen = at(201s);
    auto second = op->beacon(back, at(201s));
    ASSERT_EQ(second.size(), 1u);
    EXPECT_EQ(second[0].abilityId, "flaky");
    const auto resumed = op->findLink(second[0].linkId);
    ASSERT_TRUE(resumed);
    EXPECT_EQ(resumed->attempt, 1u);
    EXPECT_EQ(resumed->retryOf, first[0].linkId);

    op->report("a1", second[0].linkId, "denied", false, 1, at(202s));
    EXPECT_TRUE(op->beacon(back, at(203s)).empty());
    op->step(at(204s));
    EXPECT_EQ(op->status()->count(LinkStatus::Failure), 2u);
    EXPECT_EQ(op->state(), OperationState::Finished);
}

TEST_F(OperationTest, LateSuccessAfterTimeoutIsDuplicate) {
    OperationOptions options;
    options.linkTimeout = 20s;
    auto op = makeOperation(single({"slow"}), options);
    auto a1 = test::agent("a1");
    a1.beaconInterval = 600s;
    ASSERT_TRUE(op->start({}, {a1}, t0()));
    auto work = op->beacon(a1, t0());
    ASSERT_EQ(work.size(), 1u);

    op->sweep(at(20s));
    ASSERT_EQ(op->findLink(work[0].linkId)->status, LinkStatus::Timeout);
    ASSERT_EQ(op->status()->count(LinkStatus::Queued), 1u);

    auto ack = op->report("a1", work[0].linkId, "user=admin", true, 0, at(25s));
    EXPECT_EQ(ack.disposition, ResultDisposition::Duplicate);
    EXPECT_EQ(op->findLink(work[0].linkId)->status, LinkStatus::Timeout);
    EXPECT_TRUE(op->facts().empty());
    EXPECT_EQ(op->status()->count(LinkStatus::Queued), 1u);
    EXPECT_EQ(op->status()->count(LinkStatus::Success), 0u);
}

TEST_F(OperationTest, ReportedPlaceholderTextNeverReachesACommand) {
    auto op = makeOperation(single({"A", "B"}));
    auto a1 = test::agent("a1");
    ASSERT_TRUE(op->start({}, {a1}, t0()));
    auto work = op->beacon(a1, at(1s));
    ASSERT_EQ(work.size(), 1u);

    auto ack = op->report("a1", work[0].linkId, "user=#{token}\n", true, 0, at(2s));
    EXPECT_EQ(ack.disposition, ResultDisposition::Accepted);
    EXPECT_TRUE(op->facts().empty());
    EXPECT_TRUE(op->beacon(a1, at(3s)).empty());
    EXPECT_EQ(op->state(), OperationState::Running);

    auto seeded = makeOperation(single({"A"}));
    auto started = seeded->start({{"user", "#{token}"}}, {a1}, t0());
    ASSERT_FALSE(started);
    EXPECT_EQ(started.error().code, ErrorCode::InvalidArgument);
}

TEST_F(OperationTest, MegabyteOutputLineIsParsed) {
    auto op = makeOperation(single({"grab"}));
    auto a1 = test::agent("a1");
    ASSERT_TRUE(op->start({}, {a1}, t0()));
    auto work = op->beacon(a1, at(1s));
    ASSERT_EQ(work.size(), 1u);

    std::string output = "user=" + std::string(1 << 20, 'x') + "\n";
    auto ack = op->report("a1", work[0].linkId, output, true, 0, at(2s));
    EXPECT_EQ(ack.disposition, ResultDisposition::Accepted);
    EXPECT_EQ(op->findLink(work[0].linkId)->status, LinkStatus::Success);
    ASSERT_EQ(op->facts().size(), 1u);
    EXPECT_EQ(op->facts()[0].value.size(), std::size_t{1} << 20);
}

TEST_F(OperationTest, RepeatedReportIsIdempotent) {
    auto op = makeOperation(single({"A"}));
    auto a1 = test::agent("a1");
    ASSERT_TRUE(op->start({}, {a1}, t0()));
    auto work = op->beacon(a1, at(1s));
    ASSERT_EQ(work.size(), 1u);

    EXPECT_EQ(op->report("a1", work[0].linkId, "user=admin", true, 0, at(2s)).disposition,
              ResultDisposition::Accepted);
    EXPECT_EQ(op->report("a1", work[0].linkId, "user=admin", true, 0, at(3s)).disposition,
              ResultDisposition::Duplicate);
    EXPECT_EQ(op->facts().size(), 1u);
}

TEST_F(OperationTest, JournalFailureMovesToErroredUntilResumed) {
    auto op = makeOperation(single({"A", "B"}));
    auto a1 = test::agent("a1");
    ASSERT_TRUE(op->start({}, {a1}, t0()));
    auto work = op->beacon(a1, at(1s));
    ASSERT_EQ(work.size(), 1u);

    journal_.failWrites = true;
    auto ack = op->report("a1", work[0].linkId, "user=admin", true, 0, at(2s));
    EXPECT_EQ(ack.disposition, ResultDisposition::Rejected);
    EXPECT_EQ(op->state(), OperationState::Errored);
    EXPECT_EQ(op->status()->stateReason, "disk full");

    // No scheduling or dispatch while errored.
    EXPECT_TRUE(op->beacon(a1, at(3s)).empty());
    op->sweep(at(4s));
    EXPECT_EQ(op->state(), OperationState::Errored);

    EXPECT_FALSE(op->resume(at(5s)));
    EXPECT_EQ(op->state(), OperationState::Errored);

    journal_.failWrites = false;
    ASSERT_TRUE(op->resume(at(6s)));
    EXPECT_EQ(op->state(), OperationState::Running);
    EXPECT_FALSE(op->resume(at(7s)));
}

TEST_F(OperationTest, FailedPhaseBlocksLaterPhases) {
    auto op = makeOperation(test::profile(
        "p", {test::phase("initial", {"A"}), test::phase("follow-up", {"B"})}));
    auto a1 = test::agent("a1");
    ASSERT_TRUE(op->start({{"user", "seeded"}}, {a1}, t0()));

    auto work = op->beacon(a1, at(1s));
    ASSERT_EQ(work.size(), 1u);
    EXPECT_EQ(work[0].abilityId, "A");
    op->report("a1", work[0].linkId, "", false, 1, at(2s));

    EXPECT_TRUE(op->beacon(a1, at(3s)).empty());
    auto status = op->status();
    ASSERT_EQ(status->blocked.size(), 1u);
    EXPECT_EQ(status->blocked[0].waitingOnPhase, "initial");
    EXPECT_EQ(op->state(), OperationState::Running);
}

TEST_F(OperationTest, ProfileEditDiscardsRemovedWork) {
    auto op = makeOperation(single({"A", "flaky"}));
    auto a1 = test::agent("a1");
    ASSERT_TRUE(op->start({}, {a1}, t0()));
    EXPECT_EQ(op->status()->count(LinkStatus::Queued), 2u);

    ASSERT_TRUE(op->updateProfile(single({"A", "C"}), at(1s)));
    EXPECT_EQ(op->status()->count(LinkStatus::Discarded), 1u);
    EXPECT_EQ(op->status()->profileId, "p");

    auto work = op->beacon(a1, at(2s));
    ASSERT_EQ(work.size(), 1u);
    EXPECT_EQ(work[0].abilityId, "A");

    EXPECT_FALSE(op->updateProfile(single({"ghost"}), at(3s)));
}

TEST_F(OperationTest, OperationWithoutAgentsNeverFinishes) {
    auto op = makeOperation(single({"A"}));
    ASSERT_TRUE(op->start({}, {}, t0()));
    for (int i = 0; i < 4; ++i)
        op->step(at(std::chrono::seconds(i)));
    EXPECT_EQ(op->state(), OperationState::Running);
}

TEST_F(OperationTest, GroupFilterExcludesOtherAgents) {
    OperationOptions options;
    options.group = "red";
    auto op = makeOperation(single({"A"}), options);
    auto blue = test::agent("blue");
    blue.group = "blue";
    auto red = test::agent("red");
    red.group = "red";
    ASSERT_TRUE(op->start({}, {blue, red}, t0()));
    EXPECT_TRUE(op->beacon(blue, at(1s)).empty());
    EXPECT_EQ(op->beacon(red, at(1s)).size(), 1u);
    EXPECT_EQ(op->status()->agents.size(), 1u);
}

TEST_F(OperationTest, ConcurrentAgentsProduceOneOutcomePerPair) {
    auto op = makeOperation(single({"A", "flaky"}));
    constexpr int kAgents = 8;
    std::vector<AgentInfo> agents;
    for (int i = 0; i < kAgents; ++i)
        agents.push_back(test::agent("agent-" + std::to_string(i)));
    ASSERT_TRUE(op->start({}, agents, t0()));

    std::vector<std::thread> threads;
    for (const auto& agent : agents) {
        threads.emplace_back([&op, agent]() {
            for (int round = 0; round < 4; ++round) {
                for (const auto& instruction : op->beacon(agent, at(1s))) {
                    op->report(agent.id, instruction.linkId, "user=" + agent.id, true, 0,
                               at(2s));
                    // A racing duplicate must not change anything.
                    op->report(agent.id, instruction.linkId, "user=dup", true, 0, at(2s));
                }
            }
        });
    }
    for (auto& t : threads)
        t.join();

    op->step(at(3s));
    op->step(at(4s));
    EXPECT_EQ(op->state(), OperationState::Finished);

    auto links = op->links();
    ASSERT_EQ(links.size(), static_cast<std::size_t>(2 * kAgents));
    std::set<std::pair<AbilityId, AgentId>> pairs;
    for (const auto& link : links) {
        EXPECT_EQ(link.status, LinkStatus::Success);
        EXPECT_TRUE(pairs.insert({link.abilityId, link.agentId}).second);
    }
    for (const auto& fact : op->facts())
        EXPECT_NE(fact.value, "dup");
}
