// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <sortie/engine/fact_store.h>

using namespace sortie;
using namespace sortie::engine;

TEST(FactStoreTest, PutAppendsAndBumpsVersion) {
    FactStore store;
    EXPECT_EQ(store.snapshotVersion(), 0u);

    auto a = store.put("user", "admin", Provenance::seed());
    ASSERT_TRUE(a);
    EXPECT_EQ(a.value().sequence, 1u);
    auto b = store.put("user", "root", Provenance::link("link-1"));
    ASSERT_TRUE(b);
    EXPECT_EQ(b.value().sequence, 2u);

    EXPECT_EQ(store.snapshotVersion(), 2u);
    EXPECT_EQ(store.size(), 2u);
    EXPECT_EQ(store.valuesOf("user").size(), 2u);
}

TEST(FactStoreTest, ResolvePicksMostRecentValue) {
    FactStore store;
    ASSERT_TRUE(store.put("host", "10.0.0.1", Provenance::seed()));
    ASSERT_TRUE(store.put("host", "10.0.0.2", Provenance::link("link-7")));

    auto res = store.resolve({"host"});
    ASSERT_TRUE(res.complete());
    EXPECT_EQ(res.values.at("host"), "10.0.0.2");
    EXPECT_EQ(store.latest("host").value(), "10.0.0.2");
}

TEST(FactStoreTest, ResolveReportsMissingKeys) {
    FactStore store;
    ASSERT_TRUE(store.put("user", "admin", Provenance::seed()));

    auto res = store.resolve({"user", "token"});
    EXPECT_FALSE(res.complete());
    ASSERT_EQ(res.missing.size(), 1u);
    EXPECT_EQ(res.missing[0], "token");
    EXPECT_EQ(res.values.at("user"), "admin");
    EXPECT_FALSE(store.latest("token").has_value());
}

TEST(FactStoreTest, NeverOverwritesEarlierValues) {
    FactStore store;
    ASSERT_TRUE(store.put("user", "admin", Provenance::seed()));
    ASSERT_TRUE(store.put("user", "admin", Provenance::link("link-1")));

    auto values = store.valuesOf("user");
    ASSERT_EQ(values.size(), 2u);
    EXPECT_TRUE(values[0].provenance.isSeed());
    EXPECT_EQ(values[1].provenance.linkId, "link-1");
}

TEST(FactStoreTest, RejectsEmptyKeyAndAnonymousLinkProvenance) {
    FactStore store;
    auto empty = store.put("", "x", Provenance::seed());
    ASSERT_FALSE(empty);
    EXPECT_EQ(empty.error().code, ErrorCode::InvalidArgument);

    auto anonymous = store.put("k", "v", Provenance::link(""));
    ASSERT_FALSE(anonymous);
    EXPECT_EQ(anonymous.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(store.snapshotVersion(), 0u);
}

TEST(FactStoreTest, CountsFactsPerLink) {
    FactStore store;
    ASSERT_TRUE(store.put("a", "1", Provenance::link("link-1")));
    ASSERT_TRUE(store.put("b", "2", Provenance::link("link-1")));
    ASSERT_TRUE(store.put("c", "3", Provenance::link("link-2")));
    ASSERT_TRUE(store.put("d", "4", Provenance::seed()));

    EXPECT_EQ(store.countFromLink("link-1"), 2u);
    EXPECT_EQ(store.countFromLink("link-2"), 1u);
    EXPECT_EQ(store.countFromLink("link-3"), 0u);
}

TEST(FactStoreTest, RejectsValuesWithPlaceholderSyntax) {
    FactStore store;
    auto r = store.put("user", "x #{token} y", Provenance::seed());
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_TRUE(store.put("user", "price is #5 {ok}", Provenance::seed()));
    EXPECT_EQ(store.size(), 1u);
}
