// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <sortie/engine/executor_capability.h>

using namespace sortie;
using namespace sortie::engine;

TEST(PlaceholderTest, ExtractsDistinctKeysInOrder) {
    auto keys = placeholdersOf("ssh #{user}@#{host} -p #{port} # #{user}");
    ASSERT_EQ(keys.size(), 3u);
    EXPECT_EQ(keys[0], "user");
    EXPECT_EQ(keys[1], "host");
    EXPECT_EQ(keys[2], "port");
    EXPECT_TRUE(placeholdersOf("whoami").empty());
    EXPECT_TRUE(placeholdersOf("echo #{unterminated").empty());
}

TEST(PlaceholderTest, SubstitutesEveryOccurrence) {
    auto r = substitutePlaceholders("net user #{user} /domain && echo #{user}",
                                    {{"user", "admin"}});
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), "net user admin /domain && echo admin");
}

TEST(PlaceholderTest, MissingFactNamesTheKey) {
    auto r = substitutePlaceholders("curl #{host}/#{path}", {{"host", "example.org"}});
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::MissingFact);
    EXPECT_EQ(r.error().message, "path");
}

TEST(ExecutorRegistryTest, ResolvesAliases) {
    ASSERT_NE(ExecutorRegistry::forKind("sh"), nullptr);
    EXPECT_EQ(ExecutorRegistry::forKind("bash")->kind(), "shell");
    EXPECT_EQ(ExecutorRegistry::forKind("psh")->kind(), "powershell");
    EXPECT_EQ(ExecutorRegistry::forKind("cmd")->kind(), "powershell");
    EXPECT_EQ(ExecutorRegistry::forKind("python")->kind(), "script");
    EXPECT_EQ(ExecutorRegistry::forKind("fortran"), nullptr);
    EXPECT_FALSE(ExecutorRegistry::isKnown(""));
    EXPECT_EQ(ExecutorRegistry::knownKinds().count("pwsh"), 1u);
}

TEST(ExecutorCapabilityTest, PowerShellStripsBomAndCrlf) {
    const auto* psh = ExecutorRegistry::forKind("psh");
    ASSERT_NE(psh, nullptr);
    ParserRule lines;
    lines.kind = ParserKind::Line;
    lines.key = "share";
    auto r = psh->parse("\xEF\xBB\xBF"
                        "ADMIN$\r\nC$\r\n",
                        {lines});
    ASSERT_TRUE(r);
    ASSERT_EQ(r.value().size(), 2u);
    EXPECT_EQ(r.value()[0].value, "ADMIN$");
    EXPECT_EQ(r.value()[1].value, "C$");
}

TEST(ExecutorCapabilityTest, RenderUsesTextualSubstitution) {
    const auto* shell = ExecutorRegistry::forKind("shell");
    ASSERT_NE(shell, nullptr);
    auto r = shell->render("cat /home/#{user}/.ssh/id_rsa", {{"user", "bob"}});
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), "cat /home/bob/.ssh/id_rsa");
}
