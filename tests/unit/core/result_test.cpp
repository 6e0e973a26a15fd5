// Copyright 2025 The Sortie Authors
// SPDX-License-Identifier: Apache-2.0

#include <gtest/gtest.h>
#include <sortie/core/types.h>

#include <stdexcept>
#include <string>

using namespace sortie;

namespace {

Result<int> parsePositive(int v) {
    if (v <= 0)
        return Error{ErrorCode::InvalidArgument, "must be positive"};
    return v;
}

} // namespace

TEST(ResultTest, HoldsValue) {
    auto r = parsePositive(7);
    ASSERT_TRUE(r);
    EXPECT_EQ(r.value(), 7);
    EXPECT_THROW((void)r.error(), std::runtime_error);
}

TEST(ResultTest, HoldsError) {
    auto r = parsePositive(-1);
    ASSERT_FALSE(r);
    EXPECT_EQ(r.error().code, ErrorCode::InvalidArgument);
    EXPECT_EQ(r.error().message, "must be positive");
    EXPECT_THROW((void)r.value(), std::runtime_error);
}

TEST(ResultTest, VoidResultDefaultsToSuccess) {
    Result<void> ok;
    EXPECT_TRUE(ok);
    Result<void> bad(ErrorCode::MissingFact);
    ASSERT_FALSE(bad);
    EXPECT_EQ(bad.error().message, "Missing fact");
}

TEST(ResultTest, ErrorComparesWithCode) {
    Error e{ErrorCode::ProtocolViolation, "wrong agent"};
    EXPECT_TRUE(e == ErrorCode::ProtocolViolation);
    EXPECT_TRUE(ErrorCode::NotFound != e);
    EXPECT_EQ(fmt::format("{}", ErrorCode::Timeout), "Operation timed out");
}
