/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#include <gtest/gtest.h>

#include "hatch/cron.hpp"

using namespace hatch;

namespace {

// 2024-01-01T00:00:00Z, a Monday.
const TimePoint kNewYear = fromUnixSeconds(1704067200);

std::string nextAfter(const std::string& expr, TimePoint after) {
    auto parsed = CronExpr::parse(expr);
    EXPECT_TRUE(parsed) << expr;
    if (!parsed) return "";
    auto next = parsed->next(after);
    return next ? formatTime(*next) : "never";
}

TEST(CronTest, EveryMinuteIsStrictlyAfter) {
    EXPECT_EQ(nextAfter("* * * * *", kNewYear), "2024-01-01T00:01:00.000Z");
    EXPECT_EQ(nextAfter("* * * * *", kNewYear + std::chrono::seconds(59)), "2024-01-01T00:01:00.000Z");
}

TEST(CronTest, FixedTimeOfDay) {
    EXPECT_EQ(nextAfter("30 9 * * *", kNewYear), "2024-01-01T09:30:00.000Z");
    EXPECT_EQ(nextAfter("30 9 * * *", fromUnixSeconds(1704101400)), "2024-01-02T09:30:00.000Z");
}

TEST(CronTest, StepsRangesAndLists) {
    EXPECT_EQ(nextAfter("*/15 * * * *", kNewYear + std::chrono::minutes(16)), "2024-01-01T00:30:00.000Z");
    EXPECT_EQ(nextAfter("0 9-17/4 * * *", kNewYear), "2024-01-01T09:00:00.000Z");
    EXPECT_EQ(nextAfter("0 9-17/4 * * *", kNewYear + std::chrono::hours(10)), "2024-01-01T13:00:00.000Z");
    EXPECT_EQ(nextAfter("0 0 1,15 * *", kNewYear), "2024-01-15T00:00:00.000Z");
}

TEST(CronTest, DayOfWeekIncludingSevenAsSunday) {
    EXPECT_EQ(nextAfter("0 12 * * 6", kNewYear), "2024-01-06T12:00:00.000Z");
    EXPECT_EQ(nextAfter("0 0 * * 7", kNewYear), "2024-01-07T00:00:00.000Z");
    EXPECT_EQ(nextAfter("0 0 * * 0", kNewYear), "2024-01-07T00:00:00.000Z");
}

TEST(CronTest, RestrictedDayFieldsMatchEither) {
    // Classic cron: both day fields restricted means either may match.
    EXPECT_EQ(nextAfter("0 0 13 * 5", kNewYear), "2024-01-05T00:00:00.000Z");
}

TEST(CronTest, MonthsAndLeapDay) {
    EXPECT_EQ(nextAfter("0 0 29 2 *", kNewYear), "2024-02-29T00:00:00.000Z");
    EXPECT_EQ(nextAfter("0 0 1 3 *", fromUnixSeconds(1709164800)), "2024-03-01T00:00:00.000Z");
}

TEST(CronTest, SixFieldFormHasSeconds) {
    auto expr = CronExpr::parse("*/10 * * * * *");
    ASSERT_TRUE(expr);
    EXPECT_TRUE(expr->hasSeconds());
    EXPECT_EQ(formatTime(*expr->next(kNewYear + std::chrono::seconds(3))), "2024-01-01T00:00:10.000Z");
}

TEST(CronTest, RejectsMalformedExpressions) {
    std::string error;
    EXPECT_FALSE(CronExpr::parse("* * * *", &error));
    EXPECT_NE(error.find("5 or 6"), std::string::npos);
    EXPECT_FALSE(CronExpr::parse("60 * * * *", &error));
    EXPECT_NE(error.find("minute"), std::string::npos);
    EXPECT_FALSE(CronExpr::parse("* 24 * * *"));
    EXPECT_FALSE(CronExpr::parse("* * 0 * *"));
    EXPECT_FALSE(CronExpr::parse("* * * 13 *"));
    EXPECT_FALSE(CronExpr::parse("*/0 * * * *"));
    EXPECT_FALSE(CronExpr::parse("a * * * *"));
    EXPECT_FALSE(CronExpr::parse("5-1 * * * *"));
    EXPECT_FALSE(CronExpr::parse("1,,2 * * * *"));
}

TEST(CronTest, ImpossibleDateNeverFires) {
    auto expr = CronExpr::parse("0 0 31 2 *");
    ASSERT_TRUE(expr);
    EXPECT_FALSE(expr->next(kNewYear));
}

}
