/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#pragma once
#include <bitset>
#include <optional>
#include <string>

#include "hatch/util.hpp"

namespace hatch {

// Cron expression evaluated in UTC.
//   5 fields: minute hour day-of-month month day-of-week
//   6 fields: second minute hour day-of-month month day-of-week
// Each field accepts *, N, A-B, lists (a,b,c) and steps (*/N, A-B/N).
// Day-of-week 0 and 7 are both Sunday.
class CronExpr {
public:
    [[nodiscard]] static std::optional<CronExpr> parse(const std::string& expression, std::string* error = nullptr);

    // First fire time strictly after `after`.
    [[nodiscard]] std::optional<TimePoint> next(TimePoint after) const;

    [[nodiscard]] const std::string& expression() const noexcept { return expression_; }
    [[nodiscard]] bool hasSeconds() const noexcept { return hasSeconds_; }

private:
    CronExpr() = default;

    std::string expression_;
    bool hasSeconds_ = false;
    bool domRestricted_ = false;
    bool dowRestricted_ = false;
    std::bitset<60> seconds_;
    std::bitset<60> minutes_;
    std::bitset<24> hours_;
    std::bitset<32> days_;
    std::bitset<13> months_;
    std::bitset<7> weekdays_;
};

}
