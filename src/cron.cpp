/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/cron.hpp"
#include <ctime>
#include <sstream>
#include <vector>

namespace hatch {

namespace {
bool parseNumber(const std::string& text, int& out) {
    if (text.empty() || text.size() > 4) return false;
    for (char c : text) {
        if (c < '0' || c > '9') return false;
    }
    out = std::stoi(text);
    return true;
}

// Sets bits [lo, hi] of a field. Returns false with a message on bad syntax.
template <std::size_t N>
bool parseField(const std::string& field, int lo, int hi, std::bitset<N>& bits, bool& restricted,
                std::string& error) {
    restricted = field != "*" && field != "?";
    std::stringstream ss(field);
    std::string part;
    while (std::getline(ss, part, ',')) {
        if (part.empty()) {
            error = "empty list item in '" + field + "'";
            return false;
        }
        int step = 1;
        auto slash = part.find('/');
        std::string range = part;
        if (slash != std::string::npos) {
            if (!parseNumber(part.substr(slash + 1), step) || step <= 0) {
                error = "bad step in '" + part + "'";
                return false;
            }
            range = part.substr(0, slash);
        }

        int start = lo;
        int end = hi;
        if (range == "*" || range == "?") {
            // full range
        } else {
            auto dash = range.find('-');
            if (dash == std::string::npos) {
                if (!parseNumber(range, start)) {
                    error = "bad value '" + range + "'";
                    return false;
                }
                end = slash != std::string::npos ? hi : start;
            } else if (!parseNumber(range.substr(0, dash), start) ||
                       !parseNumber(range.substr(dash + 1), end)) {
                error = "bad range '" + range + "'";
                return false;
            }
        }
        if (start < lo || end > hi || start > end) {
            error = "'" + part + "' outside " + std::to_string(lo) + "-" + std::to_string(hi);
            return false;
        }
        for (int v = start; v <= end; v += step) {
            bits.set(static_cast<std::size_t>(v));
        }
    }
    return true;
}
}

std::optional<CronExpr> CronExpr::parse(const std::string& expression, std::string* error) {
    std::vector<std::string> fields;
    std::stringstream ss(expression);
    std::string f;
    while (ss >> f) fields.push_back(f);

    auto fail = [&](const std::string& msg) -> std::optional<CronExpr> {
        if (error) *error = msg;
        return std::nullopt;
    };

    if (fields.size() != 5 && fields.size() != 6) {
        return fail("expected 5 or 6 fields, got " + std::to_string(fields.size()));
    }

    CronExpr expr;
    expr.expression_ = expression;
    expr.hasSeconds_ = fields.size() == 6;
    std::size_t i = 0;
    std::string msg;
    bool restricted = false;

    if (expr.hasSeconds_) {
        if (!parseField(fields[i++], 0, 59, expr.seconds_, restricted, msg)) return fail("seconds: " + msg);
    } else {
        expr.seconds_.set(0);
    }
    if (!parseField(fields[i++], 0, 59, expr.minutes_, restricted, msg)) return fail("minute: " + msg);
    if (!parseField(fields[i++], 0, 23, expr.hours_, restricted, msg)) return fail("hour: " + msg);
    if (!parseField(fields[i++], 1, 31, expr.days_, expr.domRestricted_, msg)) return fail("day-of-month: " + msg);
    if (!parseField(fields[i++], 1, 12, expr.months_, restricted, msg)) return fail("month: " + msg);

    std::bitset<8> dow;
    if (!parseField(fields[i++], 0, 7, dow, expr.dowRestricted_, msg)) return fail("day-of-week: " + msg);
    for (std::size_t d = 0; d < 7; ++d) {
        if (dow.test(d)) expr.weekdays_.set(d);
    }
    if (dow.test(7)) expr.weekdays_.set(0);

    return expr;
}

std::optional<TimePoint> CronExpr::next(TimePoint after) const {
    std::time_t t = Clock::to_time_t(std::chrono::time_point_cast<std::chrono::seconds>(after)) + 1;
    std::tm tm{};
    gmtime_r(&t, &tm);

    // Bounded walk; each step jumps to the start of the next candidate unit.
    for (int guard = 0; guard < 500000; ++guard) {
        if (!months_.test(static_cast<std::size_t>(tm.tm_mon + 1))) {
            tm.tm_mon += 1;
            tm.tm_mday = 1;
            tm.tm_hour = tm.tm_min = tm.tm_sec = 0;
            t = timegm(&tm);
            gmtime_r(&t, &tm);
            continue;
        }

        bool domOk = days_.test(static_cast<std::size_t>(tm.tm_mday));
        bool dowOk = weekdays_.test(static_cast<std::size_t>(tm.tm_wday));
        bool dayOk = (domRestricted_ && dowRestricted_) ? (domOk || dowOk) : (domOk && dowOk);
        if (!dayOk) {
            tm.tm_mday += 1;
            tm.tm_hour = tm.tm_min = tm.tm_sec = 0;
            t = timegm(&tm);
            gmtime_r(&t, &tm);
            continue;
        }
        if (!hours_.test(static_cast<std::size_t>(tm.tm_hour))) {
            tm.tm_hour += 1;
            tm.tm_min = tm.tm_sec = 0;
            t = timegm(&tm);
            gmtime_r(&t, &tm);
            continue;
        }
        if (!minutes_.test(static_cast<std::size_t>(tm.tm_min))) {
            tm.tm_min += 1;
            tm.tm_sec = 0;
            t = timegm(&tm);
            gmtime_r(&t, &tm);
            continue;
        }
        if (!seconds_.test(static_cast<std::size_t>(tm.tm_sec))) {
            tm.tm_sec += 1;
            t = timegm(&tm);
            gmtime_r(&t, &tm);
            continue;
        }
        return Clock::from_time_t(t);
    }
    return std::nullopt;
}

}
