/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/util.hpp"
#include "hatch/logger.hpp"
#include <algorithm>
#include <atomic>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <fstream>
#include <sstream>
#include <unistd.h>

namespace hatch {

std::string formatTime(TimePoint tp) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
    if (ms < 0) {
        ms += 1000;
        secs -= std::chrono::seconds(1);
    }
    std::time_t t = Clock::to_time_t(secs);
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);

    char buf[40];
    std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                  tm_buf.tm_year + 1900, tm_buf.tm_mon + 1, tm_buf.tm_mday,
                  tm_buf.tm_hour, tm_buf.tm_min, tm_buf.tm_sec, static_cast<int>(ms));
    return buf;
}

std::optional<TimePoint> parseTime(const std::string& text) noexcept {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0, millis = 0;
    int matched = std::sscanf(text.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d.%3d",
                              &year, &month, &day, &hour, &minute, &second, &millis);
    if (matched < 6) {
        return std::nullopt;
    }
    if (matched == 6) {
        millis = 0;
    }

    std::tm tm_buf{};
    tm_buf.tm_year = year - 1900;
    tm_buf.tm_mon = month - 1;
    tm_buf.tm_mday = day;
    tm_buf.tm_hour = hour;
    tm_buf.tm_min = minute;
    tm_buf.tm_sec = second;
    std::time_t t = timegm(&tm_buf);
    if (t == static_cast<std::time_t>(-1)) {
        return std::nullopt;
    }
    return Clock::from_time_t(t) + std::chrono::milliseconds(millis);
}

std::int64_t toUnixSeconds(TimePoint tp) noexcept {
    return std::chrono::duration_cast<std::chrono::seconds>(tp.time_since_epoch()).count();
}

TimePoint fromUnixSeconds(std::int64_t secs) noexcept {
    return TimePoint(std::chrono::seconds(secs));
}

std::string generateId() {
    static std::atomic<uint64_t> counter{0};

    auto now = std::chrono::duration_cast<std::chrono::microseconds>(
        Clock::now().time_since_epoch()).count();
    uint64_t unique_counter = counter.fetch_add(1);

    std::stringstream ss;
    ss << now << "_" << getpid() << "_" << unique_counter;
    return ss.str();
}

int envInt(const char* name, int defv) noexcept {
    const char* val = std::getenv(name);
    if (!val || !*val) {
        return defv;
    }
    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        LOG_WARN(std::string("Ignoring non-numeric ") + name + "=" + val);
        return defv;
    }
}

std::string envString(const char* name, const std::string& defv) {
    const char* val = std::getenv(name);
    return (val && *val) ? std::string(val) : defv;
}

std::string toLowerCopy(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
        [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

std::string trim(const std::string& value) {
    size_t start = value.find_first_not_of(" \t\r\n");
    if (start == std::string::npos) {
        return "";
    }
    size_t end = value.find_last_not_of(" \t\r\n");
    return value.substr(start, end - start + 1);
}

bool atomicWrite(const std::filesystem::path& path, const std::string& content) noexcept {
    try {
        auto tempPath = path;
        tempPath += ".tmp";
        {
            std::ofstream file(tempPath, std::ios::binary | std::ios::trunc);
            if (!file) return false;
            file << content;
            file.flush();
            if (!file.good()) return false;
        }
        std::filesystem::rename(tempPath, path);
        return true;
    } catch (const std::exception& e) {
        LOG_ERROR("Atomic write failed for " + path.string() + ": " + e.what());
        return false;
    }
}

std::optional<std::string> readFile(const std::filesystem::path& path) noexcept {
    try {
        std::ifstream file(path, std::ios::binary);
        if (!file) {
            return std::nullopt;
        }
        return std::string((std::istreambuf_iterator<char>(file)),
                           std::istreambuf_iterator<char>());
    } catch (const std::exception& e) {
        LOG_WARN("Failed to read " + path.string() + ": " + e.what());
        return std::nullopt;
    }
}

std::optional<std::filesystem::path> resolveUnder(const std::filesystem::path& root,
                                                  const std::string& relative) noexcept {
    try {
        auto base = std::filesystem::weakly_canonical(root);
        std::filesystem::path rel(relative);
        if (rel.is_absolute()) {
            rel = rel.relative_path();
        }
        auto candidate = std::filesystem::weakly_canonical(base / rel);
        auto baseStr = base.string();
        auto candStr = candidate.string();
        if (candStr != baseStr && candStr.rfind(baseStr + "/", 0) != 0) {
            return std::nullopt;
        }
        return candidate;
    } catch (const std::filesystem::filesystem_error& e) {
        LOG_DEBUG("Path rejected: " + std::string(e.what()));
        return std::nullopt;
    }
}

}
