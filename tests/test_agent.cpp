/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#include <gtest/gtest.h>

#include <algorithm>
#include <thread>
#include <vector>

#include "hatch/agent.hpp"
#include "test_helpers.hpp"

using namespace hatch;
using namespace std::chrono_literals;

namespace {

TEST(ExtractCommandTest, FirstFencedBlock) {
    EXPECT_EQ(extractCommand("Let me look.\n```sh\nls -la\n```\n"), "ls -la");
    EXPECT_EQ(extractCommand("```\n  echo hi  \n```"), "echo hi");
    EXPECT_EQ(extractCommand("```bash\ncd src && make\n```\nthen\n```sh\nrm -rf /\n```"), "cd src && make");
    EXPECT_EQ(extractCommand("```sh\nprintf 'a\\nb'\nwc -l\n```"), "printf 'a\\nb'\nwc -l");
}

TEST(ExtractCommandTest, NoUsableBlock) {
    EXPECT_FALSE(extractCommand("No command here."));
    EXPECT_FALSE(extractCommand("```sh\nunterminated"));
    EXPECT_FALSE(extractCommand("```sh\n\n```"));
    EXPECT_FALSE(extractCommand("```sh"));
}

TEST(IsDoneTest, TrailingMarker) {
    EXPECT_TRUE(isDone("Created the file.\nDONE"));
    EXPECT_TRUE(isDone("All tests pass. DONE.\n\n"));
    EXPECT_TRUE(isDone("**DONE**"));
    EXPECT_FALSE(isDone("DONE is what I will say later"));
    EXPECT_FALSE(isDone("```sh\nls\n```"));
    EXPECT_FALSE(isDone(""));
}

class AgentLoopTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::quietLogs();
        options.workdir = dir.path();
        options.maxIterations = 4;
        options.commandTimeout = 10s;
    }

    test::TempDir dir;
    test::FakeChannel channel;
    AgentOptions options;
};

TEST_F(AgentLoopTest, RunsCommandsAndFinishesOnDone) {
    channel.replies = {
        "I'll create the file.\n```sh\necho hello > greeting.txt && cat greeting.txt\n```",
        "The file exists with the greeting.\nDONE",
    };

    AgentLoop loop(channel, options);
    auto outcome = loop.run("Create greeting.txt");
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.message, "The file exists with the greeting.");

    auto written = readFile(dir.path() / "greeting.txt");
    ASSERT_TRUE(written);
    EXPECT_EQ(*written, "hello\n");

    EXPECT_EQ(channel.types(), (std::vector<EventType>{EventType::Message, EventType::ToolUse,
                                                       EventType::ToolResult, EventType::Message,
                                                       EventType::Result}));
    const auto& toolUse = channel.events[1].second;
    EXPECT_EQ(toolUse.at("tool"), "shell");
    EXPECT_EQ(toolUse.at("input").at("command"), "echo hello > greeting.txt && cat greeting.txt");
    const auto& toolResult = channel.events[2].second;
    EXPECT_EQ(toolResult.at("exit_code"), 0);
    EXPECT_EQ(toolResult.at("output"), "hello\n");
    EXPECT_EQ(channel.events.back().second.at("success"), true);

    ASSERT_EQ(channel.seenPrompts.size(), 2u);
    EXPECT_NE(channel.seenPrompts[1].find("Exit code: 0"), std::string::npos);
    EXPECT_NE(channel.seenPrompts[1].find("Create greeting.txt"), std::string::npos);
    EXPECT_EQ(loop.steps().size(), 2u);
}

TEST_F(AgentLoopTest, FailingCommandIsReportedNotFatal) {
    channel.replies = {"```sh\nexit 3\n```", "Nothing else to do. DONE"};
    AgentLoop loop(channel, options);
    auto outcome = loop.run("try");
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(channel.events[2].second.at("exit_code"), 3);
}

TEST_F(AgentLoopTest, IterationLimitFails) {
    channel.replies = {"thinking", "still thinking", "more", "and more", "never reached"};
    AgentLoop loop(channel, options);
    auto outcome = loop.run("loop forever");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.message, "iteration limit reached (4)");
    EXPECT_EQ(channel.seenPrompts.size(), 4u);

    auto types = channel.types();
    EXPECT_EQ(std::count(types.begin(), types.end(), EventType::Result), 1);
    EXPECT_EQ(types.back(), EventType::Result);
    EXPECT_NE(channel.seenPrompts[1].find("(no command found in the reply)"), std::string::npos);
}

TEST_F(AgentLoopTest, ModelFailureEndsTheJob) {
    AgentLoop loop(channel, options);
    auto outcome = loop.run("anything");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.message, "model unavailable: no model");
    ASSERT_EQ(channel.events.size(), 1u);
    EXPECT_EQ(channel.events[0].first, EventType::Result);
}

TEST_F(AgentLoopTest, RejectedEventsStopTheLoop) {
    channel.acceptEvents = false;
    channel.replies = {"```sh\ntouch should-not-exist\n```"};
    AgentLoop loop(channel, options);
    auto outcome = loop.run("x");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.message, "orchestrator stopped accepting events");
    EXPECT_FALSE(std::filesystem::exists(dir.path() / "should-not-exist"));
}

TEST_F(AgentLoopTest, LongOutputIsTruncated) {
    options.maxOutput = 100;
    channel.replies = {"```sh\nhead -c 5000 /dev/zero | tr '\\0' x\n```", "DONE"};
    AgentLoop loop(channel, options);
    auto outcome = loop.run("x");
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.message, "Task completed");
    const auto& toolResult = channel.events[2].second;
    EXPECT_EQ(toolResult.at("truncated"), true);
    EXPECT_LE(toolResult.at("output").get<std::string>().size(), 100u);
}

TEST(RunCommandTest, TimeoutKillsTheCommand) {
    CommandOptions options;
    options.timeout = 200ms;
    auto started = std::chrono::steady_clock::now();
    auto result = runCommand({"/bin/sh", "-c", "sleep 5"}, options);
    EXPECT_TRUE(result.timedOut);
    EXPECT_FALSE(result.ok());
    EXPECT_LT(std::chrono::steady_clock::now() - started, 4s);
}

TEST(RunCommandTest, CapturesStderrAndExitCode) {
    auto result = runCommand({"/bin/sh", "-c", "echo out; echo err 1>&2; exit 2"}, {});
    EXPECT_EQ(result.exitCode, 2);
    EXPECT_NE(result.output.find("out"), std::string::npos);
    EXPECT_NE(result.output.find("err"), std::string::npos);
}

TEST(RunCommandTest, MissingProgramReportsError) {
    auto result = runCommand({"no-such-program-for-hatch"}, {});
    EXPECT_FALSE(result.error.empty());
    EXPECT_FALSE(result.ok());
}


TEST(RunCommandTest, ReplacedEnvironmentReachesTheChild) {
    CommandOptions options;
    options.env = std::map<std::string, std::string>{{"A", "1"}, {"B", "2"}};
    auto result = runCommand({"/bin/sh", "-c", "echo \"$A-$B-${HOME:-unset}\""}, options);
    ASSERT_TRUE(result.ok()) << result.error << result.output;
    EXPECT_EQ(trim(result.output), "1-2-unset");
}

TEST(RunCommandTest, ConcurrentCommandsFromManyThreads) {
    std::vector<std::thread> threads;
    std::vector<std::string> outputs(8);
    for (std::size_t i = 0; i < outputs.size(); ++i) {
        threads.emplace_back([i, &outputs] {
            CommandOptions options;
            options.env = std::map<std::string, std::string>{{"N", std::to_string(i)}};
            auto result = runCommand({"/bin/sh", "-c", "echo run-$N"}, options);
            outputs[i] = result.ok() ? trim(result.output) : "error: " + result.error;
        });
    }
    for (auto& t : threads) t.join();
    for (std::size_t i = 0; i < outputs.size(); ++i) {
        EXPECT_EQ(outputs[i], "run-" + std::to_string(i));
    }
}

}
