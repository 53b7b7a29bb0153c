/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#include <gtest/gtest.h>

#include <fstream>

#include "hatch/bridge.hpp"
#include "test_helpers.hpp"

using namespace hatch;
using namespace std::chrono_literals;

namespace {

std::filesystem::path writeScript(const std::filesystem::path& dir, const std::string& name, const std::string& body) {
    auto path = dir / name;
    std::ofstream(path) << "#!/bin/sh\n" << body;
    std::filesystem::permissions(path, std::filesystem::perms::owner_all);
    return path;
}

const char* kFakeCli =
    "echo \"$@\" >> calls.log\n"
    "echo '{\"type\":\"system\",\"subtype\":\"init\",\"session_id\":\"sess-1\",\"model\":\"opus\"}'\n"
    "echo 'warming up'\n"
    "echo '{\"type\":\"assistant\",\"session_id\":\"sess-1\",\"message\":{\"content\":["
    "{\"type\":\"text\",\"text\":\"Working\"},"
    "{\"type\":\"tool_use\",\"id\":\"tu1\",\"name\":\"Bash\",\"input\":{\"command\":\"ls\"}}]}}'\n"
    "echo '{\"type\":\"user\",\"message\":{\"content\":["
    "{\"type\":\"tool_result\",\"tool_use_id\":\"tu1\",\"content\":[{\"type\":\"text\",\"text\":\"a.txt\"}]}]}}'\n"
    "echo '{\"type\":\"result\",\"subtype\":\"success\",\"is_error\":false,\"result\":\"All done\","
    "\"session_id\":\"sess-1\",\"num_turns\":2,\"total_cost_usd\":0.01}'\n";

TEST(StreamTranslatorTest, MapsStreamJsonOntoEvents) {
    StreamTranslator translator;

    auto init = translator.translate(R"({"type":"system","subtype":"init","session_id":"s1","model":"m"})");
    ASSERT_EQ(init.size(), 1u);
    EXPECT_EQ(init[0].type, EventType::Status);
    EXPECT_EQ(init[0].payload.at("status"), "session_started");
    ASSERT_TRUE(translator.sessionId());
    EXPECT_EQ(*translator.sessionId(), "s1");

    auto assistant = translator.translate(
        R"({"type":"assistant","message":{"content":[{"type":"text","text":"Reading"},)"
        R"({"type":"text","text":"   "},{"type":"tool_use","id":"t1","name":"Read","input":{"path":"a"}}]}})");
    ASSERT_EQ(assistant.size(), 2u);
    EXPECT_EQ(assistant[0].type, EventType::Message);
    EXPECT_EQ(assistant[0].payload.at("content"), "Reading");
    EXPECT_EQ(assistant[1].type, EventType::ToolUse);
    EXPECT_EQ(assistant[1].payload.at("tool"), "Read");
    EXPECT_EQ(assistant[1].payload.at("tool_use_id"), "t1");
    EXPECT_EQ(assistant[1].payload.at("input").at("path"), "a");

    auto user = translator.translate(
        R"({"type":"user","message":{"content":[{"type":"tool_result","tool_use_id":"t1","content":"file body","is_error":true}]}})");
    ASSERT_EQ(user.size(), 1u);
    EXPECT_EQ(user[0].type, EventType::ToolResult);
    EXPECT_EQ(user[0].payload.at("output"), "file body");
    EXPECT_EQ(user[0].payload.at("is_error"), true);

    EXPECT_FALSE(translator.sawResult());
    auto result = translator.translate(R"({"type":"result","subtype":"error_max_turns","is_error":true,"num_turns":20})");
    ASSERT_EQ(result.size(), 1u);
    EXPECT_EQ(result[0].payload.at("status"), "turn_complete");
    EXPECT_EQ(result[0].payload.at("success"), false);
    EXPECT_TRUE(translator.sawResult());
    EXPECT_FALSE(translator.succeeded());
    EXPECT_EQ(translator.resultText(), "error_max_turns");

    translator.resetTurn();
    EXPECT_FALSE(translator.sawResult());
    EXPECT_TRUE(translator.sessionId());
}

TEST(StreamTranslatorTest, IgnoresNoise) {
    StreamTranslator translator;
    EXPECT_TRUE(translator.translate("").empty());
    EXPECT_TRUE(translator.translate("Loading plugins...").empty());
    EXPECT_TRUE(translator.translate("[1,2,3]").empty());
    EXPECT_TRUE(translator.translate(R"({"type":"system","subtype":"hook"})").empty());
    EXPECT_TRUE(translator.translate(R"({"type":"user","message":{"content":"plain"}})").empty());
}

TEST(BridgeCommandTest, CarriesTurnLimitAndModel) {
    test::FakeChannel channel;
    BridgeOptions options;
    options.cli = "claude";
    options.maxTurns = 5;
    options.model = "opus";
    BridgeRunner runner(channel, options);

    std::vector<std::string> expected = {
        "claude", "-p", "fix it", "--output-format", "stream-json", "--verbose",
        "--max-turns", "5", "--model", "opus",
    };
    EXPECT_EQ(runner.commandFor("fix it"), expected);
}

class BridgeRunnerTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::quietLogs();
        options.workdir = dir.path();
        options.idleWindow = 1s;
        options.pollInterval = 10ms;
    }

    test::TempDir dir;
    test::FakeChannel channel;
    BridgeOptions options;
};

TEST_F(BridgeRunnerTest, RunsFollowUpsOnTheSameSession) {
    options.cli = writeScript(dir.path(), "fake-cli", kFakeCli).string();
    channel.prompts.push_back({"now add tests", true});

    BridgeRunner runner(channel, options);
    auto outcome = runner.run("refactor the parser");
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(outcome.message, "All done");
    ASSERT_TRUE(outcome.sessionId);
    EXPECT_EQ(*outcome.sessionId, "sess-1");
    EXPECT_EQ(runner.turns(), 2);

    auto types = channel.types();
    ASSERT_EQ(types.size(), 12u);
    EXPECT_EQ(types[0], EventType::Status);
    EXPECT_EQ(types[1], EventType::Message);
    EXPECT_EQ(types[2], EventType::ToolUse);
    EXPECT_EQ(types[3], EventType::ToolResult);
    EXPECT_EQ(types[4], EventType::Status);
    EXPECT_EQ(channel.events[5].second.at("status"), "follow_up");
    EXPECT_EQ(types.back(), EventType::Result);
    EXPECT_EQ(channel.events.back().second.at("turns"), 2);
    EXPECT_EQ(channel.events[3].second.at("output"), "a.txt");

    auto calls = readFile(dir.path() / "calls.log");
    ASSERT_TRUE(calls);
    auto second = calls->find('\n');
    ASSERT_NE(second, std::string::npos);
    EXPECT_EQ(calls->substr(0, second).find("--resume"), std::string::npos);
    EXPECT_NE(calls->substr(second).find("--resume sess-1"), std::string::npos);
    EXPECT_NE(calls->substr(second).find("now add tests"), std::string::npos);
}

TEST_F(BridgeRunnerTest, IdleWindowEndsTheSession) {
    options.cli = writeScript(dir.path(), "fake-cli", kFakeCli).string();
    options.idleWindow = 100ms;
    BridgeRunner runner(channel, options);
    auto outcome = runner.run("one shot");
    EXPECT_TRUE(outcome.success);
    EXPECT_EQ(runner.turns(), 1);
    EXPECT_EQ(channel.types().back(), EventType::Result);
}

TEST_F(BridgeRunnerTest, ExitWithoutResultFails) {
    options.cli = writeScript(dir.path(), "broken-cli", "echo 'not json'\nexit 3\n").string();
    BridgeRunner runner(channel, options);
    auto outcome = runner.run("task");
    EXPECT_FALSE(outcome.success);
    EXPECT_EQ(outcome.message, "coding agent exited with code 3 without a result");
    ASSERT_EQ(channel.events.size(), 1u);
    EXPECT_EQ(channel.events[0].first, EventType::Result);
}

TEST_F(BridgeRunnerTest, MissingCliFails) {
    options.cli = (dir.path() / "nope").string();
    BridgeRunner runner(channel, options);
    auto outcome = runner.run("task");
    EXPECT_FALSE(outcome.success);
    EXPECT_NE(outcome.message.find("failed to start coding agent"), std::string::npos);
}

}
