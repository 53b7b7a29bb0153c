/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#include <gtest/gtest.h>

#include <cstdlib>
#include <thread>

#include <httplib.h>

#include "hatch/worker_client.hpp"
#include "test_helpers.hpp"

using namespace hatch;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {

// Stands in for the orchestrator's internal API for job "job1".
class WorkerClientTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::quietLogs();
        routes();
        port = server.bind_to_any_port("127.0.0.1");
        ASSERT_GT(port, 0);
        thread = std::thread([this] { server.listen_after_bind(); });
        ASSERT_TRUE(test::waitFor([this] { return server.is_running(); }));
    }

    void TearDown() override {
        server.stop();
        if (thread.joinable()) thread.join();
    }

    void routes() {
        server.Get("/internal/jobs/job1/spec", [this](const httplib::Request& req, httplib::Response& res) {
            record(req);
            res.set_content(R"({"title":"Fix the build","mode":"worker"})", "application/json");
        });
        server.Post("/internal/jobs/job1/events", [this](const httplib::Request& req, httplib::Response& res) {
            record(req);
            if (closed) {
                res.status = 409;
                res.set_content(R"({"error":"conflict","message":"event stream closed after result"})", "application/json");
                return;
            }
            {
                std::lock_guard<std::mutex> lock(mutex);
                events.push_back(json::parse(req.body));
            }
            res.status = 201;
            res.set_content(R"({"seq":1})", "application/json");
        });
        server.Post("/internal/jobs/job1/heartbeat", [this](const httplib::Request& req, httplib::Response& res) {
            record(req);
            ++heartbeats;
            res.set_content("{}", "application/json");
        });
        server.Get("/internal/jobs/job1/prompt", [this](const httplib::Request& req, httplib::Response& res) {
            record(req);
            if (promptServed.exchange(true)) {
                res.status = 204;
                return;
            }
            res.set_content(R"({"content":"also update the docs","done":false})", "application/json");
        });
        server.Post("/internal/jobs/job1/llm/complete", [this](const httplib::Request& req, httplib::Response& res) {
            record(req);
            if (!modelLoaded) {
                res.status = 503;
                res.set_content(R"({"error":"unavailable","message":"model not loaded"})", "application/json");
                return;
            }
            auto prompt = json::parse(req.body).value("prompt", std::string{});
            res.set_content(json{{"text", "echo: " + prompt}}.dump(), "application/json");
        });
    }

    void record(const httplib::Request& req) {
        std::lock_guard<std::mutex> lock(mutex);
        authorizations.push_back(req.get_header_value("Authorization"));
    }

    WorkerIdentity identity(const std::string& jobId = "job1") const {
        return {jobId, "http://127.0.0.1:" + std::to_string(port), "tok-123"};
    }

    httplib::Server server;
    std::thread thread;
    int port = 0;

    std::mutex mutex;
    std::vector<json> events;
    std::vector<std::string> authorizations;
    std::atomic<int> heartbeats{0};
    std::atomic<bool> promptServed{false};
    std::atomic<bool> closed{false};
    std::atomic<bool> modelLoaded{true};
};

TEST_F(WorkerClientTest, FetchesSpecWithBearerToken) {
    WorkerClient client(identity());
    auto spec = client.fetchSpec();
    ASSERT_TRUE(spec) << client.lastError();
    EXPECT_EQ(spec->at("title"), "Fix the build");

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(authorizations.size(), 1u);
    EXPECT_EQ(authorizations[0], "Bearer tok-123");
}

TEST_F(WorkerClientTest, UnknownJobSpecReportsStatus) {
    WorkerClient client(identity("nobody"));
    EXPECT_FALSE(client.fetchSpec());
    EXPECT_EQ(client.lastError().rfind("spec request returned 404", 0), 0u) << client.lastError();
}

TEST_F(WorkerClientTest, EmitPostsTypedEvents) {
    WorkerClient client(identity());
    EXPECT_TRUE(client.emit(EventType::ToolUse, {{"tool", "shell"}, {"input", "ls"}}));
    EXPECT_TRUE(client.emit(EventType::Result, {{"success", true}, {"message", "done"}}));

    std::lock_guard<std::mutex> lock(mutex);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].at("event_type"), "tool_use");
    EXPECT_EQ(events[0].at("payload").at("tool"), "shell");
    EXPECT_EQ(events[1].at("event_type"), "result");
}

TEST_F(WorkerClientTest, RejectedEventIsReported) {
    closed = true;
    WorkerClient client(identity());
    EXPECT_FALSE(client.emit(EventType::Message, {{"content", "late"}}));
    EXPECT_EQ(client.lastError().rfind("event rejected (409)", 0), 0u) << client.lastError();
}

TEST_F(WorkerClientTest, PromptPollYieldsOnceThenNothing) {
    WorkerClient client(identity());
    auto prompt = client.pollPrompt();
    ASSERT_TRUE(prompt);
    EXPECT_EQ(prompt->content, "also update the docs");
    EXPECT_FALSE(prompt->done);
    EXPECT_FALSE(client.pollPrompt());
}

TEST_F(WorkerClientTest, CompletionReturnsTextOrServerMessage) {
    WorkerClient client(identity());
    auto ok = client.complete("hello");
    ASSERT_TRUE(ok.ok) << ok.error;
    EXPECT_EQ(ok.output, "echo: hello");

    modelLoaded = false;
    auto failed = client.complete("hello");
    EXPECT_FALSE(failed.ok);
    EXPECT_EQ(failed.error, "model not loaded");
}

TEST_F(WorkerClientTest, HeartbeatLoopBeatsUntilDestroyed) {
    WorkerClient client(identity());
    {
        HeartbeatLoop loop(client, 1s);
        ASSERT_TRUE(test::waitFor([this] { return heartbeats.load() >= 2; }, 5s));
    }
    int seen = heartbeats.load();
    std::this_thread::sleep_for(1500ms);
    EXPECT_EQ(heartbeats.load(), seen);
}

TEST(WorkerClientOfflineTest, UnreachableOrchestratorFailsCleanly) {
    test::quietLogs();
    WorkerClient client({"job1", "http://127.0.0.1:1", "tok"});
    EXPECT_FALSE(client.heartbeat());
    EXPECT_FALSE(client.emit(EventType::Message, {{"content", "x"}}));
    EXPECT_EQ(client.lastError().rfind("event post failed", 0), 0u) << client.lastError();
    EXPECT_FALSE(client.complete("x").ok);
}

TEST(WorkerIdentityTest, FlagsWinOverEnvironment) {
    ::setenv("HATCH_JOB_ID", "env-job", 1);
    ::setenv("HATCH_ORCHESTRATOR_URL", "http://10.0.0.1:8080//", 1);
    ::setenv("HATCH_JOB_TOKEN", "env-token", 1);

    auto fromEnv = identityFromEnv("", "");
    EXPECT_EQ(fromEnv.jobId, "env-job");
    EXPECT_EQ(fromEnv.orchestratorUrl, "http://10.0.0.1:8080");
    EXPECT_EQ(fromEnv.token, "env-token");
    EXPECT_TRUE(fromEnv.complete());

    auto flagged = identityFromEnv("flag-job", "http://127.0.0.1:9000");
    EXPECT_EQ(flagged.jobId, "flag-job");
    EXPECT_EQ(flagged.orchestratorUrl, "http://127.0.0.1:9000");

    ::unsetenv("HATCH_JOB_TOKEN");
    EXPECT_FALSE(identityFromEnv("", "").complete());
    ::unsetenv("HATCH_JOB_ID");
    ::unsetenv("HATCH_ORCHESTRATOR_URL");
}

}
