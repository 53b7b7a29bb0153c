/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */
#include <gtest/gtest.h>

#include <fstream>

#include <httplib.h>
#include <nlohmann/json.hpp>

#include "hatch/api.hpp"
#include "test_helpers.hpp"

using namespace hatch;
using namespace std::chrono_literals;
using nlohmann::json;

namespace {

class ApiTest : public ::testing::Test {
protected:
    void SetUp() override {
        test::quietLogs();
        Config config;
        config.workspace = dir.path();
        config.publicUrl = "http://127.0.0.1:8600";
        config.provisioners = 1;
        config.grace = 0s;
        auto fakeBackend = std::make_unique<test::FakeBackend>();
        backend = fakeBackend.get();
        orch = std::make_unique<Orchestrator>(config, std::move(fakeBackend), std::make_unique<test::RecordingUpstream>());
        ASSERT_TRUE(orch->start(false));
        scheduler = std::make_unique<RoutineScheduler>(*orch, nullptr);
        orch->addTerminalListener([this](const Job& job) { scheduler->onJobFinished(job); });
        api = std::make_unique<ApiServer>(*orch, scheduler.get());
        ASSERT_TRUE(api->start("127.0.0.1", 0));
        client = std::make_unique<httplib::Client>("127.0.0.1", api->port());
    }

    void TearDown() override {
        api->stop();
        orch->shutdown();
    }

    json post(const std::string& path, const json& body, int expected) {
        auto res = client->Post(path.c_str(), body.dump(), "application/json");
        EXPECT_TRUE(res);
        if (!res) return json();
        EXPECT_EQ(res->status, expected) << res->body;
        return res->body.empty() ? json() : json::parse(res->body);
    }

    // Submits a job and waits for its sandbox; returns {id, worker token}.
    std::pair<std::string, std::string> runningJob(const std::string& description) {
        json created = post("/api/jobs", {{"description", description}}, 201);
        std::string id = created.value("id", std::string{});
        EXPECT_TRUE(test::waitFor([&] { return backend->launchFor(id).has_value(); }));
        auto launch = backend->launchFor(id);
        return {id, launch ? launch->env.at("HATCH_JOB_TOKEN") : std::string{}};
    }

    static httplib::Headers bearer(const std::string& token) {
        return {{"Authorization", "Bearer " + token}};
    }

    test::TempDir dir;
    test::FakeBackend* backend = nullptr;
    std::unique_ptr<Orchestrator> orch;
    std::unique_ptr<RoutineScheduler> scheduler;
    std::unique_ptr<ApiServer> api;
    std::unique_ptr<httplib::Client> client;
};

TEST_F(ApiTest, HealthReportsCounts) {
    auto res = client->Get("/api/health");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    json body = json::parse(res->body);
    EXPECT_EQ(body["status"], "ok");
    EXPECT_EQ(body["jobs"], 0);
    EXPECT_EQ(body["model"], false);
    EXPECT_EQ(body["isolated"], false);
}

TEST_F(ApiTest, CreateAndFetchJob) {
    json created = post("/api/jobs", {{"description", "Upgrade dependencies"}, {"mode", "worker"}}, 201);
    ASSERT_TRUE(created.contains("id"));
    EXPECT_EQ(created["title"], "Upgrade dependencies");
    EXPECT_FALSE(created.contains("routine_id"));

    auto res = client->Get(("/api/jobs/" + created["id"].get<std::string>()).c_str());
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 200);
    EXPECT_EQ(json::parse(res->body)["description"], "Upgrade dependencies");

    auto list = client->Get("/api/jobs?limit=10");
    ASSERT_TRUE(list);
    EXPECT_EQ(json::parse(list->body)["count"], 1);
}

TEST_F(ApiTest, ValidationErrorsUseErrorBody) {
    json bad = post("/api/jobs", {{"description", ""}}, 400);
    EXPECT_EQ(bad["error"], "validation_error");

    json mode = post("/api/jobs", {{"description", "x"}, {"mode", "daemon"}}, 400);
    EXPECT_EQ(mode["error"], "validation_error");

    auto garbage = client->Post("/api/jobs", "{not json", "application/json");
    ASSERT_TRUE(garbage);
    EXPECT_EQ(garbage->status, 400);

    auto filter = client->Get("/api/jobs?state=sleeping");
    ASSERT_TRUE(filter);
    EXPECT_EQ(filter->status, 400);
}

TEST_F(ApiTest, UnknownJobIsNotFound) {
    auto res = client->Get("/api/jobs/nope");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 404);
    EXPECT_EQ(json::parse(res->body)["error"], "not_found");

    json cancel = post("/api/jobs/nope/cancel", json::object(), 404);
    EXPECT_EQ(cancel["error"], "not_found");
}

TEST_F(ApiTest, InternalRoutesRequireJobToken) {
    auto [id, token] = runningJob("lint the repo");
    ASSERT_FALSE(token.empty());
    const std::string path = "/internal/jobs/" + id + "/events";
    const std::string body = json{{"event_type", "message"}, {"payload", {{"content", "hi"}}}}.dump();

    auto anonymous = client->Post(path.c_str(), body, "application/json");
    ASSERT_TRUE(anonymous);
    EXPECT_EQ(anonymous->status, 401);

    auto wrong = client->Post(path.c_str(), bearer("not-the-token"), body, "application/json");
    ASSERT_TRUE(wrong);
    EXPECT_EQ(wrong->status, 401);

    auto ok = client->Post(path.c_str(), bearer(token), body, "application/json");
    ASSERT_TRUE(ok);
    EXPECT_EQ(ok->status, 201);
    EXPECT_EQ(json::parse(ok->body)["sequence"], 1);

    auto spec = client->Get(("/internal/jobs/" + id + "/spec").c_str(), bearer(token));
    ASSERT_TRUE(spec);
    EXPECT_EQ(spec->status, 200);
    EXPECT_EQ(json::parse(spec->body)["state"], "in_progress");

    auto heartbeat = client->Post(("/internal/jobs/" + id + "/heartbeat").c_str(), bearer(token), "", "application/json");
    ASSERT_TRUE(heartbeat);
    EXPECT_EQ(heartbeat->status, 200);
}

TEST_F(ApiTest, WorkerResultFinishesJobAndPagesEvents) {
    auto [id, token] = runningJob("summarize the changelog");
    const std::string path = "/internal/jobs/" + id + "/events";
    for (const auto& event : {json{{"event_type", "message"}, {"payload", {{"content", "reading"}}}},
                              json{{"event_type", "tool_use"}, {"payload", {{"tool", "shell"}}}},
                              json{{"event_type", "result"}, {"payload", {{"success", true}, {"message", "done"}}}}}) {
        auto res = client->Post(path.c_str(), bearer(token), event.dump(), "application/json");
        ASSERT_TRUE(res);
        EXPECT_EQ(res->status, 201) << res->body;
    }

    auto job = client->Get(("/api/jobs/" + id).c_str());
    ASSERT_TRUE(job);
    EXPECT_EQ(json::parse(job->body)["state"], "completed");

    auto page = client->Get(("/api/jobs/" + id + "/events?since=1&limit=1").c_str());
    ASSERT_TRUE(page);
    json body = json::parse(page->body);
    ASSERT_EQ(body["events"].size(), 1u);
    EXPECT_EQ(body["events"][0]["sequence"], 2);
    EXPECT_EQ(body["next_since"], 2);
    EXPECT_EQ(body["closed"], true);

    auto bad = client->Get(("/api/jobs/" + id + "/events?since=-1").c_str());
    ASSERT_TRUE(bad);
    EXPECT_EQ(bad->status, 400);
}

TEST_F(ApiTest, CompletionNeedsAModel) {
    auto [id, token] = runningJob("answer a question");
    const std::string path = "/internal/jobs/" + id + "/llm/complete";
    const std::string body = json{{"prompt", "2+2?"}}.dump();

    auto unavailable = client->Post(path.c_str(), bearer(token), body, "application/json");
    ASSERT_TRUE(unavailable);
    EXPECT_EQ(unavailable->status, 503);

    api->setCompletion([](const std::string& prompt) {
        RunResult result;
        result.ok = true;
        result.output = "echo: " + prompt;
        return result;
    });
    auto answered = client->Post(path.c_str(), bearer(token), body, "application/json");
    ASSERT_TRUE(answered);
    EXPECT_EQ(answered->status, 200);
    EXPECT_EQ(json::parse(answered->body)["text"], "echo: 2+2?");
}

TEST_F(ApiTest, PromptsOnlyForBridgeJobs) {
    auto [id, token] = runningJob("generic work");
    json rejected = post("/api/jobs/" + id + "/prompt", {{"content", "more"}}, 400);
    EXPECT_EQ(rejected["error"], "validation_error");

    json empty = post("/api/jobs/" + id + "/prompt", json::object(), 400);
    EXPECT_EQ(empty["error"], "validation_error");

    auto none = client->Get(("/internal/jobs/" + id + "/prompt").c_str(), bearer(token));
    ASSERT_TRUE(none);
    EXPECT_EQ(none->status, 204);
}

TEST_F(ApiTest, FilesAreConfinedToProjectDirectory) {
    auto [id, token] = runningJob("write a readme");
    ASSERT_TRUE(test::waitFor([&] { return std::filesystem::is_directory(orch->projectDir(id)); }));
    std::ofstream(orch->projectDir(id) / "README.md") << "# hello\n";

    auto list = client->Get(("/api/jobs/" + id + "/files/list").c_str());
    ASSERT_TRUE(list);
    ASSERT_EQ(list->status, 200);
    json entries = json::parse(list->body)["entries"];
    bool found = false;
    for (const auto& entry : entries) {
        if (entry["name"] == "README.md") found = entry["type"] == "file";
    }
    EXPECT_TRUE(found);

    auto read = client->Get(("/api/jobs/" + id + "/files/read?path=README.md").c_str());
    ASSERT_TRUE(read);
    EXPECT_EQ(read->status, 200);
    EXPECT_EQ(read->body, "# hello\n");

    auto escape = client->Get(("/api/jobs/" + id + "/files/read?path=../../etc/passwd").c_str());
    ASSERT_TRUE(escape);
    EXPECT_EQ(escape->status, 404);
}

TEST_F(ApiTest, RoutineLifecycleAndWebhook) {
    json routine = post("/api/routines", {
        {"name", "push triage"},
        {"trigger", {{"type", "webhook"}, {"path", "/github/push/"}, {"secret", "s3cret"}}},
        {"action", {{"type", "lightweight"}, {"prompt", "Triage the push"}}},
    }, 201);
    ASSERT_TRUE(routine.contains("id"));
    EXPECT_EQ(routine["trigger"]["path"], "github/push");
    EXPECT_FALSE(routine["trigger"].contains("secret"));
    EXPECT_EQ(routine["trigger"]["has_secret"], true);
    const std::string rid = routine["id"];

    auto denied = client->Post("/hooks/github/push", httplib::Headers{{"X-Hatch-Webhook-Secret", "wrong"}},
                               "{}", "application/json");
    ASSERT_TRUE(denied);
    EXPECT_EQ(denied->status, 401);

    auto missing = client->Post("/hooks/gitlab/push", "{}", "application/json");
    ASSERT_TRUE(missing);
    EXPECT_EQ(missing->status, 404);

    auto fired = client->Post("/hooks/github/push", httplib::Headers{{"X-Hatch-Webhook-Secret", "s3cret"}},
                              R"({"ref":"main"})", "application/json");
    ASSERT_TRUE(fired);
    ASSERT_EQ(fired->status, 202) << fired->body;
    json fire = json::parse(fired->body);
    EXPECT_EQ(fire["fired"], true);
    ASSERT_TRUE(fire["job_id"].is_string());

    auto job = orch->get(fire["job_id"].get<std::string>());
    ASSERT_TRUE(job);
    EXPECT_EQ(job->spec.routineId, rid);

    auto runs = client->Get(("/api/routines/" + rid + "/runs").c_str());
    ASSERT_TRUE(runs);
    EXPECT_EQ(json::parse(runs->body)["runs"].size(), 1u);

    json toggled = post("/api/routines/" + rid + "/toggle", {{"enabled", false}}, 200);
    EXPECT_EQ(toggled["enabled"], false);

    auto removed = client->Delete(("/api/routines/" + rid).c_str());
    ASSERT_TRUE(removed);
    EXPECT_EQ(removed->status, 200);
    auto gone = client->Get(("/api/routines/" + rid).c_str());
    ASSERT_TRUE(gone);
    EXPECT_EQ(gone->status, 404);
}

TEST_F(ApiTest, InvalidRoutineRejected) {
    json noName = post("/api/routines", {
        {"name", " "},
        {"trigger", {{"type", "manual"}}},
        {"action", {{"type", "lightweight"}, {"prompt", "x"}}},
    }, 400);
    EXPECT_EQ(noName["error"], "validation_error");

    json badCron = post("/api/routines", {
        {"name", "nightly"},
        {"trigger", {{"type", "cron"}, {"schedule", "61 * * * *"}}},
        {"action", {{"type", "lightweight"}, {"prompt", "x"}}},
    }, 400);
    EXPECT_EQ(badCron["error"], "validation_error");

    json badTrigger = post("/api/routines", {
        {"name", "odd"},
        {"trigger", {{"type", "telepathy"}}},
        {"action", {{"type", "lightweight"}, {"prompt", "x"}}},
    }, 400);
    EXPECT_EQ(badTrigger["error"], "validation_error");
}

TEST(ApiWithoutRoutinesTest, RoutineRoutesUnavailable) {
    test::quietLogs();
    test::TempDir dir;
    Config config;
    config.workspace = dir.path();
    config.publicUrl = "http://127.0.0.1:8600";
    Orchestrator orch(config, std::make_unique<test::FakeBackend>(), std::make_unique<test::RecordingUpstream>());
    ASSERT_TRUE(orch.start(false));
    ApiServer api(orch, nullptr);
    ASSERT_TRUE(api.start("127.0.0.1", 0));
    httplib::Client client("127.0.0.1", api.port());
    auto res = client.Get("/api/routines");
    ASSERT_TRUE(res);
    EXPECT_EQ(res->status, 503);
    api.stop();
    orch.shutdown();
}

}
