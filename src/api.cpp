/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/api.hpp"
#include "hatch/auth.hpp"
#include "hatch/logger.hpp"
#include "hatch/util.hpp"
#include <algorithm>
#include <cctype>
#include <exception>
#include <filesystem>
#include <memory>

namespace hatch {

namespace fs = std::filesystem;
using nlohmann::json;

namespace {
constexpr const char* kJobId = R"(([A-Za-z0-9_.\-]+))";
constexpr std::size_t kMaxEventPage = 1000;
constexpr std::uintmax_t kMaxFileRead = 1024 * 1024;

std::string dump(const json& j) {
    return j.dump(-1, ' ', false, json::error_handler_t::replace);
}

// Parses a non-negative integer query parameter; false on garbage.
bool queryCount(const httplib::Request& req, const char* name, std::uint64_t& out) {
    if (!req.has_param(name)) return true;
    const std::string value = req.get_param_value(name);
    if (value.empty() || !std::all_of(value.begin(), value.end(), [](unsigned char c) { return std::isdigit(c); })) {
        return false;
    }
    try {
        out = std::stoull(value);
    } catch (const std::exception&) {
        return false;
    }
    return true;
}

bool parseBody(const httplib::Request& req, httplib::Response& res, json& out, bool allowEmpty = false) {
    if (req.body.empty() && allowEmpty) {
        out = json::object();
        return true;
    }
    try {
        out = json::parse(req.body);
    } catch (const json::parse_error& e) {
        sendError(res, ErrorCode::Validation, std::string("invalid JSON body: ") + e.what());
        return false;
    }
    if (!out.is_object()) {
        sendError(res, ErrorCode::Validation, "body must be a JSON object");
        return false;
    }
    return true;
}

std::string sseFrame(const Event& event) {
    return "id: " + std::to_string(event.sequence) + "\n" +
           "event: " + toString(event.type) + "\n" +
           "data: " + dump(json(event)) + "\n\n";
}
}

void sendJson(httplib::Response& res, const json& payload, int status) {
    res.status = status;
    res.set_content(dump(payload), "application/json");
}

void sendError(httplib::Response& res, ErrorCode code, const std::string& message) {
    sendJson(res, json{{"error", toString(code)}, {"message", message}}, httpStatus(code));
}

json routineJson(const Routine& routine) {
    json j = routine;
    if (j["trigger"].contains("secret")) {
        j["trigger"].erase("secret");
        j["trigger"]["has_secret"] = true;
    }
    return j;
}

json fireJson(const FireResult& fire) {
    json j{{"fired", fire.fired}, {"routine_id", fire.routineId}, {"run_id", fire.runId}};
    j["job_id"] = fire.jobId ? json(*fire.jobId) : json();
    if (!fire.fired) {
        j["error"] = toString(fire.error);
        j["message"] = fire.message;
    }
    return j;
}

ApiServer::ApiServer(Orchestrator& orchestrator, RoutineScheduler* routines)
    : orchestrator_(orchestrator), routines_(routines) {
    server_.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
        std::string what = "unknown error";
        try {
            std::rethrow_exception(ep);
        } catch (const std::exception& e) {
            what = e.what();
        } catch (...) {
            what = "non-standard exception";
        }
        LOG_ERROR("API handler error on " + req.path + ": " + what);
        sendError(res, ErrorCode::Internal, what);
    });

    registerJobRoutes();
    registerRoutineRoutes();
    registerInternalRoutes();
}

ApiServer::~ApiServer() {
    stop();
}

json ApiServer::jobJson(const Job& job) const {
    json j = job;
    j["stuck"] = orchestrator_.isStuck(job);
    auto url = orchestrator_.browseUrl(job.id);
    j["browse_url"] = url ? json(*url) : json();
    return j;
}

bool ApiServer::authorizeWorker(const httplib::Request& req, httplib::Response& res, const JobId& id) const {
    auto token = parseBearer(req.get_header_value("Authorization"));
    if (!token || !orchestrator_.authorize(id, *token)) {
        sendError(res, ErrorCode::Unauthorized, "missing or invalid job token");
        return false;
    }
    return true;
}

bool ApiServer::requireRoutines(httplib::Response& res) const {
    if (!routines_) {
        sendError(res, ErrorCode::Unavailable, "routine scheduler is not running");
        return false;
    }
    return true;
}

void ApiServer::registerJobRoutes() {
    server_.Get("/api/health", [this](const httplib::Request&, httplib::Response& res) {
        JobSummary s = orchestrator_.summary();
        sendJson(res, json{
            {"status", orchestrator_.isRunning() ? "ok" : "stopping"},
            {"jobs", s.total},
            {"live", s.pending + s.inProgress},
            {"sandboxes", orchestrator_.supervisor().boundCount()},
            {"provisioning", orchestrator_.provisioningBacklog()},
            {"isolated", orchestrator_.sandboxesIsolated()},
            {"model", static_cast<bool>(completion_)},
        });
    });

    server_.Post("/api/jobs", [this](const httplib::Request& req, httplib::Response& res) {
        json body;
        if (!parseBody(req, res, body)) return;
        JobSpec spec;
        try {
            spec = body.get<JobSpec>();
        } catch (const std::exception& e) {
            sendError(res, ErrorCode::Validation, e.what());
            return;
        }
        // Only the scheduler links jobs to routines.
        spec.routineId.clear();

        auto created = orchestrator_.create(spec);
        if (!created) {
            sendError(res, created.error, created.message);
            return;
        }
        auto job = orchestrator_.get(created.id);
        sendJson(res, job ? jobJson(*job) : json{{"id", created.id}}, 201);
    });

    server_.Get("/api/jobs", [this](const httplib::Request& req, httplib::Response& res) {
        JobFilter filter;
        if (req.has_param("state")) {
            const std::string state = req.get_param_value("state");
            if (state == "stuck") {
                filter.stuckOnly = true;
            } else if (auto parsed = parseJobState(state)) {
                filter.state = *parsed;
            } else {
                sendError(res, ErrorCode::Validation, "unknown state: " + state);
                return;
            }
        }
        if (req.has_param("mode")) {
            auto mode = parseJobMode(req.get_param_value("mode"));
            if (!mode) {
                sendError(res, ErrorCode::Validation, "unknown mode: " + req.get_param_value("mode"));
                return;
            }
            filter.mode = *mode;
        }
        filter.routineId = req.get_param_value("routine");
        filter.query = req.get_param_value("q");
        std::uint64_t limit = filter.limit;
        if (!queryCount(req, "limit", limit)) {
            sendError(res, ErrorCode::Validation, "limit must be a non-negative integer");
            return;
        }
        filter.limit = static_cast<std::size_t>(limit);

        json jobs = json::array();
        for (const auto& job : orchestrator_.list(filter)) {
            jobs.push_back(jobJson(job));
        }
        sendJson(res, json{{"jobs", jobs}, {"count", jobs.size()}});
    });

    server_.Get("/api/jobs/summary", [this](const httplib::Request&, httplib::Response& res) {
        sendJson(res, json(orchestrator_.summary()));
    });

    server_.Get(std::string("/api/jobs/") + kJobId, [this](const httplib::Request& req, httplib::Response& res) {
        auto job = orchestrator_.get(req.matches[1]);
        if (!job) {
            sendError(res, ErrorCode::NotFound, "job not found: " + std::string(req.matches[1]));
            return;
        }
        sendJson(res, jobJson(*job));
    });

    server_.Post(std::string("/api/jobs/") + kJobId + "/cancel", [this](const httplib::Request& req, httplib::Response& res) {
        const JobId id = req.matches[1];
        auto result = orchestrator_.cancel(id);
        if (!result) {
            sendError(res, result.error, result.message);
            return;
        }
        auto job = orchestrator_.get(id);
        sendJson(res, job ? jobJson(*job) : json{{"id", id}});
    });

    server_.Post(std::string("/api/jobs/") + kJobId + "/restart", [this](const httplib::Request& req, httplib::Response& res) {
        const JobId id = req.matches[1];
        auto created = orchestrator_.restart(id);
        if (!created) {
            sendError(res, created.error, created.message);
            return;
        }
        sendJson(res, json{{"id", created.id}, {"restarted_from", id}}, 201);
    });

    server_.Post(std::string("/api/jobs/") + kJobId + "/prompt", [this](const httplib::Request& req, httplib::Response& res) {
        json body;
        if (!parseBody(req, res, body)) return;
        const std::string content = body.value("content", std::string{});
        const bool done = body.value("done", false);
        if (content.empty() && !done) {
            sendError(res, ErrorCode::Validation, "content is required unless done is set");
            return;
        }
        auto result = orchestrator_.prompt(req.matches[1], content, done);
        if (!result) {
            sendError(res, result.error, result.message);
            return;
        }
        sendJson(res, json{{"queued", true}}, 202);
    });

    server_.Get(std::string("/api/jobs/") + kJobId + "/events", [this](const httplib::Request& req, httplib::Response& res) {
        const JobId id = req.matches[1];
        if (!orchestrator_.get(id)) {
            sendError(res, ErrorCode::NotFound, "job not found: " + id);
            return;
        }
        std::uint64_t since = 0;
        std::uint64_t limit = 100;
        if (!queryCount(req, "since", since) || !queryCount(req, "limit", limit)) {
            sendError(res, ErrorCode::Validation, "since and limit must be non-negative integers");
            return;
        }
        limit = std::min<std::uint64_t>(limit == 0 ? kMaxEventPage : limit, kMaxEventPage);

        auto events = orchestrator_.events().read(id, since, static_cast<std::size_t>(limit));
        std::uint64_t next = events.empty() ? since : events.back().sequence;
        sendJson(res, json{
            {"events", events},
            {"next_since", next},
            {"closed", orchestrator_.events().isClosed(id)},
        });
    });

    server_.Get(std::string("/api/jobs/") + kJobId + "/events/stream", [this](const httplib::Request& req, httplib::Response& res) {
        const JobId id = req.matches[1];
        if (!orchestrator_.get(id)) {
            sendError(res, ErrorCode::NotFound, "job not found: " + id);
            return;
        }
        std::uint64_t since = 0;
        if (!queryCount(req, "since", since)) {
            sendError(res, ErrorCode::Validation, "since must be a non-negative integer");
            return;
        }
        // Last-Event-ID wins on reconnect.
        if (req.has_header("Last-Event-ID")) {
            try {
                since = std::stoull(req.get_header_value("Last-Event-ID"));
            } catch (const std::exception&) {
                sendError(res, ErrorCode::Validation, "bad Last-Event-ID");
                return;
            }
        }

        std::shared_ptr<Subscription> sub = orchestrator_.events().subscribe(id, since);
        EventPipeline& events = orchestrator_.events();
        const auto keepAlive = keepAlive_;
        auto lastWrite = std::make_shared<std::chrono::steady_clock::time_point>(std::chrono::steady_clock::now());

        res.set_header("Cache-Control", "no-cache");
        res.set_header("X-Accel-Buffering", "no");
        res.set_chunked_content_provider("text/event-stream",
            [sub, &events, keepAlive, lastWrite](size_t /*offset*/, httplib::DataSink& sink) {
                if (events.isShutdown()) {
                    sink.done();
                    return true;
                }
                for (const auto& event : sub->next(std::chrono::milliseconds(500))) {
                    std::string frame = sseFrame(event);
                    if (!sink.write(frame.data(), frame.size())) return false;
                    *lastWrite = std::chrono::steady_clock::now();
                }
                if (sub->finished()) {
                    sink.done();
                    return true;
                }
                if (std::chrono::steady_clock::now() - *lastWrite >= keepAlive) {
                    static const std::string ping = ": keepalive\n\n";
                    if (!sink.write(ping.data(), ping.size())) return false;
                    *lastWrite = std::chrono::steady_clock::now();
                }
                return true;
            },
            [sub](bool /*success*/) { sub->cancel(); });
    });

    server_.Get(std::string("/api/jobs/") + kJobId + "/files/list", [this](const httplib::Request& req, httplib::Response& res) {
        const JobId id = req.matches[1];
        const fs::path root = orchestrator_.projectDir(id);
        std::error_code ec;
        if (!orchestrator_.get(id) || !fs::is_directory(root, ec)) {
            sendError(res, ErrorCode::NotFound, "no project directory for job " + id);
            return;
        }
        auto dir = resolveUnder(root, req.get_param_value("path"));
        if (!dir || !fs::is_directory(*dir, ec)) {
            sendError(res, ErrorCode::NotFound, "no such directory");
            return;
        }

        json entries = json::array();
        for (const auto& entry : fs::directory_iterator(*dir, ec)) {
            json e{{"name", entry.path().filename().string()}};
            std::error_code sizeEc;
            if (entry.is_directory(sizeEc)) {
                e["type"] = "dir";
            } else {
                e["type"] = "file";
                e["size"] = entry.file_size(sizeEc);
            }
            entries.push_back(std::move(e));
        }
        if (ec) {
            sendError(res, ErrorCode::Internal, "failed to list directory: " + ec.message());
            return;
        }
        std::sort(entries.begin(), entries.end(), [](const json& a, const json& b) {
            return a["name"].get<std::string>() < b["name"].get<std::string>();
        });
        sendJson(res, json{{"path", req.get_param_value("path")}, {"entries", entries}});
    });

    server_.Get(std::string("/api/jobs/") + kJobId + "/files/read", [this](const httplib::Request& req, httplib::Response& res) {
        const JobId id = req.matches[1];
        auto file = resolveUnder(orchestrator_.projectDir(id), req.get_param_value("path"));
        std::error_code ec;
        if (!orchestrator_.get(id) || !file || !fs::is_regular_file(*file, ec)) {
            sendError(res, ErrorCode::NotFound, "no such file");
            return;
        }
        if (fs::file_size(*file, ec) > kMaxFileRead) {
            sendError(res, ErrorCode::Validation, "file too large to read through the API");
            return;
        }
        auto content = readFile(*file);
        if (!content) {
            sendError(res, ErrorCode::Internal, "failed to read file");
            return;
        }
        res.set_content(*content, "text/plain; charset=utf-8");
    });
}

void ApiServer::registerRoutineRoutes() {
    server_.Post("/api/routines", [this](const httplib::Request& req, httplib::Response& res) {
        if (!requireRoutines(res)) return;
        json body;
        if (!parseBody(req, res, body)) return;
        Routine draft;
        try {
            draft = body.get<Routine>();
        } catch (const std::exception& e) {
            sendError(res, ErrorCode::Validation, e.what());
            return;
        }
        auto created = routines_->create(std::move(draft));
        if (!created) {
            sendError(res, created.error, created.message);
            return;
        }
        sendJson(res, routineJson(created.routine), 201);
    });

    server_.Get("/api/routines", [this](const httplib::Request&, httplib::Response& res) {
        if (!requireRoutines(res)) return;
        json list = json::array();
        for (const auto& routine : routines_->list()) {
            list.push_back(routineJson(routine));
        }
        sendJson(res, json{{"routines", list}, {"count", list.size()}});
    });

    server_.Get("/api/routines/summary", [this](const httplib::Request&, httplib::Response& res) {
        if (!requireRoutines(res)) return;
        sendJson(res, json(routines_->summary()));
    });

    server_.Post("/api/routines/events", [this](const httplib::Request& req, httplib::Response& res) {
        if (!requireRoutines(res)) return;
        json body;
        if (!parseBody(req, res, body)) return;
        const std::string text = body.value("text", std::string{});
        if (text.empty()) {
            sendError(res, ErrorCode::Validation, "text is required");
            return;
        }
        json fired = json::array();
        for (const auto& fire : routines_->onEvent(body.value("channel", std::string{}), text)) {
            fired.push_back(fireJson(fire));
        }
        sendJson(res, json{{"fired", fired}});
    });

    server_.Get(std::string("/api/routines/") + kJobId, [this](const httplib::Request& req, httplib::Response& res) {
        if (!requireRoutines(res)) return;
        auto routine = routines_->get(req.matches[1]);
        if (!routine) {
            sendError(res, ErrorCode::NotFound, "routine not found: " + std::string(req.matches[1]));
            return;
        }
        sendJson(res, routineJson(*routine));
    });

    server_.Delete(std::string("/api/routines/") + kJobId, [this](const httplib::Request& req, httplib::Response& res) {
        if (!requireRoutines(res)) return;
        auto result = routines_->remove(req.matches[1]);
        if (!result) {
            sendError(res, result.error, result.message);
            return;
        }
        sendJson(res, json{{"deleted", true}});
    });

    server_.Post(std::string("/api/routines/") + kJobId + "/toggle", [this](const httplib::Request& req, httplib::Response& res) {
        if (!requireRoutines(res)) return;
        json body;
        if (!parseBody(req, res, body, true)) return;
        std::optional<bool> enabled;
        if (body.contains("enabled")) {
            if (!body["enabled"].is_boolean()) {
                sendError(res, ErrorCode::Validation, "enabled must be a boolean");
                return;
            }
            enabled = body["enabled"].get<bool>();
        }
        auto result = routines_->toggle(req.matches[1], enabled);
        if (!result) {
            sendError(res, result.error, result.message);
            return;
        }
        sendJson(res, routineJson(result.routine));
    });

    server_.Post(std::string("/api/routines/") + kJobId + "/trigger", [this](const httplib::Request& req, httplib::Response& res) {
        if (!requireRoutines(res)) return;
        auto fire = routines_->trigger(req.matches[1]);
        if (!fire) {
            sendError(res, fire.error, fire.message);
            return;
        }
        sendJson(res, fireJson(fire), 202);
    });

    server_.Get(std::string("/api/routines/") + kJobId + "/runs", [this](const httplib::Request& req, httplib::Response& res) {
        if (!requireRoutines(res)) return;
        auto runs = routines_->runs(req.matches[1]);
        if (!runs) {
            sendError(res, ErrorCode::NotFound, "routine not found: " + std::string(req.matches[1]));
            return;
        }
        sendJson(res, json{{"runs", *runs}});
    });

    server_.Post(R"(/hooks/(.+))", [this](const httplib::Request& req, httplib::Response& res) {
        if (!requireRoutines(res)) return;
        auto fire = routines_->fireWebhook(req.matches[1], req.get_header_value("X-Hatch-Webhook-Secret"), req.body);
        if (!fire) {
            sendError(res, fire.error, fire.message);
            return;
        }
        sendJson(res, fireJson(fire), 202);
    });
}

void ApiServer::registerInternalRoutes() {
    server_.Post(std::string("/internal/jobs/") + kJobId + "/events", [this](const httplib::Request& req, httplib::Response& res) {
        const JobId id = req.matches[1];
        if (!authorizeWorker(req, res, id)) return;
        json body;
        if (!parseBody(req, res, body)) return;
        const std::string type = body.value("event_type", std::string{});
        const json payload = body.contains("payload") ? body["payload"] : json::object();

        auto result = orchestrator_.ingest(id, type, payload);
        if (!result) {
            sendError(res, result.error, result.message);
            return;
        }
        sendJson(res, json{{"sequence", result.event.sequence}}, 201);
    });

    server_.Post(std::string("/internal/jobs/") + kJobId + "/heartbeat", [this](const httplib::Request& req, httplib::Response& res) {
        const JobId id = req.matches[1];
        if (!authorizeWorker(req, res, id)) return;
        auto result = orchestrator_.heartbeat(id);
        if (!result) {
            sendError(res, result.error, result.message);
            return;
        }
        sendJson(res, json{{"ok", true}});
    });

    server_.Get(std::string("/internal/jobs/") + kJobId + "/spec", [this](const httplib::Request& req, httplib::Response& res) {
        const JobId id = req.matches[1];
        if (!authorizeWorker(req, res, id)) return;
        auto job = orchestrator_.get(id);
        if (!job) {
            sendError(res, ErrorCode::NotFound, "job not found: " + id);
            return;
        }
        json spec = job->spec;
        spec["id"] = job->id;
        spec["state"] = toString(job->state);
        sendJson(res, spec);
    });

    server_.Get(std::string("/internal/jobs/") + kJobId + "/prompt", [this](const httplib::Request& req, httplib::Response& res) {
        const JobId id = req.matches[1];
        if (!authorizeWorker(req, res, id)) return;
        auto prompt = orchestrator_.takePrompt(id);
        if (!prompt) {
            res.status = 204;
            return;
        }
        sendJson(res, json{{"content", prompt->content}, {"done", prompt->done}});
    });

    server_.Post(std::string("/internal/jobs/") + kJobId + "/llm/complete", [this](const httplib::Request& req, httplib::Response& res) {
        const JobId id = req.matches[1];
        if (!authorizeWorker(req, res, id)) return;
        if (!completion_) {
            sendError(res, ErrorCode::Unavailable, "no model is loaded");
            return;
        }
        json body;
        if (!parseBody(req, res, body)) return;
        const std::string prompt = body.value("prompt", std::string{});
        if (prompt.empty()) {
            sendError(res, ErrorCode::Validation, "prompt is required");
            return;
        }
        orchestrator_.registry().touch(id);
        RunResult result = completion_(prompt);
        orchestrator_.registry().touch(id);
        if (!result.ok) {
            sendError(res, ErrorCode::Internal, result.error);
            return;
        }
        sendJson(res, json{{"text", result.output}});
    });
}

bool ApiServer::start(const std::string& host, int port) {
    if (running_.load()) {
        LOG_WARN("API server already running");
        return false;
    }
    if (port == 0) {
        port_ = server_.bind_to_any_port(host);
        if (port_ < 0) port_ = 0;
    } else if (server_.bind_to_port(host, port)) {
        port_ = port;
    } else {
        port_ = 0;
    }
    if (port_ == 0) {
        LOG_ERROR("API server failed to bind " + host + ":" + std::to_string(port));
        return false;
    }

    running_.store(true);
    thread_ = std::thread([this]() {
        setThreadName("Api");
        if (!server_.listen_after_bind()) {
            LOG_DEBUG("API listener returned");
        }
    });
    LOG_INFO("API listening on " + host + ":" + std::to_string(port_));
    return true;
}

void ApiServer::stop() noexcept {
    if (!running_.exchange(false)) return;
    server_.stop();
    if (thread_.joinable()) thread_.join();
    LOG_DEBUG("API server stopped");
}

}
