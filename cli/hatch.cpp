/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/logger.hpp"
#include "hatch/util.hpp"
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <cctype>
#include <functional>
#include <iostream>
#include <iterator>
#include <string>
#include <vector>
#include <unistd.h>

using namespace hatch;
using nlohmann::json;

void printUsage(const char* progName) {
    std::cout << "hatch - operator CLI for hatchd\n\n";
    std::cout << "Usage: " << progName << " [--url <orchestrator>] <command> [args]\n\n";
    std::cout << "Commands:\n";
    std::cout << "  submit [options] <description>   create a job (description from stdin when omitted)\n";
    std::cout << "      --title <t> --mode worker|bridge --domain <d> --tool <t>\n";
    std::cout << "      --credential <domain>=<ref> --max-iterations <n> --max-turns <n> --model <m>\n";
    std::cout << "  jobs [--state s] [--mode m] [--routine id] [--q text] [--limit n]\n";
    std::cout << "  show <job-id>\n";
    std::cout << "  cancel <job-id>\n";
    std::cout << "  restart <job-id>\n";
    std::cout << "  prompt <job-id> <text> [--done]\n";
    std::cout << "  events <job-id> [--since n] [--follow]\n";
    std::cout << "  summary\n";
    std::cout << "  routines [show|runs|toggle|delete <id>] | routines create <file.json>\n";
    std::cout << "  trigger <routine-id>\n\n";
    std::cout << "Environment Variables:\n";
    std::cout << "  HATCH_URL          Orchestrator URL (default http://127.0.0.1:8600)\n";
    std::cout << "  HATCH_LOG_LEVEL    Log level (ERROR, WARN, INFO, DEBUG, TRACE)\n";
}

namespace {

struct Reply {
    int status = 0;
    json body;
};

class ApiClient {
public:
    explicit ApiClient(const std::string& url) : client_(url) {
        client_.set_connection_timeout(std::chrono::seconds(5));
        client_.set_read_timeout(std::chrono::seconds(60));
    }

    Reply get(const std::string& path) { return wrap(client_.Get(path)); }
    Reply post(const std::string& path, const json& body = json::object()) {
        return wrap(client_.Post(path, body.dump(), "application/json"));
    }
    Reply del(const std::string& path) { return wrap(client_.Delete(path)); }

    // Streams SSE frames, invoking `onEvent` with each data payload.
    bool stream(const std::string& path, const std::function<void(const json&)>& onEvent) {
        std::string buffer;
        auto res = client_.Get(path, [&](const char* data, size_t len) {
            buffer.append(data, len);
            std::size_t end;
            while ((end = buffer.find("\n\n")) != std::string::npos) {
                std::string frame = buffer.substr(0, end);
                buffer.erase(0, end + 2);
                std::size_t pos = 0;
                while (pos < frame.size()) {
                    std::size_t nl = frame.find('\n', pos);
                    std::string line = frame.substr(pos, nl == std::string::npos ? std::string::npos : nl - pos);
                    pos = nl == std::string::npos ? frame.size() : nl + 1;
                    if (line.rfind("data: ", 0) != 0) continue;
                    try {
                        onEvent(json::parse(line.substr(6)));
                    } catch (const json::parse_error& e) {
                        LOG_WARN(std::string("Bad event frame: ") + e.what());
                    }
                }
            }
            return true;
        });
        if (!res) {
            std::cerr << "Error: stream failed: " << httplib::to_string(res.error()) << "\n";
            return false;
        }
        if (res->status != 200) {
            std::cerr << "Error: " << res->status << " " << res->body << "\n";
            return false;
        }
        return true;
    }

private:
    Reply wrap(const httplib::Result& res) {
        Reply reply;
        if (!res) {
            std::cerr << "Error: cannot reach orchestrator: " << httplib::to_string(res.error()) << "\n";
            return reply;
        }
        reply.status = res->status;
        if (!res->body.empty()) {
            reply.body = json::parse(res->body, nullptr, false);
            if (reply.body.is_discarded()) reply.body = json{{"text", res->body}};
        }
        return reply;
    }

    httplib::Client client_;
};

// Prints the result and maps it to an exit code.
int finish(const Reply& reply, int okStatus = 200) {
    if (reply.status == 0) return 1;
    if (reply.status != okStatus && !(okStatus == 200 && reply.status >= 200 && reply.status < 300)) {
        std::string message = reply.body.is_object() ? reply.body.value("message", reply.body.dump()) : reply.body.dump();
        std::cerr << "Error (" << reply.status << "): " << message << "\n";
        return 1;
    }
    std::cout << reply.body.dump(2) << "\n";
    return 0;
}

std::string describeEvent(const json& event) {
    std::string type = event.value("event_type", std::string{});
    const json& p = event.contains("payload") ? event["payload"] : json::object();
    std::string text;
    if (type == "message") text = p.value("content", std::string{});
    else if (type == "tool_use") text = p.value("tool", std::string{}) + " " + (p.contains("input") ? p["input"].dump() : "");
    else if (type == "tool_result") text = p.value("output", std::string{});
    else if (type == "result") text = (p.value("success", false) ? "success: " : "failure: ") + p.value("message", std::string{});
    else text = p.dump();
    return "#" + std::to_string(event.value("sequence", 0)) + " [" + type + "] " + text;
}

std::string urlEncode(const std::string& value) {
    static const char* hex = "0123456789ABCDEF";
    std::string out;
    for (unsigned char c : value) {
        if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~') {
            out += static_cast<char>(c);
        } else {
            out += '%';
            out += hex[c >> 4];
            out += hex[c & 0x0F];
        }
    }
    return out;
}

int cmdSubmit(ApiClient& api, const std::vector<std::string>& args) {
    json spec = json::object();
    json domains = json::array();
    json tools = json::array();
    json credentials = json::array();
    std::string description;

    for (std::size_t i = 0; i < args.size(); ++i) {
        const std::string& arg = args[i];
        bool hasValue = i + 1 < args.size();
        if (arg == "--title" && hasValue) spec["title"] = args[++i];
        else if (arg == "--mode" && hasValue) spec["mode"] = args[++i];
        else if (arg == "--domain" && hasValue) domains.push_back(args[++i]);
        else if (arg == "--tool" && hasValue) tools.push_back(args[++i]);
        else if (arg == "--model" && hasValue) spec["model"] = args[++i];
        else if (arg == "--credential" && hasValue) {
            std::string grant = args[++i];
            auto eq = grant.find('=');
            if (eq == std::string::npos) {
                std::cerr << "Error: --credential takes <domain>=<ref>\n";
                return 1;
            }
            credentials.push_back({{"domain", grant.substr(0, eq)}, {"credential_ref", grant.substr(eq + 1)}});
        } else if ((arg == "--max-iterations" || arg == "--max-turns") && hasValue) {
            try {
                spec[arg == "--max-iterations" ? "max_iterations" : "max_turns"] = std::stoi(args[++i]);
            } catch (const std::exception&) {
                std::cerr << "Error: " << arg << " takes a number\n";
                return 1;
            }
        } else {
            if (!description.empty()) description += " ";
            description += arg;
        }
    }

    if (description.empty() && !isatty(fileno(stdin))) {
        description.assign(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
    }
    if (trim(description).empty()) {
        std::cerr << "Error: description is required\n";
        return 1;
    }
    spec["description"] = description;
    spec["allowed_domains"] = domains;
    spec["tools"] = tools;
    spec["credentials"] = credentials;

    Reply reply = api.post("/api/jobs", spec);
    if (reply.status == 201) {
        std::cout << reply.body.value("id", std::string{}) << "\n";
        return 0;
    }
    return finish(reply, 201);
}

int cmdJobs(ApiClient& api, const std::vector<std::string>& args) {
    std::string query;
    for (std::size_t i = 0; i + 1 < args.size(); i += 2) {
        std::string key = args[i];
        if (key.rfind("--", 0) == 0) key = key.substr(2);
        query += (query.empty() ? "?" : "&") + key + "=" + urlEncode(args[i + 1]);
    }
    Reply reply = api.get("/api/jobs" + query);
    if (reply.status != 200) return finish(reply);
    for (const auto& job : reply.body["jobs"]) {
        std::string state = job.value("state", std::string{});
        if (job.value("stuck", false)) state += " (stuck)";
        std::cout << job.value("id", std::string{}) << "  " << state << "  " << job.value("title", std::string{}) << "\n";
    }
    return 0;
}

int cmdEvents(ApiClient& api, const std::string& id, const std::vector<std::string>& args) {
    bool follow = false;
    std::string since = "0";
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (args[i] == "--follow" || args[i] == "-f") follow = true;
        else if (args[i] == "--since" && i + 1 < args.size()) since = args[++i];
    }
    if (follow) {
        bool ok = api.stream("/api/jobs/" + id + "/events/stream?since=" + urlEncode(since),
                             [](const json& event) { std::cout << describeEvent(event) << std::endl; });
        return ok ? 0 : 1;
    }
    Reply reply = api.get("/api/jobs/" + id + "/events?since=" + urlEncode(since) + "&limit=1000");
    if (reply.status != 200) return finish(reply);
    for (const auto& event : reply.body["events"]) {
        std::cout << describeEvent(event) << "\n";
    }
    return 0;
}

int cmdRoutines(ApiClient& api, const std::vector<std::string>& args) {
    if (args.empty() || args[0] == "list") {
        Reply reply = api.get("/api/routines");
        if (reply.status != 200) return finish(reply);
        for (const auto& r : reply.body["routines"]) {
            std::cout << r.value("id", std::string{}) << "  " << r.value("status", std::string{}) << "  "
                      << r["trigger"].value("type", std::string{}) << "  " << r.value("name", std::string{}) << "\n";
        }
        return 0;
    }
    const std::string& sub = args[0];
    if (sub == "summary") return finish(api.get("/api/routines/summary"));
    if (args.size() < 2) {
        std::cerr << "Error: routines " << sub << " needs an argument\n";
        return 1;
    }
    const std::string& id = args[1];
    if (sub == "show") return finish(api.get("/api/routines/" + id));
    if (sub == "runs") return finish(api.get("/api/routines/" + id + "/runs"));
    if (sub == "delete") return finish(api.del("/api/routines/" + id));
    if (sub == "toggle") {
        json body = json::object();
        if (args.size() > 2) body["enabled"] = (args[2] == "on" || args[2] == "true");
        return finish(api.post("/api/routines/" + id + "/toggle", body));
    }
    if (sub == "create") {
        auto content = readFile(id);
        if (!content) {
            std::cerr << "Error: cannot read " << id << "\n";
            return 1;
        }
        json body = json::parse(*content, nullptr, false);
        if (body.is_discarded()) {
            std::cerr << "Error: " << id << " is not valid JSON\n";
            return 1;
        }
        return finish(api.post("/api/routines", body), 201);
    }
    std::cerr << "Error: unknown routines command: " << sub << "\n";
    return 1;
}

}

int main(int argc, char* argv[]) {
    // Silence logs for CLI tool usage
    Logger::setLevel(LogLevel::WARN);
    if (std::getenv("HATCH_LOG_LEVEL")) {
        Logger::initFromEnv();
    }

    std::string url = envString("HATCH_URL", "http://127.0.0.1:8600");
    std::vector<std::string> args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--url" && i + 1 < argc) {
            url = argv[++i];
        } else if (arg == "-h" || arg == "--help") {
            printUsage(argv[0]);
            return 0;
        } else {
            args.push_back(arg);
        }
    }
    if (args.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    const std::string command = args[0];
    std::vector<std::string> rest(args.begin() + 1, args.end());
    auto needId = [&]() -> bool {
        if (rest.empty()) {
            std::cerr << "Error: " << command << " needs an id\n";
            return false;
        }
        return true;
    };

    try {
        ApiClient api(url);
        if (command == "submit") return cmdSubmit(api, rest);
        if (command == "jobs") return cmdJobs(api, rest);
        if (command == "summary") return finish(api.get("/api/jobs/summary"));
        if (command == "routines") return cmdRoutines(api, rest);
        if (!needId()) return 1;
        const std::string& id = rest[0];
        std::vector<std::string> tail(rest.begin() + 1, rest.end());
        if (command == "show") return finish(api.get("/api/jobs/" + id));
        if (command == "cancel") return finish(api.post("/api/jobs/" + id + "/cancel"));
        if (command == "restart") return finish(api.post("/api/jobs/" + id + "/restart"), 201);
        if (command == "events") return cmdEvents(api, id, tail);
        if (command == "trigger") return finish(api.post("/api/routines/" + id + "/trigger"), 202);
        if (command == "prompt") {
            bool done = false;
            std::string content;
            for (const auto& t : tail) {
                if (t == "--done") done = true;
                else content += (content.empty() ? "" : " ") + t;
            }
            return finish(api.post("/api/jobs/" + id + "/prompt", {{"content", content}, {"done", done}}), 202);
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    std::cerr << "Error: unknown command: " << command << "\n";
    printUsage(argv[0]);
    return 1;
}
