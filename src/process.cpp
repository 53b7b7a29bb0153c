/*
 * hatch - Sandboxed Agent Job Orchestrator
 * Copyright (c) 2025 Sanmathi Bharamgouda
 * SPDX-License-Identifier: MIT
 */

#include "hatch/process.hpp"
#include "hatch/logger.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>

namespace hatch {

namespace {
std::vector<char*> toArgv(std::vector<std::string>& args) {
    std::vector<char*> out;
    out.reserve(args.size() + 1);
    for (auto& a : args) out.push_back(a.data());
    out.push_back(nullptr);
    return out;
}
}

int decodeWaitStatus(int status) noexcept {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

std::optional<std::string> findExecutable(const std::string& name) {
    if (name.empty()) return std::nullopt;
    if (name.find('/') != std::string::npos) {
        return ::access(name.c_str(), X_OK) == 0 ? std::optional<std::string>(name) : std::nullopt;
    }
    const char* path = std::getenv("PATH");
    std::string dirs = path ? path : "/usr/local/bin:/usr/bin:/bin";
    std::size_t pos = 0;
    while (pos <= dirs.size()) {
        auto colon = dirs.find(':', pos);
        std::string dir = dirs.substr(pos, colon == std::string::npos ? std::string::npos : colon - pos);
        if (!dir.empty()) {
            std::string candidate = dir + "/" + name;
            if (::access(candidate.c_str(), X_OK) == 0) return candidate;
        }
        if (colon == std::string::npos) break;
        pos = colon + 1;
    }
    return std::nullopt;
}

CommandResult runCommand(const std::vector<std::string>& argv, const CommandOptions& options) {
    CommandResult result;
    if (argv.empty()) {
        result.error = "empty command";
        return result;
    }
    auto exe = findExecutable(argv[0]);
    if (!exe) {
        result.error = "command not found: " + argv[0];
        return result;
    }

    int out[2];
    if (::pipe2(out, O_CLOEXEC) != 0) {
        result.error = std::string("pipe failed: ") + std::strerror(errno);
        return result;
    }

    std::vector<std::string> args = argv;
    std::vector<std::string> envStrings;
    if (options.env) {
        for (const auto& [k, v] : *options.env) envStrings.push_back(k + "=" + v);
    }
    // The child only calls async-signal-safe functions.
    auto cargv = toArgv(args);
    auto cenv = toArgv(envStrings);

    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(out[0]);
        ::close(out[1]);
        result.error = std::string("fork failed: ") + std::strerror(errno);
        return result;
    }

    if (pid == 0) {
        // Stays in the caller's process group so a sandbox-wide SIGTERM reaches it.
        ::dup2(out[1], STDOUT_FILENO);
        ::dup2(out[1], STDERR_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        if (!options.cwd.empty() && ::chdir(options.cwd.c_str()) != 0) {
            _exit(126);
        }
        if (options.env) {
            ::execve(exe->c_str(), cargv.data(), cenv.data());
        } else {
            ::execv(exe->c_str(), cargv.data());
        }
        _exit(127);
    }

    ::close(out[1]);
    auto deadline = std::chrono::steady_clock::now() + options.timeout;
    char buf[4096];
    bool open = true;
    while (open) {
        int waitMs = 200;
        if (options.timeout.count() > 0) {
            auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                deadline - std::chrono::steady_clock::now()).count();
            if (left <= 0) {
                ::kill(pid, SIGKILL);
                result.timedOut = true;
                break;
            }
            waitMs = static_cast<int>(std::min<long long>(left, 200));
        }
        pollfd pfd{out[0], POLLIN, 0};
        int ready = ::poll(&pfd, 1, waitMs);
        if (ready < 0) {
            if (errno == EINTR) continue;
            break;
        }
        if (ready == 0) continue;
        ssize_t n = ::read(out[0], buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            open = false;
            break;
        }
        std::size_t room = result.output.size() < options.maxOutput ? options.maxOutput - result.output.size() : 0;
        std::size_t take = std::min(room, static_cast<std::size_t>(n));
        result.output.append(buf, take);
        if (take < static_cast<std::size_t>(n)) result.truncated = true;
    }
    ::close(out[0]);

    int status = 0;
    while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    result.exitCode = result.timedOut ? 124 : decodeWaitStatus(status);
    return result;
}

ChildProcess::~ChildProcess() {
    if (pid_ > 0 && status_ < 0) {
        terminate();
        wait();
    }
    if (fd_ >= 0) ::close(fd_);
}

bool ChildProcess::start(const std::vector<std::string>& argv, const std::filesystem::path& cwd) {
    if (argv.empty()) return false;
    auto exe = findExecutable(argv[0]);
    if (!exe) {
        LOG_ERROR("Command not found: " + argv[0]);
        return false;
    }
    int out[2];
    if (::pipe2(out, O_CLOEXEC) != 0) {
        LOG_ERROR("pipe failed: " + std::string(std::strerror(errno)));
        return false;
    }

    std::vector<std::string> args = argv;
    auto cargv = toArgv(args);
    pid_t pid = ::fork();
    if (pid < 0) {
        ::close(out[0]);
        ::close(out[1]);
        LOG_ERROR("fork failed: " + std::string(std::strerror(errno)));
        return false;
    }
    if (pid == 0) {
        // Stays in the caller's process group so a sandbox-wide SIGTERM reaches it.
        ::dup2(out[1], STDOUT_FILENO);
        int devnull = ::open("/dev/null", O_RDONLY);
        if (devnull >= 0) ::dup2(devnull, STDIN_FILENO);
        if (!cwd.empty() && ::chdir(cwd.c_str()) != 0) {
            _exit(126);
        }
        ::execv(exe->c_str(), cargv.data());
        _exit(127);
    }

    ::close(out[1]);
    pid_ = pid;
    fd_ = out[0];
    buffer_.clear();
    eof_ = false;
    status_ = -1;
    return true;
}

bool ChildProcess::readLine(std::string& line) {
    while (true) {
        auto nl = buffer_.find('\n');
        if (nl != std::string::npos) {
            line = buffer_.substr(0, nl);
            buffer_.erase(0, nl + 1);
            return true;
        }
        if (eof_ || fd_ < 0) {
            if (buffer_.empty()) return false;
            line.swap(buffer_);
            buffer_.clear();
            return true;
        }
        char buf[4096];
        ssize_t n = ::read(fd_, buf, sizeof(buf));
        if (n < 0 && errno == EINTR) continue;
        if (n <= 0) {
            eof_ = true;
            continue;
        }
        buffer_.append(buf, static_cast<std::size_t>(n));
    }
}

int ChildProcess::wait() noexcept {
    if (pid_ <= 0) return -1;
    if (status_ >= 0) return decodeWaitStatus(status_);
    int status = 0;
    while (::waitpid(pid_, &status, 0) < 0) {
        if (errno != EINTR) return -1;
    }
    status_ = status;
    return decodeWaitStatus(status);
}

void ChildProcess::terminate() noexcept {
    if (pid_ > 0 && status_ < 0) {
        ::kill(pid_, SIGTERM);
    }
}

}
