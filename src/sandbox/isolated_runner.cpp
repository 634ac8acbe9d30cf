/*
 * isolated_runner.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#ifndef _WIN32

#include "isolated_runner.hpp"

#include <algorithm>
#include <cerrno>
#include <cmath>
#include <cstring>
#include <mutex>
#include <thread>

#include <signal.h>
#include <sys/resource.h>
#include <sys/wait.h>
#include <unistd.h>

#include <pybind11/embed.h>
#include <spdlog/spdlog.h>

#include "host_channel.hpp"
#include "resource_monitor.hpp"

namespace py = pybind11;

namespace assay::sandbox {

using namespace std::chrono_literals;

namespace {

constexpr auto kReceiveSlice = 100ms;
constexpr auto kReplySlice = 1s;
constexpr auto kReapWait = 1s;
constexpr auto kReapPoll = 10ms;

/**
 * Endpoint used inside the child: every request is a round trip to the
 * parent.
 */
class ChannelEndpoint : public HostEndpoint {
public:
    explicit ChannelEndpoint(std::shared_ptr<HostChannel> channel)
        : channel_(std::move(channel)) {}

    auto call(const std::string& name, const json& arguments) -> json override {
        return request(encodeCall(name, arguments));
    }

    auto describe() -> json override { return request(encodeDescribe()); }

    auto data(const std::string& operation, const json& arguments)
        -> json override {
        return request(encodeData(operation, arguments));
    }

private:
    auto request(const json& frame) -> json {
        std::lock_guard lock(mutex_);
        if (auto sent = channel_->send(frame); !sent) {
            return lost(sent.error());
        }
        for (;;) {
            auto reply = channel_->receive(kReplySlice);
            if (!reply) {
                if (reply.error() == ChannelError::Timeout) {
                    continue;
                }
                return lost(reply.error());
            }
            if (reply->value("op", "") == "reply") {
                return reply->value("reply", json::object());
            }
            spdlog::warn("Ignoring unexpected host frame '{}'",
                         reply->value("op", ""));
        }
    }

    static auto lost(ChannelError error) -> json {
        return bridge::errorResult(
            "host connection lost: " + std::string(channelErrorToString(error)),
            "ToolCallFailure");
    }

    std::shared_ptr<HostChannel> channel_;
    std::mutex mutex_;
};

struct Reaped {
    int status{0};
    struct rusage usage {};
};

auto errnoText() -> std::string { return std::strerror(errno); }

/**
 * Wait up to wait for the child to exit on its own.
 */
auto reapWithin(pid_t pid, std::chrono::milliseconds wait)
    -> std::optional<Reaped> {
    const auto deadline = std::chrono::steady_clock::now() + wait;
    Reaped reaped;
    for (;;) {
        pid_t done = wait4(pid, &reaped.status, WNOHANG, &reaped.usage);
        if (done == pid) {
            return reaped;
        }
        if (done < 0 && errno != EINTR) {
            spdlog::error("wait4({}) failed: {}", pid, errnoText());
            return reaped;
        }
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
        std::this_thread::sleep_for(kReapPoll);
    }
}

auto killAndReap(pid_t pid) -> Reaped {
    if (kill(pid, SIGKILL) != 0 && errno != ESRCH) {
        spdlog::error("Failed to kill sandbox child {}: {}", pid, errnoText());
    }
    Reaped reaped;
    while (wait4(pid, &reaped.status, 0, &reaped.usage) < 0) {
        if (errno != EINTR) {
            spdlog::error("wait4({}) failed: {}", pid, errnoText());
            break;
        }
    }
    return reaped;
}

auto reap(pid_t pid) -> Reaped {
    if (auto reaped = reapWithin(pid, kReapWait)) {
        return *reaped;
    }
    spdlog::warn("Sandbox child {} did not exit after reporting, killing", pid);
    return killAndReap(pid);
}

auto usageOf(const Reaped& reaped, std::chrono::steady_clock::time_point start)
    -> ResourceUsage {
    ResourceUsage usage;
    usage.wallTime = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start);
    const auto seconds = [](const struct timeval& tv) {
        return static_cast<double>(tv.tv_sec) +
               static_cast<double>(tv.tv_usec) / 1e6;
    };
    usage.cpuSeconds =
        seconds(reaped.usage.ru_utime) + seconds(reaped.usage.ru_stime);
    usage.peakMemoryKb = static_cast<size_t>(reaped.usage.ru_maxrss);
    return usage;
}

/**
 * Hard CPU ceiling for the child. The governor's soft limit sits below
 * it; the kernel kills the child here if the soft signal goes unheeded.
 */
void capChildCpu(const ResourceLimits& limits, std::chrono::seconds grace) {
    const auto used =
        static_cast<rlim_t>(std::ceil(ResourceMonitor::getCpuSeconds()));
    rlim_t cap = used + static_cast<rlim_t>(limits.cpuLimitSeconds) +
                 static_cast<rlim_t>(grace.count());

    struct rlimit current {};
    if (getrlimit(RLIMIT_CPU, &current) == 0 &&
        current.rlim_max != RLIM_INFINITY) {
        cap = std::min(cap, current.rlim_max);
    }
    struct rlimit limit {};
    limit.rlim_cur = cap;
    limit.rlim_max = cap;
    if (setrlimit(RLIMIT_CPU, &limit) != 0) {
        spdlog::warn("Could not cap sandbox child CPU time: {}", errnoText());
    }
}

[[noreturn]] void runChild(int fd, const IsolatedRunner::Body& body,
                           const ResourceLimits& limits,
                           std::chrono::seconds grace) {
    auto channel = std::make_shared<HostChannel>(fd);
    capChildCpu(limits, grace);

    json frame;
    try {
        ChildReport report = body(std::make_shared<ChannelEndpoint>(channel));
        frame = {{"op", "result"},
                 {"result", report.result.toJson()},
                 {"engine_fault", report.engineFault}};
    } catch (const std::exception& e) {
        frame = {{"op", "failure"}, {"message", e.what()}};
    }

    const int code = channel->send(frame) ? 0 : 1;
    spdlog::default_logger()->flush();
    _exit(code);
}

}  // namespace

IsolatedRunner::IsolatedRunner(const ResourceLimits& limits,
                               std::chrono::seconds killGrace)
    : limits_(limits), killGrace_(killGrace) {}

auto IsolatedRunner::run(HostEndpoint& host, const Body& body) -> ChildExit {
    ChildExit outcome;
    auto fds = HostChannel::createPair();
    if (!fds) {
        outcome.failure = "could not create the host channel: " +
                       std::string(channelErrorToString(fds.error()));
        return outcome;
    }
    auto [parentFd, childFd] = *fds;

    const auto start = std::chrono::steady_clock::now();
    PyOS_BeforeFork();
    pid_t pid = fork();
    if (pid == 0) {
        PyOS_AfterFork_Child();
        ::close(parentFd);
        runChild(childFd, body, limits_, killGrace_);
    }
    const int forkErrno = errno;
    PyOS_AfterFork_Parent();
    ::close(childFd);
    if (pid < 0) {
        ::close(parentFd);
        outcome.failure = std::string("fork failed: ") + std::strerror(forkErrno);
        spdlog::error("Sandbox {}", outcome.failure);
        return outcome;
    }

    spdlog::debug("Sandbox child {} started", pid);
    HostChannel channel(parentFd);
    py::gil_scoped_release release;

    const auto deadline = start + std::chrono::seconds(limits_.timeoutSeconds) +
                          killGrace_;
    for (;;) {
        if (std::chrono::steady_clock::now() >= deadline) {
            spdlog::warn("Sandbox child {} passed its deadline, killing", pid);
            outcome.usage = usageOf(killAndReap(pid), start);
            outcome.killedFor = LimitKind::Timeout;
            return outcome;
        }

        auto message = channel.receive(kReceiveSlice);
        if (!message) {
            if (message.error() == ChannelError::Timeout) {
                continue;
            }
            if (message.error() != ChannelError::Closed) {
                outcome.usage = usageOf(killAndReap(pid), start);
                outcome.failure = "host channel failed: " +
                               std::string(channelErrorToString(message.error()));
                return outcome;
            }

            const Reaped reaped = reap(pid);
            outcome.usage = usageOf(reaped, start);
            if (WIFSIGNALED(reaped.status)) {
                const int signo = WTERMSIG(reaped.status);
                if ((signo == SIGKILL || signo == SIGXCPU) &&
                    outcome.usage.cpuSeconds + 0.5 >= limits_.cpuLimitSeconds) {
                    outcome.killedFor = LimitKind::Cpu;
                    return outcome;
                }
                outcome.failure = "sandbox child terminated by signal " +
                               std::to_string(signo);
            } else {
                outcome.failure = "sandbox child exited with status " +
                               std::to_string(WEXITSTATUS(reaped.status)) +
                               " before reporting";
            }
            return outcome;
        }

        const std::string op = message->value("op", "");
        if (op == "result") {
            try {
                outcome.result = ExecutionResult::fromJson(message->at("result"));
                outcome.engineFault = message->value("engine_fault", false);
            } catch (const json::exception& e) {
                outcome.failure =
                    std::string("malformed report from sandbox child: ") +
                    e.what();
            }
            outcome.usage = usageOf(reap(pid), start);
            return outcome;
        }
        if (op == "failure") {
            outcome.failure = message->value("message", "sandbox child failed");
            outcome.usage = usageOf(reap(pid), start);
            return outcome;
        }

        json reply;
        try {
            reply = serveRequest(host, *message);
        } catch (const std::exception& e) {
            spdlog::error("Serving sandbox child request failed: {}", e.what());
            reply = bridge::errorResult(e.what(), "ToolCallFailure");
        }
        if (auto sent = channel.send({{"op", "reply"}, {"reply", reply}});
            !sent) {
            spdlog::warn("Reply to sandbox child {} not delivered: {}", pid,
                         channelErrorToString(sent.error()));
        }
    }
}

}  // namespace assay::sandbox

#endif  // _WIN32
