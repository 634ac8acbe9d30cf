/*
 * host_channel.cpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

#include "host_channel.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <string>

#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace assay::sandbox {

using namespace std::chrono_literals;

namespace {

struct FrameHeader {
    std::uint32_t magic;
    std::uint32_t size;
};

}  // namespace

HostChannel::HostChannel(int fd) : fd_(fd) {}

HostChannel::~HostChannel() { close(); }

auto HostChannel::createPair() -> ChannelResult<std::pair<int, int>> {
    int fds[2];
    if (socketpair(AF_UNIX, SOCK_STREAM | SOCK_CLOEXEC, 0, fds) != 0) {
        spdlog::error("socketpair failed: {}", std::strerror(errno));
        return std::unexpected(ChannelError::IoError);
    }
    return std::pair{fds[0], fds[1]};
}

void HostChannel::close() {
    if (fd_ >= 0) {
        ::close(fd_);
        fd_ = -1;
    }
}

auto HostChannel::send(const json& message) -> ChannelResult<void> {
    if (fd_ < 0) {
        return std::unexpected(ChannelError::Closed);
    }
    const std::string payload =
        message.dump(-1, ' ', false, json::error_handler_t::replace);
    if (payload.size() > kMaxPayload) {
        return std::unexpected(ChannelError::MessageTooLarge);
    }

    FrameHeader header{kMagic, static_cast<std::uint32_t>(payload.size())};
    std::string frame(reinterpret_cast<const char*>(&header), sizeof(header));
    frame += payload;

    std::lock_guard lock(writeMutex_);
    size_t written = 0;
    while (written < frame.size()) {
        auto n = ::send(fd_, frame.data() + written, frame.size() - written,
                        MSG_NOSIGNAL);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == EPIPE || errno == ECONNRESET) {
                return std::unexpected(ChannelError::Closed);
            }
            spdlog::error("Channel write failed: {}", std::strerror(errno));
            return std::unexpected(ChannelError::IoError);
        }
        written += static_cast<size_t>(n);
    }
    return {};
}

auto HostChannel::waitReadable(std::chrono::milliseconds wait)
    -> ChannelResult<void> {
    const auto deadline = std::chrono::steady_clock::now() + wait;
    for (;;) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        struct pollfd pfd {};
        pfd.fd = fd_;
        pfd.events = POLLIN;
        int ret = poll(&pfd, 1, static_cast<int>(std::max(remaining, 0ms).count()));
        if (ret > 0) {
            return {};
        }
        if (ret == 0) {
            return std::unexpected(ChannelError::Timeout);
        }
        if (errno != EINTR) {
            spdlog::error("Channel poll failed: {}", std::strerror(errno));
            return std::unexpected(ChannelError::IoError);
        }
    }
}

auto HostChannel::readExact(char* buffer, size_t size,
                            std::chrono::milliseconds wait)
    -> ChannelResult<void> {
    size_t done = 0;
    while (done < size) {
        if (auto ready = waitReadable(wait); !ready) {
            return ready;
        }
        auto n = ::recv(fd_, buffer + done, size - done, 0);
        if (n == 0) {
            return std::unexpected(ChannelError::Closed);
        }
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            if (errno == ECONNRESET) {
                return std::unexpected(ChannelError::Closed);
            }
            spdlog::error("Channel read failed: {}", std::strerror(errno));
            return std::unexpected(ChannelError::IoError);
        }
        done += static_cast<size_t>(n);
    }
    return {};
}

auto HostChannel::receive(std::chrono::milliseconds timeout)
    -> ChannelResult<json> {
    if (fd_ < 0) {
        return std::unexpected(ChannelError::Closed);
    }
    if (auto ready = waitReadable(timeout); !ready) {
        return std::unexpected(ready.error());
    }

    const auto chunkWait = std::max<std::chrono::milliseconds>(timeout, 1s);
    FrameHeader header{};
    if (auto read = readExact(reinterpret_cast<char*>(&header), sizeof(header),
                              chunkWait);
        !read) {
        return std::unexpected(read.error());
    }
    if (header.magic != kMagic) {
        return std::unexpected(ChannelError::InvalidMessage);
    }
    if (header.size > kMaxPayload) {
        return std::unexpected(ChannelError::MessageTooLarge);
    }

    std::string payload(header.size, '\0');
    if (auto read = readExact(payload.data(), payload.size(), chunkWait); !read) {
        return std::unexpected(read.error());
    }
    try {
        return json::parse(payload);
    } catch (const json::parse_error& e) {
        spdlog::error("Malformed channel frame: {}", e.what());
        return std::unexpected(ChannelError::InvalidMessage);
    }
}

}  // namespace assay::sandbox
