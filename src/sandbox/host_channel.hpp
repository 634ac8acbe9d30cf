/*
 * host_channel.hpp
 *
 * Copyright (C) 2023-2024 Max Qian <lightapt.com>
 */

/**
 * @file host_channel.hpp
 * @brief Framed JSON messages over a connected local socket
 *
 * Each frame is a fixed header (magic, payload size) followed by the
 * JSON text. Used between the sandbox host and its isolated run
 * process. POSIX only.
 */

#ifndef ASSAY_SANDBOX_HOST_CHANNEL_HPP
#define ASSAY_SANDBOX_HOST_CHANNEL_HPP

#include <chrono>
#include <cstdint>
#include <expected>
#include <mutex>
#include <string_view>
#include <utility>

#include "atom/type/noncopyable.hpp"

#include "types.hpp"

namespace assay::sandbox {

enum class ChannelError {
    Timeout,
    Closed,
    IoError,
    MessageTooLarge,
    InvalidMessage
};

[[nodiscard]] constexpr std::string_view channelErrorToString(
    ChannelError error) noexcept {
    switch (error) {
        case ChannelError::Timeout: return "Timeout";
        case ChannelError::Closed: return "Channel closed";
        case ChannelError::IoError: return "I/O error";
        case ChannelError::MessageTooLarge: return "Message too large";
        case ChannelError::InvalidMessage: return "Invalid message";
    }
    return "Unknown error";
}

template <typename T>
using ChannelResult = std::expected<T, ChannelError>;

class HostChannel : public NonCopyable {
public:
    static constexpr std::uint32_t kMagic = 0x41535931;  // "ASY1"
    static constexpr std::uint32_t kMaxPayload = 64U * 1024 * 1024;

    /**
     * @brief Take ownership of a connected socket
     */
    explicit HostChannel(int fd);
    ~HostChannel();

    /**
     * @brief A connected socket pair; both ends close on exec
     */
    [[nodiscard]] static auto createPair() -> ChannelResult<std::pair<int, int>>;

    [[nodiscard]] auto send(const json& message) -> ChannelResult<void>;

    /**
     * @brief Next frame, waiting at most timeout for it to start
     *
     * Once a frame has started, the rest of it is read with the same
     * allowance (at least one second) per chunk.
     */
    [[nodiscard]] auto receive(std::chrono::milliseconds timeout)
        -> ChannelResult<json>;

    void close();

    [[nodiscard]] auto isOpen() const noexcept -> bool { return fd_ >= 0; }

private:
    auto readExact(char* buffer, size_t size, std::chrono::milliseconds wait)
        -> ChannelResult<void>;
    auto waitReadable(std::chrono::milliseconds wait) -> ChannelResult<void>;

    int fd_;
    std::mutex writeMutex_;
};

}  // namespace assay::sandbox

#endif  // ASSAY_SANDBOX_HOST_CHANNEL_HPP
