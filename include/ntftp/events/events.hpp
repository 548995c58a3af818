/**
 * @file events.hpp
 * @brief Events published by the transfer core
 *
 * NAMING CONVENTION:
 * - Events are past-tense: TransferStartedEvent, TransferFailedEvent
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace ntftp::events {

enum class Direction {
    Get,
    Put
};

inline const char* to_string(Direction direction) {
    return direction == Direction::Get ? "get" : "put";
}

/**
 * @brief Emitted once both streams of a transfer are open and linked
 *
 * WHO EMITS: Transfer
 */
struct TransferStartedEvent {
    Direction direction;
    std::string remote_path;
    std::string local_path;
    std::chrono::system_clock::time_point timestamp{std::chrono::system_clock::now()};
};

/**
 * @brief Emitted whenever the remote stream reports progress
 *
 * Informational only. Nothing in the transfer core reacts to it.
 */
struct TransferProgressEvent {
    Direction direction;
    std::string remote_path;
    std::uint64_t bytes_transferred = 0;
    std::optional<std::uint64_t> total_bytes;
};

struct TransferCompletedEvent {
    Direction direction;
    std::string remote_path;
    std::string local_path;
    std::uint64_t bytes = 0;
    std::chrono::milliseconds duration{0};
};

struct TransferFailedEvent {
    Direction direction;
    std::string remote_path;
    std::string local_path;
    std::string error_message;
};

struct TransferCancelledEvent {
    Direction direction;
    std::string remote_path;
    std::string local_path;
};

// ════════════════════════════════════════════════════════
// Session Events
// ════════════════════════════════════════════════════════

/**
 * @brief Emitted for every interrupt the session loop handles
 *
 * `terminating` is set on the second interrupt inside the grace window.
 */
struct InterruptReceivedEvent {
    bool transfer_active = false;
    bool terminating = false;
};

} // namespace ntftp::events
