/**
 * @file components.hpp
 * @brief Event consumers wired up by the executable
 */

#pragma once

#include "ntftp/events/event_bus.hpp"
#include "ntftp/events/events.hpp"

#include <spdlog/spdlog.h>


namespace ntftp::events {

/**
 * @brief Logs every transfer event through spdlog
 *
 * Progress goes to debug so a normal session only sees start/finish.
 * Unsubscribes on destruction.
 */
class LoggerComponent {
public:
    explicit LoggerComponent(EventBus& bus) : bus_(bus) {
        started_id_ = bus_.subscribe<TransferStartedEvent>([](const TransferStartedEvent& e) {
            spdlog::info("[TransferStarted] {} remote={} local={}",
                         to_string(e.direction), e.remote_path, e.local_path);
        });

        progress_id_ = bus_.subscribe<TransferProgressEvent>([](const TransferProgressEvent& e) {
            if (e.total_bytes) {
                spdlog::debug("[TransferProgress] {} remote={} bytes={}/{}",
                              to_string(e.direction), e.remote_path, e.bytes_transferred, *e.total_bytes);
            } else {
                spdlog::debug("[TransferProgress] {} remote={} bytes={}",
                              to_string(e.direction), e.remote_path, e.bytes_transferred);
            }
        });

        completed_id_ = bus_.subscribe<TransferCompletedEvent>([](const TransferCompletedEvent& e) {
            spdlog::info("[TransferCompleted] {} remote={} local={} bytes={} duration={}ms",
                         to_string(e.direction), e.remote_path, e.local_path, e.bytes, e.duration.count());
        });

        failed_id_ = bus_.subscribe<TransferFailedEvent>([](const TransferFailedEvent& e) {
            spdlog::warn("[TransferFailed] {} remote={} local={} error={}",
                         to_string(e.direction), e.remote_path, e.local_path, e.error_message);
        });

        cancelled_id_ = bus_.subscribe<TransferCancelledEvent>([](const TransferCancelledEvent& e) {
            spdlog::info("[TransferCancelled] {} remote={} local={}",
                         to_string(e.direction), e.remote_path, e.local_path);
        });

        interrupt_id_ = bus_.subscribe<InterruptReceivedEvent>([](const InterruptReceivedEvent& e) {
            spdlog::debug("[Interrupt] transfer_active={} terminating={}", e.transfer_active, e.terminating);
        });
    }

    ~LoggerComponent() {
        bus_.unsubscribe<TransferStartedEvent>(started_id_);
        bus_.unsubscribe<TransferProgressEvent>(progress_id_);
        bus_.unsubscribe<TransferCompletedEvent>(completed_id_);
        bus_.unsubscribe<TransferFailedEvent>(failed_id_);
        bus_.unsubscribe<TransferCancelledEvent>(cancelled_id_);
        bus_.unsubscribe<InterruptReceivedEvent>(interrupt_id_);
    }

    LoggerComponent(const LoggerComponent&) = delete;
    LoggerComponent& operator=(const LoggerComponent&) = delete;

private:
    EventBus& bus_;
    std::size_t started_id_ = 0;
    std::size_t progress_id_ = 0;
    std::size_t completed_id_ = 0;
    std::size_t failed_id_ = 0;
    std::size_t cancelled_id_ = 0;
    std::size_t interrupt_id_ = 0;
};

} // namespace ntftp::events
