#pragma once

#include "ntftp/cli/console.hpp"
#include "ntftp/events/event_bus.hpp"
#include "ntftp/events/events.hpp"

#include <chrono>
#include <cstddef>
#include <string>

namespace ntftp::cli {

/**
 * @brief Shows transfer progress on the console's status line
 *
 * Updates are rate limited to one per `min_interval`, except the first
 * one of a transfer and the one that reaches the announced total.
 * Unsubscribes on destruction.
 */
class ProgressDisplay {
public:
    static constexpr std::chrono::milliseconds kMinInterval{250};

    ProgressDisplay(events::EventBus& bus,
                    Console& console,
                    std::chrono::milliseconds min_interval = kMinInterval);
    ~ProgressDisplay();

    ProgressDisplay(const ProgressDisplay&) = delete;
    ProgressDisplay& operator=(const ProgressDisplay&) = delete;

    // "get a.bin: 1024 bytes", "put b.bin: 512/2048 bytes (25%)"
    static std::string format(const events::TransferProgressEvent& event);

private:
    void on_progress(const events::TransferProgressEvent& event);

    events::EventBus& bus_;
    Console& console_;
    std::chrono::milliseconds min_interval_;
    std::chrono::steady_clock::time_point last_shown_{};
    bool shown_for_transfer_ = false;
    std::size_t started_id_ = 0;
    std::size_t progress_id_ = 0;
};

} // namespace ntftp::cli
