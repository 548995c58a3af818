#include "ntftp/cli/progress_display.hpp"

namespace ntftp::cli {

ProgressDisplay::ProgressDisplay(events::EventBus& bus,
                                 Console& console,
                                 std::chrono::milliseconds min_interval)
    : bus_(bus), console_(console), min_interval_(min_interval) {
    started_id_ = bus_.subscribe<events::TransferStartedEvent>([this](const events::TransferStartedEvent&) {
        shown_for_transfer_ = false;
    });
    progress_id_ = bus_.subscribe<events::TransferProgressEvent>([this](const events::TransferProgressEvent& e) {
        on_progress(e);
    });
}

ProgressDisplay::~ProgressDisplay() {
    bus_.unsubscribe<events::TransferStartedEvent>(started_id_);
    bus_.unsubscribe<events::TransferProgressEvent>(progress_id_);
}

void ProgressDisplay::on_progress(const events::TransferProgressEvent& event) {
    const auto now = std::chrono::steady_clock::now();
    const bool reached_total = event.total_bytes && event.bytes_transferred >= *event.total_bytes;

    if (shown_for_transfer_ && !reached_total && now - last_shown_ < min_interval_) {
        return;
    }
    shown_for_transfer_ = true;
    last_shown_ = now;
    console_.status(format(event));
}

std::string ProgressDisplay::format(const events::TransferProgressEvent& event) {
    std::string text = std::string(events::to_string(event.direction)) + " " + event.remote_path + ": " +
                       std::to_string(event.bytes_transferred);
    if (event.total_bytes) {
        const auto total = *event.total_bytes;
        const auto percent = total == 0 ? 100 : event.bytes_transferred * 100 / total;
        text += "/" + std::to_string(total) + " bytes (" + std::to_string(percent) + "%)";
    } else {
        text += " bytes";
    }
    return text;
}

} // namespace ntftp::cli
